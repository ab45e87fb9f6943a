#include "application.hpp"
#include "allanime/allanime_adapter.hpp"
#include "logging.hpp"
#include "playback_launcher.hpp"
#include "source/http_client.hpp"
#include "source/resolution_pipeline.hpp"
#include "ui/curses_terminal.hpp"
#include "ui/ui_controller.hpp"
#include <glib-unix.h>
#include <csignal>
#include <memory>

struct _ShioApplication {
    GApplication parent_instance;

    Shio::Config *config;
    Shio::HttpClient *http_client;
    Shio::ResolutionPipeline *pipeline;
    Shio::PlaybackLauncher *launcher;
    Shio::Session *session;
    Shio::CursesTerminal *terminal;
    Shio::UiController *controller;

    guint sigint_watch;
    guint sigterm_watch;
    bool held;
    int exit_status;
};

G_DEFINE_TYPE(ShioApplication, shio_application, G_TYPE_APPLICATION)

static const GOptionEntry option_entries[] = {
    { "player", 'p', 0, G_OPTION_ARG_STRING, nullptr,
      "Player command template, e.g. \"mpv {url}\"", "TEMPLATE" },
    { "mode", 'm', 0, G_OPTION_ARG_STRING, nullptr,
      "Translation mode: sub, dub or raw", "MODE" },
    { "policy", 0, 0, G_OPTION_ARG_STRING, nullptr,
      "Search policy: first-success or aggregate", "POLICY" },
    { "source", 's', 0, G_OPTION_ARG_STRING_ARRAY, nullptr,
      "Source to query, e.g. allanime:dub (repeatable)", "SOURCE" },
    { "timeout", 't', 0, G_OPTION_ARG_INT, nullptr,
      "Request timeout in seconds", "SECONDS" },
    { "retries", 0, 0, G_OPTION_ARG_INT, nullptr,
      "Retries for transient network failures", "COUNT" },
    { "debug", 'd', 0, G_OPTION_ARG_NONE, nullptr,
      "Write debug messages to the log file", nullptr },
    { "log-file", 0, 0, G_OPTION_ARG_FILENAME, nullptr,
      "Log file path", "PATH" },
    { G_OPTION_REMAINING, 0, 0, G_OPTION_ARG_STRING_ARRAY, nullptr,
      nullptr, "[QUERY...]" },
    { nullptr, 0, 0, G_OPTION_ARG_NONE, nullptr, nullptr, nullptr }
};

static void release_application(ShioApplication *self) {
    if (self->held) {
        self->held = false;
        g_application_release(G_APPLICATION(self));
    }
}

static gboolean on_terminate_signal(gpointer user_data) {
    ShioApplication *self = SHIO_APPLICATION(user_data);
    g_info("[App] Termination signal received");

    if (self->session) {
        // Goes through the controller's quit path and restores the terminal
        self->session->quit();
    } else {
        release_application(self);
    }
    return G_SOURCE_CONTINUE;
}

static gint shio_application_handle_local_options(GApplication *app, GVariantDict *options) {
    ShioApplication *self = SHIO_APPLICATION(app);

    Shio::ConfigLoader loader;
    std::string error;

    const char *log_file = nullptr;
    if (g_variant_dict_lookup(options, "log-file", "^&ay", &log_file)) {
        loader.set_log_file(log_file);
    }
    gboolean debug = g_variant_dict_contains(options, "debug");
    loader.set_debug(debug);

    if (!loader.load_file(Shio::ConfigLoader::get_config_path(), error)) {
        g_printerr("shio: %s\n", error.c_str());
        return 1;
    }

    loader.load_environment();

    const char *player = nullptr;
    if (g_variant_dict_lookup(options, "player", "&s", &player)) {
        loader.set_player_command(player);
    }

    const char *mode = nullptr;
    if (g_variant_dict_lookup(options, "mode", "&s", &mode) && !loader.set_mode(mode, error)) {
        g_printerr("shio: %s\n", error.c_str());
        return 1;
    }

    const char *policy = nullptr;
    if (g_variant_dict_lookup(options, "policy", "&s", &policy) && !loader.set_policy(policy, error)) {
        g_printerr("shio: %s\n", error.c_str());
        return 1;
    }

    g_autofree const char **sources = nullptr;
    if (g_variant_dict_lookup(options, "source", "^a&s", &sources)) {
        std::vector<std::string> list;
        for (const char **it = sources; it && *it; it++) {
            list.push_back(*it);
        }
        loader.set_sources(list);
    }

    gint32 timeout = 0;
    if (g_variant_dict_lookup(options, "timeout", "i", &timeout) && !loader.set_timeout(timeout, error)) {
        g_printerr("shio: %s\n", error.c_str());
        return 1;
    }

    gint32 retries = 0;
    if (g_variant_dict_lookup(options, "retries", "i", &retries) && !loader.set_retries(retries, error)) {
        g_printerr("shio: %s\n", error.c_str());
        return 1;
    }

    g_autofree const char **remaining = nullptr;
    if (g_variant_dict_lookup(options, G_OPTION_REMAINING, "^a&s", &remaining) && remaining) {
        g_autofree gchar *query = g_strjoinv(" ", const_cast<gchar **>(remaining));
        loader.set_initial_query(query);
    }

    auto config = loader.finish(error);
    if (!config) {
        g_printerr("shio: %s\n", error.c_str());
        return 1;
    }

    self->config = new Shio::Config(*config);
    if (!Shio::Logging::init(self->config->log_file, self->config->debug, error)) {
        g_printerr("shio: %s (logging disabled)\n", error.c_str());
    }

    // Continue with default processing, which activates the application
    return -1;
}

static void shio_application_startup(GApplication *app) {
    G_APPLICATION_CLASS(shio_application_parent_class)->startup(app);

    ShioApplication *self = SHIO_APPLICATION(app);

    self->sigint_watch = g_unix_signal_add(SIGINT, on_terminate_signal, self);
    self->sigterm_watch = g_unix_signal_add(SIGTERM, on_terminate_signal, self);
}

static void shio_application_activate(GApplication *app) {
    ShioApplication *self = SHIO_APPLICATION(app);

    if (self->controller) {
        return;
    }
    if (!self->config) {
        self->config = new Shio::Config();
        self->config->player_command = Shio::PlayerCommand::default_template();
        self->config->sources.push_back("allanime:sub");
    }

    const Shio::Config &config = *self->config;

    Shio::Error error;
    auto command = Shio::PlayerCommand::parse(config.player_command, error);
    if (!command) {
        g_printerr("shio: %s\n", error.message.c_str());
        self->exit_status = 1;
        return;
    }

    self->http_client = new Shio::HttpClient(config.timeout_seconds);

    std::vector<std::shared_ptr<Shio::SourceAdapter>> adapters;
    for (const auto &source : config.sources) {
        auto colon = source.find(':');
        std::string mode_name = colon == std::string::npos ? config.mode : source.substr(colon + 1);
        auto mode = AllAnime::mode_from_string(mode_name);
        if (!mode) continue;
        adapters.push_back(std::make_shared<AllAnime::Adapter>(*self->http_client, *mode));
    }

    Shio::PipelineOptions options;
    options.policy = config.policy;
    options.max_retries = config.max_retries;
    options.backoff_ms = config.backoff_ms;

    self->pipeline = new Shio::ResolutionPipeline(std::move(adapters), options);
    self->launcher = new Shio::PlaybackLauncher(std::move(*command));
    self->session = new Shio::Session(*self->pipeline, *self->launcher);
    self->terminal = new Shio::CursesTerminal();
    self->controller = new Shio::UiController(*self->session, *self->terminal);

    self->controller->on_quit([self]() {
        g_info("[App] Quit requested");
        release_application(self);
    });

    if (!self->controller->start(config.initial_query)) {
        g_printerr("shio: an interactive terminal is required\n");
        self->exit_status = 1;
        return;
    }

    g_info("[App] Started with %zu source(s), policy %s",
           self->pipeline->get_adapters().size(), Shio::to_string(config.policy));

    self->held = true;
    g_application_hold(app);
}

static void shio_application_shutdown(GApplication *app) {
    ShioApplication *self = SHIO_APPLICATION(app);

    if (self->sigint_watch) {
        g_source_remove(self->sigint_watch);
        self->sigint_watch = 0;
    }
    if (self->sigterm_watch) {
        g_source_remove(self->sigterm_watch);
        self->sigterm_watch = 0;
    }

    // Tear down in reverse order of construction
    delete self->controller;
    self->controller = nullptr;
    delete self->terminal;
    self->terminal = nullptr;
    delete self->session;
    self->session = nullptr;
    delete self->launcher;
    self->launcher = nullptr;
    delete self->pipeline;
    self->pipeline = nullptr;
    delete self->http_client;
    self->http_client = nullptr;

    Shio::Logging::shutdown();

    G_APPLICATION_CLASS(shio_application_parent_class)->shutdown(app);
}

static void shio_application_finalize(GObject *object) {
    ShioApplication *self = SHIO_APPLICATION(object);

    delete self->config;
    self->config = nullptr;

    G_OBJECT_CLASS(shio_application_parent_class)->finalize(object);
}

static void shio_application_class_init(ShioApplicationClass *klass) {
    GObjectClass *object_class = G_OBJECT_CLASS(klass);
    GApplicationClass *app_class = G_APPLICATION_CLASS(klass);

    object_class->finalize = shio_application_finalize;

    app_class->handle_local_options = shio_application_handle_local_options;
    app_class->activate = shio_application_activate;
    app_class->startup = shio_application_startup;
    app_class->shutdown = shio_application_shutdown;
}

static void shio_application_init(ShioApplication *self) {
    self->config = nullptr;
    self->http_client = nullptr;
    self->pipeline = nullptr;
    self->launcher = nullptr;
    self->session = nullptr;
    self->terminal = nullptr;
    self->controller = nullptr;
    self->sigint_watch = 0;
    self->sigterm_watch = 0;
    self->held = false;
    self->exit_status = 0;

    g_application_add_main_option_entries(G_APPLICATION(self), option_entries);
    g_application_set_option_context_parameter_string(G_APPLICATION(self), "- search and play anime");
}

ShioApplication *shio_application_new(void) {
    return SHIO_APPLICATION(g_object_new(
        SHIO_TYPE_APPLICATION,
        "application-id", "io.github.shio",
        "flags", G_APPLICATION_NON_UNIQUE,
        nullptr
    ));
}

int shio_application_get_exit_status(ShioApplication *app) {
    g_return_val_if_fail(SHIO_IS_APPLICATION(app), 1);
    return app->exit_status;
}
