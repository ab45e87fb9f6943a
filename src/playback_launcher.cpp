#include "playback_launcher.hpp"
#include <gio/gio.h>
#include <glib.h>
#include <cstring>
#include <unistd.h>

namespace Shio {

static const char* PLACEHOLDERS[] = { "url", "user_agent", "referer" };

static bool is_known_placeholder(const std::string& name) {
    for (const char* known : PLACEHOLDERS) {
        if (name == known) return true;
    }
    return false;
}

std::optional<PlayerCommand> PlayerCommand::parse(const std::string& command_template, Error& error) {
    gint argc = 0;
    gchar** argv = nullptr;
    g_autoptr(GError) gerror = nullptr;

    if (!g_shell_parse_argv(command_template.c_str(), &argc, &argv, &gerror)) {
        error = Error::launch_error("malformed player command '" + command_template + "': " +
                                    gerror->message);
        return std::nullopt;
    }

    PlayerCommand command;
    for (gint i = 0; i < argc; i++) {
        command.argv_.emplace_back(argv[i]);
    }
    g_strfreev(argv);

    bool has_url = false;
    for (const auto& arg : command.argv_) {
        size_t pos = 0;
        while ((pos = arg.find('{', pos)) != std::string::npos) {
            size_t end = arg.find('}', pos);
            if (end == std::string::npos) {
                error = Error::launch_error("unterminated placeholder in player command '" +
                                            command_template + "'");
                return std::nullopt;
            }

            std::string name = arg.substr(pos + 1, end - pos - 1);
            if (!is_known_placeholder(name)) {
                error = Error::launch_error("unknown placeholder {" + name + "} in player command");
                return std::nullopt;
            }
            if (name == "url") has_url = true;
            pos = end + 1;
        }
    }

    if (!has_url) {
        error = Error::launch_error("player command '" + command_template +
                                    "' has no {url} placeholder");
        return std::nullopt;
    }

    // The program itself must be a literal
    if (command.argv_.front().find('{') != std::string::npos) {
        error = Error::launch_error("player command must start with a program name");
        return std::nullopt;
    }

    return command;
}

std::string PlayerCommand::default_template() {
    const char* prefix = g_getenv("PREFIX");
    if (prefix) {
        g_autofree gchar* lower = g_ascii_strdown(prefix, -1);
        if (strstr(lower, "termux")) {
            return "termux-open {url} --content-type video";
        }
    }
    return "mpv {url}";
}

std::string PlayerCommand::substitute(const std::string& arg, const StreamDescriptor& descriptor) {
    std::string out;
    size_t pos = 0;

    while (pos < arg.size()) {
        size_t open = arg.find('{', pos);
        if (open == std::string::npos) {
            out.append(arg, pos, std::string::npos);
            break;
        }
        size_t close = arg.find('}', open);
        out.append(arg, pos, open - pos);

        std::string name = arg.substr(open + 1, close - open - 1);
        if (name == "url") {
            out += descriptor.url;
        } else if (name == "user_agent") {
            out += descriptor.user_agent.value_or("");
        } else if (name == "referer") {
            out += descriptor.referer.value_or("");
        }
        pos = close + 1;
    }

    return out;
}

std::vector<std::string> PlayerCommand::expand(const StreamDescriptor& descriptor) const {
    std::vector<std::string> result;
    result.reserve(argv_.size());

    for (const auto& arg : argv_) {
        std::string value = substitute(arg, descriptor);
        if (value.empty() && !arg.empty()) {
            continue;
        }
        result.push_back(std::move(value));
    }
    return result;
}

std::string PlayerCommand::expand_to_string(const StreamDescriptor& descriptor) const {
    std::string line;
    for (const auto& arg : expand(descriptor)) {
        if (!line.empty()) line += " ";
        line += arg;
    }
    return line;
}

PlaybackLauncher::PlaybackLauncher(PlayerCommand command) : command_(std::move(command)) {
}

std::optional<PlayerProcess> PlaybackLauncher::launch(const StreamDescriptor& descriptor, Error& error) {
    std::vector<std::string> args = command_.expand(descriptor);
    if (args.empty()) {
        error = Error::launch_error("player command is empty");
        return std::nullopt;
    }

    g_autofree gchar* program = g_find_program_in_path(args.front().c_str());
    if (!program) {
        error = Error::launch_error("executable not found: " + args.front());
        return std::nullopt;
    }

    std::vector<const gchar*> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(program);
    for (size_t i = 1; i < args.size(); i++) {
        argv.push_back(args[i].c_str());
    }
    argv.push_back(nullptr);

    // Player output would corrupt the curses screen
    g_autoptr(GSubprocessLauncher) launcher = g_subprocess_launcher_new(
        static_cast<GSubprocessFlags>(G_SUBPROCESS_FLAGS_STDOUT_SILENCE |
                                      G_SUBPROCESS_FLAGS_STDERR_SILENCE));
    // New session so the player outlives us and ignores our terminal signals
    g_subprocess_launcher_set_child_setup(launcher,
        []([[maybe_unused]] gpointer user_data) { setsid(); },
        nullptr, nullptr);

    g_autoptr(GError) gerror = nullptr;
    GSubprocess* process = g_subprocess_launcher_spawnv(launcher, argv.data(), &gerror);
    if (!process) {
        error = Error::launch_error(gerror->message);
        return std::nullopt;
    }

    PlayerProcess result;
    const gchar* identifier = g_subprocess_get_identifier(process);
    result.identifier = identifier ? identifier : "";
    result.command_line = command_.expand_to_string(descriptor);

    g_info("[Player] Started %s (pid %s)", args.front().c_str(), result.identifier.c_str());

    // Reap the child when it exits; the callback owns the last reference
    g_subprocess_wait_async(process, nullptr,
        [](GObject* source, GAsyncResult* res, [[maybe_unused]] gpointer user_data) {
            g_autoptr(GError) wait_error = nullptr;
            if (!g_subprocess_wait_finish(G_SUBPROCESS(source), res, &wait_error)) {
                g_debug("[Player] Wait failed: %s", wait_error->message);
            }
            g_object_unref(source);
        },
        nullptr);

    return result;
}

std::optional<PlayerProcess> PlaybackLauncher::launch(const StreamDescriptor& descriptor,
                                                      const std::string& command_template,
                                                      Error& error) {
    auto command = PlayerCommand::parse(command_template, error);
    if (!command) {
        return std::nullopt;
    }
    PlaybackLauncher launcher(std::move(*command));
    return launcher.launch(descriptor, error);
}

} // namespace Shio
