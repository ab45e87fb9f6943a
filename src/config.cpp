#include "config.hpp"
#include "allanime/allanime_adapter.hpp"
#include "playback_launcher.hpp"
#include <json-glib/json-glib.h>
#include <glib.h>

namespace Shio {

namespace {

bool holds_string(JsonNode* node) {
    return JSON_NODE_HOLDS_VALUE(node) && json_node_get_value_type(node) == G_TYPE_STRING;
}

bool get_string_member(JsonObject* obj, const char* key, std::string& out, std::string& error) {
    JsonNode* node = json_object_get_member(obj, key);
    if (!holds_string(node)) {
        error = std::string("'") + key + "' must be a string";
        return false;
    }
    out = json_node_get_string(node);
    return true;
}

bool get_int_member(JsonObject* obj, const char* key, gint64& out, std::string& error) {
    JsonNode* node = json_object_get_member(obj, key);
    if (!JSON_NODE_HOLDS_VALUE(node) || json_node_get_value_type(node) != G_TYPE_INT64) {
        error = std::string("'") + key + "' must be an integer";
        return false;
    }
    out = json_node_get_int(node);
    return true;
}

} // namespace

ConfigLoader::ConfigLoader() {
    config_.player_command = PlayerCommand::default_template();
    config_.log_file = get_default_log_path();
}

std::string ConfigLoader::get_config_path() {
    const char* config_dir = g_get_user_config_dir();
    return std::string(config_dir) + "/shio/config.json";
}

std::string ConfigLoader::get_default_log_path() {
    const char* cache_dir = g_get_user_cache_dir();
    return std::string(cache_dir) + "/shio/shio.log";
}

bool ConfigLoader::load_file(const std::string& path, std::string& error) {
    if (!g_file_test(path.c_str(), G_FILE_TEST_EXISTS)) {
        g_debug("[Config] No config file at %s", path.c_str());
        return true;
    }

    g_autoptr(JsonParser) parser = json_parser_new();
    g_autoptr(GError) gerror = nullptr;

    if (!json_parser_load_from_file(parser, path.c_str(), &gerror)) {
        error = "Failed to load " + path + ": " + gerror->message;
        return false;
    }

    JsonNode* root = json_parser_get_root(parser);
    if (!root || !JSON_NODE_HOLDS_OBJECT(root)) {
        error = "Invalid config format in " + path + ": expected an object";
        return false;
    }

    JsonObject* obj = json_node_get_object(root);

    std::string text;
    gint64 number = 0;

    if (json_object_has_member(obj, "player")) {
        if (!get_string_member(obj, "player", text, error)) return false;
        config_.player_command = text;
    }
    if (json_object_has_member(obj, "mode")) {
        if (!get_string_member(obj, "mode", text, error)) return false;
        if (!set_mode(text, error)) return false;
    }
    if (json_object_has_member(obj, "policy")) {
        if (!get_string_member(obj, "policy", text, error)) return false;
        if (!set_policy(text, error)) return false;
    }
    if (json_object_has_member(obj, "sources")) {
        JsonNode* node = json_object_get_member(obj, "sources");
        if (!JSON_NODE_HOLDS_ARRAY(node)) {
            error = "'sources' must be an array of strings";
            return false;
        }
        std::vector<std::string> sources;
        JsonArray* arr = json_node_get_array(node);
        guint len = json_array_get_length(arr);
        for (guint i = 0; i < len; i++) {
            JsonNode* elem = json_array_get_element(arr, i);
            if (!holds_string(elem)) {
                error = "'sources' must be an array of strings";
                return false;
            }
            sources.push_back(json_node_get_string(elem));
        }
        config_.sources = std::move(sources);
    }
    if (json_object_has_member(obj, "timeout")) {
        if (!get_int_member(obj, "timeout", number, error)) return false;
        number = CLAMP(number, G_MININT, G_MAXINT);
        if (!set_timeout(static_cast<int>(number), error)) return false;
    }
    if (json_object_has_member(obj, "retries")) {
        if (!get_int_member(obj, "retries", number, error)) return false;
        number = CLAMP(number, G_MININT, G_MAXINT);
        if (!set_retries(static_cast<int>(number), error)) return false;
    }

    g_info("[Config] Loaded %s", path.c_str());
    return true;
}

void ConfigLoader::load_environment() {
    const char* player = g_getenv("SHIO_PLAYER_CMD");
    if (player && *player) {
        config_.player_command = player;
    }
}

void ConfigLoader::set_player_command(const std::string& command) {
    config_.player_command = command;
}

bool ConfigLoader::set_mode(const std::string& mode, std::string& error) {
    if (!AllAnime::mode_from_string(mode)) {
        error = "Unknown mode '" + mode + "' (expected sub, dub or raw)";
        return false;
    }
    config_.mode = mode;
    return true;
}

bool ConfigLoader::set_policy(const std::string& policy, std::string& error) {
    auto parsed = search_policy_from_string(policy);
    if (!parsed) {
        error = "Unknown search policy '" + policy + "' (expected first-success or aggregate)";
        return false;
    }
    config_.policy = *parsed;
    return true;
}

void ConfigLoader::set_sources(const std::vector<std::string>& sources) {
    config_.sources = sources;
}

bool ConfigLoader::set_timeout(int seconds, std::string& error) {
    if (seconds <= 0) {
        error = "Timeout must be a positive number of seconds";
        return false;
    }
    config_.timeout_seconds = static_cast<unsigned int>(seconds);
    return true;
}

bool ConfigLoader::set_retries(int retries, std::string& error) {
    if (retries < 0) {
        error = "Retries must not be negative";
        return false;
    }
    config_.max_retries = retries;
    return true;
}

void ConfigLoader::set_debug(bool debug) {
    config_.debug = debug;
}

void ConfigLoader::set_log_file(const std::string& path) {
    config_.log_file = path;
}

void ConfigLoader::set_initial_query(const std::string& query) {
    config_.initial_query = query;
}

std::optional<Config> ConfigLoader::finish(std::string& error) const {
    Config config = config_;

    Error template_error;
    if (!PlayerCommand::parse(config.player_command, template_error)) {
        error = template_error.message;
        return std::nullopt;
    }

    if (config.sources.empty()) {
        config.sources.push_back("allanime:" + config.mode);
    }

    for (const auto& source : config.sources) {
        // "<backend>:<mode>"; only the AllAnime backend exists
        auto colon = source.find(':');
        std::string backend = source.substr(0, colon);
        std::string mode = colon == std::string::npos ? config.mode : source.substr(colon + 1);
        if (backend != "allanime" || !AllAnime::mode_from_string(mode)) {
            error = "Unknown source '" + source + "'";
            return std::nullopt;
        }
    }

    return config;
}

} // namespace Shio
