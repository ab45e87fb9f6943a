#pragma once

#include "source/resolution_pipeline.hpp"
#include <optional>
#include <string>
#include <vector>

namespace Shio {

/**
 * Startup configuration. Read once; no hot reload.
 */
struct Config {
    std::string player_command;
    std::string mode = "sub";
    SearchPolicy policy = SearchPolicy::FirstSuccess;
    std::vector<std::string> sources;   // e.g. "allanime:sub"; defaults to allanime:<mode>
    unsigned int timeout_seconds = 12;
    int max_retries = 2;
    unsigned int backoff_ms = 250;
    bool debug = false;
    std::string log_file;
    std::string initial_query;
};

/**
 * Builds a Config from defaults, the optional JSON config file,
 * SHIO_PLAYER_CMD and command line options (in that order of precedence).
 */
class ConfigLoader {
public:
    ConfigLoader();

    /**
     * Default location: $XDG_CONFIG_HOME/shio/config.json
     */
    static std::string get_config_path();

    /**
     * Default log file: $XDG_CACHE_HOME/shio/shio.log
     */
    static std::string get_default_log_path();

    /**
     * Merge a JSON config file. A missing file is not an error.
     * @return false with error set if the file exists but is invalid
     */
    bool load_file(const std::string& path, std::string& error);

    /**
     * Apply SHIO_PLAYER_CMD if set
     */
    void load_environment();

    void set_player_command(const std::string& command);
    bool set_mode(const std::string& mode, std::string& error);
    bool set_policy(const std::string& policy, std::string& error);
    void set_sources(const std::vector<std::string>& sources);
    bool set_timeout(int seconds, std::string& error);
    bool set_retries(int retries, std::string& error);
    void set_debug(bool debug);
    void set_log_file(const std::string& path);
    void set_initial_query(const std::string& query);

    /**
     * Final validation: player template and source list.
     * @return the config, or std::nullopt with error set
     */
    std::optional<Config> finish(std::string& error) const;

private:
    Config config_;
};

} // namespace Shio
