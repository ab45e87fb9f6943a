#pragma once

#include "../source/source_types.hpp"
#include <json-glib/json-glib.h>
#include <optional>
#include <string>
#include <vector>

namespace AllAnime {

/**
 * Raw entry of an episode's "sourceUrls" array
 */
struct SourceUrl {
    std::string name;
    std::string url;
};

struct EpisodeSources {
    std::string episode_string;
    std::vector<SourceUrl> sources;
};

/**
 * JSON parser for AllAnime GraphQL responses.
 * Parsers return std::nullopt and fill error on failure.
 */
class Parser {
public:
    /**
     * Parse a "shows" search response into results tagged with adapter_id.
     * episode_count is taken from availableEpisodes[mode].
     */
    static std::optional<std::vector<Shio::SearchResult>> parse_search(
        const std::string& json, const std::string& adapter_id,
        const std::string& mode, Shio::Error& error);

    /**
     * Parse a "show" response into the episode labels available for mode,
     * sorted in ascending numeric order
     */
    static std::optional<std::vector<std::string>> parse_episode_list(
        const std::string& json, const std::string& mode, Shio::Error& error);

    /**
     * Parse an "episode" response into its source URLs (still encoded)
     */
    static std::optional<EpisodeSources> parse_episode_sources(
        const std::string& json, Shio::Error& error);

    /**
     * Extract links[0].link from a clock.json response
     */
    static std::optional<std::string> parse_clock_link(const std::string& json, Shio::Error& error);

    /**
     * Turn an obfuscated/relative source URL into an absolute one.
     * "--" prefixed values are hex encoded with every byte XORed with 56.
     */
    static std::string decode_source_url(const std::string& raw);

    /**
     * Hex decode + XOR 56. Returns an empty string on malformed input.
     */
    static std::string decrypt(const std::string& hex);

    /**
     * Stable numeric sort of episode labels; unparsable labels count as 0
     */
    static void sort_episode_labels(std::vector<std::string>& labels);

private:
    static JsonObject* load_data_object(JsonParser* parser, const std::string& json,
                                        const char* what, Shio::Error& error);
    static std::string get_string(JsonObject* obj, const char* member);
    static std::optional<std::string> get_optional_string(JsonObject* obj, const char* member);
    static JsonObject* get_object(JsonObject* obj, const char* member);
};

} // namespace AllAnime
