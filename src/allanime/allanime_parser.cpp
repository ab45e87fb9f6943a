#include "allanime_parser.hpp"
#include <glib.h>
#include <algorithm>
#include <cmath>

namespace AllAnime {

using Shio::Error;

static const char* ALLANIME_BASE = "https://allanime.day";

std::string Parser::get_string(JsonObject* obj, const char* member) {
    if (!json_object_has_member(obj, member)) return "";
    JsonNode* node = json_object_get_member(obj, member);
    if (json_node_get_node_type(node) != JSON_NODE_VALUE) return "";
    if (json_node_get_value_type(node) != G_TYPE_STRING) return "";
    return json_node_get_string(node) ? json_node_get_string(node) : "";
}

std::optional<std::string> Parser::get_optional_string(JsonObject* obj, const char* member) {
    std::string value = get_string(obj, member);
    if (value.empty()) return std::nullopt;
    return value;
}

JsonObject* Parser::get_object(JsonObject* obj, const char* member) {
    if (!obj || !json_object_has_member(obj, member)) return nullptr;
    JsonNode* node = json_object_get_member(obj, member);
    if (json_node_get_node_type(node) != JSON_NODE_OBJECT) return nullptr;
    return json_node_get_object(node);
}

JsonObject* Parser::load_data_object(JsonParser* parser, const std::string& json,
                                     const char* what, Error& error) {
    g_autoptr(GError) gerror = nullptr;

    if (!json_parser_load_from_data(parser, json.c_str(), json.length(), &gerror)) {
        g_warning("[AllAnime] Failed to parse %s JSON: %s", what, gerror->message);
        error = Error::parse_error(std::string("malformed ") + what + " response");
        return nullptr;
    }

    JsonNode* root = json_parser_get_root(parser);
    if (!root || json_node_get_node_type(root) != JSON_NODE_OBJECT) {
        error = Error::parse_error(std::string("unexpected ") + what + " response");
        return nullptr;
    }

    JsonObject* obj = json_node_get_object(root);
    JsonObject* data = get_object(obj, "data");
    if (!data) {
        // GraphQL reports failures in "errors" with "data" absent or null
        std::string message = std::string("no data in ") + what + " response";
        if (json_object_has_member(obj, "errors")) {
            JsonNode* errors_node = json_object_get_member(obj, "errors");
            if (json_node_get_node_type(errors_node) == JSON_NODE_ARRAY) {
                JsonArray* errors = json_node_get_array(errors_node);
                if (json_array_get_length(errors) > 0) {
                    JsonNode* first = json_array_get_element(errors, 0);
                    if (json_node_get_node_type(first) == JSON_NODE_OBJECT) {
                        std::string m = get_string(json_node_get_object(first), "message");
                        if (!m.empty()) message = m;
                    }
                }
            }
        }
        error = Error::parse_error(message);
        return nullptr;
    }

    return data;
}

std::optional<std::vector<Shio::SearchResult>> Parser::parse_search(
    const std::string& json, const std::string& adapter_id,
    const std::string& mode, Error& error) {
    g_autoptr(JsonParser) parser = json_parser_new();

    JsonObject* data = load_data_object(parser, json, "search", error);
    if (!data) return std::nullopt;

    JsonObject* shows = get_object(data, "shows");
    if (!shows || !json_object_has_member(shows, "edges")) {
        error = Error::parse_error("search response has no shows");
        return std::nullopt;
    }

    JsonNode* edges_node = json_object_get_member(shows, "edges");
    if (json_node_get_node_type(edges_node) != JSON_NODE_ARRAY) {
        error = Error::parse_error("search response has no shows");
        return std::nullopt;
    }

    std::vector<Shio::SearchResult> results;
    JsonArray* edges = json_node_get_array(edges_node);
    guint len = json_array_get_length(edges);

    for (guint i = 0; i < len; i++) {
        JsonNode* edge_node = json_array_get_element(edges, i);
        if (json_node_get_node_type(edge_node) != JSON_NODE_OBJECT) continue;
        JsonObject* edge = json_node_get_object(edge_node);

        Shio::SearchResult result;
        result.adapter_id = adapter_id;
        result.id = get_string(edge, "_id");
        result.title = get_string(edge, "name");
        if (result.id.empty() || result.title.empty()) {
            g_debug("[AllAnime] Skipping search edge %u without id or name", i);
            continue;
        }
        result.english_title = get_optional_string(edge, "englishName");

        JsonObject* available = get_object(edge, "availableEpisodes");
        if (available && json_object_has_member(available, mode.c_str())) {
            JsonNode* count = json_object_get_member(available, mode.c_str());
            if (json_node_get_node_type(count) == JSON_NODE_VALUE &&
                json_node_get_value_type(count) == G_TYPE_INT64) {
                result.episode_count = static_cast<int>(json_node_get_int(count));
            }
        }

        results.push_back(std::move(result));
    }

    return results;
}

void Parser::sort_episode_labels(std::vector<std::string>& labels) {
    auto number = [](const std::string& label) {
        char* end = nullptr;
        double value = g_ascii_strtod(label.c_str(), &end);
        if (end == label.c_str() || *end != '\0' || !std::isfinite(value)) return 0.0;
        return value;
    };

    std::stable_sort(labels.begin(), labels.end(),
                     [&number](const std::string& a, const std::string& b) {
                         return number(a) < number(b);
                     });
}

std::optional<std::vector<std::string>> Parser::parse_episode_list(
    const std::string& json, const std::string& mode, Error& error) {
    g_autoptr(JsonParser) parser = json_parser_new();

    JsonObject* data = load_data_object(parser, json, "episode list", error);
    if (!data) return std::nullopt;

    JsonObject* show = get_object(data, "show");
    if (!show) {
        error = Error::not_found("show does not exist");
        return std::nullopt;
    }

    JsonObject* detail = get_object(show, "availableEpisodesDetail");
    if (!detail || !json_object_has_member(detail, mode.c_str())) {
        error = Error::not_found("no episodes found for mode '" + mode + "'");
        return std::nullopt;
    }

    JsonNode* list_node = json_object_get_member(detail, mode.c_str());
    if (json_node_get_node_type(list_node) != JSON_NODE_ARRAY) {
        error = Error::parse_error("episode list is not an array");
        return std::nullopt;
    }

    std::vector<std::string> labels;
    JsonArray* list = json_node_get_array(list_node);
    guint len = json_array_get_length(list);
    for (guint i = 0; i < len; i++) {
        JsonNode* elem = json_array_get_element(list, i);
        if (json_node_get_node_type(elem) == JSON_NODE_VALUE) {
            const char* str = json_node_get_string(elem);
            if (str) labels.push_back(str);
        }
    }

    if (labels.empty()) {
        error = Error::not_found("no episodes found for mode '" + mode + "'");
        return std::nullopt;
    }

    sort_episode_labels(labels);
    return labels;
}

std::optional<EpisodeSources> Parser::parse_episode_sources(const std::string& json, Error& error) {
    g_autoptr(JsonParser) parser = json_parser_new();

    JsonObject* data = load_data_object(parser, json, "episode", error);
    if (!data) return std::nullopt;

    JsonObject* episode = get_object(data, "episode");
    if (!episode) {
        error = Error::not_found("episode does not exist");
        return std::nullopt;
    }

    EpisodeSources result;
    result.episode_string = get_string(episode, "episodeString");

    if (json_object_has_member(episode, "sourceUrls")) {
        JsonNode* urls_node = json_object_get_member(episode, "sourceUrls");
        if (json_node_get_node_type(urls_node) == JSON_NODE_ARRAY) {
            JsonArray* urls = json_node_get_array(urls_node);
            guint len = json_array_get_length(urls);
            for (guint i = 0; i < len; i++) {
                JsonNode* url_node = json_array_get_element(urls, i);
                if (json_node_get_node_type(url_node) != JSON_NODE_OBJECT) continue;
                JsonObject* obj = json_node_get_object(url_node);

                SourceUrl source;
                source.name = get_string(obj, "sourceName");
                source.url = get_string(obj, "sourceUrl");
                if (!source.url.empty()) {
                    result.sources.push_back(std::move(source));
                }
            }
        }
    }

    return result;
}

std::optional<std::string> Parser::parse_clock_link(const std::string& json, Error& error) {
    g_autoptr(JsonParser) parser = json_parser_new();
    g_autoptr(GError) gerror = nullptr;

    if (!json_parser_load_from_data(parser, json.c_str(), json.length(), &gerror)) {
        g_warning("[AllAnime] Failed to parse clock JSON: %s", gerror->message);
        error = Error::parse_error("malformed clock.json response");
        return std::nullopt;
    }

    JsonNode* root = json_parser_get_root(parser);
    if (root && json_node_get_node_type(root) == JSON_NODE_OBJECT) {
        JsonObject* obj = json_node_get_object(root);
        if (json_object_has_member(obj, "links")) {
            JsonNode* links_node = json_object_get_member(obj, "links");
            if (json_node_get_node_type(links_node) == JSON_NODE_ARRAY) {
                JsonArray* links = json_node_get_array(links_node);
                if (json_array_get_length(links) > 0) {
                    JsonNode* first = json_array_get_element(links, 0);
                    if (json_node_get_node_type(first) == JSON_NODE_OBJECT) {
                        std::string link = get_string(json_node_get_object(first), "link");
                        if (!link.empty()) return link;
                    }
                }
            }
        }
    }

    error = Error::parse_error("could not find 'link' field in clock.json response");
    return std::nullopt;
}

std::string Parser::decrypt(const std::string& hex) {
    if (hex.size() % 2 != 0) return "";

    std::string out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = g_ascii_xdigit_value(hex[i]);
        int lo = g_ascii_xdigit_value(hex[i + 1]);
        if (hi < 0 || lo < 0) return "";
        out.push_back(static_cast<char>(((hi << 4) | lo) ^ 56));
    }
    return out;
}

std::string Parser::decode_source_url(const std::string& raw) {
    std::string uri;
    if (raw.rfind("--", 0) == 0) {
        uri = decrypt(raw.substr(2));
    } else if (raw.rfind("//", 0) == 0) {
        uri = "https:" + raw;
    } else {
        uri = raw;
    }

    size_t clock = uri.find("/clock");
    if (clock != std::string::npos && uri.find("/clock.json") == std::string::npos) {
        uri.replace(clock, 6, "/clock.json");
    }

    if (uri.rfind("/apivtwo/", 0) == 0) {
        uri = ALLANIME_BASE + uri;
    }

    return uri;
}

} // namespace AllAnime
