#include "allanime_adapter.hpp"
#include <json-glib/json-glib.h>
#include <glib.h>
#include <vector>

namespace AllAnime {

using Shio::Error;

static const char* ALLANIME_API_URL = "https://api.allanime.day/api";
static const char* ALLANIME_REFERER = "https://allmanga.to";
static const char* ALLANIME_USER_AGENT =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) Gecko/20100101 Firefox/121.0";

static const char* SEARCH_GQL =
    "query( $search: SearchInput $limit: Int $page: Int "
    "$translationType: VaildTranslationTypeEnumType $countryOrigin: VaildCountryOriginEnumType ) "
    "{ shows( search: $search limit: $limit page: $page translationType: $translationType "
    "countryOrigin: $countryOrigin ) { edges { _id name englishName availableEpisodes __typename } }}";

static const char* EPISODE_LIST_GQL =
    "query ($showId: String!) { show( _id: $showId ) { _id name availableEpisodesDetail }}";

static const char* EPISODE_GQL =
    "query ($showId: String!, $translationType: VaildTranslationTypeEnumType!, "
    "$episodeString: String!) { episode( showId: $showId translationType: $translationType "
    "episodeString: $episodeString ) { episodeString sourceUrls }}";

// Serialize GraphQL variables with json-glib so user input is escaped properly
static std::string build_variables(JsonBuilder* builder) {
    g_autoptr(JsonNode) root = json_builder_get_root(builder);
    g_autoptr(JsonGenerator) gen = json_generator_new();
    json_generator_set_root(gen, root);
    g_autofree gchar* data = json_generator_to_data(gen, nullptr);
    return data ? data : "{}";
}

const char* to_string(Mode mode) {
    switch (mode) {
        case Mode::Sub: return "sub";
        case Mode::Dub: return "dub";
        case Mode::Raw: return "raw";
    }
    return "sub";
}

std::optional<Mode> mode_from_string(const std::string& value) {
    if (value == "sub") return Mode::Sub;
    if (value == "dub") return Mode::Dub;
    if (value == "raw") return Mode::Raw;
    return std::nullopt;
}

struct Adapter::ResolveState {
    std::string anime_id;
    std::string episode;
    std::vector<SourceUrl> sources;   // decoded, in response order
    GCancellable* cancellable = nullptr;
    Shio::StreamCallback callback;
    Error last_error;

    ~ResolveState() {
        if (cancellable) g_object_unref(cancellable);
    }
};

Adapter::Adapter(Shio::Transport& transport, Mode mode)
    : transport_(transport)
    , mode_(mode)
    , id_(std::string("allanime:") + to_string(mode)) {
}

const std::string& Adapter::id() const {
    return id_;
}

const char* Adapter::user_agent() {
    return ALLANIME_USER_AGENT;
}

const char* Adapter::referer() {
    return ALLANIME_REFERER;
}

Shio::HttpRequest Adapter::build_api_request(const std::string& variables, const char* gql) const {
    Shio::HttpRequest request;
    request.url = ALLANIME_API_URL;
    request.query.emplace_back("variables", variables);
    request.query.emplace_back("query", gql);
    request.headers["Referer"] = ALLANIME_REFERER;
    request.headers["User-Agent"] = ALLANIME_USER_AGENT;
    return request;
}

void Adapter::search(const std::string& query, GCancellable* cancellable,
                     Shio::SearchCallback callback) {
    g_autoptr(JsonBuilder) builder = json_builder_new();
    json_builder_begin_object(builder);

    json_builder_set_member_name(builder, "search");
    json_builder_begin_object(builder);
    json_builder_set_member_name(builder, "allowAdult");
    json_builder_add_boolean_value(builder, FALSE);
    json_builder_set_member_name(builder, "allowUnknown");
    json_builder_add_boolean_value(builder, FALSE);
    json_builder_set_member_name(builder, "query");
    json_builder_add_string_value(builder, query.c_str());
    json_builder_end_object(builder);

    json_builder_set_member_name(builder, "limit");
    json_builder_add_int_value(builder, 40);
    json_builder_set_member_name(builder, "page");
    json_builder_add_int_value(builder, 1);
    json_builder_set_member_name(builder, "translationType");
    json_builder_add_string_value(builder, to_string(mode_));
    json_builder_set_member_name(builder, "countryOrigin");
    json_builder_add_string_value(builder, "ALL");

    json_builder_end_object(builder);

    auto request = build_api_request(build_variables(builder), SEARCH_GQL);
    std::string mode = to_string(mode_);

    transport_.fetch(request, cancellable,
        [this, callback, mode, query](std::optional<Shio::HttpResponse> response, const Error& error) {
            if (!response) {
                callback(std::nullopt, error);
                return;
            }

            Error parse_error;
            auto results = Parser::parse_search(response->body, id_, mode, parse_error);
            if (!results) {
                callback(std::nullopt, parse_error);
                return;
            }

            g_debug("[AllAnime] %zu results for '%s' (%s)", results->size(), query.c_str(), mode.c_str());
            callback(std::move(results), Error{});
        });
}

void Adapter::list_episodes(const std::string& anime_id, GCancellable* cancellable,
                            Shio::EpisodesCallback callback) {
    g_autoptr(JsonBuilder) builder = json_builder_new();
    json_builder_begin_object(builder);
    json_builder_set_member_name(builder, "showId");
    json_builder_add_string_value(builder, anime_id.c_str());
    json_builder_end_object(builder);

    auto request = build_api_request(build_variables(builder), EPISODE_LIST_GQL);
    std::string mode = to_string(mode_);

    transport_.fetch(request, cancellable,
        [this, callback, mode, anime_id](std::optional<Shio::HttpResponse> response, const Error& error) {
            if (!response) {
                callback(std::nullopt, error);
                return;
            }

            Error parse_error;
            auto labels = Parser::parse_episode_list(response->body, mode, parse_error);
            if (!labels) {
                callback(std::nullopt, parse_error);
                return;
            }

            std::vector<Shio::EpisodeRef> episodes;
            episodes.reserve(labels->size());
            for (const auto& label : *labels) {
                Shio::EpisodeRef episode;
                episode.adapter_id = id_;
                episode.anime_id = anime_id;
                episode.number = label;
                episodes.push_back(std::move(episode));
            }

            callback(std::move(episodes), Error{});
        });
}

void Adapter::resolve_stream(const std::string& anime_id, const Shio::EpisodeRef& episode,
                             GCancellable* cancellable, Shio::StreamCallback callback) {
    g_autoptr(JsonBuilder) builder = json_builder_new();
    json_builder_begin_object(builder);
    json_builder_set_member_name(builder, "showId");
    json_builder_add_string_value(builder, anime_id.c_str());
    json_builder_set_member_name(builder, "translationType");
    json_builder_add_string_value(builder, to_string(mode_));
    json_builder_set_member_name(builder, "episodeString");
    json_builder_add_string_value(builder, episode.number.c_str());
    json_builder_end_object(builder);

    auto request = build_api_request(build_variables(builder), EPISODE_GQL);

    auto state = std::make_shared<ResolveState>();
    state->anime_id = anime_id;
    state->episode = episode.number;
    state->cancellable = cancellable ? G_CANCELLABLE(g_object_ref(cancellable)) : nullptr;
    state->callback = std::move(callback);

    transport_.fetch(request, cancellable,
        [this, state](std::optional<Shio::HttpResponse> response, const Error& error) {
            if (!response) {
                state->callback(std::nullopt, error);
                return;
            }

            Error parse_error;
            auto parsed = Parser::parse_episode_sources(response->body, parse_error);
            if (!parsed) {
                state->callback(std::nullopt, parse_error);
                return;
            }

            for (const auto& source : parsed->sources) {
                SourceUrl decoded;
                decoded.name = source.name;
                decoded.url = Parser::decode_source_url(source.url);
                if (decoded.url.empty()) {
                    g_debug("[AllAnime] Dropping undecodable source %s", source.name.c_str());
                    continue;
                }
                state->sources.push_back(std::move(decoded));
            }

            if (state->sources.empty()) {
                state->callback(std::nullopt, Error::not_found(
                    "no sources for episode " + state->episode));
                return;
            }

            try_sources(state, 0);
        });
}

void Adapter::try_sources(std::shared_ptr<ResolveState> state, size_t index) {
    // Prefer sources served through clock.json, they yield direct media links
    for (; index < state->sources.size(); index++) {
        if (state->sources[index].url.find("clock.json") != std::string::npos) {
            break;
        }
    }

    if (index >= state->sources.size()) {
        for (const auto& source : state->sources) {
            if (source.url.find("clock.json") == std::string::npos &&
                source.url.rfind("http", 0) == 0) {
                g_info("[AllAnime] No direct source for episode %s, using %s embed",
                       state->episode.c_str(), source.name.c_str());
                state->callback(make_descriptor(source.url, source.name), Error{});
                return;
            }
        }

        if (state->last_error) {
            state->callback(std::nullopt, state->last_error);
        } else {
            state->callback(std::nullopt, Error::not_found(
                "no playable source for episode " + state->episode));
        }
        return;
    }

    const SourceUrl& source = state->sources[index];

    Shio::HttpRequest request;
    request.url = source.url;
    request.headers["Referer"] = ALLANIME_REFERER;
    request.headers["User-Agent"] = ALLANIME_USER_AGENT;

    transport_.fetch(request, state->cancellable,
        [this, state, index](std::optional<Shio::HttpResponse> response, const Error& error) {
            if (error.is_cancelled()) {
                state->callback(std::nullopt, error);
                return;
            }

            const SourceUrl& source = state->sources[index];
            if (response) {
                Error parse_error;
                auto link = Parser::parse_clock_link(response->body, parse_error);
                if (link) {
                    state->callback(make_descriptor(*link, source.name), Error{});
                    return;
                }
                state->last_error = parse_error;
            } else {
                state->last_error = error;
            }

            g_info("[AllAnime] Source %s failed: %s", source.name.c_str(),
                   state->last_error.describe().c_str());
            try_sources(state, index + 1);
        });
}

Shio::StreamDescriptor Adapter::make_descriptor(const std::string& url, const std::string& provider) const {
    Shio::StreamDescriptor descriptor;
    descriptor.url = url;
    descriptor.user_agent = ALLANIME_USER_AGENT;
    descriptor.referer = ALLANIME_REFERER;
    if (!provider.empty()) {
        descriptor.provider = provider;
    }
    return descriptor;
}

} // namespace AllAnime
