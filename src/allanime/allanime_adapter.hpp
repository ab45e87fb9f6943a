#pragma once

#include "../source/http_client.hpp"
#include "../source/source_adapter.hpp"
#include "allanime_parser.hpp"
#include <memory>
#include <optional>
#include <string>

namespace AllAnime {

enum class Mode {
    Sub,
    Dub,
    Raw,
};

const char* to_string(Mode mode);
std::optional<Mode> mode_from_string(const std::string& value);

/**
 * Source adapter for the AllAnime GraphQL API.
 * One instance serves one translation type; its id is "allanime:<mode>".
 */
class Adapter : public Shio::SourceAdapter {
public:
    Adapter(Shio::Transport& transport, Mode mode);

    const std::string& id() const override;

    void search(const std::string& query, GCancellable* cancellable,
                Shio::SearchCallback callback) override;

    void list_episodes(const std::string& anime_id, GCancellable* cancellable,
                       Shio::EpisodesCallback callback) override;

    void resolve_stream(const std::string& anime_id, const Shio::EpisodeRef& episode,
                        GCancellable* cancellable, Shio::StreamCallback callback) override;

    static const char* user_agent();
    static const char* referer();

private:
    struct ResolveState;

    Shio::Transport& transport_;
    Mode mode_;
    std::string id_;

    Shio::HttpRequest build_api_request(const std::string& variables, const char* gql) const;

    // Walk the decoded sources in order until one yields a playable URL
    void try_sources(std::shared_ptr<ResolveState> state, size_t index);
    Shio::StreamDescriptor make_descriptor(const std::string& url, const std::string& provider) const;
};

} // namespace AllAnime
