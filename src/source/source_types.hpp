#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Shio {

/**
 * Error taxonomy shared by transport, adapters, pipeline and launcher
 */
enum class ErrorKind {
    None,
    Transport,
    Parse,
    NotFound,
    Launch,
};

enum class TransportFailure {
    None,
    Timeout,
    Connection,
    BadStatus,
    InvalidRequest,
    Cancelled,
};

struct Error {
    ErrorKind kind = ErrorKind::None;
    TransportFailure transport = TransportFailure::None;
    unsigned int http_status = 0;
    std::string message;

    explicit operator bool() const { return kind != ErrorKind::None; }

    /**
     * Transient transport failures are worth retrying:
     * timeouts, connection failures, 5xx and 429 responses.
     */
    bool is_transient() const;

    bool is_cancelled() const {
        return kind == ErrorKind::Transport && transport == TransportFailure::Cancelled;
    }

    /**
     * Short user-facing description (e.g. "Source unavailable: ...")
     */
    std::string describe() const;

    static Error transport_error(TransportFailure failure, const std::string& message,
                                 unsigned int http_status = 0);
    static Error parse_error(const std::string& message);
    static Error not_found(const std::string& message);
    static Error launch_error(const std::string& message);
};

const char* to_string(ErrorKind kind);

/**
 * A title returned by a source search.
 * Identity is (adapter_id, id): raw ids are only unique per adapter.
 */
struct SearchResult {
    std::string adapter_id;
    std::string id;
    std::string title;
    std::optional<std::string> english_title;
    std::optional<int> year;
    std::optional<int> episode_count;
    std::optional<std::string> thumbnail;

    std::string get_key() const {
        return adapter_id + ":" + id;
    }
};

/**
 * One entry of an anime's episode list, in broadcast order
 */
struct EpisodeRef {
    std::string adapter_id;
    std::string anime_id;
    std::string number;            // episode label as the backend spells it ("1", "12.5")
    std::optional<std::string> title;
};

/**
 * Everything the player needs to open a resolved episode.
 * Stream URLs are short-lived; descriptors are never cached.
 */
struct StreamDescriptor {
    std::string url;
    std::optional<std::string> user_agent;
    std::optional<std::string> referer;
    std::map<std::string, std::string> headers;
    std::optional<std::string> provider;
};

template<typename T>
using ResultCallback = std::function<void(std::optional<T> result, const Error& error)>;

using SearchCallback = ResultCallback<std::vector<SearchResult>>;
using EpisodesCallback = ResultCallback<std::vector<EpisodeRef>>;
using StreamCallback = ResultCallback<StreamDescriptor>;

} // namespace Shio
