#pragma once

#include "playback_launcher.hpp"
#include "source/resolution_pipeline.hpp"
#include "source/source_types.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Shio {

enum class Stage {
    Idle,
    Searching,
    Results,
    EpisodeList,
    Resolving,
    ReadyToPlay,
    Error,
};

const char* to_string(Stage stage);

/**
 * Pipeline operation a failure came from, so retry can re-issue it
 */
enum class Operation {
    None,
    Search,
    ListEpisodes,
    ResolveStream,
};

/**
 * Everything the user is looking at. Read-only outside Session.
 */
struct SessionState {
    Stage stage = Stage::Idle;
    std::string query;
    std::vector<SearchResult> results;

    std::optional<SearchResult> anime;      // selected title
    std::vector<EpisodeRef> episodes;
    bool episodes_loading = false;
    std::optional<size_t> episode_index;    // selected episode

    std::optional<StreamDescriptor> stream; // only while ReadyToPlay
    std::optional<PlayerProcess> player;

    std::optional<Error> last_error;
    Operation failed_operation = Operation::None;
    Stage recovery_stage = Stage::Idle;     // where back() leads from Error

    uint64_t generation = 0;
    bool quit = false;

    const EpisodeRef* current_episode() const {
        if (!episode_index || *episode_index >= episodes.size()) return nullptr;
        return &episodes[*episode_index];
    }
};

/**
 * Browsing state machine.
 *
 * All mutation happens on the main loop thread, either from user input or
 * from pipeline completions posted back to it. Every request carries the
 * generation it was started in; a completion is applied only if the
 * generation is still current and the stage is the one that issued it.
 * At most one request is outstanding; starting one cancels the previous.
 */
class Session {
public:
    using ChangedCallback = std::function<void()>;

    Session(ResolutionPipeline& pipeline, Launcher& launcher);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /**
     * Start a new search, superseding whatever is in flight.
     * Blank queries are ignored.
     */
    void submit(const std::string& query);

    /**
     * Abort the outstanding request, same as back() while loading
     */
    void cancel();

    /**
     * Results: open a title and load its episodes
     */
    void select_anime(size_t index);

    /**
     * EpisodeList (loaded) or ReadyToPlay: resolve and play an episode
     */
    void select_episode(size_t index);

    void play_next();
    void play_previous();
    void replay();

    /**
     * Step back to the previous stable stage, cancelling any request
     */
    void back();

    /**
     * Error: re-issue the failed operation
     */
    void retry();

    void quit();

    const SessionState& get_state() const { return state_; }
    Stage get_stage() const { return state_.stage; }
    bool has_pending_request() const { return pending_ != nullptr; }

    /**
     * Subscribe to state changes
     */
    void on_changed(ChangedCallback callback);

private:
    ResolutionPipeline& pipeline_;
    Launcher& launcher_;
    SessionState state_;
    std::shared_ptr<RequestHandle> pending_;
    std::vector<ChangedCallback> change_callbacks_;

    void cancel_pending();
    uint64_t begin_request();
    bool accepts(uint64_t generation, Stage origin) const;
    void keep_pending(uint64_t generation, std::shared_ptr<RequestHandle> handle);

    void start_search();
    void start_list_episodes();
    void start_resolve(size_t index);

    void on_search_finished(uint64_t generation, std::optional<std::vector<SearchResult>> results,
                            const Error& error);
    void on_episodes_finished(uint64_t generation, std::optional<std::vector<EpisodeRef>> episodes,
                              const Error& error);
    void on_stream_finished(uint64_t generation, std::optional<StreamDescriptor> stream,
                            const Error& error);

    void fail(Operation operation, const Error& error, Stage recovery);
    void notify_change();
};

} // namespace Shio
