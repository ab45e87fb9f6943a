#include "session.hpp"
#include <glib.h>

namespace Shio {

const char* to_string(Stage stage) {
    switch (stage) {
        case Stage::Idle: return "Idle";
        case Stage::Searching: return "Searching";
        case Stage::Results: return "Results";
        case Stage::EpisodeList: return "EpisodeList";
        case Stage::Resolving: return "Resolving";
        case Stage::ReadyToPlay: return "ReadyToPlay";
        case Stage::Error: return "Error";
    }
    return "Unknown";
}

Session::Session(ResolutionPipeline& pipeline, Launcher& launcher)
    : pipeline_(pipeline)
    , launcher_(launcher) {
}

Session::~Session() {
    cancel_pending();
}

void Session::on_changed(ChangedCallback callback) {
    change_callbacks_.push_back(std::move(callback));
}

void Session::notify_change() {
    for (const auto& callback : change_callbacks_) {
        callback();
    }
}

void Session::cancel_pending() {
    if (pending_) {
        pending_->cancel();
        pending_.reset();
    }
    // Anything still in flight is stale from now on
    state_.generation++;
}

uint64_t Session::begin_request() {
    cancel_pending();
    state_.last_error.reset();
    state_.failed_operation = Operation::None;
    return state_.generation;
}

bool Session::accepts(uint64_t generation, Stage origin) const {
    return !state_.quit && generation == state_.generation && state_.stage == origin;
}

void Session::keep_pending(uint64_t generation, std::shared_ptr<RequestHandle> handle) {
    // The completion may already have run synchronously
    if (generation == state_.generation &&
        (state_.stage == Stage::Searching || state_.stage == Stage::Resolving ||
         (state_.stage == Stage::EpisodeList && state_.episodes_loading))) {
        pending_ = std::move(handle);
    }
}

void Session::submit(const std::string& query) {
    if (state_.quit) return;

    g_autofree gchar* trimmed = g_strstrip(g_strdup(query.c_str()));
    if (!trimmed || *trimmed == '\0') {
        return;
    }

    state_.query = trimmed;
    start_search();
}

void Session::start_search() {
    uint64_t generation = begin_request();

    state_.stage = Stage::Searching;
    state_.results.clear();
    state_.anime.reset();
    state_.episodes.clear();
    state_.episodes_loading = false;
    state_.episode_index.reset();
    state_.stream.reset();
    state_.player.reset();

    g_debug("[Session] Search '%s' (generation %" G_GUINT64_FORMAT ")",
            state_.query.c_str(), static_cast<guint64>(generation));

    notify_change();

    auto handle = pipeline_.search(state_.query,
        [this, generation](std::optional<std::vector<SearchResult>> results, const Error& error) {
            on_search_finished(generation, std::move(results), error);
        });
    keep_pending(generation, std::move(handle));
}

void Session::on_search_finished(uint64_t generation, std::optional<std::vector<SearchResult>> results,
                                 const Error& error) {
    if (!accepts(generation, Stage::Searching)) {
        g_debug("[Session] Dropping stale search result");
        return;
    }
    pending_.reset();

    if (!results || results->empty()) {
        fail(Operation::Search, results ? Error::not_found("no results for '" + state_.query + "'") : error,
             Stage::Idle);
        return;
    }

    state_.results = std::move(*results);
    state_.stage = Stage::Results;
    notify_change();
}

void Session::cancel() {
    switch (state_.stage) {
        case Stage::Searching:
        case Stage::Resolving:
            back();
            break;
        case Stage::EpisodeList:
            if (state_.episodes_loading) back();
            break;
        default:
            break;
    }
}

void Session::select_anime(size_t index) {
    if (state_.quit || state_.stage != Stage::Results || index >= state_.results.size()) {
        return;
    }

    state_.anime = state_.results[index];
    start_list_episodes();
}

void Session::start_list_episodes() {
    uint64_t generation = begin_request();

    state_.stage = Stage::EpisodeList;
    state_.episodes.clear();
    state_.episodes_loading = true;
    state_.episode_index.reset();
    state_.stream.reset();
    state_.player.reset();
    notify_change();

    auto handle = pipeline_.list_episodes(*state_.anime,
        [this, generation](std::optional<std::vector<EpisodeRef>> episodes, const Error& error) {
            on_episodes_finished(generation, std::move(episodes), error);
        });
    keep_pending(generation, std::move(handle));
}

void Session::on_episodes_finished(uint64_t generation, std::optional<std::vector<EpisodeRef>> episodes,
                                   const Error& error) {
    if (!accepts(generation, Stage::EpisodeList) || !state_.episodes_loading) {
        g_debug("[Session] Dropping stale episode list");
        return;
    }
    pending_.reset();
    state_.episodes_loading = false;

    if (!episodes || episodes->empty()) {
        fail(Operation::ListEpisodes, episodes ? Error::not_found("no episodes available") : error,
             Stage::Results);
        return;
    }

    state_.episodes = std::move(*episodes);
    notify_change();
}

void Session::select_episode(size_t index) {
    if (state_.quit || index >= state_.episodes.size()) {
        return;
    }

    bool from_list = state_.stage == Stage::EpisodeList && !state_.episodes_loading;
    if (!from_list && state_.stage != Stage::ReadyToPlay) {
        return;
    }

    start_resolve(index);
}

void Session::play_next() {
    if (state_.stage != Stage::ReadyToPlay || !state_.episode_index) return;
    select_episode(*state_.episode_index + 1);
}

void Session::play_previous() {
    if (state_.stage != Stage::ReadyToPlay || !state_.episode_index || *state_.episode_index == 0) return;
    select_episode(*state_.episode_index - 1);
}

void Session::replay() {
    if (state_.stage != Stage::ReadyToPlay || !state_.episode_index) return;
    select_episode(*state_.episode_index);
}

void Session::start_resolve(size_t index) {
    uint64_t generation = begin_request();

    state_.stage = Stage::Resolving;
    state_.episode_index = index;
    state_.stream.reset();
    state_.player.reset();
    notify_change();

    auto handle = pipeline_.resolve_stream(state_.episodes[index],
        [this, generation](std::optional<StreamDescriptor> stream, const Error& error) {
            on_stream_finished(generation, std::move(stream), error);
        });
    keep_pending(generation, std::move(handle));
}

void Session::on_stream_finished(uint64_t generation, std::optional<StreamDescriptor> stream,
                                 const Error& error) {
    if (!accepts(generation, Stage::Resolving)) {
        g_debug("[Session] Dropping stale stream");
        return;
    }
    pending_.reset();

    if (!stream) {
        fail(Operation::ResolveStream, error, Stage::EpisodeList);
        return;
    }

    Error launch_error;
    auto process = launcher_.launch(*stream, launch_error);
    if (!process) {
        // Only this playback attempt failed; stay on the episode list
        g_warning("[Session] %s", launch_error.describe().c_str());
        state_.stage = Stage::EpisodeList;
        state_.last_error = launch_error;
        notify_change();
        return;
    }

    state_.stream = std::move(stream);
    state_.player = std::move(process);
    state_.stage = Stage::ReadyToPlay;
    notify_change();
}

void Session::fail(Operation operation, const Error& error, Stage recovery) {
    g_warning("[Session] %s failed: %s", to_string(state_.stage), error.describe().c_str());

    state_.stage = Stage::Error;
    state_.last_error = error;
    state_.failed_operation = operation;
    state_.recovery_stage = recovery;
    state_.episodes_loading = false;
    notify_change();
}

void Session::back() {
    if (state_.quit) return;

    switch (state_.stage) {
        case Stage::Idle:
            return;
        case Stage::Searching:
        case Stage::Results:
            cancel_pending();
            state_.results.clear();
            state_.stage = Stage::Idle;
            break;
        case Stage::EpisodeList:
            cancel_pending();
            state_.anime.reset();
            state_.episodes.clear();
            state_.episodes_loading = false;
            state_.episode_index.reset();
            state_.stage = Stage::Results;
            break;
        case Stage::Resolving:
        case Stage::ReadyToPlay:
            cancel_pending();
            state_.stream.reset();
            state_.player.reset();
            state_.stage = Stage::EpisodeList;
            break;
        case Stage::Error:
            cancel_pending();
            state_.stage = state_.recovery_stage;
            if (state_.stage == Stage::Idle) {
                state_.results.clear();
            } else if (state_.stage == Stage::Results) {
                state_.anime.reset();
                state_.episodes.clear();
            }
            break;
    }

    state_.last_error.reset();
    state_.failed_operation = Operation::None;
    notify_change();
}

void Session::retry() {
    if (state_.quit || state_.stage != Stage::Error) return;

    switch (state_.failed_operation) {
        case Operation::Search:
            start_search();
            break;
        case Operation::ListEpisodes:
            if (state_.anime) start_list_episodes();
            break;
        case Operation::ResolveStream:
            if (state_.episode_index && *state_.episode_index < state_.episodes.size()) {
                start_resolve(*state_.episode_index);
            }
            break;
        case Operation::None:
            break;
    }
}

void Session::quit() {
    if (state_.quit) return;
    cancel_pending();
    state_.quit = true;
    notify_change();
}

} // namespace Shio
