#include "resolution_pipeline.hpp"
#include <glib.h>
#include <set>

namespace Shio {

const char* to_string(SearchPolicy policy) {
    switch (policy) {
        case SearchPolicy::FirstSuccess: return "first-success";
        case SearchPolicy::Aggregate: return "aggregate";
    }
    return "first-success";
}

std::optional<SearchPolicy> search_policy_from_string(const std::string& value) {
    if (value == "first-success") return SearchPolicy::FirstSuccess;
    if (value == "aggregate") return SearchPolicy::Aggregate;
    return std::nullopt;
}

RequestHandle::RequestHandle() : cancellable_(g_cancellable_new()) {
}

RequestHandle::~RequestHandle() {
    g_object_unref(cancellable_);
}

void RequestHandle::cancel() {
    if (cancelled_) return;
    cancelled_ = true;
    g_cancellable_cancel(cancellable_);
}

ResolutionPipeline::ResolutionPipeline(std::vector<std::shared_ptr<SourceAdapter>> adapters,
                                       PipelineOptions options)
    : adapters_(std::move(adapters))
    , options_(options)
    , alive_(std::make_shared<bool>(true)) {
}

ResolutionPipeline::~ResolutionPipeline() {
    *alive_ = false;
}

const std::vector<std::shared_ptr<SourceAdapter>>& ResolutionPipeline::get_adapters() const {
    return adapters_;
}

std::shared_ptr<SourceAdapter> ResolutionPipeline::get_adapter(const std::string& adapter_id) const {
    for (const auto& adapter : adapters_) {
        if (adapter->id() == adapter_id) {
            return adapter;
        }
    }
    return nullptr;
}

const PipelineOptions& ResolutionPipeline::get_options() const {
    return options_;
}

void ResolutionPipeline::schedule(unsigned int delay_ms, std::function<void()> fn) {
    struct TimerData {
        std::weak_ptr<bool> alive;
        std::function<void()> fn;
    };
    auto* data = new TimerData{alive_, std::move(fn)};

    g_timeout_add_full(G_PRIORITY_DEFAULT, delay_ms,
        [](gpointer user_data) -> gboolean {
            auto* data = static_cast<TimerData*>(user_data);
            auto alive = data->alive.lock();
            if (alive && *alive) {
                data->fn();
            }
            return G_SOURCE_REMOVE;
        },
        data,
        [](gpointer user_data) {
            delete static_cast<TimerData*>(user_data);
        });
}

template<typename T>
void ResolutionPipeline::run_with_retry(std::shared_ptr<RequestHandle> handle, Attempt<T> attempt,
                                        int attempt_number, ResultCallback<T> callback) {
    attempt(handle->cancellable(),
        [this, handle, attempt, attempt_number, callback](std::optional<T> result, const Error& error) {
            if (handle->is_cancelled()) {
                return;
            }

            if (!result && error.is_transient() && attempt_number < options_.max_retries) {
                unsigned int delay = options_.backoff_ms * static_cast<unsigned int>(attempt_number + 1);
                g_info("[Pipeline] %s, retrying in %u ms (%d/%d)", error.describe().c_str(),
                       delay, attempt_number + 1, options_.max_retries);
                schedule(delay, [this, handle, attempt, attempt_number, callback]() {
                    if (handle->is_cancelled()) return;
                    run_with_retry<T>(handle, attempt, attempt_number + 1, callback);
                });
                return;
            }

            callback(std::move(result), error);
        });
}

std::vector<SearchResult> ResolutionPipeline::remove_duplicates(std::vector<SearchResult> results) {
    std::set<std::string> seen;
    std::vector<SearchResult> unique;
    unique.reserve(results.size());

    for (auto& result : results) {
        if (seen.insert(result.get_key()).second) {
            unique.push_back(std::move(result));
        }
    }
    return unique;
}

Error ResolutionPipeline::pick_error(const std::vector<Error>& errors, const std::string& query) {
    // Transport problems matter most to the user, then unusable sources
    for (auto kind : {ErrorKind::Transport, ErrorKind::Parse}) {
        for (auto it = errors.rbegin(); it != errors.rend(); ++it) {
            if (it->kind == kind) return *it;
        }
    }
    return Error::not_found("no results for '" + query + "'");
}

std::shared_ptr<RequestHandle> ResolutionPipeline::search(const std::string& query, SearchCallback callback) {
    auto handle = std::make_shared<RequestHandle>();

    g_info("[Pipeline] Searching '%s' across %zu sources (%s)", query.c_str(),
           adapters_.size(), to_string(options_.policy));

    if (options_.policy == SearchPolicy::Aggregate) {
        search_all(handle, query, std::move(callback));
    } else {
        search_next(handle, query, 0, {}, std::move(callback));
    }
    return handle;
}

void ResolutionPipeline::search_next(std::shared_ptr<RequestHandle> handle, const std::string& query,
                                     size_t index, std::vector<Error> errors, SearchCallback callback) {
    if (index >= adapters_.size()) {
        Error error = pick_error(errors, query);
        schedule(0, [handle, callback, error]() {
            if (!handle->is_cancelled()) callback(std::nullopt, error);
        });
        return;
    }

    auto adapter = adapters_[index];
    Attempt<std::vector<SearchResult>> attempt =
        [adapter, query](GCancellable* cancellable, SearchCallback cb) {
            adapter->search(query, cancellable, std::move(cb));
        };

    run_with_retry<std::vector<SearchResult>>(handle, attempt, 0,
        [this, handle, query, index, errors, callback, adapter]
        (std::optional<std::vector<SearchResult>> results, const Error& error) mutable {
            if (results && !results->empty()) {
                callback(remove_duplicates(std::move(*results)), Error{});
                return;
            }

            if (results) {
                g_info("[Pipeline] No results from %s", adapter->id().c_str());
                errors.push_back(Error::not_found("no results for '" + query + "'"));
            } else {
                g_warning("[Pipeline] Search failed on %s: %s", adapter->id().c_str(),
                          error.describe().c_str());
                errors.push_back(error);
            }
            search_next(handle, query, index + 1, std::move(errors), callback);
        });
}

void ResolutionPipeline::search_all(std::shared_ptr<RequestHandle> handle, const std::string& query,
                                    SearchCallback callback) {
    if (adapters_.empty()) {
        search_next(handle, query, 0, {}, std::move(callback));
        return;
    }

    struct AggregateState {
        size_t pending;
        std::vector<std::optional<std::vector<SearchResult>>> results;
        std::vector<Error> errors;
    };
    auto state = std::make_shared<AggregateState>();
    state->pending = adapters_.size();
    state->results.resize(adapters_.size());

    for (size_t i = 0; i < adapters_.size(); i++) {
        auto adapter = adapters_[i];
        Attempt<std::vector<SearchResult>> attempt =
            [adapter, query](GCancellable* cancellable, SearchCallback cb) {
                adapter->search(query, cancellable, std::move(cb));
            };

        run_with_retry<std::vector<SearchResult>>(handle, attempt, 0,
            [state, i, adapter, query, callback]
            (std::optional<std::vector<SearchResult>> results, const Error& error) {
                if (results) {
                    state->results[i] = std::move(results);
                } else {
                    g_warning("[Pipeline] Search failed on %s: %s", adapter->id().c_str(),
                              error.describe().c_str());
                    state->errors.push_back(error);
                }

                state->pending--;
                if (state->pending > 0) {
                    return;
                }

                // Merge in configured adapter order, not completion order
                std::vector<SearchResult> merged;
                for (auto& partial : state->results) {
                    if (!partial) continue;
                    for (auto& result : *partial) {
                        merged.push_back(std::move(result));
                    }
                }

                if (merged.empty()) {
                    callback(std::nullopt, pick_error(state->errors, query));
                    return;
                }
                callback(remove_duplicates(std::move(merged)), Error{});
            });
    }
}

std::shared_ptr<RequestHandle> ResolutionPipeline::list_episodes(const SearchResult& anime,
                                                                 EpisodesCallback callback) {
    auto handle = std::make_shared<RequestHandle>();
    auto adapter = get_adapter(anime.adapter_id);

    if (!adapter) {
        Error error = Error::not_found("unknown source '" + anime.adapter_id + "'");
        schedule(0, [handle, callback, error]() {
            if (!handle->is_cancelled()) callback(std::nullopt, error);
        });
        return handle;
    }

    g_info("[Pipeline] Listing episodes of %s via %s", anime.id.c_str(), adapter->id().c_str());

    std::string anime_id = anime.id;
    Attempt<std::vector<EpisodeRef>> attempt =
        [adapter, anime_id](GCancellable* cancellable, EpisodesCallback cb) {
            adapter->list_episodes(anime_id, cancellable, std::move(cb));
        };
    run_with_retry<std::vector<EpisodeRef>>(handle, attempt, 0, std::move(callback));
    return handle;
}

std::shared_ptr<RequestHandle> ResolutionPipeline::resolve_stream(const EpisodeRef& episode,
                                                                  StreamCallback callback) {
    auto handle = std::make_shared<RequestHandle>();
    auto adapter = get_adapter(episode.adapter_id);

    if (!adapter) {
        Error error = Error::not_found("unknown source '" + episode.adapter_id + "'");
        schedule(0, [handle, callback, error]() {
            if (!handle->is_cancelled()) callback(std::nullopt, error);
        });
        return handle;
    }

    g_info("[Pipeline] Resolving episode %s of %s via %s", episode.number.c_str(),
           episode.anime_id.c_str(), adapter->id().c_str());

    Attempt<StreamDescriptor> attempt =
        [adapter, episode](GCancellable* cancellable, StreamCallback cb) {
            adapter->resolve_stream(episode.anime_id, episode, cancellable, std::move(cb));
        };
    run_with_retry<StreamDescriptor>(handle, attempt, 0, std::move(callback));
    return handle;
}

} // namespace Shio
