#pragma once

#include "source_adapter.hpp"
#include "source_types.hpp"
#include <gio/gio.h>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Shio {

enum class SearchPolicy {
    FirstSuccess,   // adapters in order, first non-empty success wins
    Aggregate,      // all adapters, union of results in adapter order
};

const char* to_string(SearchPolicy policy);
std::optional<SearchPolicy> search_policy_from_string(const std::string& value);

struct PipelineOptions {
    SearchPolicy policy = SearchPolicy::FirstSuccess;
    int max_retries = 2;
    unsigned int backoff_ms = 250;   // multiplied by the attempt number
};

/**
 * Handle of one outstanding pipeline call.
 * Once cancelled, the call's callback is never invoked.
 */
class RequestHandle {
public:
    RequestHandle();
    ~RequestHandle();

    RequestHandle(const RequestHandle&) = delete;
    RequestHandle& operator=(const RequestHandle&) = delete;

    void cancel();
    bool is_cancelled() const { return cancelled_; }
    GCancellable* cancellable() const { return cancellable_; }

private:
    GCancellable* cancellable_;
    bool cancelled_ = false;
};

/**
 * Orchestrates the configured source adapters: search policy, retries of
 * transient transport failures, routing of follow-up calls to the adapter
 * that produced a result, and cancellation.
 */
class ResolutionPipeline {
public:
    ResolutionPipeline(std::vector<std::shared_ptr<SourceAdapter>> adapters,
                       PipelineOptions options = PipelineOptions{});
    ~ResolutionPipeline();

    /**
     * Search all configured adapters according to the search policy.
     * Successful results have unique (adapter, id) pairs.
     */
    std::shared_ptr<RequestHandle> search(const std::string& query, SearchCallback callback);

    /**
     * List episodes using the adapter that produced the search result
     */
    std::shared_ptr<RequestHandle> list_episodes(const SearchResult& anime, EpisodesCallback callback);

    /**
     * Resolve an episode using the adapter that listed it
     */
    std::shared_ptr<RequestHandle> resolve_stream(const EpisodeRef& episode, StreamCallback callback);

    const std::vector<std::shared_ptr<SourceAdapter>>& get_adapters() const;
    std::shared_ptr<SourceAdapter> get_adapter(const std::string& adapter_id) const;
    const PipelineOptions& get_options() const;

    /**
     * Drop later duplicates of the same (adapter, id), keeping order
     */
    static std::vector<SearchResult> remove_duplicates(std::vector<SearchResult> results);

private:
    template<typename T>
    using Attempt = std::function<void(GCancellable* cancellable, ResultCallback<T> callback)>;

    std::vector<std::shared_ptr<SourceAdapter>> adapters_;
    PipelineOptions options_;
    std::shared_ptr<bool> alive_;

    template<typename T>
    void run_with_retry(std::shared_ptr<RequestHandle> handle, Attempt<T> attempt,
                        int attempt_number, ResultCallback<T> callback);

    void search_next(std::shared_ptr<RequestHandle> handle, const std::string& query,
                     size_t index, std::vector<Error> errors, SearchCallback callback);
    void search_all(std::shared_ptr<RequestHandle> handle, const std::string& query,
                    SearchCallback callback);

    // Invoke fn from the main loop after delay_ms unless the pipeline is gone
    void schedule(unsigned int delay_ms, std::function<void()> fn);

    static Error pick_error(const std::vector<Error>& errors, const std::string& query);
};

} // namespace Shio
