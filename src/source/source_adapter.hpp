#pragma once

#include "source_types.hpp"
#include <gio/gio.h>
#include <string>

namespace Shio {

/**
 * Capability interface implemented once per streaming backend.
 *
 * Every operation is asynchronous and independently failable. Callbacks run
 * on the main context; cancelled operations still invoke their callback
 * (with a Cancelled transport error) so implementations can release state.
 * Adapters tag everything they emit with id().
 */
class SourceAdapter {
public:
    virtual ~SourceAdapter() = default;

    /**
     * Unique tag of this adapter instance (e.g. "allanime:sub")
     */
    virtual const std::string& id() const = 0;

    /**
     * Search titles. Result order is the backend's relevance ranking.
     */
    virtual void search(const std::string& query, GCancellable* cancellable,
                        SearchCallback callback) = 0;

    /**
     * List episodes of a title in broadcast order
     */
    virtual void list_episodes(const std::string& anime_id, GCancellable* cancellable,
                               EpisodesCallback callback) = 0;

    /**
     * Resolve one episode into a playable stream
     */
    virtual void resolve_stream(const std::string& anime_id, const EpisodeRef& episode,
                                GCancellable* cancellable, StreamCallback callback) = 0;
};

} // namespace Shio
