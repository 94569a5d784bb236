/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file engine.hpp
 * @brief The offline-first cache and synchronization engine facade.
 *
 * @details
 * `OfflineEngine` is the only type an embedding application talks to. It owns the
 * caches, the favorite set, the pending queue, the reachability monitor, the
 * scheduler and the sync coordinator, and exposes copies of their state only.
 *
 * **Wiring:**
 * - Storage, transport and clock are injected, so several engines (or tests) can
 * coexist in one process.
 * - Every persisted record lives under `config.key_prefix`, which is what
 * `get_storage_usage()` and `clear_all()` operate on.
 */

#pragma once

#include "larder/cache/entity_cache.hpp"
#include "larder/cache/favorite_set.hpp"
#include "larder/cache/query_cache.hpp"
#include "larder/core/config.hpp"
#include "larder/infra/clock.hpp"
#include "larder/infra/scheduler.hpp"
#include "larder/storage/governor.hpp"
#include "larder/sync/pending_queue.hpp"
#include "larder/sync/reachability.hpp"
#include "larder/sync/sync_coordinator.hpp"
#include "larder/sync/transport.hpp"

#include <functional>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace larder::core {

struct NetworkStatus {
    bool is_online = false;
    bool is_syncing = false;
};

/// @brief How `submit_mutation()` disposed of a mutation.
enum class SubmitOutcome {
    APPLIED, ///< The remote call succeeded immediately.
    QUEUED   ///< Recorded in the pending queue for replay.
};

/**
 * @class NotCachedError
 * @brief Raised by a read when the remote is unavailable and no cached copy exists.
 */
class NotCachedError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

class OfflineEngine {
  public:
    using NetworkListener = std::function<void(const NetworkStatus&)>;
    using Unsubscribe = std::function<void()>;

    /**
     * @brief Restores persisted state and starts the sync triggers.
     *
     * If the engine starts online with a non-empty queue, a drain is posted at once.
     *
     * @param store Backing store; must outlive the engine.
     * @param transport Remote calls used for immediate attempts, replay and reads.
     * @param clock Time source; must outlive the engine.
     * @param initially_online Reachability before the first platform signal.
     */
    OfflineEngine(storage::KeyValueStore& store, sync::Transport transport,
                  const infra::Clock& clock, EngineConfig config = EngineConfig(),
                  bool initially_online = true);

    /// @brief Stops the timer and waits for any background drain.
    ~OfflineEngine();

    OfflineEngine(const OfflineEngine&) = delete;
    OfflineEngine& operator=(const OfflineEngine&) = delete;

    // --- Entity cache ---

    void cache_entity(const model::Recipe& recipe);
    std::optional<model::Recipe> get_cached_entity(const std::string& id);

    /// @brief Cached recipes, most recently accessed first.
    std::vector<model::Recipe> list_cached_entities() const;

    /// @brief Empties the entity and query caches. Favorites and the queue are kept.
    void clear_cache();

    // --- Query cache ---

    void cache_query(const std::string& query, const model::SearchFilters& filters,
                     const std::vector<model::Recipe>& results);
    std::optional<std::vector<model::Recipe>> get_cached_query(const std::string& query,
                                                               const model::SearchFilters& filters);

    // --- Reachability ---

    NetworkStatus get_network_status() const;

    /**
     * @brief Registers a listener for online/offline transitions.
     * @return Unsubscribe Removes the listener when called. Safe to call more than once.
     */
    Unsubscribe on_network_change(NetworkListener listener);

    /// @brief Platform reachability signal entry point.
    void set_online(bool online);

    // --- Mutations and sync ---

    /**
     * @brief Records a mutation for replay and applies its optimistic local effect.
     *
     * When online, a background drain is requested right away.
     *
     * @return true If the queue entry reached durable storage. On false the
     * mutation is still replayed by this process but would not survive a restart.
     */
    bool enqueue_mutation(const model::Mutation& mutation);

    /**
     * @brief Attempts a mutation against the remote, queueing it if that is not possible.
     *
     * The immediate attempt is made only when online and the queue is empty, so a
     * new mutation never overtakes an older queued one.
     */
    SubmitOutcome submit_mutation(const model::Mutation& mutation);

    /// @brief Runs one drain cycle on the calling thread. See `SyncCoordinator::sync_now()`.
    std::optional<sync::DrainReport> sync_now();

    /// @brief Blocks until every posted background drain has finished.
    void wait_for_background_sync();

    void on_permanent_failure(sync::SyncCoordinator::FailureListener listener);

    std::vector<model::PendingOperation> pending_operations() const;

    // --- Favorites ---

    /**
     * @brief Marks `id` as a favorite locally and queues the `favorite` call for replay.
     * @return false If the queued operation could not be persisted.
     */
    bool add_offline_favorite(const std::string& id);

    /// @brief Counterpart of `add_offline_favorite`, queueing an `unfavorite` call.
    bool remove_offline_favorite(const std::string& id);
    bool is_offline_favorite(const std::string& id) const;

    /**
     * @brief Replaces the favorite set with confirmed server state, then re-applies
     * the favorite toggles still waiting in the queue, in queue order.
     */
    void reconcile_favorites(const std::set<std::string>& server_ids);

    // --- Read-through ---

    /**
     * @brief Prefers the remote copy, falls back to the cache.
     * @throws NotCachedError If neither is available.
     */
    model::Recipe fetch_recipe(const std::string& id);

    /**
     * @brief Returns fresh cached results, otherwise asks the remote and caches the answer.
     * @throws NotCachedError If there is no fresh cached copy and the remote is unavailable.
     */
    std::vector<model::Recipe> search(const std::string& query,
                                      const model::SearchFilters& filters);

    // --- Storage ---

    storage::StorageUsage get_storage_usage() const;

    /**
     * @brief Drops every engine-owned record: caches, favorites and the pending queue.
     * @return size_t The number of storage keys removed by the final sweep.
     */
    size_t clear_all();

    const EngineConfig& config() const { return config_; }

  private:
    void apply_optimistic(const model::Mutation& mutation);

    EngineConfig config_;

    storage::StorageGovernor governor_;
    cache::EntityCache entities_;
    cache::QueryCache queries_;
    cache::FavoriteSet favorites_;
    sync::PendingQueue queue_;
    sync::ReachabilityMonitor reachability_;

    // Declared before the coordinator: the coordinator drains on its workers.
    infra::Scheduler scheduler_;
    sync::SyncCoordinator coordinator_;
};

} // namespace larder::core
