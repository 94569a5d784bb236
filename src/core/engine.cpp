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

#include "larder/core/engine.hpp"

#include "larder/infra/logger.hpp"

#include <exception>
#include <string>
#include <type_traits>
#include <variant>

namespace larder::core {

OfflineEngine::OfflineEngine(storage::KeyValueStore& store, sync::Transport transport,
                             const infra::Clock& clock, EngineConfig config, bool initially_online)
    : config_(std::move(config)), governor_(store, config_.key_prefix),
      entities_(store, clock, config_.key_prefix + "entity_cache", config_.entity_capacity,
                config_.entity_eviction_batch),
      queries_(store, clock, config_.key_prefix + "query_cache", config_.query_capacity,
               config_.query_eviction_batch, config_.query_ttl),
      favorites_(store, config_.key_prefix + "favorites"),
      queue_(store, clock, config_.key_prefix + "pending_ops", config_.max_retries),
      reachability_(initially_online), scheduler_(1),
      coordinator_(queue_, reachability_, std::move(transport), scheduler_, config_.sync_interval)
{
    coordinator_.start();

    infra::Logger::log(infra::LogLevel::INFO,
                       "Core: Engine ready. cached=" + std::to_string(entities_.size()) +
                           " pending=" + std::to_string(queue_.size()) +
                           (initially_online ? " (online)" : " (offline)"));

    if (reachability_.is_online() && queue_.size() > 0) {
        coordinator_.request_sync();
    }
}

OfflineEngine::~OfflineEngine() { coordinator_.shutdown(); }

// --- Entity cache ---

void OfflineEngine::cache_entity(const model::Recipe& recipe) { entities_.put(recipe); }

std::optional<model::Recipe> OfflineEngine::get_cached_entity(const std::string& id)
{
    return entities_.get(id);
}

std::vector<model::Recipe> OfflineEngine::list_cached_entities() const
{
    std::vector<model::Recipe> recipes;
    for (auto& entry : entities_.list()) {
        recipes.push_back(std::move(entry.entity));
    }
    return recipes;
}

void OfflineEngine::clear_cache()
{
    entities_.clear();
    queries_.clear();
    infra::Logger::log(infra::LogLevel::INFO, "Core: Caches cleared.");
}

// --- Query cache ---

void OfflineEngine::cache_query(const std::string& query, const model::SearchFilters& filters,
                                const std::vector<model::Recipe>& results)
{
    queries_.put(query, filters, results);
}

std::optional<std::vector<model::Recipe>>
OfflineEngine::get_cached_query(const std::string& query, const model::SearchFilters& filters)
{
    return queries_.get(query, filters);
}

// --- Reachability ---

NetworkStatus OfflineEngine::get_network_status() const
{
    NetworkStatus status;
    status.is_online = reachability_.is_online();
    status.is_syncing = coordinator_.is_syncing();
    return status;
}

OfflineEngine::Unsubscribe OfflineEngine::on_network_change(NetworkListener listener)
{
    sync::ReachabilityMonitor::SubscriptionId id =
        reachability_.subscribe([this, listener = std::move(listener)](bool online) {
            NetworkStatus status;
            status.is_online = online;
            status.is_syncing = coordinator_.is_syncing();
            listener(status);
        });

    return [this, id]() { reachability_.unsubscribe(id); };
}

void OfflineEngine::set_online(bool online) { reachability_.set_online(online); }

// --- Mutations and sync ---

void OfflineEngine::apply_optimistic(const model::Mutation& mutation)
{
    std::visit(
        [this](const auto& payload) {
            using T = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<T, model::Favorite>) {
                favorites_.add(payload.recipe_id);
            } else if constexpr (std::is_same_v<T, model::Unfavorite>) {
                favorites_.remove(payload.recipe_id);
            }
        },
        mutation);
}

bool OfflineEngine::enqueue_mutation(const model::Mutation& mutation)
{
    apply_optimistic(mutation);
    bool durable = queue_.enqueue(mutation);

    if (reachability_.is_online()) {
        coordinator_.request_sync();
    }
    return durable;
}

SubmitOutcome OfflineEngine::submit_mutation(const model::Mutation& mutation)
{
    apply_optimistic(mutation);
    const char* kind = model::type_name(model::type_of(mutation));

    if (!reachability_.is_online()) {
        infra::Logger::log(infra::LogLevel::DEBUG,
                           std::string("Core: Offline, queueing '") + kind + "'.");
        queue_.enqueue(mutation);
        return SubmitOutcome::QUEUED;
    }

    if (queue_.size() > 0) {
        queue_.enqueue(mutation);
        coordinator_.request_sync();
        return SubmitOutcome::QUEUED;
    }

    std::string reason = "remote call reported failure";
    try {
        if (sync::dispatch(coordinator_.transport(), mutation)) {
            return SubmitOutcome::APPLIED;
        }
    } catch (const std::exception& e) {
        reason = e.what();
    }

    infra::Logger::log(infra::LogLevel::WARN,
                       std::string("Core: '") + kind + "' failed (" + reason + "), queued for retry.");
    queue_.enqueue(mutation);
    coordinator_.request_sync();
    return SubmitOutcome::QUEUED;
}

std::optional<sync::DrainReport> OfflineEngine::sync_now() { return coordinator_.sync_now(); }

void OfflineEngine::wait_for_background_sync() { scheduler_.wait_idle(); }

void OfflineEngine::on_permanent_failure(sync::SyncCoordinator::FailureListener listener)
{
    coordinator_.on_permanent_failure(std::move(listener));
}

std::vector<model::PendingOperation> OfflineEngine::pending_operations() const
{
    return queue_.snapshot();
}

// --- Favorites ---

bool OfflineEngine::add_offline_favorite(const std::string& id)
{
    return enqueue_mutation(model::Favorite{id});
}

bool OfflineEngine::remove_offline_favorite(const std::string& id)
{
    return enqueue_mutation(model::Unfavorite{id});
}

bool OfflineEngine::is_offline_favorite(const std::string& id) const
{
    return favorites_.contains(id);
}

void OfflineEngine::reconcile_favorites(const std::set<std::string>& server_ids)
{
    std::set<std::string> merged = server_ids;
    for (const auto& op : queue_.snapshot()) {
        if (const auto* fav = std::get_if<model::Favorite>(&op.mutation)) {
            merged.insert(fav->recipe_id);
        } else if (const auto* unfav = std::get_if<model::Unfavorite>(&op.mutation)) {
            merged.erase(unfav->recipe_id);
        }
    }
    favorites_.assign(std::move(merged));
}

// --- Read-through ---

model::Recipe OfflineEngine::fetch_recipe(const std::string& id)
{
    const sync::Transport& transport = coordinator_.transport();

    if (reachability_.is_online() && transport.fetch_recipe) {
        try {
            model::Recipe recipe = transport.fetch_recipe(id);
            entities_.put(recipe);
            return recipe;
        } catch (const std::exception& e) {
            infra::Logger::log(infra::LogLevel::WARN, "Core: Remote fetch of recipe " + id +
                                                          " failed, using cache: " + e.what());
        }
    }

    std::optional<model::Recipe> cached = entities_.get(id);
    if (cached) {
        return *cached;
    }
    throw NotCachedError("Recipe " + id + " is not available offline.");
}

std::vector<model::Recipe> OfflineEngine::search(const std::string& query,
                                                 const model::SearchFilters& filters)
{
    std::optional<std::vector<model::Recipe>> cached = queries_.get(query, filters);
    if (cached) {
        return *cached;
    }

    const sync::Transport& transport = coordinator_.transport();
    if (reachability_.is_online() && transport.search) {
        try {
            std::vector<model::Recipe> results = transport.search(query, filters);
            queries_.put(query, filters, results);
            return results;
        } catch (const std::exception& e) {
            infra::Logger::log(infra::LogLevel::WARN,
                               "Core: Remote search failed: " + std::string(e.what()));
        }
    }
    throw NotCachedError("Search '" + query + "' is not available offline.");
}

// --- Storage ---

storage::StorageUsage OfflineEngine::get_storage_usage() const { return governor_.usage(); }

size_t OfflineEngine::clear_all()
{
    entities_.clear();
    queries_.clear();
    favorites_.clear();
    queue_.clear();
    size_t removed = governor_.clear_all();
    infra::Logger::log(infra::LogLevel::INFO, "Core: All offline data cleared.");
    return removed;
}

} // namespace larder::core
