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
 * @file entity_cache.hpp
 * @brief Bounded, recency-ordered cache of recipes.
 *
 * @details
 * The cache holds at most `capacity` recipes keyed by id. Inserting past the bound
 * evicts a batch of the least recently accessed entries. Every hit refreshes the
 * entry's access time and is written through to storage, so recency survives a
 * restart.
 *
 * Persistence is best-effort: a rejected write is logged and the in-memory state
 * stays authoritative for the lifetime of the process.
 */

#pragma once

#include "larder/infra/clock.hpp"
#include "larder/model/recipe.hpp"
#include "larder/storage/store.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace larder::cache {

/**
 * @struct CachedEntity
 * @brief A recipe plus its cache bookkeeping.
 */
struct CachedEntity {
    model::Recipe entity;
    int64_t cached_at = 0;        ///< Time of first insertion; preserved on overwrite.
    int64_t last_accessed_at = 0; ///< Refreshed on every put and every hit.
    uint64_t access_order = 0;    ///< Monotonic tiebreaker for equal access times.
};

class EntityCache {
  public:
    /**
     * @param store Durable storage backing the cache record.
     * @param clock Time source for `cached_at` / `last_accessed_at`.
     * @param storage_key Key of the persisted record.
     * @param capacity Maximum live entries (N_max).
     * @param eviction_batch Entries evicted when the bound is exceeded (K).
     */
    EntityCache(storage::KeyValueStore& store, const infra::Clock& clock, std::string storage_key,
                size_t capacity, size_t eviction_batch);

    /**
     * @brief Inserts or overwrites a recipe.
     *
     * Sets `cached_at` for a new id, always refreshes `last_accessed_at`, then evicts
     * if the bound is exceeded. Evicts at least `eviction_batch` entries and at least
     * enough to return to `capacity`.
     */
    void put(const model::Recipe& recipe);

    /**
     * @brief Looks up a recipe. A hit counts as an access.
     */
    std::optional<model::Recipe> get(const std::string& id);

    /// @brief Looks up an entry without touching its access time.
    std::optional<CachedEntity> peek(const std::string& id) const;

    /// @brief All entries, most recently accessed first.
    std::vector<CachedEntity> list() const;

    void clear();
    size_t size() const;

  private:
    void load();
    void persist();
    void evict_if_needed();

    storage::KeyValueStore& store_;
    const infra::Clock& clock_;
    std::string storage_key_;
    size_t capacity_;
    size_t eviction_batch_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, CachedEntity> entries_;
    uint64_t next_order_ = 0;
};

} // namespace larder::cache
