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
 * @file query_cache.hpp
 * @brief Search result cache with a freshness window and a count bound.
 *
 * @details
 * Entries are keyed by the normalized query text plus the canonical filter set.
 * Two independent bounds apply:
 * - **TTL:** an entry whose age reaches `ttl` is treated as absent and purged on the
 * next access, even when capacity is available.
 * - **Capacity:** past `capacity` entries, the oldest by timestamp are evicted.
 */

#pragma once

#include "larder/infra/clock.hpp"
#include "larder/model/recipe.hpp"
#include "larder/storage/store.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace larder::cache {

struct CachedQuery {
    std::string query;
    model::SearchFilters filters;
    std::vector<model::Recipe> results;
    int64_t timestamp = 0;
    uint64_t insert_order = 0;
};

class QueryCache {
  public:
    QueryCache(storage::KeyValueStore& store, const infra::Clock& clock, std::string storage_key,
               size_t capacity, size_t eviction_batch, std::chrono::milliseconds ttl);

    /**
     * @brief Derives the composite cache key.
     *
     * @code
     * QueryCache::make_key("  Pasta ", {{"cuisine", {"Italian"}}}); // pasta_{"cuisine":["Italian"]}
     * @endcode
     */
    static std::string make_key(const std::string& query, const model::SearchFilters& filters);

    /**
     * @brief Stores (or refreshes) the results of a search, stamped with the current time.
     */
    void put(const std::string& query, const model::SearchFilters& filters,
             const std::vector<model::Recipe>& results);

    /**
     * @brief Returns cached results if present and fresh.
     *
     * A stale entry (`now - timestamp >= ttl`) is deleted and reported as a miss.
     */
    std::optional<std::vector<model::Recipe>> get(const std::string& query,
                                                  const model::SearchFilters& filters);

    /// @brief Deletes every stale entry. Returns the number removed.
    size_t purge_expired();

    void clear();
    size_t size() const;

  private:
    void load();
    void persist();
    void evict_if_needed();
    bool is_fresh(const CachedQuery& entry, int64_t now) const;

    storage::KeyValueStore& store_;
    const infra::Clock& clock_;
    std::string storage_key_;
    size_t capacity_;
    size_t eviction_batch_;
    std::chrono::milliseconds ttl_;

    mutable std::mutex mutex_;
    std::map<std::string, CachedQuery> entries_;
    uint64_t next_order_ = 0;
};

} // namespace larder::cache
