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
 * @file entity_cache.cpp
 * @brief LRU eviction and write-through persistence for cached recipes.
 *
 * @details
 * Persisted layout: a JSON array from least to most recently accessed, each element `{"key", "entity", "cachedAt", "lastAccessedAt", "accessOrder"}`.
 */

#include "larder/cache/entity_cache.hpp"

#include "larder/infra/logger.hpp"
#include "larder/model/json.hpp"

#include <algorithm>

namespace larder::cache {

namespace {

// Ascending recency: the entry evicted first sorts first.
bool less_recent(const CachedEntity* a, const CachedEntity* b)
{
    if (a->last_accessed_at != b->last_accessed_at) {
        return a->last_accessed_at < b->last_accessed_at;
    }
    return a->access_order < b->access_order;
}

} // namespace

EntityCache::EntityCache(storage::KeyValueStore& store, const infra::Clock& clock,
                         std::string storage_key, size_t capacity, size_t eviction_batch)
    : store_(store), clock_(clock), storage_key_(std::move(storage_key)), capacity_(capacity),
      eviction_batch_(eviction_batch)
{
    load();
}

void EntityCache::load()
{
    std::optional<std::string> raw = store_.read(storage_key_);
    if (!raw) {
        return;
    }

    model::json::JsonPtr root = model::json::parse(*raw);
    if (!cJSON_IsArray(root.get())) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Cache: Entity record is corrupt. Starting with an empty cache.");
        return;
    }

    cJSON* item = nullptr;
    cJSON_ArrayForEach(item, root.get())
    {
        CachedEntity entry;
        if (!model::recipe_from_json(cJSON_GetObjectItemCaseSensitive(item, "entity"),
                                     entry.entity)) {
            infra::Logger::log(infra::LogLevel::ERROR, "Cache: Skipping malformed entity entry.");
            continue;
        }
        entry.cached_at = model::json::get_int64(item, "cachedAt");
        entry.last_accessed_at = model::json::get_int64(item, "lastAccessedAt");
        entry.access_order = static_cast<uint64_t>(model::json::get_int64(item, "accessOrder"));
        next_order_ = std::max(next_order_, entry.access_order + 1);

        std::string key = model::json::get_string(item, "key", entry.entity.id);
        entries_[key] = std::move(entry);
    }

    infra::Logger::log(infra::LogLevel::DEBUG,
                       "Cache: Restored " + std::to_string(entries_.size()) + " recipes.");
}

/**
 * @brief Writes the whole cache record. Must be called with `mutex_` held.
 *
 * Failures (quota exhaustion, I/O) are logged and swallowed: caching never blocks
 * the caller's primary path.
 */
void EntityCache::persist()
{
    std::vector<const CachedEntity*> ordered;
    ordered.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        ordered.push_back(&entry);
    }
    std::sort(ordered.begin(), ordered.end(), less_recent);

    model::json::JsonPtr root(cJSON_CreateArray());
    for (const CachedEntity* entry : ordered) {
        cJSON* node = cJSON_CreateObject();
        cJSON_AddStringToObject(node, "key", entry->entity.id.c_str());
        cJSON_AddItemToObject(node, "entity", model::recipe_to_json(entry->entity));
        cJSON_AddNumberToObject(node, "cachedAt", static_cast<double>(entry->cached_at));
        cJSON_AddNumberToObject(node, "lastAccessedAt",
                                static_cast<double>(entry->last_accessed_at));
        cJSON_AddNumberToObject(node, "accessOrder", static_cast<double>(entry->access_order));
        cJSON_AddItemToArray(root.get(), node);
    }

    if (!store_.write(storage_key_, model::json::print(root.get()))) {
        infra::Logger::log(infra::LogLevel::WARN,
                           "Cache: Failed to persist recipe cache (storage rejected write).");
    }
}

/**
 * @brief Drops the least recently accessed entries once the bound is exceeded.
 */
void EntityCache::evict_if_needed()
{
    if (entries_.size() <= capacity_) {
        return;
    }

    std::vector<const CachedEntity*> ordered;
    ordered.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        ordered.push_back(&entry);
    }
    std::sort(ordered.begin(), ordered.end(), less_recent);

    size_t to_evict = std::max(eviction_batch_, entries_.size() - capacity_);
    to_evict = std::min(to_evict, ordered.size());

    std::vector<std::string> victims;
    victims.reserve(to_evict);
    for (size_t i = 0; i < to_evict; ++i) {
        victims.push_back(ordered[i]->entity.id);
    }
    for (const auto& id : victims) {
        entries_.erase(id);
    }

    infra::Logger::log(infra::LogLevel::DEBUG,
                       "Cache: Evicted " + std::to_string(victims.size()) + " recipes.");
}

void EntityCache::put(const model::Recipe& recipe)
{
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t now = clock_.now_ms();

    auto it = entries_.find(recipe.id);
    if (it == entries_.end()) {
        CachedEntity entry;
        entry.entity = recipe;
        entry.cached_at = now;
        entry.last_accessed_at = now;
        entry.access_order = next_order_++;
        entries_.emplace(recipe.id, std::move(entry));
    } else {
        it->second.entity = recipe;
        it->second.last_accessed_at = now;
        it->second.access_order = next_order_++;
    }

    evict_if_needed();
    persist();
}

std::optional<model::Recipe> EntityCache::get(const std::string& id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }

    it->second.last_accessed_at = clock_.now_ms();
    it->second.access_order = next_order_++;
    model::Recipe copy = it->second.entity;
    persist();
    return copy;
}

std::optional<CachedEntity> EntityCache::peek(const std::string& id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<CachedEntity> EntityCache::list() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<const CachedEntity*> ordered;
    ordered.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        ordered.push_back(&entry);
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const CachedEntity* a, const CachedEntity* b) { return less_recent(b, a); });

    std::vector<CachedEntity> out;
    out.reserve(ordered.size());
    for (const CachedEntity* entry : ordered) {
        out.push_back(*entry);
    }
    return out;
}

void EntityCache::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    if (!store_.remove(storage_key_)) {
        infra::Logger::log(infra::LogLevel::WARN, "Cache: Failed to remove recipe cache record.");
    }
}

size_t EntityCache::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace larder::cache
