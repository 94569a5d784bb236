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
 * @file query_cache.cpp
 * @brief Freshness checks, oldest-first eviction and persistence for search results.
 */

#include "larder/cache/query_cache.hpp"

#include "larder/infra/logger.hpp"
#include "larder/infra/string.hpp"
#include "larder/model/json.hpp"

#include <algorithm>

namespace larder::cache {

namespace {

bool older(const CachedQuery* a, const CachedQuery* b)
{
    if (a->timestamp != b->timestamp) {
        return a->timestamp < b->timestamp;
    }
    return a->insert_order < b->insert_order;
}

} // namespace

QueryCache::QueryCache(storage::KeyValueStore& store, const infra::Clock& clock,
                       std::string storage_key, size_t capacity, size_t eviction_batch,
                       std::chrono::milliseconds ttl)
    : store_(store), clock_(clock), storage_key_(std::move(storage_key)), capacity_(capacity),
      eviction_batch_(eviction_batch), ttl_(ttl)
{
    load();
}

std::string QueryCache::make_key(const std::string& query, const model::SearchFilters& filters)
{
    return infra::String::normalize_query(query) + "_" + model::canonical_filters(filters);
}

bool QueryCache::is_fresh(const CachedQuery& entry, int64_t now) const
{
    return now - entry.timestamp < ttl_.count();
}

void QueryCache::load()
{
    std::optional<std::string> raw = store_.read(storage_key_);
    if (!raw) {
        return;
    }

    model::json::JsonPtr root = model::json::parse(*raw);
    if (!cJSON_IsArray(root.get())) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Cache: Search record is corrupt. Starting with an empty cache.");
        return;
    }

    cJSON* item = nullptr;
    cJSON_ArrayForEach(item, root.get())
    {
        std::string key = model::json::get_string(item, "key");
        if (key.empty()) {
            continue;
        }
        CachedQuery entry;
        entry.query = model::json::get_string(item, "query");
        entry.filters = model::filters_from_json(cJSON_GetObjectItemCaseSensitive(item, "filters"));
        entry.results = model::recipes_from_json(cJSON_GetObjectItemCaseSensitive(item, "results"));
        entry.timestamp = model::json::get_int64(item, "timestamp");
        entry.insert_order = next_order_++;
        entries_[key] = std::move(entry);
    }
}

/// @brief Must be called with `mutex_` held. Failures are logged, never thrown.
void QueryCache::persist()
{
    std::vector<std::pair<const std::string*, const CachedQuery*>> ordered;
    ordered.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        ordered.emplace_back(&key, &entry);
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const auto& a, const auto& b) { return older(a.second, b.second); });

    model::json::JsonPtr root(cJSON_CreateArray());
    for (const auto& [key, entry] : ordered) {
        cJSON* node = cJSON_CreateObject();
        cJSON_AddStringToObject(node, "key", key->c_str());
        cJSON_AddStringToObject(node, "query", entry->query.c_str());
        cJSON_AddItemToObject(node, "filters", model::filters_to_json(entry->filters));
        cJSON_AddItemToObject(node, "results", model::recipes_to_json(entry->results));
        cJSON_AddNumberToObject(node, "timestamp", static_cast<double>(entry->timestamp));
        cJSON_AddItemToArray(root.get(), node);
    }

    if (!store_.write(storage_key_, model::json::print(root.get()))) {
        infra::Logger::log(infra::LogLevel::WARN,
                           "Cache: Failed to persist search cache (storage rejected write).");
    }
}

void QueryCache::evict_if_needed()
{
    if (entries_.size() <= capacity_) {
        return;
    }

    std::vector<std::pair<std::string, const CachedQuery*>> ordered;
    ordered.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        ordered.emplace_back(key, &entry);
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const auto& a, const auto& b) { return older(a.second, b.second); });

    size_t to_evict = std::max(eviction_batch_, entries_.size() - capacity_);
    to_evict = std::min(to_evict, ordered.size());

    std::vector<std::string> victims;
    for (size_t i = 0; i < to_evict; ++i) {
        victims.push_back(ordered[i].first);
    }
    for (const auto& key : victims) {
        entries_.erase(key);
    }

    infra::Logger::log(infra::LogLevel::DEBUG,
                       "Cache: Evicted " + std::to_string(victims.size()) + " searches.");
}

void QueryCache::put(const std::string& query, const model::SearchFilters& filters,
                     const std::vector<model::Recipe>& results)
{
    std::lock_guard<std::mutex> lock(mutex_);

    CachedQuery entry;
    entry.query = query;
    entry.filters = filters;
    entry.results = results;
    entry.timestamp = clock_.now_ms();
    entry.insert_order = next_order_++;
    entries_[make_key(query, filters)] = std::move(entry);

    evict_if_needed();
    persist();
}

std::optional<std::vector<model::Recipe>> QueryCache::get(const std::string& query,
                                                          const model::SearchFilters& filters)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::string key = make_key(query, filters);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }

    if (!is_fresh(it->second, clock_.now_ms())) {
        entries_.erase(it);
        infra::Logger::log(infra::LogLevel::DEBUG, "Cache: Purged stale search '" + key + "'.");
        persist();
        return std::nullopt;
    }
    return it->second.results;
}

size_t QueryCache::purge_expired()
{
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t now = clock_.now_ms();

    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (!is_fresh(it->second, now)) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        persist();
    }
    return removed;
}

void QueryCache::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    if (!store_.remove(storage_key_)) {
        infra::Logger::log(infra::LogLevel::WARN, "Cache: Failed to remove search cache record.");
    }
}

size_t QueryCache::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace larder::cache
