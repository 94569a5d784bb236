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

#include "larder/cache/favorite_set.hpp"

#include "larder/infra/logger.hpp"
#include "larder/model/json.hpp"

namespace larder::cache {

FavoriteSet::FavoriteSet(storage::KeyValueStore& store, std::string storage_key)
    : store_(store), storage_key_(std::move(storage_key))
{
    load();
}

void FavoriteSet::load()
{
    std::optional<std::string> raw = store_.read(storage_key_);
    if (!raw) {
        return;
    }

    model::json::JsonPtr root = model::json::parse(*raw);
    if (!cJSON_IsArray(root.get())) {
        infra::Logger::log(infra::LogLevel::ERROR, "Cache: Favorites record is corrupt. Ignored.");
        return;
    }

    cJSON* item = nullptr;
    cJSON_ArrayForEach(item, root.get())
    {
        if (cJSON_IsString(item) && item->valuestring) {
            ids_.insert(item->valuestring);
        }
    }
}

void FavoriteSet::persist()
{
    model::json::JsonPtr root(cJSON_CreateArray());
    for (const auto& id : ids_) {
        cJSON_AddItemToArray(root.get(), cJSON_CreateString(id.c_str()));
    }
    if (!store_.write(storage_key_, model::json::print(root.get()))) {
        infra::Logger::log(infra::LogLevel::WARN,
                           "Cache: Failed to persist favorites (storage rejected write).");
    }
}

void FavoriteSet::add(const std::string& id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (ids_.insert(id).second) {
        persist();
    }
}

void FavoriteSet::remove(const std::string& id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (ids_.erase(id) > 0) {
        persist();
    }
}

bool FavoriteSet::contains(const std::string& id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return ids_.count(id) > 0;
}

void FavoriteSet::assign(std::set<std::string> ids)
{
    std::lock_guard<std::mutex> lock(mutex_);
    ids_ = std::move(ids);
    persist();
}

std::vector<std::string> FavoriteSet::list() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(ids_.begin(), ids_.end());
}

void FavoriteSet::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    ids_.clear();
    if (!store_.remove(storage_key_)) {
        infra::Logger::log(infra::LogLevel::WARN, "Cache: Failed to remove favorites record.");
    }
}

} // namespace larder::cache
