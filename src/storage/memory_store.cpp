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

#include "larder/storage/store.hpp"

namespace larder::storage {

MemoryStore::MemoryStore(size_t capacity) : capacity_(capacity) {}

std::optional<std::string> MemoryStore::read(const std::string& key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryStore::write(const std::string& key, const std::string& bytes)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_writes_) {
        return false;
    }

    size_t used = 0;
    for (const auto& [k, v] : values_) {
        if (k != key) {
            used += v.size();
        }
    }
    if (used + bytes.size() > capacity_) {
        return false;
    }

    values_[key] = bytes;
    return true;
}

bool MemoryStore::remove(const std::string& key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    values_.erase(key);
    return true;
}

std::vector<std::string> MemoryStore::keys()
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(values_.size());
    for (const auto& [k, v] : values_) {
        out.push_back(k);
    }
    return out;
}

void MemoryStore::set_fail_writes(bool fail)
{
    std::lock_guard<std::mutex> lock(mutex_);
    fail_writes_ = fail;
}

} // namespace larder::storage
