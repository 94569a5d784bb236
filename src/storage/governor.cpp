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

#include "larder/storage/governor.hpp"

#include "larder/infra/logger.hpp"

namespace larder::storage {

StorageGovernor::StorageGovernor(KeyValueStore& store, std::string key_prefix)
    : store_(store), key_prefix_(std::move(key_prefix))
{
}

bool StorageGovernor::owns(const std::string& key) const
{
    return key.compare(0, key_prefix_.size(), key_prefix_) == 0;
}

StorageUsage StorageGovernor::usage() const
{
    StorageUsage usage;
    usage.total = store_.capacity();

    for (const auto& key : store_.keys()) {
        if (!owns(key)) {
            continue;
        }
        if (auto value = store_.read(key)) {
            usage.used += value->size();
        }
    }

    if (usage.total > 0) {
        usage.percentage =
            static_cast<double>(usage.used) / static_cast<double>(usage.total) * 100.0;
    }
    return usage;
}

size_t StorageGovernor::clear_all()
{
    size_t removed = 0;
    for (const auto& key : store_.keys()) {
        if (!owns(key)) {
            continue;
        }
        if (store_.remove(key)) {
            ++removed;
        } else {
            infra::Logger::log(infra::LogLevel::WARN, "Storage: Failed to remove key " + key);
        }
    }
    infra::Logger::log(infra::LogLevel::INFO,
                       "Storage: Cleared " + std::to_string(removed) + " engine-owned keys.");
    return removed;
}

} // namespace larder::storage
