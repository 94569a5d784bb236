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
 * @file governor.hpp
 * @brief Storage usage reporting and full reset for engine-owned keys.
 */

#pragma once

#include "larder/storage/store.hpp"

#include <cstddef>
#include <string>

namespace larder::storage {

struct StorageUsage {
    size_t used = 0;
    size_t total = 0;
    double percentage = 0.0;
};

/**
 * @class StorageGovernor
 * @brief Diagnostic view over the keys the engine owns in a shared store.
 *
 * @details
 * Ownership is decided by key prefix, so keys written by other components sharing
 * the same store are neither counted nor removed.
 */
class StorageGovernor {
  public:
    StorageGovernor(KeyValueStore& store, std::string key_prefix);

    /**
     * @brief Sums the serialized size of every engine-owned value.
     *
     * `total` is the store's configured capacity; `percentage` is `used / total * 100`
     * (0 when the capacity is 0).
     */
    StorageUsage usage() const;

    /**
     * @brief Removes every engine-owned key.
     * @return size_t The number of keys removed.
     */
    size_t clear_all();

    bool owns(const std::string& key) const;

  private:
    KeyValueStore& store_;
    std::string key_prefix_;
};

} // namespace larder::storage
