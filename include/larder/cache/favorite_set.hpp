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
 * @file favorite_set.hpp
 * @brief Locally known favorite recipe ids.
 *
 * @details
 * Answers "is favorited" without a round trip. Membership is the confirmed server
 * state (once fetched) with the not-yet-replayed local toggles applied on top; the
 * engine maintains that union, this class only stores and persists it.
 */

#pragma once

#include "larder/storage/store.hpp"

#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace larder::cache {

class FavoriteSet {
  public:
    FavoriteSet(storage::KeyValueStore& store, std::string storage_key);

    void add(const std::string& id);
    void remove(const std::string& id);
    bool contains(const std::string& id) const;

    /// @brief Replaces the whole membership in one write.
    void assign(std::set<std::string> ids);

    std::vector<std::string> list() const;
    void clear();

  private:
    void load();
    void persist();

    storage::KeyValueStore& store_;
    std::string storage_key_;

    mutable std::mutex mutex_;
    std::set<std::string> ids_;
};

} // namespace larder::cache
