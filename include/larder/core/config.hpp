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
 * @file config.hpp
 * @brief Tunables of the offline engine and their JSON loader.
 */

#pragma once

#include <cJSON.h>
#include <chrono>
#include <cstddef>
#include <string>

namespace larder::core {

/**
 * @struct EngineConfig
 * @brief Every bound and interval the engine enforces.
 *
 * @details
 * JSON field names match the member names; durations are given in milliseconds
 * with an `_ms` suffix (`query_ttl_ms`, `sync_interval_ms`).
 */
struct EngineConfig {
    size_t entity_capacity = 100;
    size_t entity_eviction_batch = 10;

    size_t query_capacity = 50;
    size_t query_eviction_batch = 10;
    std::chrono::milliseconds query_ttl{std::chrono::hours(1)};

    int max_retries = 5;
    std::chrono::milliseconds sync_interval{std::chrono::minutes(5)};

    /// @brief Capacity handed to the file store by `larder_shell`.
    size_t storage_quota_bytes = 5 * 1024 * 1024;

    /// @brief Prefix of every key the engine writes.
    std::string key_prefix = "larder_";
};

/**
 * @brief Overlays the fields present in `obj` onto the defaults.
 *
 * @throws std::runtime_error If `obj` is not an object or a field has the wrong type
 * or an out-of-range value.
 */
EngineConfig config_from_json(const cJSON* obj);

/**
 * @brief Reads a JSON configuration file.
 *
 * @throws std::runtime_error If the file cannot be read or parsed.
 */
EngineConfig load_config(const std::string& path);

} // namespace larder::core
