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

#include "larder/core/config.hpp"

#include "larder/model/json.hpp"

#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace larder::core {

namespace {

/// @brief Reads a non-negative integral field, leaving `out` untouched if absent.
template <typename T>
void read_count(const cJSON* obj, const char* key, T& out)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(obj, key);
    if (!item) {
        return;
    }
    if (!cJSON_IsNumber(item) || item->valuedouble < 0) {
        throw std::runtime_error(std::string("Config field '") + key +
                                 "' must be a non-negative number.");
    }
    // Valid values are below 2^digits; anything larger does not fit in T.
    if (item->valuedouble >= std::ldexp(1.0, std::numeric_limits<T>::digits)) {
        throw std::runtime_error(std::string("Config field '") + key + "' is out of range.");
    }
    out = static_cast<T>(item->valuedouble);
}

void read_millis(const cJSON* obj, const char* key, std::chrono::milliseconds& out)
{
    int64_t value = out.count();
    read_count(obj, key, value);
    out = std::chrono::milliseconds(value);
}

} // namespace

EngineConfig config_from_json(const cJSON* obj)
{
    if (!cJSON_IsObject(obj)) {
        throw std::runtime_error("Config root must be a JSON object.");
    }

    EngineConfig config;
    read_count(obj, "entity_capacity", config.entity_capacity);
    read_count(obj, "entity_eviction_batch", config.entity_eviction_batch);
    read_count(obj, "query_capacity", config.query_capacity);
    read_count(obj, "query_eviction_batch", config.query_eviction_batch);
    read_millis(obj, "query_ttl_ms", config.query_ttl);
    read_count(obj, "max_retries", config.max_retries);
    read_millis(obj, "sync_interval_ms", config.sync_interval);
    read_count(obj, "storage_quota_bytes", config.storage_quota_bytes);

    const cJSON* prefix = cJSON_GetObjectItemCaseSensitive(obj, "key_prefix");
    if (prefix) {
        if (!cJSON_IsString(prefix) || prefix->valuestring == nullptr) {
            throw std::runtime_error("Config field 'key_prefix' must be a string.");
        }
        config.key_prefix = prefix->valuestring;
    }

    if (config.entity_capacity < 1) {
        throw std::runtime_error("Config field 'entity_capacity' must be at least 1.");
    }
    if (config.query_capacity < 1) {
        throw std::runtime_error("Config field 'query_capacity' must be at least 1.");
    }
    if (config.max_retries < 1) {
        throw std::runtime_error("Config field 'max_retries' must be at least 1.");
    }
    if (config.sync_interval.count() <= 0) {
        throw std::runtime_error("Config field 'sync_interval_ms' must be positive.");
    }
    return config;
}

EngineConfig load_config(const std::string& path)
{
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    model::json::JsonPtr root = model::json::parse(buffer.str());
    if (!root) {
        throw std::runtime_error("Malformed JSON in config file: " + path);
    }
    return config_from_json(root.get());
}

} // namespace larder::core
