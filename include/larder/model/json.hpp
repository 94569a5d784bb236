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
 * @file json.hpp
 * @brief Small cJSON accessors shared by the model codecs.
 *
 * @details
 * cJSON hands out raw pointers. These helpers read typed fields with defaults and
 * tie the lifetime of a parsed or built tree to a scope (`JsonPtr`), so the codecs
 * never leak on early returns.
 */

#pragma once

#include <cJSON.h>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace larder::model::json {

/// @brief Deleter releasing a cJSON tree.
struct Deleter {
    void operator()(cJSON* node) const { cJSON_Delete(node); }
};

/// @brief Owning handle over a cJSON tree root.
using JsonPtr = std::unique_ptr<cJSON, Deleter>;

/// @brief Parses `raw`; returns an empty handle on syntax error.
JsonPtr parse(const std::string& raw);

/// @brief Serializes without whitespace.
std::string print(const cJSON* node);

std::string get_string(const cJSON* obj, const char* key, const std::string& fallback = "");
double get_number(const cJSON* obj, const char* key, double fallback = 0.0);
int64_t get_int64(const cJSON* obj, const char* key, int64_t fallback = 0);
std::vector<std::string> get_string_array(const cJSON* obj, const char* key);

/**
 * @brief Adds `values` to `obj` as a JSON array of strings under `key`.
 */
void add_string_array(cJSON* obj, const char* key, const std::vector<std::string>& values);

} // namespace larder::model::json
