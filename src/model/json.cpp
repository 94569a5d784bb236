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

#include "larder/model/json.hpp"

#include <cstdlib>

namespace larder::model::json {

JsonPtr parse(const std::string& raw)
{
    return JsonPtr(cJSON_Parse(raw.c_str()));
}

std::string print(const cJSON* node)
{
    char* raw = cJSON_PrintUnformatted(node);
    if (!raw) {
        return "";
    }
    std::string out(raw);
    free(raw);
    return out;
}

std::string get_string(const cJSON* obj, const char* key, const std::string& fallback)
{
    cJSON* node = cJSON_GetObjectItemCaseSensitive(obj, key);
    if (cJSON_IsString(node) && node->valuestring) {
        return node->valuestring;
    }
    return fallback;
}

double get_number(const cJSON* obj, const char* key, double fallback)
{
    cJSON* node = cJSON_GetObjectItemCaseSensitive(obj, key);
    if (cJSON_IsNumber(node)) {
        return node->valuedouble;
    }
    return fallback;
}

int64_t get_int64(const cJSON* obj, const char* key, int64_t fallback)
{
    cJSON* node = cJSON_GetObjectItemCaseSensitive(obj, key);
    if (cJSON_IsNumber(node)) {
        // valueint saturates at INT_MAX; millisecond timestamps need the double.
        return static_cast<int64_t>(node->valuedouble);
    }
    return fallback;
}

std::vector<std::string> get_string_array(const cJSON* obj, const char* key)
{
    std::vector<std::string> out;
    cJSON* arr = cJSON_GetObjectItemCaseSensitive(obj, key);
    if (!cJSON_IsArray(arr)) {
        return out;
    }
    cJSON* item = nullptr;
    cJSON_ArrayForEach(item, arr)
    {
        if (cJSON_IsString(item) && item->valuestring) {
            out.emplace_back(item->valuestring);
        }
    }
    return out;
}

void add_string_array(cJSON* obj, const char* key, const std::vector<std::string>& values)
{
    cJSON* arr = cJSON_AddArrayToObject(obj, key);
    for (const auto& v : values) {
        cJSON_AddItemToArray(arr, cJSON_CreateString(v.c_str()));
    }
}

} // namespace larder::model::json
