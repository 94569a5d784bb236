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
 * @file handler.cpp
 * @brief Implementation of the shell command pipeline.
 *
 * @details
 * 1. **Ingest**: Parse the JSON line.
 * 2. **Dispatch**: Route the `action` to the engine.
 * 3. **Respond**: Wrap the result (or the error) in the standard envelope.
 */

#include "larder/shell/handler.hpp"

#include "larder/model/json.hpp"

#include <exception>
#include <stdexcept>

namespace larder::shell {

namespace {

std::string error_response(const std::string& message)
{
    model::json::JsonPtr resp(cJSON_CreateObject());
    cJSON_AddStringToObject(resp.get(), "status", "error");
    cJSON_AddStringToObject(resp.get(), "message", message.c_str());
    return model::json::print(resp.get());
}

/// @throws std::invalid_argument If `key` is missing or not a string.
std::string require_string(const cJSON* req, const char* key)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(req, key);
    if (!cJSON_IsString(item) || item->valuestring == nullptr) {
        throw std::invalid_argument(std::string("Missing argument: '") + key + "'");
    }
    return item->valuestring;
}

/// @throws std::invalid_argument If `key` is missing or not a boolean.
bool require_bool(const cJSON* req, const char* key)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(req, key);
    if (!cJSON_IsBool(item)) {
        throw std::invalid_argument(std::string("Missing boolean argument: '") + key + "'");
    }
    return cJSON_IsTrue(item);
}

/// @throws std::invalid_argument If `filters` is present but not an object.
model::SearchFilters read_filters(const cJSON* req)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(req, "filters");
    if (item && !cJSON_IsNull(item) && !cJSON_IsObject(item)) {
        throw std::invalid_argument("Argument 'filters' must be an object");
    }
    return model::filters_from_json(item);
}

cJSON* report_to_json(const sync::DrainReport& report)
{
    cJSON* obj = cJSON_CreateObject();
    cJSON_AddNumberToObject(obj, "attempted", static_cast<double>(report.attempted));
    cJSON_AddNumberToObject(obj, "succeeded", static_cast<double>(report.succeeded));
    cJSON_AddNumberToObject(obj, "retried", static_cast<double>(report.retried));
    cJSON_AddNumberToObject(obj, "failed", static_cast<double>(report.failed));
    return obj;
}

/**
 * @brief Executes one action.
 * @return cJSON* The `data` payload (owned by the caller), or nullptr for none.
 */
cJSON* dispatch(core::OfflineEngine& engine, SimulatedRemote& remote, const std::string& action,
                const cJSON* req)
{
    if (action == "status") {
        core::NetworkStatus status = engine.get_network_status();
        cJSON* data = cJSON_CreateObject();
        cJSON_AddBoolToObject(data, "isOnline", status.is_online);
        cJSON_AddBoolToObject(data, "isSyncing", status.is_syncing);
        cJSON_AddBoolToObject(data, "remoteHealthy", remote.healthy());
        cJSON_AddNumberToObject(data, "pending",
                                static_cast<double>(engine.pending_operations().size()));
        cJSON_AddNumberToObject(data, "cached",
                                static_cast<double>(engine.list_cached_entities().size()));
        return data;
    }
    if (action == "set_online") {
        engine.set_online(require_bool(req, "online"));
        return nullptr;
    }
    if (action == "set_remote") {
        remote.set_healthy(require_bool(req, "healthy"));
        return nullptr;
    }
    if (action == "cache_recipe") {
        model::Recipe recipe;
        if (!model::recipe_from_json(cJSON_GetObjectItemCaseSensitive(req, "recipe"), recipe)) {
            throw std::invalid_argument("Missing or malformed 'recipe'");
        }
        engine.cache_entity(recipe);
        return nullptr;
    }
    if (action == "get_recipe") {
        return model::recipe_to_json(engine.fetch_recipe(require_string(req, "id")));
    }
    if (action == "list_recipes") {
        return model::recipes_to_json(engine.list_cached_entities());
    }
    if (action == "clear_cache") {
        engine.clear_cache();
        return nullptr;
    }
    if (action == "cache_search") {
        model::SearchFilters filters = read_filters(req);
        std::vector<model::Recipe> results =
            model::recipes_from_json(cJSON_GetObjectItemCaseSensitive(req, "results"));
        engine.cache_query(require_string(req, "query"), filters, results);
        return nullptr;
    }
    if (action == "get_search") {
        model::SearchFilters filters = read_filters(req);
        return model::recipes_to_json(engine.search(require_string(req, "query"), filters));
    }
    if (action == "enqueue") {
        std::string type_name = require_string(req, "type");
        std::optional<model::MutationType> type = model::parse_type(type_name);
        if (!type) {
            throw std::invalid_argument("Unknown mutation type: " + type_name);
        }
        model::Mutation mutation =
            model::mutation_from_json(*type, cJSON_GetObjectItemCaseSensitive(req, "payload"));
        bool durable = engine.enqueue_mutation(mutation);
        cJSON* data = cJSON_CreateObject();
        cJSON_AddBoolToObject(data, "durable", durable);
        return data;
    }
    if (action == "sync") {
        std::optional<sync::DrainReport> report = engine.sync_now();
        if (!report) {
            throw std::runtime_error("Sync skipped: offline or already syncing");
        }
        return report_to_json(*report);
    }
    if (action == "pending") {
        cJSON* data = cJSON_CreateArray();
        for (const auto& op : engine.pending_operations()) {
            cJSON_AddItemToArray(data, model::operation_to_json(op));
        }
        return data;
    }
    if (action == "favorite" || action == "unfavorite") {
        std::string id = require_string(req, "id");
        core::SubmitOutcome outcome =
            action == "favorite" ? engine.submit_mutation(model::Favorite{id})
                                 : engine.submit_mutation(model::Unfavorite{id});
        cJSON* data = cJSON_CreateObject();
        cJSON_AddStringToObject(data, "outcome",
                                outcome == core::SubmitOutcome::APPLIED ? "applied" : "queued");
        return data;
    }
    if (action == "is_favorite") {
        return cJSON_CreateBool(engine.is_offline_favorite(require_string(req, "id")));
    }
    if (action == "usage") {
        storage::StorageUsage usage = engine.get_storage_usage();
        cJSON* data = cJSON_CreateObject();
        cJSON_AddNumberToObject(data, "used", static_cast<double>(usage.used));
        cJSON_AddNumberToObject(data, "total", static_cast<double>(usage.total));
        cJSON_AddNumberToObject(data, "percentage", usage.percentage);
        return data;
    }
    if (action == "clear_all") {
        size_t removed = engine.clear_all();
        cJSON* data = cJSON_CreateObject();
        cJSON_AddNumberToObject(data, "removed", static_cast<double>(removed));
        return data;
    }
    throw std::invalid_argument("Unknown action: " + action);
}

} // namespace

std::string Handler::process(core::OfflineEngine& engine, SimulatedRemote& remote,
                             const std::string& raw_json)
{
    if (raw_json.empty()) {
        return error_response("Empty request payload");
    }

    model::json::JsonPtr req = model::json::parse(raw_json);
    if (!cJSON_IsObject(req.get())) {
        return error_response("Invalid JSON syntax");
    }

    std::string action = model::json::get_string(req.get(), "action");
    if (action == "exit") {
        return "{\"status\":\"goodbye\"}";
    }

    try {
        model::json::JsonPtr data(dispatch(engine, remote, action, req.get()));
        model::json::JsonPtr resp(cJSON_CreateObject());
        cJSON_AddStringToObject(resp.get(), "status", "ok");
        if (data) {
            cJSON_AddItemToObject(resp.get(), "data", data.release());
        }
        return model::json::print(resp.get());
    } catch (const core::NotCachedError& e) {
        return error_response(std::string("Not cached: ") + e.what());
    } catch (const std::exception& e) {
        return error_response(e.what());
    }
}

} // namespace larder::shell
