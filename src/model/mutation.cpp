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
 * @file mutation.cpp
 * @brief Wire names and cJSON codecs for queued mutations.
 *
 * @details
 * A queued record has the shape
 * `{"id": ..., "type": "favorite", "payload": {...}, "enqueuedAt": ..., "retryCount": ...}`.
 */

#include "larder/model/mutation.hpp"

#include "larder/model/json.hpp"

namespace larder::model {

namespace {

// std::visit helper for inline lambda overload sets.
template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::string require_recipe_id(const cJSON* payload)
{
    std::string id = json::get_string(payload, "recipeId");
    if (id.empty()) {
        throw std::runtime_error("Favorite toggle payload is missing 'recipeId'");
    }
    return id;
}

} // namespace

bool GenerateRecipe::operator==(const GenerateRecipe& other) const
{
    return message == other.message && meal_type == other.meal_type && cuisine == other.cuisine &&
           difficulty == other.difficulty && cooking_time == other.cooking_time &&
           servings == other.servings && include_ingredients == other.include_ingredients &&
           exclude_ingredients == other.exclude_ingredients &&
           dietary_restrictions == other.dietary_restrictions && spice_level == other.spice_level;
}

bool UpdatePreferences::operator==(const UpdatePreferences& other) const
{
    return dietary_restrictions == other.dietary_restrictions && allergies == other.allergies &&
           cuisine_preferences == other.cuisine_preferences && spice_level == other.spice_level &&
           max_cooking_time == other.max_cooking_time && serving_size == other.serving_size;
}

MutationType PendingOperation::type() const
{
    return type_of(mutation);
}

MutationType type_of(const Mutation& mutation)
{
    return std::visit(overloaded{
                          [](const Favorite&) { return MutationType::FAVORITE; },
                          [](const Unfavorite&) { return MutationType::UNFAVORITE; },
                          [](const GenerateRecipe&) { return MutationType::GENERATE; },
                          [](const UpdatePreferences&) { return MutationType::UPDATE_PREFERENCES; },
                      },
                      mutation);
}

const char* type_name(MutationType type)
{
    switch (type) {
    case MutationType::FAVORITE:
        return "favorite";
    case MutationType::UNFAVORITE:
        return "unfavorite";
    case MutationType::GENERATE:
        return "generate";
    case MutationType::UPDATE_PREFERENCES:
        return "updatePreferences";
    }
    return "unknown";
}

std::optional<MutationType> parse_type(const std::string& name)
{
    if (name == "favorite")
        return MutationType::FAVORITE;
    if (name == "unfavorite")
        return MutationType::UNFAVORITE;
    if (name == "generate")
        return MutationType::GENERATE;
    if (name == "updatePreferences")
        return MutationType::UPDATE_PREFERENCES;
    return std::nullopt;
}

cJSON* payload_to_json(const Mutation& mutation)
{
    cJSON* obj = cJSON_CreateObject();
    std::visit(overloaded{
                   [obj](const Favorite& m) {
                       cJSON_AddStringToObject(obj, "recipeId", m.recipe_id.c_str());
                   },
                   [obj](const Unfavorite& m) {
                       cJSON_AddStringToObject(obj, "recipeId", m.recipe_id.c_str());
                   },
                   [obj](const GenerateRecipe& m) {
                       cJSON_AddStringToObject(obj, "message", m.message.c_str());
                       cJSON_AddStringToObject(obj, "mealType", m.meal_type.c_str());
                       cJSON_AddStringToObject(obj, "cuisine", m.cuisine.c_str());
                       cJSON_AddStringToObject(obj, "difficulty", m.difficulty.c_str());
                       cJSON_AddNumberToObject(obj, "cookingTime", m.cooking_time);
                       cJSON_AddNumberToObject(obj, "servings", m.servings);
                       json::add_string_array(obj, "includeIngredients", m.include_ingredients);
                       json::add_string_array(obj, "excludeIngredients", m.exclude_ingredients);
                       json::add_string_array(obj, "dietaryRestrictions", m.dietary_restrictions);
                       cJSON_AddStringToObject(obj, "spiceLevel", m.spice_level.c_str());
                   },
                   [obj](const UpdatePreferences& m) {
                       json::add_string_array(obj, "dietaryRestrictions", m.dietary_restrictions);
                       json::add_string_array(obj, "allergies", m.allergies);
                       json::add_string_array(obj, "cuisinePreferences", m.cuisine_preferences);
                       cJSON_AddStringToObject(obj, "spiceLevel", m.spice_level.c_str());
                       cJSON_AddNumberToObject(obj, "maxCookingTime", m.max_cooking_time);
                       cJSON_AddNumberToObject(obj, "servingSize", m.serving_size);
                   },
               },
               mutation);
    return obj;
}

Mutation mutation_from_json(MutationType type, const cJSON* payload)
{
    switch (type) {
    case MutationType::FAVORITE:
        return Favorite{require_recipe_id(payload)};
    case MutationType::UNFAVORITE:
        return Unfavorite{require_recipe_id(payload)};
    case MutationType::GENERATE: {
        GenerateRecipe m;
        m.message = json::get_string(payload, "message");
        m.meal_type = json::get_string(payload, "mealType");
        m.cuisine = json::get_string(payload, "cuisine");
        m.difficulty = json::get_string(payload, "difficulty");
        m.cooking_time = static_cast<int>(json::get_number(payload, "cookingTime"));
        m.servings = static_cast<int>(json::get_number(payload, "servings"));
        m.include_ingredients = json::get_string_array(payload, "includeIngredients");
        m.exclude_ingredients = json::get_string_array(payload, "excludeIngredients");
        m.dietary_restrictions = json::get_string_array(payload, "dietaryRestrictions");
        m.spice_level = json::get_string(payload, "spiceLevel");
        return m;
    }
    case MutationType::UPDATE_PREFERENCES: {
        UpdatePreferences m;
        m.dietary_restrictions = json::get_string_array(payload, "dietaryRestrictions");
        m.allergies = json::get_string_array(payload, "allergies");
        m.cuisine_preferences = json::get_string_array(payload, "cuisinePreferences");
        m.spice_level = json::get_string(payload, "spiceLevel");
        m.max_cooking_time = static_cast<int>(json::get_number(payload, "maxCookingTime"));
        m.serving_size = static_cast<int>(json::get_number(payload, "servingSize"));
        return m;
    }
    }
    throw UnknownMutationError(std::to_string(static_cast<int>(type)));
}

cJSON* operation_to_json(const PendingOperation& op)
{
    cJSON* obj = cJSON_CreateObject();
    cJSON_AddStringToObject(obj, "id", op.id.c_str());
    cJSON_AddStringToObject(obj, "type", type_name(op.type()));
    cJSON_AddItemToObject(obj, "payload", payload_to_json(op.mutation));
    cJSON_AddNumberToObject(obj, "enqueuedAt", static_cast<double>(op.enqueued_at));
    cJSON_AddNumberToObject(obj, "retryCount", op.retry_count);
    return obj;
}

PendingOperation operation_from_json(const cJSON* node)
{
    if (!cJSON_IsObject(node)) {
        throw std::runtime_error("Queued operation record is not an object");
    }

    std::string type_str = json::get_string(node, "type");
    std::optional<MutationType> type = parse_type(type_str);
    if (!type) {
        throw UnknownMutationError(type_str);
    }

    PendingOperation op;
    op.id = json::get_string(node, "id");
    if (op.id.empty()) {
        throw std::runtime_error("Queued operation record has no id");
    }
    op.mutation = mutation_from_json(*type, cJSON_GetObjectItemCaseSensitive(node, "payload"));
    op.enqueued_at = json::get_int64(node, "enqueuedAt");
    op.retry_count = static_cast<int>(json::get_number(node, "retryCount"));
    return op;
}

} // namespace larder::model
