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
 * @file recipe.cpp
 * @brief cJSON codecs for recipes and filter sets.
 *
 * @details
 * Field names follow the remote API (`cookingTime`, `mealType`, ...), so a recipe
 * body received from the service can be decoded directly.
 */

#include "larder/model/recipe.hpp"

#include "larder/model/json.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace larder::model {

bool Ingredient::operator==(const Ingredient& other) const
{
    return name == other.name && amount == other.amount && unit == other.unit;
}

bool Recipe::operator==(const Recipe& other) const
{
    return id == other.id && title == other.title && description == other.description &&
           ingredients == other.ingredients && instructions == other.instructions &&
           cooking_time == other.cooking_time && prep_time == other.prep_time &&
           servings == other.servings && difficulty == other.difficulty &&
           cuisine == other.cuisine && meal_type == other.meal_type && tags == other.tags &&
           rating == other.rating && image_url == other.image_url;
}

cJSON* recipe_to_json(const Recipe& recipe)
{
    cJSON* obj = cJSON_CreateObject();
    cJSON_AddStringToObject(obj, "id", recipe.id.c_str());
    cJSON_AddStringToObject(obj, "title", recipe.title.c_str());
    cJSON_AddStringToObject(obj, "description", recipe.description.c_str());

    cJSON* ingredients = cJSON_AddArrayToObject(obj, "ingredients");
    for (const auto& ing : recipe.ingredients) {
        cJSON* node = cJSON_CreateObject();
        cJSON_AddStringToObject(node, "name", ing.name.c_str());
        cJSON_AddNumberToObject(node, "amount", ing.amount);
        cJSON_AddStringToObject(node, "unit", ing.unit.c_str());
        cJSON_AddItemToArray(ingredients, node);
    }

    json::add_string_array(obj, "instructions", recipe.instructions);
    cJSON_AddNumberToObject(obj, "cookingTime", recipe.cooking_time);
    cJSON_AddNumberToObject(obj, "prepTime", recipe.prep_time);
    cJSON_AddNumberToObject(obj, "servings", recipe.servings);
    cJSON_AddStringToObject(obj, "difficulty", recipe.difficulty.c_str());
    cJSON_AddStringToObject(obj, "cuisine", recipe.cuisine.c_str());
    cJSON_AddStringToObject(obj, "mealType", recipe.meal_type.c_str());
    json::add_string_array(obj, "tags", recipe.tags);
    cJSON_AddNumberToObject(obj, "rating", recipe.rating);
    cJSON_AddStringToObject(obj, "imageUrl", recipe.image_url.c_str());
    return obj;
}

bool recipe_from_json(const cJSON* node, Recipe& out)
{
    if (!cJSON_IsObject(node)) {
        return false;
    }

    // The remote API hands out numeric ids; the cache keys on their text form.
    cJSON* id = cJSON_GetObjectItemCaseSensitive(node, "id");
    if (cJSON_IsString(id) && id->valuestring) {
        out.id = id->valuestring;
    } else if (cJSON_IsNumber(id)) {
        out.id = std::to_string(static_cast<long long>(id->valuedouble));
    } else {
        return false;
    }

    out.title = json::get_string(node, "title");
    out.description = json::get_string(node, "description");

    out.ingredients.clear();
    cJSON* ingredients = cJSON_GetObjectItemCaseSensitive(node, "ingredients");
    cJSON* item = nullptr;
    cJSON_ArrayForEach(item, ingredients)
    {
        Ingredient ing;
        ing.name = json::get_string(item, "name");
        ing.amount = json::get_number(item, "amount");
        ing.unit = json::get_string(item, "unit");
        out.ingredients.push_back(std::move(ing));
    }

    out.instructions = json::get_string_array(node, "instructions");
    out.cooking_time = static_cast<int>(json::get_number(node, "cookingTime"));
    out.prep_time = static_cast<int>(json::get_number(node, "prepTime"));
    out.servings = static_cast<int>(json::get_number(node, "servings"));
    out.difficulty = json::get_string(node, "difficulty");
    out.cuisine = json::get_string(node, "cuisine");
    out.meal_type = json::get_string(node, "mealType");
    out.tags = json::get_string_array(node, "tags");
    out.rating = json::get_number(node, "rating");
    out.image_url = json::get_string(node, "imageUrl");
    return true;
}

cJSON* recipes_to_json(const std::vector<Recipe>& recipes)
{
    cJSON* arr = cJSON_CreateArray();
    for (const auto& r : recipes) {
        cJSON_AddItemToArray(arr, recipe_to_json(r));
    }
    return arr;
}

std::vector<Recipe> recipes_from_json(const cJSON* array)
{
    std::vector<Recipe> out;
    cJSON* item = nullptr;
    cJSON_ArrayForEach(item, array)
    {
        Recipe r;
        if (recipe_from_json(item, r)) {
            out.push_back(std::move(r));
        }
    }
    return out;
}

namespace {

/// @brief Deep copy of `node` with object keys sorted and string lists sorted.
cJSON* canonical_copy(const cJSON* node)
{
    if (cJSON_IsObject(node)) {
        std::vector<const cJSON*> members;
        const cJSON* item = nullptr;
        cJSON_ArrayForEach(item, node)
        {
            if (item->string) {
                members.push_back(item);
            }
        }
        std::stable_sort(members.begin(), members.end(), [](const cJSON* a, const cJSON* b) {
            return std::strcmp(a->string, b->string) < 0;
        });

        cJSON* obj = cJSON_CreateObject();
        for (const cJSON* member : members) {
            if (cJSON_GetObjectItemCaseSensitive(obj, member->string)) {
                continue;
            }
            cJSON_AddItemToObject(obj, member->string, canonical_copy(member));
        }
        return obj;
    }

    if (cJSON_IsArray(node)) {
        std::vector<cJSON*> elements;
        bool all_strings = true;
        const cJSON* item = nullptr;
        cJSON_ArrayForEach(item, node)
        {
            all_strings = all_strings && cJSON_IsString(item) && item->valuestring;
            elements.push_back(canonical_copy(item));
        }
        if (all_strings) {
            std::stable_sort(elements.begin(), elements.end(), [](const cJSON* a, const cJSON* b) {
                return std::strcmp(a->valuestring, b->valuestring) < 0;
            });
        }

        cJSON* arr = cJSON_CreateArray();
        for (cJSON* element : elements) {
            cJSON_AddItemToArray(arr, element);
        }
        return arr;
    }

    return cJSON_Duplicate(node, true);
}

} // namespace

SearchFilters::SearchFilters(std::initializer_list<Selection> selections)
{
    json::JsonPtr obj(cJSON_CreateObject());
    for (const auto& [name, values] : selections) {
        json::add_string_array(obj.get(), name.c_str(), values);
    }
    *this = filters_from_json(obj.get());
}

SearchFilters SearchFilters::parse(const std::string& raw)
{
    json::JsonPtr root = json::parse(raw);
    if (!cJSON_IsObject(root.get())) {
        throw std::invalid_argument("Search filters must be a JSON object.");
    }
    return filters_from_json(root.get());
}

cJSON* filters_to_json(const SearchFilters& filters)
{
    return cJSON_Parse(filters.canonical().c_str());
}

SearchFilters filters_from_json(const cJSON* node)
{
    SearchFilters filters;
    if (cJSON_IsObject(node)) {
        json::JsonPtr canonical(canonical_copy(node));
        filters.canonical_ = json::print(canonical.get());
    }
    return filters;
}

std::string canonical_filters(const SearchFilters& filters) { return filters.canonical(); }

} // namespace larder::model
