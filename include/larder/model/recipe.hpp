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
 * @file recipe.hpp
 * @brief The cached domain entity and the search filter set.
 */

#pragma once

#include <cJSON.h>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace larder::model {

struct Ingredient {
    std::string name;
    double amount = 0.0;
    std::string unit;

    bool operator==(const Ingredient& other) const;
    bool operator!=(const Ingredient& other) const { return !(*this == other); }
};

/**
 * @struct Recipe
 * @brief A recipe as returned by the remote service.
 *
 * @details
 * `id` is the cache key. The engine treats every other field as opaque payload that
 * must round-trip through persistence unchanged.
 */
struct Recipe {
    std::string id;
    std::string title;
    std::string description;
    std::vector<Ingredient> ingredients;
    std::vector<std::string> instructions;
    int cooking_time = 0;
    int prep_time = 0;
    int servings = 0;
    std::string difficulty;
    std::string cuisine;
    std::string meal_type;
    std::vector<std::string> tags;
    double rating = 0.0;
    std::string image_url;

    bool operator==(const Recipe& other) const;
    bool operator!=(const Recipe& other) const { return !(*this == other); }
};

/**
 * @class SearchFilters
 * @brief Immutable filter set of a search, e.g. `{"cuisine": ["Italian"], "maxCookingTime": 30}`.
 *
 * Any JSON object is accepted: string lists, numbers, booleans and nested ranges such
 * as `{"servings": {"min": 2, "max": 4}}`. The set is held in canonical text form
 * (object keys sorted at every level, string lists sorted), so two filter sets that
 * select the same recipes compare and serialize identically.
 */
class SearchFilters {
  public:
    using Selection = std::pair<const std::string, std::vector<std::string>>;

    SearchFilters() = default;

    /// @brief Builds a set made only of string lists, e.g. `{{"cuisine", {"Italian"}}}`.
    SearchFilters(std::initializer_list<Selection> selections);

    /**
     * @brief Parses a JSON object.
     * @throws std::invalid_argument If `raw` is not a JSON object.
     */
    static SearchFilters parse(const std::string& raw);

    const std::string& canonical() const { return canonical_; }
    bool empty() const { return canonical_ == "{}"; }

    bool operator==(const SearchFilters& other) const { return canonical_ == other.canonical_; }
    bool operator!=(const SearchFilters& other) const { return !(*this == other); }

  private:
    friend SearchFilters filters_from_json(const cJSON* node);

    std::string canonical_ = "{}";
};

/**
 * @brief Serializes a recipe.
 * @warning The caller owns the returned tree and must `cJSON_Delete` it.
 */
cJSON* recipe_to_json(const Recipe& recipe);

/**
 * @brief Decodes a recipe.
 * @return false If `node` is not an object or has no string `id`.
 */
bool recipe_from_json(const cJSON* node, Recipe& out);

/// @warning The caller owns the returned array.
cJSON* recipes_to_json(const std::vector<Recipe>& recipes);

/// @brief Decodes an array of recipes, skipping malformed elements.
std::vector<Recipe> recipes_from_json(const cJSON* array);

/// @brief Canonical text form of a filter set, used in cache keys.
std::string canonical_filters(const SearchFilters& filters);

/// @warning The caller owns the returned object.
cJSON* filters_to_json(const SearchFilters& filters);

/// @brief Canonicalizes a filter object. A missing or non-object node yields no filters.
SearchFilters filters_from_json(const cJSON* node);

} // namespace larder::model
