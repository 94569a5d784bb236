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
 * @file model_test.cpp
 * @brief Unit tests for the recipe and mutation codecs.
 */

#include "fixtures.hpp"
#include "framework.hpp"
#include "larder/model/json.hpp"
#include "larder/model/mutation.hpp"
#include "larder/model/recipe.hpp"

#include <stdexcept>
#include <string>
#include <variant>

using namespace larder;

void test_recipe_json_round_trip()
{
    model::Recipe original = test::make_recipe("7", "Shakshuka");
    model::json::JsonPtr node(model::recipe_to_json(original));

    model::Recipe decoded;
    ASSERT_TRUE(model::recipe_from_json(node.get(), decoded));
    ASSERT_TRUE(decoded == original);
}

/**
 * @brief The remote hands out numeric ids; they are keyed by their text form.
 */
void test_recipe_numeric_id()
{
    model::json::JsonPtr node = model::json::parse(R"({"id": 42, "title": "Soup"})");
    model::Recipe decoded;
    ASSERT_TRUE(model::recipe_from_json(node.get(), decoded));
    ASSERT_EQ(decoded.id, std::string("42"));
    ASSERT_EQ(decoded.title, std::string("Soup"));

    model::json::JsonPtr no_id = model::json::parse(R"({"title": "Nameless"})");
    ASSERT_FALSE(model::recipe_from_json(no_id.get(), decoded));
}

/**
 * @brief Filter sets selecting the same values serialize identically.
 */
void test_canonical_filters_order_independent()
{
    model::SearchFilters a = {{"diet", {"vegan", "gluten-free"}}, {"cuisine", {"Italian"}}};
    model::SearchFilters b = {{"cuisine", {"Italian"}}, {"diet", {"gluten-free", "vegan"}}};
    ASSERT_EQ(model::canonical_filters(a), model::canonical_filters(b));
    ASSERT_EQ(model::canonical_filters({{"cuisine", {"Italian"}}}),
              std::string(R"({"cuisine":["Italian"]})"));

    model::SearchFilters mixed = model::SearchFilters::parse(
        R"({"minRating":4,"servings":{"min":2,"max":4},"cuisine":["Thai","Greek"],"isFavorite":false})");
    ASSERT_EQ(
        mixed.canonical(),
        std::string(
            R"({"cuisine":["Greek","Thai"],"isFavorite":false,"minRating":4,"servings":{"max":4,"min":2}})"));
    ASSERT_TRUE(model::SearchFilters::parse("{}").empty());
    ASSERT_THROWS(model::SearchFilters::parse(R"(["cuisine"])"), std::invalid_argument);
}

void test_operation_json_round_trip()
{
    model::GenerateRecipe gen;
    gen.message = "something spicy";
    gen.cuisine = "Thai";
    gen.cooking_time = 30;
    gen.servings = 4;
    gen.include_ingredients = {"basil"};
    gen.exclude_ingredients = {"peanut"};
    gen.spice_level = "hot";

    model::PendingOperation op;
    op.id = "sync_1_abc";
    op.mutation = gen;
    op.enqueued_at = 1700000000123;
    op.retry_count = 2;

    model::json::JsonPtr node(model::operation_to_json(op));
    ASSERT_EQ(model::json::get_string(node.get(), "type"), std::string("generate"));

    model::PendingOperation decoded = model::operation_from_json(node.get());
    ASSERT_EQ(decoded.id, op.id);
    ASSERT_EQ(decoded.enqueued_at, op.enqueued_at);
    ASSERT_EQ(decoded.retry_count, 2);
    ASSERT_TRUE(decoded.type() == model::MutationType::GENERATE);
    ASSERT_TRUE(std::get<model::GenerateRecipe>(decoded.mutation) == gen);
}

void test_operation_unknown_type()
{
    model::json::JsonPtr node = model::json::parse(
        R"({"id":"sync_1_x","type":"rateRecipe","payload":{},"enqueuedAt":1,"retryCount":0})");
    ASSERT_THROWS(model::operation_from_json(node.get()), model::UnknownMutationError);

    try {
        model::operation_from_json(node.get());
    } catch (const model::UnknownMutationError& e) {
        ASSERT_EQ(e.type(), std::string("rateRecipe"));
    }
}

void test_favorite_requires_recipe_id()
{
    model::json::JsonPtr payload = model::json::parse("{}");
    ASSERT_THROWS(model::mutation_from_json(model::MutationType::FAVORITE, payload.get()),
                  std::runtime_error);

    ASSERT_TRUE(!model::parse_type("bogus").has_value());
    ASSERT_EQ(std::string(model::type_name(model::MutationType::UPDATE_PREFERENCES)),
              std::string("updatePreferences"));
}
