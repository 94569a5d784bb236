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
 * @file fixtures.hpp
 * @brief Shared builders and RAII helpers for the test suite.
 */

#pragma once

#include "larder/model/recipe.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <thread>

namespace larder::test {

/**
 * @class TempDir
 * @brief RAII scratch directory, purged on construction and destruction.
 */
class TempDir {
  public:
    explicit TempDir(std::string path) : path_(std::move(path))
    {
        std::filesystem::remove_all(path_);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }

  private:
    std::string path_;
};

/// @brief A fully populated recipe, so round trips cover every field.
inline model::Recipe make_recipe(const std::string& id, const std::string& title = "Pasta")
{
    model::Recipe r;
    r.id = id;
    r.title = title;
    r.description = "A test recipe";
    r.ingredients = {{"flour", 200.0, "g"}, {"egg", 2.0, ""}};
    r.instructions = {"Mix", "Knead", "Boil"};
    r.cooking_time = 20;
    r.prep_time = 10;
    r.servings = 2;
    r.difficulty = "easy";
    r.cuisine = "Italian";
    r.meal_type = "dinner";
    r.tags = {"quick", "vegetarian"};
    r.rating = 4.5;
    r.image_url = "https://example.com/" + id + ".jpg";
    return r;
}

/// @brief Polls `pred` for up to two seconds.
template <typename Pred> bool eventually(Pred pred)
{
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

} // namespace larder::test
