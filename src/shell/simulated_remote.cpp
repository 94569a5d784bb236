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

#include "larder/shell/simulated_remote.hpp"

#include "larder/infra/logger.hpp"
#include "larder/infra/string.hpp"

#include <stdexcept>

namespace larder::shell {

void SimulatedRemote::set_healthy(bool healthy)
{
    healthy_.store(healthy);
    infra::Logger::log(infra::LogLevel::INFO,
                       healthy ? "Shell: Remote marked healthy." : "Shell: Remote marked unhealthy.");
}

std::set<std::string> SimulatedRemote::favorites() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return favorites_;
}

void SimulatedRemote::check(const char* call)
{
    calls_.fetch_add(1);
    infra::Logger::log(infra::LogLevel::DEBUG, std::string("Shell: Remote call '") + call + "'.");
    if (!healthy_.load()) {
        throw std::runtime_error(std::string("remote unavailable (") + call + ")");
    }
}

sync::Transport SimulatedRemote::transport()
{
    sync::Transport t;

    t.favorite = [this](const model::Favorite& m) {
        check("favorite");
        std::lock_guard<std::mutex> lock(mutex_);
        favorites_.insert(m.recipe_id);
        return true;
    };

    t.unfavorite = [this](const model::Unfavorite& m) {
        check("unfavorite");
        std::lock_guard<std::mutex> lock(mutex_);
        favorites_.erase(m.recipe_id);
        return true;
    };

    t.generate = [this](const model::GenerateRecipe& m) {
        check("generate");
        std::lock_guard<std::mutex> lock(mutex_);
        model::Recipe recipe;
        recipe.id = "gen_" + std::to_string(next_recipe_++);
        recipe.title = m.message.empty() ? "Generated recipe" : m.message;
        recipe.cuisine = m.cuisine;
        recipe.meal_type = m.meal_type;
        recipe.difficulty = m.difficulty;
        recipe.cooking_time = m.cooking_time;
        recipe.servings = m.servings;
        catalogue_[recipe.id] = recipe;
        return true;
    };

    t.update_preferences = [this](const model::UpdatePreferences&) {
        check("updatePreferences");
        return true;
    };

    t.fetch_recipe = [this](const std::string& id) {
        check("fetchRecipe");
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = catalogue_.find(id);
        if (it == catalogue_.end()) {
            throw std::runtime_error("recipe " + id + " not found on remote");
        }
        return it->second;
    };

    t.search = [this](const std::string& query, const model::SearchFilters&) {
        check("search");
        std::string needle = infra::String::normalize_query(query);
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<model::Recipe> results;
        for (const auto& [id, recipe] : catalogue_) {
            if (infra::String::to_lower(recipe.title).find(needle) != std::string::npos) {
                results.push_back(recipe);
            }
        }
        return results;
    };

    return t;
}

} // namespace larder::shell
