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
 * @file transport.hpp
 * @brief Caller-supplied remote calls, one per operation kind.
 *
 * @details
 * The engine never talks to the network itself. The embedding application supplies
 * one callable per remote call shape; the same callables serve the immediate online
 * attempt and the queued replay. A mutating call reports failure by returning
 * `false` or by throwing a `std::exception`. Read calls report failure by throwing.
 *
 * Bounding each call with a timeout is the transport's job; the engine waits for
 * every call it makes to return.
 */

#pragma once

#include "larder/model/mutation.hpp"
#include "larder/model/recipe.hpp"

#include <functional>
#include <string>
#include <vector>

namespace larder::sync {

struct Transport {
    std::function<bool(const model::Favorite&)> favorite;
    std::function<bool(const model::Unfavorite&)> unfavorite;
    std::function<bool(const model::GenerateRecipe&)> generate;
    std::function<bool(const model::UpdatePreferences&)> update_preferences;

    std::function<model::Recipe(const std::string& recipe_id)> fetch_recipe;
    std::function<std::vector<model::Recipe>(const std::string& query,
                                             const model::SearchFilters& filters)>
        search;
};

/**
 * @brief Routes a mutation to the matching transport call.
 *
 * @return false If the call returned false.
 * @throws std::runtime_error If no callable is installed for the kind.
 * @throws Whatever the transport callable throws.
 */
bool dispatch(const Transport& transport, const model::Mutation& mutation);

} // namespace larder::sync
