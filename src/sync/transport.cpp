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

#include "larder/sync/transport.hpp"

#include <stdexcept>
#include <string>
#include <variant>

namespace larder::sync {

namespace {

template <typename Fn, typename Payload>
bool call(const Fn& fn, const Payload& payload, model::MutationType type)
{
    if (!fn) {
        throw std::runtime_error(std::string("No transport installed for '") +
                                 model::type_name(type) + "'");
    }
    return fn(payload);
}

} // namespace

bool dispatch(const Transport& transport, const model::Mutation& mutation)
{
    model::MutationType type = model::type_of(mutation);
    switch (type) {
    case model::MutationType::FAVORITE:
        return call(transport.favorite, std::get<model::Favorite>(mutation), type);
    case model::MutationType::UNFAVORITE:
        return call(transport.unfavorite, std::get<model::Unfavorite>(mutation), type);
    case model::MutationType::GENERATE:
        return call(transport.generate, std::get<model::GenerateRecipe>(mutation), type);
    case model::MutationType::UPDATE_PREFERENCES:
        return call(transport.update_preferences, std::get<model::UpdatePreferences>(mutation),
                    type);
    }
    return false;
}

} // namespace larder::sync
