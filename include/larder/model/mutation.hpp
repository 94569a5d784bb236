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
 * @file mutation.hpp
 * @brief Strongly-typed mutating operations and their queued envelope.
 *
 * @details
 * Each operation kind the remote service accepts has its own payload struct, and a
 * `Mutation` is a variant over them. A replay therefore dispatches on the variant
 * alternative instead of inspecting an untyped payload at runtime.
 */

#pragma once

#include <cJSON.h>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace larder::model {

/**
 * @enum MutationType
 * @brief Wire-level operation kinds.
 */
enum class MutationType {
    FAVORITE,          ///< "favorite": mark a recipe as favorite.
    UNFAVORITE,        ///< "unfavorite": clear the favorite mark.
    GENERATE,          ///< "generate": request a new generated recipe.
    UPDATE_PREFERENCES ///< "updatePreferences": replace the user's preferences.
};

struct Favorite {
    std::string recipe_id;

    bool operator==(const Favorite& other) const { return recipe_id == other.recipe_id; }
};

struct Unfavorite {
    std::string recipe_id;

    bool operator==(const Unfavorite& other) const { return recipe_id == other.recipe_id; }
};

/// @brief A recipe generation request, as submitted by the generator form.
struct GenerateRecipe {
    std::string message;
    std::string meal_type;
    std::string cuisine;
    std::string difficulty;
    int cooking_time = 0;
    int servings = 0;
    std::vector<std::string> include_ingredients;
    std::vector<std::string> exclude_ingredients;
    std::vector<std::string> dietary_restrictions;
    std::string spice_level;

    bool operator==(const GenerateRecipe& other) const;
};

/// @brief The full preference profile; replaying it overwrites the server copy.
struct UpdatePreferences {
    std::vector<std::string> dietary_restrictions;
    std::vector<std::string> allergies;
    std::vector<std::string> cuisine_preferences;
    std::string spice_level;
    int max_cooking_time = 0;
    int serving_size = 0;

    bool operator==(const UpdatePreferences& other) const;
};

using Mutation = std::variant<Favorite, Unfavorite, GenerateRecipe, UpdatePreferences>;

/**
 * @struct PendingOperation
 * @brief A mutation waiting in the durable queue.
 */
struct PendingOperation {
    std::string id;
    Mutation mutation;
    int64_t enqueued_at = 0;
    int retry_count = 0;

    MutationType type() const;
};

/**
 * @class UnknownMutationError
 * @brief Raised when a persisted record names an operation kind this build does not know.
 */
class UnknownMutationError : public std::runtime_error {
  public:
    explicit UnknownMutationError(const std::string& type)
        : std::runtime_error("Unknown mutation type: " + type), type_(type)
    {
    }

    const std::string& type() const { return type_; }

  private:
    std::string type_;
};

MutationType type_of(const Mutation& mutation);

/// @brief Returns the wire name (`favorite`, `unfavorite`, `generate`, `updatePreferences`).
const char* type_name(MutationType type);

std::optional<MutationType> parse_type(const std::string& name);

/**
 * @brief Serializes only the payload of a mutation.
 * @warning The caller owns the returned object.
 */
cJSON* payload_to_json(const Mutation& mutation);

/**
 * @brief Rebuilds a mutation from its kind and payload.
 * @throws std::runtime_error If a favorite toggle is missing its `recipeId`.
 */
Mutation mutation_from_json(MutationType type, const cJSON* payload);

/// @warning The caller owns the returned object.
cJSON* operation_to_json(const PendingOperation& op);

/**
 * @brief Decodes a queued operation record.
 *
 * @throws UnknownMutationError If the `type` field names an unknown kind.
 * @throws std::runtime_error If the record is structurally malformed.
 */
PendingOperation operation_from_json(const cJSON* node);

} // namespace larder::model
