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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * Used by the query cache to derive stable keys from free-form search text.
 */

#pragma once

#include <string>

namespace larder::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return std::string The trimmed content, or an empty string if the input
     * consists solely of whitespace.
     */
    static std::string trim(const std::string& s);

    /**
     * @brief Lower-cases every ASCII letter of a string.
     */
    static std::string to_lower(const std::string& s);

    /**
     * @brief Canonicalizes search text for cache keying.
     *
     * Trims the input, lower-cases it and collapses every internal whitespace run
     * into a single space, so `"  Pasta\tBake "` and `"pasta bake"` share a key.
     *
     * @code
     * std::string key = larder::infra::String::normalize_query("  Pasta\tBake "); // "pasta bake"
     * @endcode
     */
    static std::string normalize_query(const std::string& s);
};

} // namespace larder::infra
