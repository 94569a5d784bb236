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
 * @file id_generator.hpp
 * @brief Opaque identifier generation for queued operations.
 */

#pragma once

#include <cstdint>
#include <string>

namespace larder::infra {

/**
 * @class IdGenerator
 * @brief A static utility producing time-ordered, collision-resistant identifiers.
 *
 * @details
 * Identifiers have the shape `<prefix>_<millis>_<suffix>` where `suffix` is nine
 * random base-36 characters. The millisecond component makes ids roughly sortable
 * by creation time; the random suffix separates ids minted within the same tick.
 */
class IdGenerator {
  public:
    /**
     * @brief Generates a new identifier.
     *
     * @param prefix A short tag naming the id family (e.g. "sync").
     * @param now_ms The creation time in milliseconds since the epoch.
     * @return std::string e.g. `sync_1760659200000_k3j9x0qz1`.
     *
     * @code
     * std::string id = larder::infra::IdGenerator::generate("sync", clock.now_ms());
     * @endcode
     */
    static std::string generate(const std::string& prefix, int64_t now_ms);
};

} // namespace larder::infra
