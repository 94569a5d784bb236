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
 * @file handler.hpp
 * @brief JSON command dispatcher for the interactive shell.
 *
 * @details
 * This header declares the `Handler` class, which bridges line-oriented JSON input
 * and the `OfflineEngine`. It deserializes a request, validates its arguments,
 * routes it to the engine (or to the simulated remote) and serializes the result.
 */

#pragma once

#include "larder/core/engine.hpp"
#include "larder/shell/simulated_remote.hpp"

#include <string>

namespace larder::shell {

/**
 * @class Handler
 * @brief A static controller for interpreting requests and marshaling responses.
 */
class Handler {
  public:
    /**
     * @brief Processes one request.
     *
     * @param engine The engine under control.
     * @param remote The simulated service behind the engine's transport.
     * @param raw_json One request object, e.g. `{"action":"favorite","id":"42"}`.
     *
     * @return std::string The serialized response.
     *
     * **Response Formats:**
     * - **Success:** `{"status": "ok", "data": <result>}`
     * - **Error:** `{"status": "error", "message": "<error_description>"}`
     * - **Exit:** `{"status": "goodbye"}`
     */
    static std::string process(core::OfflineEngine& engine, SimulatedRemote& remote,
                               const std::string& raw_json);
};

} // namespace larder::shell
