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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for Larder.
 *
 * @details
 * This header declares the `Logger` class, the single reporting channel of the
 * offline engine. Cache degradation, replay failures and reachability changes are
 * all reported here instead of being thrown into unrelated call sites.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace larder::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details (per-entry cache decisions).
    DEBUG, ///< Diagnostic information (evictions, TTL purges, drain snapshots).
    INFO,  ///< Nominal operational events (startup, reachability transitions).
    WARN,  ///< Best-effort paths that degraded (cache write rejected by storage).
    ERROR, ///< Lost durability or permanently failed operations.
    FATAL  ///< Conditions the engine cannot interpret (unknown operation kinds).
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 *
 * @details
 * Output is serialized through an internal mutex so that entries emitted by the
 * scheduler threads and the caller thread never interleave.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr`.
     *
     * Messages below the configured minimum level are discarded before the lock
     * is taken.
     *
     * @code
     * larder::infra::Logger::log(LogLevel::WARN, "Cache: Write rejected by storage.");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that reaches the console.
     * @param level Entries strictly below this level are dropped.
     */
    static void set_level(LogLevel level);

    /// @brief Returns the currently configured minimum severity.
    static LogLevel level();

  private:
    /// @brief Guards `std::cout` and `std::cerr` against interleaved writes.
    static std::mutex mutex_;

    /// @brief Minimum severity filter (defaults to `TRACE`).
    static std::atomic<LogLevel> min_level_;
};

} // namespace larder::infra
