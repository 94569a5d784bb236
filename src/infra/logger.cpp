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
 * @file logger.cpp
 * @brief Implementation of the thread-safe diagnostic logging utility.
 *
 * @details
 * Formats each entry as `[YYYY-MM-DD HH:MM:SS] [TAG] message` with ANSI colour
 * coding per severity, and applies the process-wide minimum level filter.
 */

#include "larder/infra/logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace larder::infra {

std::mutex Logger::mutex_;
std::atomic<LogLevel> Logger::min_level_{LogLevel::TRACE};

void Logger::set_level(LogLevel level)
{
    min_level_.store(level);
}

LogLevel Logger::level()
{
    return min_level_.load();
}

/**
 * @brief Dispatches a formatted log entry to the appropriate system stream.
 *
 * Operational Logic:
 * 1. **Filtering**: Drops entries below the configured minimum level.
 * 2. **Synchronization**: Acquires a `lock_guard` to prevent interleaved output.
 * 3. **Stream Segregation**: Routes messages to `stdout` or `stderr` based on severity.
 */
void Logger::log(LogLevel level, const std::string& message)
{
    if (level < min_level_.load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    auto& stream = (level >= LogLevel::WARN) ? std::cerr : std::cout;

    // Mutex also protects std::localtime's internal static buffer.
    stream << "[" << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S") << "] ";

    switch (level) {
    case LogLevel::TRACE:
        stream << "\033[90m[TRCE] ";
        break;
    case LogLevel::DEBUG:
        stream << "\033[36m[DBUG] ";
        break;
    case LogLevel::INFO:
        stream << "\033[32m[INFO] ";
        break;
    case LogLevel::WARN:
        stream << "\033[33m[WARN] ";
        break;
    case LogLevel::ERROR:
        stream << "\033[31m[FAIL] ";
        break;
    case LogLevel::FATAL:
        stream << "\033[1;31m[CRIT] ";
        break;
    }

    stream << message << "\033[0m" << std::endl;
}

} // namespace larder::infra
