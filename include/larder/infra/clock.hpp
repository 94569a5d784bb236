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
 * @file clock.hpp
 * @brief Injectable wall-clock source.
 *
 * @details
 * Every timestamp the engine records (`cachedAt`, `lastAccessedAt`, query
 * freshness, `enqueuedAt`) is read through a `Clock`, so tests can drive time
 * explicitly instead of sleeping.
 */

#pragma once

#include <atomic>
#include <cstdint>

namespace larder::infra {

/**
 * @class Clock
 * @brief Abstract millisecond clock.
 */
class Clock {
  public:
    virtual ~Clock() = default;

    /// @brief Milliseconds since the Unix epoch.
    virtual int64_t now_ms() const = 0;
};

/**
 * @class SystemClock
 * @brief Reads `std::chrono::system_clock`.
 */
class SystemClock : public Clock {
  public:
    int64_t now_ms() const override;
};

/**
 * @class ManualClock
 * @brief A clock that only moves when told to.
 */
class ManualClock : public Clock {
  public:
    explicit ManualClock(int64_t start_ms = 0) : now_(start_ms) {}

    int64_t now_ms() const override { return now_.load(); }

    void set(int64_t ms) { now_.store(ms); }
    void advance(int64_t delta_ms) { now_.fetch_add(delta_ms); }

  private:
    std::atomic<int64_t> now_;
};

} // namespace larder::infra
