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
 * @file reachability.hpp
 * @brief Online/offline state with ordered change notification.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace larder::sync {

/**
 * @class ReachabilityMonitor
 * @brief Tracks network reachability as reported by the platform.
 *
 * @details
 * The platform signal source calls `set_online()`. The state is updated immediately
 * and, on an actual transition, every subscriber is called synchronously in
 * subscription order. A subscriber that throws is logged and skipped; the remaining
 * subscribers still run.
 */
class ReachabilityMonitor {
  public:
    using Listener = std::function<void(bool is_online)>;
    using SubscriptionId = uint64_t;

    explicit ReachabilityMonitor(bool initially_online = true);

    bool is_online() const { return online_.load(); }

    /**
     * @brief Platform signal entry point.
     *
     * Repeated signals with the current state are ignored.
     */
    void set_online(bool online);

    /**
     * @brief Registers a listener.
     * @return SubscriptionId Handle for `unsubscribe()`.
     */
    SubscriptionId subscribe(Listener listener);

    /// @return true If the id was registered.
    bool unsubscribe(SubscriptionId id);

  private:
    std::atomic<bool> online_;

    /// @brief Serializes transitions so listeners observe them in order.
    std::mutex transition_mutex_;

    std::mutex listeners_mutex_;
    std::map<SubscriptionId, Listener> listeners_;
    SubscriptionId next_id_ = 1;
};

} // namespace larder::sync
