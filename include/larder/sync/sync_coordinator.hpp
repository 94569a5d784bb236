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
 * @file sync_coordinator.hpp
 * @brief Orchestrates replay of the pending queue against the remote service.
 *
 * @details
 * The coordinator is a two-state machine, `Idle -> Draining -> Idle`. A drain is
 * started by one of three triggers:
 * 1. **Reachability:** the monitor reports a transition to online.
 * 2. **Timer:** a periodic task owned by the coordinator, registered on the scheduler.
 * 3. **Manual:** `sync_now()` or `request_sync()`, e.g. right after an enqueue.
 *
 * Only one drain runs at a time. A trigger arriving while a drain is in flight is a
 * no-op; anything enqueued meanwhile is picked up by the next cycle.
 */

#pragma once

#include "larder/infra/scheduler.hpp"
#include "larder/sync/pending_queue.hpp"
#include "larder/sync/reachability.hpp"
#include "larder/sync/transport.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <vector>

namespace larder::sync {

class SyncCoordinator {
  public:
    using FailureListener = std::function<void(const FailureReport&)>;

    /**
     * @brief Wires the coordinator. Nothing is triggered until `start()`.
     *
     * @param interval Period of the timer trigger.
     */
    SyncCoordinator(PendingQueue& queue, ReachabilityMonitor& reachability, Transport transport,
                    infra::Scheduler& scheduler, std::chrono::milliseconds interval);

    /// @brief Calls `shutdown()`.
    ~SyncCoordinator();

    SyncCoordinator(const SyncCoordinator&) = delete;
    SyncCoordinator& operator=(const SyncCoordinator&) = delete;

    /// @brief Subscribes to reachability and registers the periodic task.
    void start();

    /**
     * @brief Detaches every trigger and waits for in-flight background work.
     *
     * @note Idempotent. Blocks until the scheduler is idle.
     */
    void shutdown();

    /**
     * @brief Runs one drain cycle on the calling thread.
     *
     * @return std::optional<DrainReport> The cycle's counters, or `std::nullopt` if
     * offline or another drain was already in progress.
     */
    std::optional<DrainReport> sync_now();

    /// @brief Posts a drain onto the scheduler.
    void request_sync();

    bool is_syncing() const { return syncing_.load(); }

    /// @brief Registers a listener for operations dropped after exhausting retries.
    void on_permanent_failure(FailureListener listener);

    const Transport& transport() const { return transport_; }

  private:
    void notify_failure(const FailureReport& report);

    PendingQueue& queue_;
    ReachabilityMonitor& reachability_;
    Transport transport_;
    infra::Scheduler& scheduler_;
    std::chrono::milliseconds interval_;

    /// @brief Re-entrancy guard; set for the whole duration of a drain.
    std::atomic<bool> syncing_{false};

    std::mutex lifecycle_mutex_;
    bool started_ = false;
    ReachabilityMonitor::SubscriptionId subscription_ = 0;
    infra::Scheduler::TaskId timer_ = 0;

    std::mutex listeners_mutex_;
    std::vector<FailureListener> failure_listeners_;
};

} // namespace larder::sync
