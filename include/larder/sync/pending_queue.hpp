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
 * @file pending_queue.hpp
 * @brief Durable FIFO log of mutations awaiting replay.
 *
 * @details
 * This header declares the `PendingQueue`, the component that turns a user action
 * performed without connectivity into an at-least-once delivery to the remote
 * service.
 *
 * **Guarantees:**
 * - **Durability:** Every mutation of the queue rewrites the whole persisted record
 * under the queue mutex before the call returns.
 * - **Ordering:** `drain()` replays in enqueue order; an earlier action is always
 * dispatched before a later one.
 * - **Bounded Retry:** A failed replay increments `retry_count`. At `max_retries` the
 * operation is removed and reported once as a permanent failure.
 * - **Snapshot Drains:** A drain works on the queue as it was when the drain began.
 * Operations enqueued meanwhile wait for the next drain.
 */

#pragma once

#include "larder/infra/clock.hpp"
#include "larder/model/mutation.hpp"
#include "larder/storage/store.hpp"

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace larder::sync {

/**
 * @struct DrainReport
 * @brief Outcome counters of one drain cycle.
 */
struct DrainReport {
    size_t attempted = 0; ///< Replay calls made.
    size_t succeeded = 0; ///< Operations removed after a successful replay.
    size_t retried = 0;   ///< Operations kept for a later drain.
    size_t failed = 0;    ///< Operations removed as permanent failures.
};

/**
 * @struct FailureReport
 * @brief Describes an operation the queue gave up on.
 */
struct FailureReport {
    std::string operation_id;
    std::string type;     ///< Wire name of the operation kind, as persisted.
    int retry_count = 0;  ///< Failed attempts, including the last one.
    std::string reason;   ///< Last error message, if the replay raised one.
};

class PendingQueue {
  public:
    /// @brief Replays one operation; returns false or throws on failure.
    using ReplayFn = std::function<bool(const model::PendingOperation&)>;

    using FailureFn = std::function<void(const FailureReport&)>;

    /**
     * @brief Restores the persisted queue.
     *
     * Records naming an unknown operation kind are logged as FATAL and reported as
     * permanent failures on the next drain, never replayed.
     */
    PendingQueue(storage::KeyValueStore& store, const infra::Clock& clock, std::string storage_key,
                 int max_retries);

    /**
     * @brief Appends a new operation with `retry_count = 0`.
     *
     * @param mutation The typed operation.
     * @param out Receives a copy of the queued operation, if non-null.
     * @return true If the append reached durable storage. On false the operation is
     * still queued in memory and will be replayed by this process.
     */
    bool enqueue(model::Mutation mutation, model::PendingOperation* out = nullptr);

    /**
     * @brief Replays a snapshot of the queue in FIFO order.
     *
     * @param replay Called once per snapshotted operation, outside the queue lock.
     * @param on_failure Called once per operation removed as a permanent failure.
     */
    DrainReport drain(const ReplayFn& replay, const FailureFn& on_failure);

    /// @brief A copy of the queue in replay order.
    std::vector<model::PendingOperation> snapshot() const;

    size_t size() const;
    int max_retries() const { return max_retries_; }

    void clear();

  private:
    void load();
    bool persist();

    storage::KeyValueStore& store_;
    const infra::Clock& clock_;
    std::string storage_key_;
    int max_retries_;

    mutable std::mutex mutex_;
    std::vector<model::PendingOperation> ops_;

    /// @brief A persisted record that could not be decoded, kept verbatim until reported.
    struct RejectedRecord {
        FailureReport report;
        std::string raw;
    };

    std::vector<RejectedRecord> rejected_;
};

} // namespace larder::sync
