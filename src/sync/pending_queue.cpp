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
 * @file pending_queue.cpp
 * @brief Implementation of the durable replay queue.
 *
 * @details
 * The queue is persisted as one JSON array of operation records. Every mutation
 * performs a read-modify-write of the whole record under `mutex_`, which gives the
 * same atomicity a single-threaded event loop would.
 */

#include "larder/sync/pending_queue.hpp"

#include "larder/infra/id_generator.hpp"
#include "larder/infra/logger.hpp"
#include "larder/model/json.hpp"

#include <exception>
#include <unordered_map>

namespace larder::sync {

PendingQueue::PendingQueue(storage::KeyValueStore& store, const infra::Clock& clock,
                           std::string storage_key, int max_retries)
    : store_(store), clock_(clock), storage_key_(std::move(storage_key)),
      max_retries_(max_retries)
{
    load();
}

/**
 * @brief Restores the queue from its persisted record.
 *
 * **Replay Strategy:**
 * 1. A corrupt record is logged and the queue starts empty.
 * 2. Each element is decoded independently; a malformed element is skipped.
 * 3. An element with an unknown kind is kept aside verbatim and reported as a
 * permanent failure on the next drain.
 */
void PendingQueue::load()
{
    std::optional<std::string> raw = store_.read(storage_key_);
    if (!raw) {
        return;
    }

    model::json::JsonPtr root = model::json::parse(*raw);
    if (!cJSON_IsArray(root.get())) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Queue: Persisted queue is corrupt. Pending operations were lost.");
        return;
    }

    cJSON* item = nullptr;
    cJSON_ArrayForEach(item, root.get())
    {
        try {
            ops_.push_back(model::operation_from_json(item));
        } catch (const model::UnknownMutationError& e) {
            infra::Logger::log(infra::LogLevel::FATAL, "Queue: " + std::string(e.what()) +
                                                           ". Operation will not be replayed.");
            RejectedRecord rejected;
            rejected.report.operation_id = model::json::get_string(item, "id");
            rejected.report.type = e.type();
            rejected.report.retry_count =
                static_cast<int>(model::json::get_number(item, "retryCount"));
            rejected.report.reason = e.what();
            rejected.raw = model::json::print(item);
            rejected_.push_back(std::move(rejected));
        } catch (const std::exception& e) {
            infra::Logger::log(infra::LogLevel::ERROR,
                               "Queue: Skipping malformed operation: " + std::string(e.what()));
        }
    }

    if (!ops_.empty()) {
        infra::Logger::log(infra::LogLevel::INFO, "Queue: Restored " + std::to_string(ops_.size()) +
                                                      " pending operations.");
    }
}

/// @brief Must be called with `mutex_` held.
bool PendingQueue::persist()
{
    model::json::JsonPtr root(cJSON_CreateArray());
    for (const auto& rejected : rejected_) {
        cJSON* node = cJSON_Parse(rejected.raw.c_str());
        if (node) {
            cJSON_AddItemToArray(root.get(), node);
        }
    }
    for (const auto& op : ops_) {
        cJSON_AddItemToArray(root.get(), model::operation_to_json(op));
    }

    if (!store_.write(storage_key_, model::json::print(root.get()))) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Queue: Failed to persist pending operations. Queue is memory-only "
                           "until the next successful write.");
        return false;
    }
    return true;
}

bool PendingQueue::enqueue(model::Mutation mutation, model::PendingOperation* out)
{
    std::lock_guard<std::mutex> lock(mutex_);

    model::PendingOperation op;
    op.enqueued_at = clock_.now_ms();
    op.id = infra::IdGenerator::generate("sync", op.enqueued_at);
    op.mutation = std::move(mutation);
    op.retry_count = 0;

    infra::Logger::log(infra::LogLevel::DEBUG, std::string("Queue: Enqueued '") +
                                                   model::type_name(op.type()) + "' as " + op.id);

    if (out) {
        *out = op;
    }
    ops_.push_back(std::move(op));
    return persist();
}

/**
 * @brief Replays a snapshot of the queue.
 *
 * **Cycle:**
 * 1. **Snapshot:** Copy the queue (and take over rejected records) under the lock.
 * 2. **Replay:** Call `replay` for each snapshotted operation in order, without the lock.
 * 3. **Commit:** Under the lock, remove successes, bump retry counters of failures and
 * drop the exhausted ones. Operations enqueued during step 2 are untouched.
 * 4. **Report:** Invoke `on_failure` for each permanent failure, outside the lock.
 */
DrainReport PendingQueue::drain(const ReplayFn& replay, const FailureFn& on_failure)
{
    DrainReport report;
    std::vector<model::PendingOperation> snapshot;
    std::vector<FailureReport> failures;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot = ops_;
        for (auto& rejected : rejected_) {
            failures.push_back(std::move(rejected.report));
        }
        if (!rejected_.empty()) {
            rejected_.clear();
            persist();
        }
    }
    report.failed += failures.size();

    struct Outcome {
        bool ok = false;
        std::string reason;
    };
    std::unordered_map<std::string, Outcome> outcomes;

    for (const auto& op : snapshot) {
        Outcome outcome;
        try {
            outcome.ok = replay(op);
            if (!outcome.ok) {
                outcome.reason = "remote call reported failure";
            }
        } catch (const std::exception& e) {
            outcome.reason = e.what();
        }
        ++report.attempted;

        if (!outcome.ok) {
            infra::Logger::log(infra::LogLevel::WARN, std::string("Queue: Replay of '") +
                                                          model::type_name(op.type()) + "' " +
                                                          op.id + " failed: " + outcome.reason);
        }
        outcomes.emplace(op.id, std::move(outcome));
    }

    if (!snapshot.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<model::PendingOperation> remaining;
        remaining.reserve(ops_.size());

        for (auto& op : ops_) {
            auto it = outcomes.find(op.id);
            if (it == outcomes.end()) {
                remaining.push_back(std::move(op));
                continue;
            }
            if (it->second.ok) {
                ++report.succeeded;
                continue;
            }

            op.retry_count += 1;
            if (op.retry_count < max_retries_) {
                ++report.retried;
                remaining.push_back(std::move(op));
            } else {
                ++report.failed;
                FailureReport failure;
                failure.operation_id = op.id;
                failure.type = model::type_name(op.type());
                failure.retry_count = op.retry_count;
                failure.reason = it->second.reason;
                failures.push_back(std::move(failure));
            }
        }

        ops_ = std::move(remaining);
        persist();
    }

    for (const auto& failure : failures) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Queue: Max retries reached for '" + failure.type + "' " +
                               failure.operation_id + ". Operation dropped.");
        if (on_failure) {
            try {
                on_failure(failure);
            } catch (const std::exception& e) {
                infra::Logger::log(infra::LogLevel::WARN,
                                   "Queue: Failure listener raised: " + std::string(e.what()));
            }
        }
    }

    return report;
}

std::vector<model::PendingOperation> PendingQueue::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return ops_;
}

size_t PendingQueue::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return ops_.size();
}

void PendingQueue::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    ops_.clear();
    rejected_.clear();
    if (!store_.remove(storage_key_)) {
        infra::Logger::log(infra::LogLevel::WARN, "Queue: Failed to remove queue record.");
    }
}

} // namespace larder::sync
