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
 * @file sync_test.cpp
 * @brief Unit tests for the pending queue, reachability monitor and sync coordinator.
 *
 * @details
 * The queue tests drive `drain()` directly with scripted replay functions. The
 * coordinator tests wire a real scheduler and verify the trigger and guard logic.
 */

#include "fixtures.hpp"
#include "framework.hpp"
#include "larder/infra/clock.hpp"
#include "larder/infra/scheduler.hpp"
#include "larder/storage/store.hpp"
#include "larder/sync/pending_queue.hpp"
#include "larder/sync/reachability.hpp"
#include "larder/sync/sync_coordinator.hpp"
#include "larder/sync/transport.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using namespace larder;

namespace {

const std::string kQueueKey = "larder_pending_ops";

std::string recipe_of(const model::PendingOperation& op)
{
    if (const auto* fav = std::get_if<model::Favorite>(&op.mutation)) {
        return "+" + fav->recipe_id;
    }
    if (const auto* unfav = std::get_if<model::Unfavorite>(&op.mutation)) {
        return "-" + unfav->recipe_id;
    }
    return "?";
}

} // namespace

// ============================================================================
// Pending Queue
// ============================================================================

/**
 * @brief An earlier favorite is dispatched strictly before a later unfavorite.
 */
void test_queue_fifo_order()
{
    storage::MemoryStore store;
    infra::ManualClock clock(10);
    sync::PendingQueue queue(store, clock, kQueueKey, 5);

    model::PendingOperation first;
    ASSERT_TRUE(queue.enqueue(model::Favorite{"42"}, &first));
    ASSERT_TRUE(queue.enqueue(model::Unfavorite{"42"}));
    ASSERT_TRUE(queue.enqueue(model::Favorite{"7"}));
    ASSERT_EQ(first.retry_count, 0);
    ASSERT_EQ(first.enqueued_at, static_cast<int64_t>(10));

    std::vector<std::string> dispatched;
    sync::DrainReport report = queue.drain(
        [&dispatched](const model::PendingOperation& op) {
            dispatched.push_back(recipe_of(op));
            return true;
        },
        nullptr);

    ASSERT_EQ(dispatched.size(), static_cast<size_t>(3));
    ASSERT_EQ(dispatched[0], std::string("+42"));
    ASSERT_EQ(dispatched[1], std::string("-42"));
    ASSERT_EQ(dispatched[2], std::string("+7"));
    ASSERT_EQ(report.succeeded, static_cast<size_t>(3));
    ASSERT_EQ(queue.size(), static_cast<size_t>(0));
}

/**
 * @brief An always-failing operation is attempted exactly `max_retries` times,
 * then removed and reported once.
 */
void test_queue_retry_bound()
{
    storage::MemoryStore store;
    infra::ManualClock clock(0);
    sync::PendingQueue queue(store, clock, kQueueKey, 5);
    ASSERT_TRUE(queue.enqueue(model::Favorite{"1"}));

    int attempts = 0;
    std::vector<sync::FailureReport> reports;
    auto replay = [&attempts](const model::PendingOperation&) {
        ++attempts;
        return false;
    };
    auto on_failure = [&reports](const sync::FailureReport& r) { reports.push_back(r); };

    for (int cycle = 1; cycle <= 4; ++cycle) {
        sync::DrainReport report = queue.drain(replay, on_failure);
        ASSERT_EQ(report.retried, static_cast<size_t>(1));
        ASSERT_EQ(queue.snapshot()[0].retry_count, cycle);
    }

    sync::DrainReport last = queue.drain(replay, on_failure);
    ASSERT_EQ(last.failed, static_cast<size_t>(1));
    ASSERT_EQ(queue.size(), static_cast<size_t>(0));

    sync::DrainReport idle = queue.drain(replay, on_failure);
    ASSERT_EQ(idle.attempted, static_cast<size_t>(0));

    ASSERT_EQ(attempts, 5);
    ASSERT_EQ(reports.size(), static_cast<size_t>(1));
    ASSERT_EQ(reports[0].retry_count, 5);
    ASSERT_EQ(reports[0].type, std::string("favorite"));
}

/**
 * @brief A favorite whose first reply is lost after the remote applied it gets
 * replayed; the idempotent remote ends in the same state as after one replay.
 */
void test_queue_replay_is_idempotent()
{
    std::set<std::string> once;
    once.insert("42");

    storage::MemoryStore store;
    infra::ManualClock clock(0);
    sync::PendingQueue queue(store, clock, kQueueKey, 5);
    ASSERT_TRUE(queue.enqueue(model::Favorite{"42"}));

    std::set<std::string> remote;
    int calls = 0;
    auto replay = [&remote, &calls](const model::PendingOperation& op) {
        ++calls;
        remote.insert(std::get<model::Favorite>(op.mutation).recipe_id);
        if (calls == 1) {
            throw std::runtime_error("response lost");
        }
        return true;
    };

    sync::DrainReport first = queue.drain(replay, nullptr);
    ASSERT_EQ(first.retried, static_cast<size_t>(1));
    ASSERT_TRUE(remote == once);

    sync::DrainReport second = queue.drain(replay, nullptr);
    ASSERT_EQ(second.succeeded, static_cast<size_t>(1));
    ASSERT_EQ(calls, 2);
    ASSERT_EQ(queue.size(), static_cast<size_t>(0));
    ASSERT_TRUE(remote == once);
}

/**
 * @brief Three operations, the second throwing every time: after five drains the
 * queue is empty and exactly one permanent failure names the second operation.
 */
void test_queue_partial_failure()
{
    storage::MemoryStore store;
    infra::ManualClock clock(0);
    sync::PendingQueue queue(store, clock, kQueueKey, 5);

    model::PendingOperation second;
    ASSERT_TRUE(queue.enqueue(model::Favorite{"1"}));
    ASSERT_TRUE(queue.enqueue(model::Favorite{"2"}, &second));
    ASSERT_TRUE(queue.enqueue(model::Favorite{"3"}));

    std::vector<sync::FailureReport> reports;
    auto replay = [](const model::PendingOperation& op) {
        if (recipe_of(op) == "+2") {
            throw std::runtime_error("HTTP 500");
        }
        return true;
    };

    for (int cycle = 0; cycle < 5; ++cycle) {
        queue.drain(replay, [&reports](const sync::FailureReport& r) { reports.push_back(r); });
    }

    ASSERT_EQ(queue.size(), static_cast<size_t>(0));
    ASSERT_EQ(reports.size(), static_cast<size_t>(1));
    ASSERT_EQ(reports[0].operation_id, second.id);
    ASSERT_EQ(reports[0].reason, std::string("HTTP 500"));
}

/**
 * @brief An operation enqueued while a drain runs is left for the next cycle.
 */
void test_queue_enqueue_during_drain()
{
    storage::MemoryStore store;
    infra::ManualClock clock(0);
    sync::PendingQueue queue(store, clock, kQueueKey, 5);
    ASSERT_TRUE(queue.enqueue(model::Favorite{"1"}));

    sync::DrainReport report = queue.drain(
        [&queue](const model::PendingOperation&) {
            queue.enqueue(model::Favorite{"2"});
            return true;
        },
        nullptr);

    ASSERT_EQ(report.attempted, static_cast<size_t>(1));
    std::vector<model::PendingOperation> left = queue.snapshot();
    ASSERT_EQ(left.size(), static_cast<size_t>(1));
    ASSERT_EQ(recipe_of(left[0]), std::string("+2"));
    ASSERT_EQ(left[0].retry_count, 0);
}

/**
 * @brief The queue, including retry counters, survives a restart.
 */
void test_queue_persistence()
{
    storage::MemoryStore store;
    infra::ManualClock clock(0);
    std::string first_id;
    {
        sync::PendingQueue queue(store, clock, kQueueKey, 5);
        model::PendingOperation op;
        ASSERT_TRUE(queue.enqueue(model::Favorite{"1"}, &op));
        ASSERT_TRUE(queue.enqueue(model::Unfavorite{"1"}));
        first_id = op.id;
        queue.drain([](const model::PendingOperation&) { return false; }, nullptr);
    }

    sync::PendingQueue restored(store, clock, kQueueKey, 5);
    std::vector<model::PendingOperation> ops = restored.snapshot();
    ASSERT_EQ(ops.size(), static_cast<size_t>(2));
    ASSERT_EQ(ops[0].id, first_id);
    ASSERT_EQ(ops[0].retry_count, 1);
    ASSERT_EQ(recipe_of(ops[1]), std::string("-1"));
}

/**
 * @brief A persisted record of an unknown kind is never replayed; it is reported
 * once as a permanent failure and then dropped from storage.
 */
void test_queue_unknown_record_reported()
{
    storage::MemoryStore store;
    infra::ManualClock clock(0);
    ASSERT_TRUE(store.write(
        kQueueKey,
        R"([{"id":"sync_1_old","type":"rateRecipe","payload":{"stars":5},"enqueuedAt":1,"retryCount":2},)"
        R"({"id":"sync_2_ok","type":"favorite","payload":{"recipeId":"9"},"enqueuedAt":2,"retryCount":0}])"));

    std::vector<sync::FailureReport> reports;
    int attempts = 0;
    {
        sync::PendingQueue queue(store, clock, kQueueKey, 5);
        ASSERT_EQ(queue.size(), static_cast<size_t>(1));

        sync::DrainReport report = queue.drain(
            [&attempts](const model::PendingOperation&) {
                ++attempts;
                return true;
            },
            [&reports](const sync::FailureReport& r) { reports.push_back(r); });

        ASSERT_EQ(report.succeeded, static_cast<size_t>(1));
        ASSERT_EQ(report.failed, static_cast<size_t>(1));
    }

    ASSERT_EQ(attempts, 1);
    ASSERT_EQ(reports.size(), static_cast<size_t>(1));
    ASSERT_EQ(reports[0].operation_id, std::string("sync_1_old"));
    ASSERT_EQ(reports[0].type, std::string("rateRecipe"));
    ASSERT_EQ(reports[0].retry_count, 2);

    sync::PendingQueue reopened(store, clock, kQueueKey, 5);
    sync::DrainReport again = reopened.drain([](const model::PendingOperation&) { return true; },
                                             nullptr);
    ASSERT_EQ(again.failed, static_cast<size_t>(0));
    ASSERT_EQ(again.attempted, static_cast<size_t>(0));
}

/**
 * @brief A rejected append reports lost durability but keeps the operation in memory.
 */
void test_queue_enqueue_storage_failure()
{
    storage::MemoryStore store;
    store.set_fail_writes(true);
    infra::ManualClock clock(0);
    sync::PendingQueue queue(store, clock, kQueueKey, 5);

    ASSERT_FALSE(queue.enqueue(model::Favorite{"1"}));
    ASSERT_EQ(queue.size(), static_cast<size_t>(1));
}

// ============================================================================
// Reachability
// ============================================================================

/**
 * @brief Subscribers run in subscription order, a throwing one does not stop the
 * others, and repeated signals of the same state are ignored.
 */
void test_reachability_notification()
{
    sync::ReachabilityMonitor monitor(true);
    std::vector<std::string> calls;

    monitor.subscribe([&calls](bool online) { calls.push_back(online ? "a:on" : "a:off"); });
    sync::ReachabilityMonitor::SubscriptionId faulty =
        monitor.subscribe([](bool) { throw std::runtime_error("listener bug"); });
    sync::ReachabilityMonitor::SubscriptionId last =
        monitor.subscribe([&calls](bool online) { calls.push_back(online ? "c:on" : "c:off"); });

    monitor.set_online(true);
    ASSERT_EQ(calls.size(), static_cast<size_t>(0));

    monitor.set_online(false);
    ASSERT_FALSE(monitor.is_online());
    ASSERT_EQ(calls.size(), static_cast<size_t>(2));
    ASSERT_EQ(calls[0], std::string("a:off"));
    ASSERT_EQ(calls[1], std::string("c:off"));

    ASSERT_TRUE(monitor.unsubscribe(last));
    ASSERT_TRUE(monitor.unsubscribe(faulty));
    ASSERT_FALSE(monitor.unsubscribe(last));

    monitor.set_online(true);
    ASSERT_EQ(calls.size(), static_cast<size_t>(3));
    ASSERT_EQ(calls[2], std::string("a:on"));
}

// ============================================================================
// Sync Coordinator
// ============================================================================

/**
 * @brief A kind without an installed callable raises, so the drain records the
 * cause as the failure reason.
 */
void test_dispatch_missing_callable()
{
    sync::Transport transport;
    ASSERT_THROWS(sync::dispatch(transport, model::Favorite{"1"}), std::runtime_error);

    transport.favorite = [](const model::Favorite& m) { return m.recipe_id == "1"; };
    ASSERT_TRUE(sync::dispatch(transport, model::Favorite{"1"}));
    ASSERT_FALSE(sync::dispatch(transport, model::Favorite{"2"}));
    ASSERT_THROWS(sync::dispatch(transport, model::Unfavorite{"1"}), std::runtime_error);

    storage::MemoryStore store;
    infra::ManualClock clock(0);
    sync::PendingQueue queue(store, clock, kQueueKey, 1);
    ASSERT_TRUE(queue.enqueue(model::Unfavorite{"1"}));

    std::vector<sync::FailureReport> reports;
    queue.drain([&transport](const model::PendingOperation& op) {
        return sync::dispatch(transport, op.mutation);
    },
                [&reports](const sync::FailureReport& r) { reports.push_back(r); });
    ASSERT_EQ(reports.size(), static_cast<size_t>(1));
    ASSERT_EQ(reports[0].reason, std::string("No transport installed for 'unfavorite'"));
}

/**
 * @brief Offline syncs are no-ops, and a drain triggered from inside a running
 * drain is rejected by the guard.
 */
void test_coordinator_guard()
{
    storage::MemoryStore store;
    infra::ManualClock clock(0);
    sync::PendingQueue queue(store, clock, kQueueKey, 5);
    sync::ReachabilityMonitor monitor(false);
    infra::Scheduler scheduler(1);

    sync::SyncCoordinator* self = nullptr;
    bool nested_rejected = false;
    sync::Transport transport;
    transport.favorite = [&self, &nested_rejected](const model::Favorite&) {
        ASSERT_TRUE(self->is_syncing());
        nested_rejected = !self->sync_now().has_value();
        return true;
    };

    sync::SyncCoordinator coordinator(queue, monitor, transport, scheduler,
                                      std::chrono::minutes(5));
    self = &coordinator;

    ASSERT_TRUE(queue.enqueue(model::Favorite{"1"}));
    ASSERT_FALSE(coordinator.sync_now().has_value());
    ASSERT_EQ(queue.size(), static_cast<size_t>(1));

    monitor.set_online(true);
    std::optional<sync::DrainReport> report = coordinator.sync_now();
    ASSERT_TRUE(report.has_value());
    ASSERT_EQ(report->succeeded, static_cast<size_t>(1));
    ASSERT_TRUE(nested_rejected);
    ASSERT_FALSE(coordinator.is_syncing());
}

/**
 * @brief A transition to online drains the queue in the background.
 */
void test_coordinator_online_trigger()
{
    storage::MemoryStore store;
    infra::ManualClock clock(0);
    sync::PendingQueue queue(store, clock, kQueueKey, 5);
    sync::ReachabilityMonitor monitor(false);
    infra::Scheduler scheduler(1);

    std::atomic<int> delivered{0};
    sync::Transport transport;
    transport.favorite = [&delivered](const model::Favorite&) {
        delivered.fetch_add(1);
        return true;
    };

    sync::SyncCoordinator coordinator(queue, monitor, transport, scheduler,
                                      std::chrono::minutes(5));
    coordinator.start();

    ASSERT_TRUE(queue.enqueue(model::Favorite{"1"}));
    ASSERT_TRUE(queue.enqueue(model::Favorite{"2"}));

    monitor.set_online(true);
    scheduler.wait_idle();

    ASSERT_EQ(delivered.load(), 2);
    ASSERT_EQ(queue.size(), static_cast<size_t>(0));

    coordinator.shutdown();
    coordinator.shutdown();
}

/**
 * @brief The periodic task drains while online, and stops after shutdown.
 */
void test_coordinator_periodic_trigger()
{
    storage::MemoryStore store;
    infra::ManualClock clock(0);
    sync::PendingQueue queue(store, clock, kQueueKey, 5);
    sync::ReachabilityMonitor monitor(true);
    infra::Scheduler scheduler(1);

    std::vector<sync::FailureReport> reports;
    std::mutex reports_mutex;
    sync::Transport transport;
    transport.unfavorite = [](const model::Unfavorite&) { return false; };

    sync::SyncCoordinator coordinator(queue, monitor, transport, scheduler,
                                      std::chrono::milliseconds(10));
    coordinator.on_permanent_failure([&reports, &reports_mutex](const sync::FailureReport& r) {
        std::lock_guard<std::mutex> lock(reports_mutex);
        reports.push_back(r);
    });
    coordinator.start();

    ASSERT_TRUE(queue.enqueue(model::Unfavorite{"5"}));
    ASSERT_TRUE(test::eventually([&queue]() { return queue.size() == 0; }));

    coordinator.shutdown();
    std::lock_guard<std::mutex> lock(reports_mutex);
    ASSERT_EQ(reports.size(), static_cast<size_t>(1));
    ASSERT_EQ(reports[0].type, std::string("unfavorite"));
}
