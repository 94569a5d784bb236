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
 * @file infra_test.cpp
 * @brief Unit tests for shared infrastructure primitives.
 *
 * @details
 * Covers identifier generation, query normalization, the manual clock and the
 * scheduler's worker pool and periodic tasks.
 */

#include "fixtures.hpp"
#include "framework.hpp"
#include "larder/infra/clock.hpp"
#include "larder/infra/id_generator.hpp"
#include "larder/infra/scheduler.hpp"
#include "larder/infra/string.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

using namespace larder;

/**
 * @brief Identifiers follow `<prefix>_<millis>_<9 base-36 chars>`.
 */
void test_id_format()
{
    std::string id = infra::IdGenerator::generate("sync", 1700000000000);
    std::string head = "sync_1700000000000_";
    ASSERT_EQ(id.substr(0, head.size()), head);
    ASSERT_EQ(id.size(), head.size() + static_cast<size_t>(9));

    for (char c : id.substr(head.size())) {
        ASSERT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'z'));
    }
}

/**
 * @brief Two ids minted in the same millisecond still differ.
 */
void test_id_uniqueness()
{
    std::string id1 = infra::IdGenerator::generate("sync", 42);
    std::string id2 = infra::IdGenerator::generate("sync", 42);
    ASSERT_NE(id1, id2);
}

void test_string_trim()
{
    ASSERT_EQ(infra::String::trim("   hello larder   "), std::string("hello larder"));
    ASSERT_EQ(infra::String::trim("  \t\n  \r "), std::string(""));
}

/**
 * @brief Normalization trims, lowercases and collapses inner whitespace.
 */
void test_normalize_query()
{
    ASSERT_EQ(infra::String::normalize_query("  Creamy   PASTA\tBake "),
              std::string("creamy pasta bake"));
    ASSERT_EQ(infra::String::normalize_query(""), std::string(""));
}

void test_manual_clock()
{
    infra::ManualClock clock(1000);
    ASSERT_EQ(clock.now_ms(), static_cast<int64_t>(1000));
    clock.advance(250);
    ASSERT_EQ(clock.now_ms(), static_cast<int64_t>(1250));
    clock.set(5);
    ASSERT_EQ(clock.now_ms(), static_cast<int64_t>(5));
}

/**
 * @brief `wait_idle()` returns only after every queued task ran, and a throwing
 * task does not take its worker down.
 */
void test_scheduler_wait_idle()
{
    infra::Scheduler scheduler(2);
    std::atomic<int> counter{0};

    scheduler.enqueue([]() { throw std::runtime_error("boom"); });
    for (int i = 0; i < 10; ++i) {
        scheduler.enqueue([&counter]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            counter.fetch_add(1);
        });
    }
    scheduler.wait_idle();

    ASSERT_EQ(counter.load(), 10);
}

/**
 * @brief A periodic task keeps firing until cancelled, and never after.
 */
void test_scheduler_periodic_and_cancel()
{
    infra::Scheduler scheduler(1);
    std::atomic<int> ticks{0};

    infra::Scheduler::TaskId id =
        scheduler.schedule_every(std::chrono::milliseconds(10), [&ticks]() { ticks.fetch_add(1); });

    ASSERT_TRUE(test::eventually([&ticks]() { return ticks.load() >= 3; }));
    ASSERT_TRUE(scheduler.cancel(id));
    ASSERT_FALSE(scheduler.cancel(id));

    scheduler.wait_idle();
    int frozen = ticks.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    ASSERT_EQ(ticks.load(), frozen);
}
