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
 * @file scheduler.cpp
 * @brief Implementation of the worker pool and periodic timer.
 *
 * @details
 * Workers follow the classic producer-consumer loop. The timer thread never runs
 * user code itself: when a periodic deadline passes it moves a copy of the task onto
 * the FIFO queue, so periodic and one-shot work share the same workers and the same
 * shutdown semantics.
 */

#include "larder/infra/scheduler.hpp"

#include "larder/infra/logger.hpp"

#include <exception>
#include <string>

namespace larder::infra {

Scheduler::Scheduler(size_t threads) : stop_(false)
{
    if (threads == 0) {
        threads = 1;
    }
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
    timer_ = std::thread([this] { timer_loop(); });
}

Scheduler::~Scheduler()
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
        periodic_.clear();
    }

    condition_.notify_all();
    timer_condition_.notify_all();

    if (timer_.joinable()) {
        timer_.join();
    }
    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void Scheduler::run_task(std::function<void()>& task)
{
    try {
        task();
    } catch (const std::exception& e) {
        Logger::log(LogLevel::ERROR, "Scheduler: Task raised: " + std::string(e.what()));
    }
}

/**
 * @brief Worker Thread Event Loop.
 *
 * Exits only when the scheduler is stopping AND all pending tasks have been drained,
 * so a replay queued just before shutdown still completes.
 */
void Scheduler::worker_loop()
{
    while (true) {
        std::function<void()> task;

        // --- Critical Section: Task Acquisition ---
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
            ++active_;
        }

        if (task) {
            run_task(task);
        }

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            --active_;
            if (tasks_.empty() && active_ == 0) {
                idle_condition_.notify_all();
            }
        }
    }
}

/**
 * @brief Timer Thread Loop.
 *
 * Sleeps until the earliest deadline (or indefinitely if nothing is scheduled) and
 * re-evaluates on every wake-up, which makes spurious wake-ups and concurrent
 * `schedule_every`/`cancel` calls harmless.
 */
void Scheduler::timer_loop()
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    while (!stop_) {
        if (periodic_.empty()) {
            timer_condition_.wait(lock, [this] { return stop_ || !periodic_.empty(); });
            continue;
        }

        auto now = std::chrono::steady_clock::now();
        auto earliest = std::chrono::steady_clock::time_point::max();
        bool fired = false;

        for (auto& [id, entry] : periodic_) {
            if (entry.next_due <= now) {
                tasks_.push(entry.task);
                entry.next_due = now + entry.interval;
                fired = true;
            }
            if (entry.next_due < earliest) {
                earliest = entry.next_due;
            }
        }

        if (fired) {
            condition_.notify_all();
        }

        timer_condition_.wait_until(lock, earliest);
    }
}

void Scheduler::enqueue(std::function<void()> task)
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_) {
            Logger::log(LogLevel::WARN, "Scheduler: Task rejected, shutdown in progress.");
            return;
        }
        tasks_.emplace(std::move(task));
    }
    condition_.notify_one();
}

Scheduler::TaskId Scheduler::schedule_every(std::chrono::milliseconds interval,
                                            std::function<void()> task)
{
    TaskId id = 0;
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        id = next_id_++;
        periodic_.emplace(
            id, PeriodicTask{interval, std::chrono::steady_clock::now() + interval, std::move(task)});
    }
    timer_condition_.notify_all();
    return id;
}

bool Scheduler::cancel(TaskId id)
{
    bool erased = false;
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        erased = periodic_.erase(id) > 0;
    }
    timer_condition_.notify_all();
    return erased;
}

void Scheduler::wait_idle()
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_condition_.wait(lock, [this] { return tasks_.empty() && active_ == 0; });
}

} // namespace larder::infra
