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
 * @file scheduler.hpp
 * @brief Worker pool with cancellable periodic tasks.
 *
 * @details
 * This header defines the `Scheduler` class, the background execution backbone of
 * the offline engine. Queue replays triggered by reachability changes or new
 * mutations run on its workers, and the periodic sync timer is a task it owns, so
 * no background work outlives the engine that scheduled it.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace larder::infra {

/**
 * @class Scheduler
 * @brief A thread-safe worker pool with a timer thread for recurring work.
 *
 * @details
 * **Concurrency Model:**
 * - **Producers:** Any thread can `enqueue()` a task or `schedule_every()` a recurring one.
 * - **Consumers:** Worker threads sleep on a condition variable until work is available.
 * - **Timer:** A dedicated thread sleeps until the earliest periodic deadline and then
 * pushes the due task onto the regular FIFO queue.
 */
class Scheduler {
  public:
    /// @brief Handle identifying a periodic task.
    using TaskId = uint64_t;

    /**
     * @brief Spawns the worker threads and the timer thread.
     *
     * @param threads The number of worker threads. Zero is promoted to one.
     */
    explicit Scheduler(size_t threads = 1);

    /**
     * @brief Destructor. Cancels every periodic task, lets queued work finish and
     * joins all threads.
     *
     * @note This is a **blocking** operation.
     */
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Submits a task for asynchronous execution.
     *
     * A task that throws a `std::exception` is logged at ERROR; the worker survives.
     */
    void enqueue(std::function<void()> task);

    /**
     * @brief Registers a task that runs every `interval`, first after one interval.
     *
     * @return TaskId A handle accepted by `cancel()`.
     */
    TaskId schedule_every(std::chrono::milliseconds interval, std::function<void()> task);

    /**
     * @brief Stops a periodic task. A run that was already queued still executes.
     * @return true If the id referred to a live periodic task.
     */
    bool cancel(TaskId id);

    /**
     * @brief Blocks until the FIFO queue is empty and no worker is executing a task.
     */
    void wait_idle();

  private:
    struct PeriodicTask {
        std::chrono::milliseconds interval;
        std::chrono::steady_clock::time_point next_due;
        std::function<void()> task;
    };

    void worker_loop();
    void timer_loop();
    void run_task(std::function<void()>& task);

    std::vector<std::thread> workers_;
    std::thread timer_;

    std::queue<std::function<void()>> tasks_;
    std::map<TaskId, PeriodicTask> periodic_;
    TaskId next_id_ = 1;
    size_t active_ = 0;

    /// @brief Protects `tasks_`, `periodic_`, `next_id_` and `active_`.
    std::mutex queue_mutex_;

    /// @brief Wakes workers on new tasks or shutdown.
    std::condition_variable condition_;

    /// @brief Wakes the timer thread when the periodic set changes.
    std::condition_variable timer_condition_;

    /// @brief Signals `wait_idle()` callers.
    std::condition_variable idle_condition_;

    std::atomic<bool> stop_;
};

} // namespace larder::infra
