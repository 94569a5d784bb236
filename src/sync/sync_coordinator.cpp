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

#include "larder/sync/sync_coordinator.hpp"

#include "larder/infra/logger.hpp"

#include <exception>
#include <string>

namespace larder::sync {

namespace {

/// @brief Clears the re-entrancy flag when a drain leaves scope.
class SyncingGuard {
  public:
    explicit SyncingGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~SyncingGuard() { flag_.store(false); }

  private:
    std::atomic<bool>& flag_;
};

} // namespace

SyncCoordinator::SyncCoordinator(PendingQueue& queue, ReachabilityMonitor& reachability,
                                 Transport transport, infra::Scheduler& scheduler,
                                 std::chrono::milliseconds interval)
    : queue_(queue), reachability_(reachability), transport_(std::move(transport)),
      scheduler_(scheduler), interval_(interval)
{
}

SyncCoordinator::~SyncCoordinator() { shutdown(); }

void SyncCoordinator::start()
{
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (started_) {
        return;
    }

    subscription_ = reachability_.subscribe([this](bool online) {
        if (online) {
            request_sync();
        }
    });

    timer_ = scheduler_.schedule_every(interval_, [this]() {
        if (reachability_.is_online()) {
            sync_now();
        }
    });

    started_ = true;
    infra::Logger::log(infra::LogLevel::DEBUG,
                       "Sync: Coordinator started (interval " + std::to_string(interval_.count()) +
                           " ms).");
}

void SyncCoordinator::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (!started_) {
            return;
        }
        reachability_.unsubscribe(subscription_);
        scheduler_.cancel(timer_);
        started_ = false;
    }
    scheduler_.wait_idle();
    infra::Logger::log(infra::LogLevel::DEBUG, "Sync: Coordinator stopped.");
}

std::optional<DrainReport> SyncCoordinator::sync_now()
{
    if (!reachability_.is_online()) {
        infra::Logger::log(infra::LogLevel::DEBUG, "Sync: Skipped, offline.");
        return std::nullopt;
    }

    bool expected = false;
    if (!syncing_.compare_exchange_strong(expected, true)) {
        infra::Logger::log(infra::LogLevel::DEBUG, "Sync: Skipped, drain already in progress.");
        return std::nullopt;
    }
    SyncingGuard guard(syncing_);

    DrainReport report = queue_.drain(
        [this](const model::PendingOperation& op) { return dispatch(transport_, op.mutation); },
        [this](const FailureReport& failure) { notify_failure(failure); });

    if (report.attempted > 0 || report.failed > 0) {
        infra::Logger::log(infra::LogLevel::INFO,
                           "Sync: Drain finished. attempted=" + std::to_string(report.attempted) +
                               " succeeded=" + std::to_string(report.succeeded) +
                               " retried=" + std::to_string(report.retried) +
                               " failed=" + std::to_string(report.failed));
    } else {
        infra::Logger::log(infra::LogLevel::DEBUG, "Sync: Queue empty.");
    }
    return report;
}

void SyncCoordinator::request_sync()
{
    scheduler_.enqueue([this]() { sync_now(); });
}

void SyncCoordinator::on_permanent_failure(FailureListener listener)
{
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    failure_listeners_.push_back(std::move(listener));
}

void SyncCoordinator::notify_failure(const FailureReport& report)
{
    std::vector<FailureListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = failure_listeners_;
    }
    for (auto& listener : listeners) {
        try {
            listener(report);
        } catch (const std::exception& e) {
            infra::Logger::log(infra::LogLevel::WARN,
                               "Sync: Failure listener raised: " + std::string(e.what()));
        }
    }
}

} // namespace larder::sync
