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

#include "larder/sync/reachability.hpp"

#include "larder/infra/logger.hpp"

#include <exception>
#include <string>
#include <vector>

namespace larder::sync {

ReachabilityMonitor::ReachabilityMonitor(bool initially_online) : online_(initially_online) {}

void ReachabilityMonitor::set_online(bool online)
{
    std::lock_guard<std::mutex> transition(transition_mutex_);

    if (online_.exchange(online) == online) {
        return;
    }

    infra::Logger::log(infra::LogLevel::INFO,
                       online ? "Net: Connectivity restored." : "Net: Connectivity lost.");

    // Listeners run outside the registry lock so they may (un)subscribe.
    std::vector<Listener> snapshot;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        snapshot.reserve(listeners_.size());
        for (const auto& [id, listener] : listeners_) {
            snapshot.push_back(listener);
        }
    }

    for (auto& listener : snapshot) {
        try {
            listener(online);
        } catch (const std::exception& e) {
            infra::Logger::log(infra::LogLevel::WARN,
                               "Net: Reachability listener raised: " + std::string(e.what()));
        }
    }
}

ReachabilityMonitor::SubscriptionId ReachabilityMonitor::subscribe(Listener listener)
{
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    SubscriptionId id = next_id_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

bool ReachabilityMonitor::unsubscribe(SubscriptionId id)
{
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    return listeners_.erase(id) > 0;
}

} // namespace larder::sync
