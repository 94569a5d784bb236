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
 * @file simulated_remote.hpp
 * @brief In-process stand-in for the recipe service, used by `larder_shell`.
 *
 * @details
 * Every call is logged. While marked unhealthy, every call throws, which lets a
 * shell session exercise queueing, retry and permanent failure without a network.
 * Successful `generate` calls add a recipe to the remote catalogue, which
 * `fetch_recipe` and `search` then serve.
 */

#pragma once

#include "larder/sync/transport.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <string>

namespace larder::shell {

class SimulatedRemote {
  public:
    void set_healthy(bool healthy);
    bool healthy() const { return healthy_.load(); }

    /// @brief Number of calls received, failed ones included.
    size_t calls() const { return calls_.load(); }

    /// @brief Ids the remote currently holds as favorites.
    std::set<std::string> favorites() const;

    /**
     * @brief Builds a transport bound to this remote.
     * @warning The remote must outlive every copy of the returned transport.
     */
    sync::Transport transport();

  private:
    /// @throws std::runtime_error While unhealthy.
    void check(const char* call);

    std::atomic<bool> healthy_{true};
    std::atomic<size_t> calls_{0};

    mutable std::mutex mutex_;
    std::map<std::string, model::Recipe> catalogue_;
    std::set<std::string> favorites_;
    size_t next_recipe_ = 1;
};

} // namespace larder::shell
