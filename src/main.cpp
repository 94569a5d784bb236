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
 * @file main.cpp
 * @brief Application Entry Point (Bootstrap).
 *
 * @details
 * This file contains the `main` function of `larder_shell`:
 * 1. Argument Parsing and configuration loading.
 * 2. Signal Handling Registration (SIGINT/SIGTERM).
 * 3. Subsystem Initialization (File store, simulated remote, engine).
 * 4. Line-oriented command loop on stdin.
 */

#include "larder/core/config.hpp"
#include "larder/core/engine.hpp"
#include "larder/infra/clock.hpp"
#include "larder/infra/logger.hpp"
#include "larder/shell/handler.hpp"
#include "larder/shell/simulated_remote.hpp"
#include "larder/storage/store.hpp"

#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>

/// @brief Set by the signal handler; polled between commands.
static volatile std::sig_atomic_t g_interrupted = 0;

void signal_handler(int signum)
{
    g_interrupted = signum;
}

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [DATA_PATH] [CONFIG_JSON]\n"
              << "Options:\n"
              << "  DATA_PATH     Directory for persisted engine state (Default: ./larder_data)\n"
              << "  CONFIG_JSON   Engine configuration file (Default: built-in defaults)\n"
              << "  --help        Show this help message\n"
              << "\n"
              << "Reads one JSON request per line, e.g. {\"action\":\"status\"}.\n";
}

int main(int argc, char* argv[])
{
    if (argc > 1 && std::string(argv[1]) == "--help") {
        print_help(argv[0]);
        return 0;
    }

    std::string data_path = "./larder_data";

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        if (argc > 1)
            data_path = argv[1];

        larder::core::EngineConfig config;
        if (argc > 2) {
            config = larder::core::load_config(argv[2]);
            larder::infra::Logger::log(larder::infra::LogLevel::INFO,
                                       "Shell: Loaded configuration from '" +
                                           std::string(argv[2]) + "'");
        }

        larder::infra::Logger::log(larder::infra::LogLevel::INFO,
                                   "Shell: Data path set to '" + data_path + "'");

        larder::storage::FileStore store(data_path, config.storage_quota_bytes);
        larder::infra::SystemClock clock;
        larder::shell::SimulatedRemote remote;
        larder::core::OfflineEngine engine(store, remote.transport(), clock, config);

        std::string line;
        while (!g_interrupted && std::getline(std::cin, line)) {
            if (line.empty()) {
                continue;
            }
            std::string resp = larder::shell::Handler::process(engine, remote, line);
            std::cout << resp << std::endl;
            if (resp.find("\"status\":\"goodbye\"") != std::string::npos) {
                break;
            }
        }

        if (g_interrupted) {
            larder::infra::Logger::log(larder::infra::LogLevel::WARN,
                                       "Shell: Interrupt received (Signal " +
                                           std::to_string(g_interrupted) + "). Shutting down...");
        }
    } catch (const std::exception& e) {
        larder::infra::Logger::log(larder::infra::LogLevel::FATAL,
                                   "Shell: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    larder::infra::Logger::log(larder::infra::LogLevel::INFO, "Shell: Shutdown complete.");
    return 0;
}
