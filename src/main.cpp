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
 * @brief Entry point of `chronoid-bench`, the generator self-check tool.
 *
 * @details
 * The tool mints identifiers from several threads against one generator and
 * verifies the two guarantees deployments rely on:
 * 1. No identifier is produced twice.
 * 2. Each thread observes strictly increasing timestamps.
 *
 * It reports throughput and how far issued ticks ran ahead of the wall clock.
 */

#include "chronoid/infra/config.hpp"
#include "chronoid/infra/logger.hpp"
#include "chronoid/timeuuid/clock_sequence.hpp"
#include "chronoid/timeuuid/generator.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using chronoid::infra::Logger;
using chronoid::infra::LogLevel;
using chronoid::timeuuid::Identifier;

/// @brief Raised by the signal handler; workers poll it between identifiers.
static std::atomic<bool> g_stop{false};

/**
 * @brief Catches SIGINT/SIGTERM so a long run ends with a report instead of
 * an abrupt termination.
 */
void signal_handler(int)
{
    g_stop = true;
}

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [THREADS] [PER_THREAD] [--config FILE]\n"
              << "Options:\n"
              << "  THREADS       Concurrent minting threads (Default: 10)\n"
              << "  PER_THREAD    Identifiers minted per thread (Default: 500000)\n"
              << "  --config FILE JSON generator configuration\n"
              << "  --help        Show this help message\n";
}

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    std::size_t threads = 10;
    std::size_t per_thread = 500000;
    std::string config_path;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        std::vector<std::string> positional;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help") {
                print_help(argv[0]);
                return 0;
            }
            if (arg == "--config") {
                if (i + 1 >= argc) {
                    throw std::invalid_argument("--config requires a file argument");
                }
                config_path = argv[++i];
                continue;
            }
            positional.push_back(arg);
        }
        if (positional.size() > 0)
            threads = std::stoul(positional[0]);
        if (positional.size() > 1)
            per_thread = std::stoul(positional[1]);
        if (threads == 0) {
            throw std::invalid_argument("THREADS must be at least 1");
        }

        chronoid::infra::GeneratorOptions options;
        if (!config_path.empty()) {
            options = chronoid::infra::Config::load(config_path);
        }
        Logger::set_level(options.log_level);

        Logger::log(LogLevel::INFO, "Bench: " + std::to_string(threads) + " threads x " +
                                        std::to_string(per_thread) + " identifiers");

        chronoid::timeuuid::TimeUuidGenerator generator(options);
        generator.node();

        std::vector<std::vector<Identifier>> minted(threads);
        std::atomic<std::size_t> regressions{0};
        std::atomic<std::size_t> failures{0};

        auto started = std::chrono::steady_clock::now();

        std::vector<std::thread> workers;
        for (std::size_t t = 0; t < threads; ++t) {
            workers.emplace_back([&, t] {
                std::vector<Identifier>& out = minted[t];
                out.reserve(per_thread);
                try {
                    std::uint64_t previous = 0;
                    for (std::size_t i = 0; i < per_thread && !g_stop; ++i) {
                        Identifier id = generator.time_based();
                        if (id.timestamp() <= previous) {
                            regressions++;
                        }
                        previous = id.timestamp();
                        out.push_back(id);
                    }
                } catch (const std::exception& e) {
                    Logger::log(LogLevel::ERROR, "Bench: worker " + std::to_string(t) +
                                                     " failed: " + std::string(e.what()));
                    failures++;
                }
            });
        }
        for (std::thread& worker : workers) {
            worker.join();
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::steady_clock::now() - started)
                           .count();

        std::vector<Identifier> all;
        for (auto& batch : minted) {
            all.insert(all.end(), batch.begin(), batch.end());
            std::vector<Identifier>().swap(batch);
        }
        std::sort(all.begin(), all.end());
        std::size_t duplicates = 0;
        for (std::size_t i = 1; i < all.size(); ++i) {
            if (all[i] == all[i - 1]) {
                duplicates++;
            }
        }

        const std::uint64_t wall = chronoid::timeuuid::ClockSequence::wall_clock_ticks();
        const std::uint64_t last = generator.last_tick();
        const std::uint64_t drift_ms =
            last > wall ? (last - wall) / chronoid::timeuuid::kTicksPerMillisecond : 0;

        Logger::log(LogLevel::INFO, "Bench: minted " + std::to_string(all.size()) + " in " +
                                        std::to_string(elapsed) + " ms");
        Logger::log(LogLevel::INFO, "Bench: tick drift ahead of wall clock " +
                                        std::to_string(drift_ms) + " ms");
        if (g_stop) {
            Logger::log(LogLevel::WARN, "Bench: interrupted before completion");
        }

        if (duplicates > 0 || regressions > 0 || failures > 0) {
            Logger::log(LogLevel::FATAL, "Bench: " + std::to_string(duplicates) +
                                             " duplicates, " + std::to_string(regressions.load()) +
                                             " timestamp regressions, " +
                                             std::to_string(failures.load()) + " failed workers");
            return 1;
        }

        Logger::log(LogLevel::INFO, "Bench: all identifiers unique and strictly increasing.");

    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "Bench: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
