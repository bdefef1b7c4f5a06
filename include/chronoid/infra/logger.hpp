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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for Chronoid.
 *
 * @details
 * Declares the `Logger` class used by the identifier generator and the bench
 * tool to report bootstrap events and fatal conditions (entropy or clock
 * failures). Output is serialized so entries from concurrent threads never
 * interleave.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace chronoid::infra {

/**
 * @enum LogLevel
 * @brief Severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details.
    DEBUG, ///< Diagnostic information (chosen node, clock sequence).
    INFO,  ///< Nominal operational events (generator bootstrap, config loaded).
    WARN,  ///< Non-blocking anomalies (unknown configuration keys).
    ERROR, ///< Failures surfaced to the caller (clock read errors).
    FATAL  ///< Conditions under which no identifier can be produced.
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 *
 * @details
 * Messages below the configured minimum level are dropped before the lock
 * is taken. The minimum level defaults to `INFO`.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * chronoid::infra::Logger::log(LogLevel::INFO, "Generator: ready.");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that will be written.
     */
    static void set_level(LogLevel level);

    /// @brief Returns the current minimum severity.
    static LogLevel level();

  private:
    /// @brief Guards `std::cout` and `std::cerr` against interleaved output.
    static std::mutex mutex_;

    /// @brief Minimum severity written by `log()`.
    static std::atomic<LogLevel> min_level_;
};

} // namespace chronoid::infra
