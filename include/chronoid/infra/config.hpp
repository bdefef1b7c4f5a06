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
 * @file config.hpp
 * @brief JSON configuration for identifier generators.
 *
 * @details
 * A generator is normally fully self-configuring: its node identifier and
 * clock sequence are drawn from the system entropy source. Deployments that
 * need to pin either value (reproducible tests, externally coordinated node
 * assignment) describe them in a small JSON document:
 *
 * @code
 * { "node": "0x8a1b2c3d4e5f", "clock_seq": 4660, "log_level": "debug" }
 * @endcode
 */

#pragma once

#include "chronoid/infra/logger.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace chronoid::infra {

/**
 * @struct GeneratorOptions
 * @brief Resolved settings for a `TimeUuidGenerator`.
 *
 * Unset optionals mean "draw from the entropy source".
 */
struct GeneratorOptions {
    /// @brief Fixed node identifier. The top bit is forced and the value masked to 48 bits.
    std::optional<std::uint64_t> node;

    /// @brief Fixed clock-sequence field, 0..16383.
    std::optional<std::uint16_t> clock_seq;

    /// @brief Minimum severity for the process logger.
    LogLevel log_level = LogLevel::INFO;
};

/**
 * @class Config
 * @brief Static parser turning JSON documents into `GeneratorOptions`.
 */
class Config {
  public:
    /**
     * @brief Parses an in-memory JSON document.
     *
     * Recognized keys: `node` (number or hex string), `clock_seq` (number),
     * `log_level` (string). Unknown keys are logged at WARN and ignored.
     *
     * @param text The raw JSON text.
     * @return GeneratorOptions The resolved settings.
     * @throws ConfigError On invalid syntax, wrong value types or out-of-range values.
     */
    static GeneratorOptions parse(const std::string& text);

    /**
     * @brief Reads and parses a JSON configuration file.
     *
     * @param path Filesystem path of the document.
     * @throws ConfigError If the file cannot be read or fails `parse()`.
     */
    static GeneratorOptions load(const std::string& path);

    /**
     * @brief Maps a level name (`trace`..`fatal`, case-insensitive) to a `LogLevel`.
     *
     * @throws ConfigError On an unknown name.
     */
    static LogLevel parse_level(const std::string& name);
};

} // namespace chronoid::infra
