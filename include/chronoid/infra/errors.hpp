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
 * @file errors.hpp
 * @brief Exception types raised by the identifier generator.
 *
 * @details
 * All failures in Chronoid are fatal for the operation that hit them and are
 * reported as exceptions derived from `std::runtime_error`. None of them is
 * ever converted into a placeholder identifier.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace chronoid::infra {

/**
 * @class EntropyError
 * @brief The system randomness source could not be read.
 *
 * Raised while choosing a node identifier or clock sequence. A generator
 * that hits this error cannot produce identifiers.
 */
class EntropyError : public std::runtime_error {
  public:
    explicit EntropyError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @class ClockError
 * @brief The real-time clock could not be read.
 */
class ClockError : public std::runtime_error {
  public:
    explicit ClockError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @class ConfigError
 * @brief A configuration document is malformed or holds out-of-range values.
 */
class ConfigError : public std::runtime_error {
  public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace chronoid::infra
