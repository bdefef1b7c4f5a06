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
 * @file entropy.hpp
 * @brief Access to the system's non-deterministic randomness source.
 */

#pragma once

#include <cstdint>

namespace chronoid::infra {

/**
 * @class Entropy
 * @brief Static wrapper around `std::random_device`.
 *
 * @details
 * Used for values that must be unpredictable across processes: node
 * identifiers, clock sequences and the seeds of per-thread random engines.
 * It is not used on any per-identifier hot path.
 */
class Entropy {
  public:
    /**
     * @brief Draws 64 bits from the system randomness source.
     *
     * @throws EntropyError If the device is unavailable or fails to produce data.
     * The failure is logged at FATAL before the exception leaves this function.
     */
    static std::uint64_t next_u64();
};

} // namespace chronoid::infra
