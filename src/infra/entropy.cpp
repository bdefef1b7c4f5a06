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
 * @file entropy.cpp
 * @brief `std::random_device` access with fatal error reporting.
 */

#include "chronoid/infra/entropy.hpp"

#include "chronoid/infra/errors.hpp"
#include "chronoid/infra/logger.hpp"

#include <random>
#include <string>

namespace chronoid::infra {

std::uint64_t Entropy::next_u64()
{
    try {
        std::random_device rd;
        // random_device yields 32-bit words; two draws fill one 64-bit value.
        std::uint64_t hi = rd();
        std::uint64_t lo = rd();
        return (hi << 32) | (lo & 0xFFFFFFFFULL);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL,
                    "Entropy: system randomness source unavailable: " + std::string(e.what()));
        throw EntropyError("randomness source unavailable: " + std::string(e.what()));
    }
}

} // namespace chronoid::infra
