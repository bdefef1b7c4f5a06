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
 * @file clock_sequence.cpp
 * @brief Implementation of the monotonic tick issuer.
 */

#include "chronoid/timeuuid/clock_sequence.hpp"

#include "chronoid/infra/errors.hpp"
#include "chronoid/infra/logger.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <string>
#include <utility>

namespace chronoid::timeuuid {

ClockSequence::ClockSequence() : source_(&ClockSequence::wall_clock_ticks) {}

ClockSequence::ClockSequence(TickSource source)
    : source_(source ? std::move(source) : TickSource(&ClockSequence::wall_clock_ticks))
{
}

/**
 * @brief Issues `max(now, last + 1)` through a CAS loop.
 *
 * `compare_exchange_weak` writes the competing value into `last` on failure,
 * so the candidate is recomputed from the freshest state each round.
 */
std::uint64_t ClockSequence::next()
{
    const std::uint64_t now = source_();

    std::uint64_t last = last_.load();
    std::uint64_t candidate = 0;
    do {
        candidate = (now > last) ? now : last + 1;
    } while (!last_.compare_exchange_weak(last, candidate));

    return candidate;
}

std::uint64_t ClockSequence::last() const
{
    return last_.load();
}

std::uint64_t ClockSequence::wall_clock_ticks()
{
    timespec ts{};
    if (clock_gettime(CLOCK_REALTIME, &ts) != 0) {
        const int err = errno;
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Clock: CLOCK_REALTIME read failed: " + std::string(std::strerror(err)));
        throw infra::ClockError("real-time clock unavailable: " + std::string(std::strerror(err)));
    }

    const std::int64_t seconds =
        static_cast<std::int64_t>(ts.tv_sec) + kEpochOffsetMillis / 1000;
    if (seconds < 0) {
        throw infra::ClockError("real-time clock reports a time before 1582-10-15");
    }

    return static_cast<std::uint64_t>(seconds) * kTicksPerSecond +
           static_cast<std::uint64_t>(ts.tv_nsec) / 100;
}

} // namespace chronoid::timeuuid
