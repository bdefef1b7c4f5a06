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
 * @file clock_sequence.hpp
 * @brief Strictly increasing 100 ns tick source for time-based identifiers.
 *
 * @details
 * Time-based identifiers embed a 60-bit count of 100 ns ticks since the
 * Gregorian reform (1582-10-15T00:00:00Z). The wall clock alone cannot
 * guarantee uniqueness: two requests may land in the same tick, and the
 * clock may be stepped backwards. `ClockSequence` therefore hands out
 * `max(wall_clock, last_issued + 1)`, which keeps every issued value
 * strictly greater than all earlier ones.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>

namespace chronoid::timeuuid {

/// @brief Number of 100 ns ticks in one millisecond.
inline constexpr std::uint64_t kTicksPerMillisecond = 10000;

/// @brief Number of 100 ns ticks in one second.
inline constexpr std::uint64_t kTicksPerSecond = 10000000;

/// @brief Milliseconds between 1582-10-15T00:00:00Z and the Unix epoch.
inline constexpr std::int64_t kEpochOffsetMillis = 12219292800000LL;

/// @brief Ticks between 1582-10-15T00:00:00Z and the Unix epoch.
inline constexpr std::uint64_t kEpochOffsetTicks =
    static_cast<std::uint64_t>(kEpochOffsetMillis) * kTicksPerMillisecond;

/**
 * @class ClockSequence
 * @brief Lock-free monotonic tick issuer shared by all callers of one generator.
 *
 * @details
 * **Concurrency Model:**
 * The last issued tick lives in a single `std::atomic<uint64_t>`. `next()`
 * reads the wall clock once, then runs a compare-and-swap loop. A failed CAS
 * reloads the value another thread just published and retries against it
 * without touching the clock again, so every failure corresponds to progress
 * by some other caller. The loop is lock-free and needs no backoff.
 *
 * Under sustained request rates above one per 100 ns the issued ticks run
 * ahead of real time; they fall back in step as soon as the rate drops.
 */
class ClockSequence {
  public:
    /// @brief Callable returning the current wall-clock time in ticks since 1582.
    using TickSource = std::function<std::uint64_t()>;

    /// @brief Uses the real-time clock (`wall_clock_ticks()`).
    ClockSequence();

    /**
     * @brief Uses a caller-supplied tick source.
     *
     * Intended for tests that need to freeze or rewind time. An empty
     * callable selects the real-time clock.
     */
    explicit ClockSequence(TickSource source);

    ClockSequence(const ClockSequence&) = delete;
    ClockSequence& operator=(const ClockSequence&) = delete;

    /**
     * @brief Issues the next tick.
     *
     * @return A value strictly greater than every value previously returned by
     * this instance, on any thread.
     * @throws ClockError If the real-time clock cannot be read.
     */
    std::uint64_t next();

    /// @brief The most recently issued tick, or 0 before the first call.
    std::uint64_t last() const;

    /**
     * @brief Reads `CLOCK_REALTIME` and converts it to ticks since 1582.
     *
     * @throws ClockError If `clock_gettime` fails.
     */
    static std::uint64_t wall_clock_ticks();

  private:
    TickSource source_;
    std::atomic<std::uint64_t> last_{0};
};

} // namespace chronoid::timeuuid
