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
 * @file range_boundary.hpp
 * @brief Unix time conversion and millisecond range bounds.
 *
 * @details
 * Ordered stores sort time-based identifiers by their embedded timestamp,
 * then by clock sequence and node. To scan "everything minted during
 * millisecond `t`" a caller needs the smallest and largest identifier any
 * generator could have produced in `t`:
 *
 * @code
 * auto from = RangeBoundary::lower_bound_of(t_begin);
 * auto to   = RangeBoundary::upper_bound_of(t_end);
 * // SELECT ... WHERE id >= from AND id <= to
 * @endcode
 *
 * Bounds are synthetic. A real identifier may share their bit pattern, which
 * is harmless because both bounds are inclusive.
 */

#pragma once

#include "chronoid/timeuuid/identifier.hpp"

#include <cstdint>

namespace chronoid::timeuuid {

/**
 * @class RangeBoundary
 * @brief Pure conversion and boundary functions.
 */
class RangeBoundary {
  public:
    /**
     * @brief Converts Unix milliseconds to ticks since 1582-10-15.
     *
     * Exact integer arithmetic. Negative values (before 1970) are accepted
     * down to the 1582 epoch.
     */
    static std::uint64_t to_internal_ticks(std::int64_t unix_millis);

    /**
     * @brief Recovers Unix milliseconds from an identifier's timestamp.
     *
     * Sub-millisecond ticks are discarded.
     */
    static std::int64_t extract_unix_millis(const Identifier& id);

    /// @brief Smallest identifier mintable within `unix_millis`.
    static Identifier lower_bound_of(std::int64_t unix_millis);

    /// @brief Largest identifier mintable within `unix_millis`.
    static Identifier upper_bound_of(std::int64_t unix_millis);
};

} // namespace chronoid::timeuuid
