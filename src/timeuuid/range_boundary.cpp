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
 * @file range_boundary.cpp
 * @brief Implementation of the millisecond range bounds.
 */

#include "chronoid/timeuuid/range_boundary.hpp"

#include "chronoid/timeuuid/assembler.hpp"
#include "chronoid/timeuuid/clock_sequence.hpp"

namespace chronoid::timeuuid {

std::uint64_t RangeBoundary::to_internal_ticks(std::int64_t unix_millis)
{
    // Unsigned wrap-around makes negative millisecond values land correctly.
    return static_cast<std::uint64_t>(unix_millis) * kTicksPerMillisecond + kEpochOffsetTicks;
}

std::int64_t RangeBoundary::extract_unix_millis(const Identifier& id)
{
    return static_cast<std::int64_t>(id.timestamp() / kTicksPerMillisecond) - kEpochOffsetMillis;
}

Identifier RangeBoundary::lower_bound_of(std::int64_t unix_millis)
{
    return IdentifierAssembler::build(to_internal_ticks(unix_millis), 0, 0);
}

Identifier RangeBoundary::upper_bound_of(std::int64_t unix_millis)
{
    return IdentifierAssembler::build(to_internal_ticks(unix_millis) + kTicksPerMillisecond - 1,
                                      IdentifierAssembler::kClockSeqMask,
                                      IdentifierAssembler::kNodeMask);
}

} // namespace chronoid::timeuuid
