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
 * @file assembler.cpp
 * @brief Implementation of the version 1 bit packing.
 */

#include "chronoid/timeuuid/assembler.hpp"

namespace chronoid::timeuuid {

std::uint64_t IdentifierAssembler::make_msb(std::uint64_t ticks)
{
    ticks &= kTickMask;

    std::uint64_t msb = 0;
    msb |= (ticks & 0x00000000FFFFFFFFULL) << 32; // time_low
    msb |= (ticks & 0x0000FFFF00000000ULL) >> 16; // time_mid
    msb |= (ticks & 0x0FFF000000000000ULL) >> 48; // time_high
    msb |= kVersionBits;
    return msb;
}

std::uint64_t IdentifierAssembler::make_lsb(std::uint16_t clock_seq, std::uint64_t node)
{
    std::uint64_t lsb = kVariantBits;
    lsb |= static_cast<std::uint64_t>(clock_seq & kClockSeqMask) << 48;
    lsb |= node & kNodeMask;
    return lsb;
}

Identifier IdentifierAssembler::build(std::uint64_t ticks, std::uint16_t clock_seq,
                                      std::uint64_t node)
{
    return Identifier(make_msb(ticks), make_lsb(clock_seq, node));
}

} // namespace chronoid::timeuuid
