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
 * @file assembler.hpp
 * @brief Bit packing of version 1 (time-based) identifiers.
 */

#pragma once

#include "chronoid/timeuuid/identifier.hpp"

#include <cstdint>

namespace chronoid::timeuuid {

/**
 * @class IdentifierAssembler
 * @brief Stateless packer for the RFC 4122 version 1 layout.
 *
 * @details
 * **Field placement:**
 * - ticks[0..31]  -> `time_low`  (msb bits 32..63)
 * - ticks[32..47] -> `time_mid`  (msb bits 16..31)
 * - ticks[48..59] -> `time_high` (msb bits 0..11), version `0001` above it
 * - clock_seq[0..13] -> lsb bits 48..61, variant `10` in bits 62..63
 * - node[0..47]   -> lsb bits 0..47
 *
 * All functions are total: inputs wider than their field are truncated.
 */
class IdentifierAssembler {
  public:
    static constexpr std::uint64_t kVersionBits = 0x0000000000001000ULL;
    static constexpr std::uint64_t kVariantBits = 0x8000000000000000ULL;
    static constexpr std::uint64_t kTickMask = 0x0FFFFFFFFFFFFFFFULL;
    static constexpr std::uint16_t kClockSeqMask = 0x3FFF;
    static constexpr std::uint64_t kNodeMask = 0xFFFFFFFFFFFFULL;

    /// @brief Packs a 60-bit tick count and the version nibble into the high half.
    static std::uint64_t make_msb(std::uint64_t ticks);

    /// @brief Packs the variant, clock sequence and node into the low half.
    static std::uint64_t make_lsb(std::uint16_t clock_seq, std::uint64_t node);

    /**
     * @brief Assembles a complete version 1 identifier.
     *
     * @param ticks 100 ns ticks since 1582-10-15.
     * @param clock_seq The 14-bit clock-sequence field.
     * @param node The 48-bit node field, used as-is.
     */
    static Identifier build(std::uint64_t ticks, std::uint16_t clock_seq, std::uint64_t node);
};

} // namespace chronoid::timeuuid
