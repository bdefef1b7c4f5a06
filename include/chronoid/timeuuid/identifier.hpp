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
 * @file identifier.hpp
 * @brief The 128-bit identifier value type.
 *
 * @details
 * An `Identifier` is stored as two 64-bit halves matching the RFC 4122 wire
 * layout read big-endian:
 *
 * ```
 * msb: time_low(32) | time_mid(16) | version(4) time_high(12)
 * lsb: variant(2) clock_seq(14)    | node(48)
 * ```
 *
 * Identifiers are immutable values. The ordering operators compare the raw
 * halves and exist for containers; chronological ordering is the job of the
 * storage layer's comparator, which sorts by `timestamp()` first.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace chronoid::timeuuid {

/**
 * @class Identifier
 * @brief Immutable 128-bit identifier with RFC 4122 field accessors.
 */
class Identifier {
  public:
    /// @brief Size of the binary wire representation in bytes.
    static constexpr std::size_t kSize = 16;

    using Bytes = std::array<std::uint8_t, kSize>;

    /// @brief The nil identifier (all bits zero).
    constexpr Identifier() = default;

    constexpr Identifier(std::uint64_t msb, std::uint64_t lsb) : msb_(msb), lsb_(lsb) {}

    constexpr std::uint64_t most_significant_bits() const { return msb_; }
    constexpr std::uint64_t least_significant_bits() const { return lsb_; }

    /// @brief The 4-bit version nibble (1 = time-based, 4 = random).
    constexpr int version() const { return static_cast<int>((msb_ >> 12) & 0x0F); }

    /**
     * @brief The variant field decoded as in RFC 4122 section 4.1.1.
     *
     * @return 0 (NCS), 2 (RFC 4122), 6 (Microsoft) or 7 (reserved).
     */
    constexpr int variant() const
    {
        const std::uint64_t top = lsb_ >> 61;
        if ((top & 0x4) == 0) {
            return 0;
        }
        if ((top & 0x2) == 0) {
            return 2;
        }
        return static_cast<int>(top);
    }

    /**
     * @brief The 60-bit count of 100 ns ticks since 1582-10-15.
     *
     * Only meaningful for version 1 identifiers.
     */
    constexpr std::uint64_t timestamp() const
    {
        return ((msb_ & 0x0FFFULL) << 48) | (((msb_ >> 16) & 0xFFFFULL) << 32) | (msb_ >> 32);
    }

    /// @brief The 14-bit clock-sequence field.
    constexpr std::uint16_t clock_sequence() const
    {
        return static_cast<std::uint16_t>((lsb_ >> 48) & 0x3FFF);
    }

    /// @brief The 48-bit node field.
    constexpr std::uint64_t node() const { return lsb_ & 0xFFFFFFFFFFFFULL; }

    /**
     * @brief Serializes to the 16-byte big-endian wire layout.
     *
     * This is the form handed to storage collaborators, whose comparators
     * operate on raw bytes.
     */
    Bytes to_bytes() const;

    /// @brief Rebuilds an identifier from its 16-byte wire layout.
    static Identifier from_bytes(const Bytes& bytes);

    friend constexpr bool operator==(const Identifier& a, const Identifier& b)
    {
        return a.msb_ == b.msb_ && a.lsb_ == b.lsb_;
    }

    friend constexpr bool operator!=(const Identifier& a, const Identifier& b) { return !(a == b); }

    friend constexpr bool operator<(const Identifier& a, const Identifier& b)
    {
        return a.msb_ < b.msb_ || (a.msb_ == b.msb_ && a.lsb_ < b.lsb_);
    }

  private:
    std::uint64_t msb_ = 0;
    std::uint64_t lsb_ = 0;
};

} // namespace chronoid::timeuuid

namespace std {

template <> struct hash<chronoid::timeuuid::Identifier> {
    size_t operator()(const chronoid::timeuuid::Identifier& id) const noexcept
    {
        const std::uint64_t msb = id.most_significant_bits();
        const std::uint64_t lsb = id.least_significant_bits();
        return std::hash<std::uint64_t>{}(msb ^ (lsb * 0x9E3779B97F4A7C15ULL));
    }
};

} // namespace std
