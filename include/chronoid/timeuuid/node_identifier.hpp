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
 * @file node_identifier.hpp
 * @brief The 48-bit node field shared by all identifiers of one generator.
 *
 * @details
 * The node is never derived from a hardware address. Its most significant
 * bit (the IEEE 802 multicast bit) is always set, which RFC 4122 section 4.5
 * reserves for locally generated node values; a randomly chosen node can
 * therefore never collide with a registered MAC address.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>

namespace chronoid::timeuuid {

/**
 * @class NodeIdentifier
 * @brief Lazily chosen, then immutable, 48-bit node value.
 *
 * @details
 * The random value is drawn on the first call to `value()`. Concurrent first
 * callers are serialized by `std::call_once`, so exactly one value is chosen.
 * If the entropy source fails, the exception propagates and a later call
 * retries; no fallback value is ever returned.
 */
class NodeIdentifier {
  public:
    /// @brief Marks a node value as locally administered.
    static constexpr std::uint64_t kLocalBit = 0x800000000000ULL;

    /// @brief Mask of the 48 usable node bits.
    static constexpr std::uint64_t kMask = 0xFFFFFFFFFFFFULL;

    /// @brief Callable producing 64 random bits; throws `EntropyError` on failure.
    using EntropySource = std::function<std::uint64_t()>;

    /**
     * @brief Creates a node identifier.
     *
     * @param fixed Pins the node to this value, masked to 48 bits with its top
     * bit forced to 1. When empty the node is drawn from `source` on first use.
     * @param source Randomness for the unpinned case. An empty callable selects
     * `infra::Entropy::next_u64`.
     */
    explicit NodeIdentifier(std::optional<std::uint64_t> fixed = std::nullopt,
                            EntropySource source = EntropySource());

    NodeIdentifier(const NodeIdentifier&) = delete;
    NodeIdentifier& operator=(const NodeIdentifier&) = delete;

    /**
     * @brief Returns the node value, choosing it on the first call.
     *
     * @throws EntropyError If the randomness source is unavailable.
     */
    std::uint64_t value() const;

  private:
    EntropySource source_;
    mutable std::once_flag once_;
    mutable std::uint64_t value_ = 0;
    bool fixed_ = false;
};

} // namespace chronoid::timeuuid
