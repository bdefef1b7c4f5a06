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
 * @file generator.hpp
 * @brief Context object owning all state needed to mint time-based identifiers.
 *
 * @details
 * A `TimeUuidGenerator` bundles one `ClockSequence`, one `NodeIdentifier`
 * and a fixed clock-sequence field. Applications normally go through the
 * process-wide instance behind `Uuids`; tests and embedders construct their
 * own instances with pinned values or a controlled tick source.
 */

#pragma once

#include "chronoid/infra/config.hpp"
#include "chronoid/timeuuid/clock_sequence.hpp"
#include "chronoid/timeuuid/identifier.hpp"
#include "chronoid/timeuuid/node_identifier.hpp"

#include <cstdint>

namespace chronoid::timeuuid {

/**
 * @class TimeUuidGenerator
 * @brief Thread-safe minting of version 1 identifiers.
 *
 * @details
 * Identifiers from one generator are unique and strictly increasing in their
 * embedded timestamp. The clock-sequence field is chosen once per generator
 * and carries no ordering logic; it only adds entropy between generators that
 * happen to share a node value.
 */
class TimeUuidGenerator {
  public:
    /// @brief Random node and clock sequence, real-time clock.
    TimeUuidGenerator();

    /**
     * @brief Builds a generator from resolved configuration.
     *
     * @throws EntropyError If a clock sequence must be drawn and the entropy
     * source is unavailable.
     */
    explicit TimeUuidGenerator(const infra::GeneratorOptions& options);

    /**
     * @brief Builds a generator reading time from `source`.
     *
     * An empty `source` selects the real-time clock; an empty `node_entropy`
     * selects the system entropy source.
     */
    TimeUuidGenerator(ClockSequence::TickSource source, const infra::GeneratorOptions& options,
                      NodeIdentifier::EntropySource node_entropy = NodeIdentifier::EntropySource());

    TimeUuidGenerator(const TimeUuidGenerator&) = delete;
    TimeUuidGenerator& operator=(const TimeUuidGenerator&) = delete;

    /**
     * @brief Mints the next time-based identifier.
     *
     * Safe for unrestricted concurrent use.
     *
     * @throws ClockError If the real-time clock cannot be read.
     * @throws EntropyError On first use, if the node cannot be chosen.
     */
    Identifier time_based();

    /// @brief Packs `ticks` with this generator's clock sequence and node.
    Identifier build(std::uint64_t ticks) const;

    /// @brief The node field, choosing it if necessary.
    std::uint64_t node() const;

    std::uint16_t clock_sequence() const { return clock_seq_; }

    /// @brief The most recently issued tick.
    std::uint64_t last_tick() const { return clock_.last(); }

  private:
    ClockSequence clock_;
    NodeIdentifier node_;
    std::uint16_t clock_seq_;
};

} // namespace chronoid::timeuuid
