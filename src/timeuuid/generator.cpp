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
 * @file generator.cpp
 * @brief Implementation of the time-based identifier generator.
 */

#include "chronoid/timeuuid/generator.hpp"

#include "chronoid/infra/entropy.hpp"
#include "chronoid/infra/logger.hpp"
#include "chronoid/timeuuid/assembler.hpp"

#include <string>
#include <utility>

namespace chronoid::timeuuid {

namespace {

std::uint16_t resolve_clock_seq(const infra::GeneratorOptions& options)
{
    if (options.clock_seq) {
        return static_cast<std::uint16_t>(*options.clock_seq & IdentifierAssembler::kClockSeqMask);
    }
    return static_cast<std::uint16_t>(infra::Entropy::next_u64() &
                                      IdentifierAssembler::kClockSeqMask);
}

} // namespace

TimeUuidGenerator::TimeUuidGenerator() : TimeUuidGenerator(infra::GeneratorOptions{}) {}

TimeUuidGenerator::TimeUuidGenerator(const infra::GeneratorOptions& options)
    : TimeUuidGenerator(ClockSequence::TickSource(), options)
{
}

TimeUuidGenerator::TimeUuidGenerator(ClockSequence::TickSource source,
                                     const infra::GeneratorOptions& options,
                                     NodeIdentifier::EntropySource node_entropy)
    : clock_(std::move(source)), node_(options.node, std::move(node_entropy)),
      clock_seq_(resolve_clock_seq(options))
{
    infra::Logger::log(infra::LogLevel::DEBUG,
                       "Generator: clock sequence " + std::to_string(clock_seq_) +
                           (options.node ? ", pinned node" : ", random node"));
}

Identifier TimeUuidGenerator::time_based()
{
    // Resolve the node first so an entropy failure never consumes a tick.
    const std::uint64_t node = node_.value();
    return IdentifierAssembler::build(clock_.next(), clock_seq_, node);
}

Identifier TimeUuidGenerator::build(std::uint64_t ticks) const
{
    return IdentifierAssembler::build(ticks, clock_seq_, node_.value());
}

std::uint64_t TimeUuidGenerator::node() const
{
    return node_.value();
}

} // namespace chronoid::timeuuid
