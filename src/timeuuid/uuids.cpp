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
 * @file uuids.cpp
 * @brief Implementation of the process-wide identifier facade.
 */

#include "chronoid/timeuuid/uuids.hpp"

#include "chronoid/infra/entropy.hpp"
#include "chronoid/infra/logger.hpp"
#include "chronoid/timeuuid/range_boundary.hpp"

#include <mutex>
#include <random>
#include <stdexcept>
#include <string>

namespace chronoid::timeuuid {

namespace {

/**
 * @brief Settings for the process generator, frozen when it is first built.
 */
struct FacadeState {
    std::mutex mutex;
    infra::GeneratorOptions options;
    bool initialized = false;
};

FacadeState& facade_state()
{
    static FacadeState state;
    return state;
}

/// @brief Marks the facade initialized and hands out the options to build with.
infra::GeneratorOptions take_options()
{
    FacadeState& state = facade_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.initialized = true;
    return state.options;
}

} // namespace

void Uuids::configure(const infra::GeneratorOptions& options)
{
    FacadeState& state = facade_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (state.initialized) {
        throw std::logic_error("Uuids::configure called after the process generator was "
                               "initialized");
    }
    state.options = options;
}

TimeUuidGenerator& Uuids::instance()
{
    // Function-local static: construction is serialized by the runtime.
    static TimeUuidGenerator generator(take_options());

    // The node is chosen before any caller receives the generator.
    generator.node();
    return generator;
}

/**
 * @brief Generates an RFC 4122 compliant Version 4 identifier.
 *
 * Implementation Strategy:
 * 1. **Thread Safety**: `thread_local` engines avoid any shared state.
 * 2. **Protocol Compliance**: version nibble `0100`, variant bits `10`.
 */
Identifier Uuids::random()
{
    instance();

    static thread_local std::mt19937_64 gen(infra::Entropy::next_u64());
    static thread_local std::uniform_int_distribution<std::uint64_t> dis;

    std::uint64_t msb = dis(gen);
    std::uint64_t lsb = dis(gen);

    msb = (msb & ~0xF000ULL) | 0x4000ULL;
    lsb = (lsb & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;
    return Identifier(msb, lsb);
}

Identifier Uuids::time_based()
{
    return instance().time_based();
}

std::int64_t Uuids::unix_timestamp(const Identifier& id)
{
    instance();

    if (id.version() != 1) {
        throw std::invalid_argument("Can only retrieve the unix timestamp for version 1 "
                                    "identifiers (provided version " +
                                    std::to_string(id.version()) + ")");
    }
    return RangeBoundary::extract_unix_millis(id);
}

Identifier Uuids::start_of(std::int64_t unix_millis)
{
    instance();
    return RangeBoundary::lower_bound_of(unix_millis);
}

Identifier Uuids::end_of(std::int64_t unix_millis)
{
    instance();
    return RangeBoundary::upper_bound_of(unix_millis);
}

} // namespace chronoid::timeuuid
