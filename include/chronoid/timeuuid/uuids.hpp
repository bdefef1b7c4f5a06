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
 * @file uuids.hpp
 * @brief Process-wide entry points for identifier generation.
 *
 * @details
 * `Uuids` is the interface consumed by applications and storage layers. It
 * forwards to a single, lazily constructed `TimeUuidGenerator`. The first call
 * to any operation, including `random()` and the range bounds, initializes
 * that generator and chooses its node identifier.
 *
 * The process generator is self-configured unless `configure()` is called
 * before that first operation.
 *
 * @code
 * using chronoid::timeuuid::Uuids;
 *
 * auto id = Uuids::time_based();
 * std::int64_t ms = Uuids::unix_timestamp(id);
 * auto from = Uuids::start_of(ms - 1000);
 * auto to = Uuids::end_of(ms);
 * @endcode
 */

#pragma once

#include "chronoid/infra/config.hpp"
#include "chronoid/timeuuid/generator.hpp"
#include "chronoid/timeuuid/identifier.hpp"

#include <cstdint>

namespace chronoid::timeuuid {

/**
 * @class Uuids
 * @brief Static facade over the process-wide generator.
 */
class Uuids {
  public:
    /**
     * @brief Generates a random (version 4) identifier.
     *
     * Uses a `thread_local` 64-bit Mersenne Twister seeded from the system
     * entropy source. Carries no ordering guarantee.
     */
    static Identifier random();

    /// @brief Mints a time-based (version 1) identifier from the process generator.
    static Identifier time_based();

    /**
     * @brief Milliseconds since the Unix epoch embedded in a time-based identifier.
     *
     * @throws std::invalid_argument If `id` is not a version 1 identifier.
     */
    static std::int64_t unix_timestamp(const Identifier& id);

    /// @brief Inclusive lower range bound for identifiers minted at `unix_millis`.
    static Identifier start_of(std::int64_t unix_millis);

    /// @brief Inclusive upper range bound for identifiers minted at `unix_millis`.
    static Identifier end_of(std::int64_t unix_millis);

    /**
     * @brief Sets the options the process generator will be built with.
     *
     * May be called any number of times before the first operation; the last
     * call wins. `log_level` is not applied here.
     *
     * @throws std::logic_error Once the process generator exists.
     */
    static void configure(const infra::GeneratorOptions& options);

  private:
    /**
     * @brief The process-wide generator, created and primed on first use.
     *
     * @throws EntropyError If the node identifier cannot be chosen.
     */
    static TimeUuidGenerator& instance();
};

} // namespace chronoid::timeuuid
