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
 * @file timeuuid_test.cpp
 * @brief Tests for time-based identifier generation and range bounds.
 *
 * @details
 * Bulk tests build their own `TimeUuidGenerator` so the ticks they push ahead
 * of the wall clock never leak into the process-wide generator used by the
 * clock fidelity test.
 */

#include "chronoid/infra/config.hpp"
#include "chronoid/infra/errors.hpp"
#include "chronoid/timeuuid/assembler.hpp"
#include "chronoid/timeuuid/clock_sequence.hpp"
#include "chronoid/timeuuid/generator.hpp"
#include "chronoid/timeuuid/range_boundary.hpp"
#include "chronoid/timeuuid/uuids.hpp"
#include "framework.hpp"
#include "timeuuid_comparator.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <thread>
#include <unordered_set>
#include <vector>

using chronoid::infra::GeneratorOptions;
using chronoid::test::timeuuid_compare;
using chronoid::timeuuid::ClockSequence;
using chronoid::timeuuid::NodeIdentifier;
using chronoid::timeuuid::Identifier;
using chronoid::timeuuid::IdentifierAssembler;
using chronoid::timeuuid::RangeBoundary;
using chronoid::timeuuid::TimeUuidGenerator;
using chronoid::timeuuid::Uuids;

namespace {

std::int64_t now_millis()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace

// ============================================================================
// Conformance
// ============================================================================

/**
 * @brief Pinned options reach the process generator, and a range-bound call
 * is enough to freeze them.
 *
 * Must run before anything else touches `Uuids`.
 */
void test_facade_configure_then_range_bound_initializes()
{
    GeneratorOptions first;
    first.node = 0x111111111111ULL;
    Uuids::configure(first);

    GeneratorOptions second;
    second.node = 0x222222222222ULL;
    second.clock_seq = 42;
    Uuids::configure(second);

    Identifier lo = Uuids::start_of(0);
    ASSERT_EQ(lo.least_significant_bits(), static_cast<std::uint64_t>(0x8000000000000000ULL));

    ASSERT_THROWS(Uuids::configure(first), std::logic_error);

    Identifier id = Uuids::time_based();
    ASSERT_EQ(id.node(), static_cast<std::uint64_t>(0xA22222222222ULL));
    ASSERT_EQ(static_cast<int>(id.clock_sequence()), 42);
}

/**
 * @brief Version/variant conformance and clock fidelity of the process generator.
 *
 * `random()` runs first so one-time initialization (entropy reads) is not
 * charged to the timed call.
 */
void test_time_based_conformance()
{
    Uuids::random();

    std::int64_t now = now_millis();
    Identifier id = Uuids::time_based();

    ASSERT_EQ(id.version(), 1);
    ASSERT_EQ(id.variant(), 2);

    std::int64_t tstamp = Uuids::unix_timestamp(id);
    ASSERT_TRUE(now <= tstamp);
    ASSERT_TRUE(tstamp - now <= 10);
}

void test_random_is_version_4()
{
    Identifier a = Uuids::random();
    Identifier b = Uuids::random();

    ASSERT_EQ(a.version(), 4);
    ASSERT_EQ(a.variant(), 2);
    ASSERT_TRUE(a != b);
    ASSERT_THROWS(Uuids::unix_timestamp(a), std::invalid_argument);
}

// ============================================================================
// Uniqueness and ordering
// ============================================================================

void test_sequential_uniqueness()
{
    TimeUuidGenerator generator;
    const std::size_t count = 1000000;

    std::unordered_set<Identifier> generated;
    generated.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        generated.insert(generator.time_based());
    }

    ASSERT_EQ(generated.size(), count);
}

/**
 * @brief 10 threads x 500,000 identifiers from one generator never collide.
 */
void test_concurrent_uniqueness()
{
    TimeUuidGenerator generator;
    const std::size_t threads = 10;
    const std::size_t per_thread = 500000;

    std::vector<std::vector<Identifier>> batches(threads);
    std::vector<std::thread> workers;
    for (std::size_t t = 0; t < threads; ++t) {
        workers.emplace_back([&generator, &batches, t, per_thread] {
            batches[t].reserve(per_thread);
            for (std::size_t i = 0; i < per_thread; ++i) {
                batches[t].push_back(generator.time_based());
            }
        });
    }
    for (std::thread& worker : workers) {
        worker.join();
    }

    std::vector<Identifier> all;
    all.reserve(threads * per_thread);
    for (const auto& batch : batches) {
        all.insert(all.end(), batch.begin(), batch.end());
    }
    std::sort(all.begin(), all.end());

    ASSERT_EQ(all.size(), threads * per_thread);
    ASSERT_TRUE(std::adjacent_find(all.begin(), all.end()) == all.end());
}

void test_strict_monotonicity()
{
    TimeUuidGenerator generator;
    std::uint64_t previous = 0;

    for (int i = 0; i < 1000000; ++i) {
        std::uint64_t current = generator.time_based().timestamp();
        ASSERT_TRUE(previous < current);
        previous = current;
    }
}

/**
 * @brief Minting order equals storage order under the external comparator.
 */
void test_minting_order_matches_comparator()
{
    TimeUuidGenerator generator;
    Identifier previous = generator.time_based();

    for (int i = 0; i < 10000; ++i) {
        Identifier current = generator.time_based();
        ASSERT_TRUE(timeuuid_compare(previous, current) < 0);
        previous = current;
    }
}

// ============================================================================
// ClockSequence
// ============================================================================

/**
 * @brief A clock stuck on one tick still yields strictly increasing values.
 */
void test_clock_frozen()
{
    ClockSequence clock([] { return static_cast<std::uint64_t>(1000); });

    ASSERT_EQ(clock.next(), static_cast<std::uint64_t>(1000));
    ASSERT_EQ(clock.next(), static_cast<std::uint64_t>(1001));
    ASSERT_EQ(clock.next(), static_cast<std::uint64_t>(1002));
    ASSERT_EQ(clock.last(), static_cast<std::uint64_t>(1002));
}

/**
 * @brief A clock stepped backwards is ignored until real time catches up.
 */
void test_clock_rewound()
{
    std::vector<std::uint64_t> readings = {5000, 4000, 4500, 6000};
    std::size_t cursor = 0;
    ClockSequence clock([&readings, &cursor] { return readings[cursor++]; });

    ASSERT_EQ(clock.next(), static_cast<std::uint64_t>(5000));
    ASSERT_EQ(clock.next(), static_cast<std::uint64_t>(5001));
    ASSERT_EQ(clock.next(), static_cast<std::uint64_t>(5002));
    ASSERT_EQ(clock.next(), static_cast<std::uint64_t>(6000));
}

/**
 * @brief Contended callers on a frozen clock receive a gap-free run of ticks.
 */
void test_clock_frozen_concurrent()
{
    const std::uint64_t base = 1000000;
    const std::size_t threads = 4;
    const std::size_t per_thread = 10000;
    ClockSequence clock([base] { return base; });

    std::vector<std::vector<std::uint64_t>> issued(threads);
    std::vector<std::thread> workers;
    for (std::size_t t = 0; t < threads; ++t) {
        workers.emplace_back([&clock, &issued, t, per_thread] {
            for (std::size_t i = 0; i < per_thread; ++i) {
                issued[t].push_back(clock.next());
            }
        });
    }
    for (std::thread& worker : workers) {
        worker.join();
    }

    std::vector<std::uint64_t> all;
    for (const auto& batch : issued) {
        all.insert(all.end(), batch.begin(), batch.end());
    }
    std::sort(all.begin(), all.end());

    ASSERT_EQ(all.size(), threads * per_thread);
    for (std::size_t i = 0; i < all.size(); ++i) {
        ASSERT_EQ(all[i], base + i);
    }
}

/**
 * @brief A failing clock surfaces from `time_based()` and issues no tick.
 */
void test_time_based_propagates_clock_error()
{
    GeneratorOptions pinned;
    pinned.node = 0x1;
    pinned.clock_seq = 1;
    TimeUuidGenerator generator(
        []() -> std::uint64_t { throw chronoid::infra::ClockError("clock read failed"); }, pinned);

    ASSERT_THROWS(generator.time_based(), chronoid::infra::ClockError);
    ASSERT_THROWS(generator.time_based(), chronoid::infra::ClockError);
    ASSERT_EQ(generator.last_tick(), static_cast<std::uint64_t>(0));
}

void test_wall_clock_ticks_track_system_clock()
{
    std::int64_t before = now_millis();
    std::uint64_t ticks = ClockSequence::wall_clock_ticks();
    std::int64_t after = now_millis();

    Identifier id = IdentifierAssembler::build(ticks, 0, 0);
    std::int64_t millis = RangeBoundary::extract_unix_millis(id);
    ASSERT_TRUE(before <= millis);
    ASSERT_TRUE(millis <= after);
}

// ============================================================================
// NodeIdentifier
// ============================================================================

void test_node_top_bit_and_width()
{
    TimeUuidGenerator generator;
    std::uint64_t node = generator.node();

    ASSERT_TRUE((node & 0x800000000000ULL) != 0);
    ASSERT_TRUE(node <= 0xFFFFFFFFFFFFULL);

    GeneratorOptions pinned;
    pinned.node = 0xFF0000000123ULL | (1ULL << 50);
    TimeUuidGenerator fixed(pinned);
    ASSERT_EQ(fixed.node(), static_cast<std::uint64_t>(0xFF0000000123ULL));

    pinned.node = 0x123;
    TimeUuidGenerator low(pinned);
    ASSERT_EQ(low.node(), static_cast<std::uint64_t>(0x800000000123ULL));
    ASSERT_EQ(low.time_based().node(), static_cast<std::uint64_t>(0x800000000123ULL));
}

/**
 * @brief Racing first callers agree on a single node value.
 */
void test_node_chosen_once_across_threads()
{
    TimeUuidGenerator generator;
    const std::size_t threads = 8;
    std::vector<std::uint64_t> seen(threads, 0);
    std::atomic<bool> go{false};

    std::vector<std::thread> workers;
    for (std::size_t t = 0; t < threads; ++t) {
        workers.emplace_back([&, t] {
            while (!go) {
                std::this_thread::yield();
            }
            seen[t] = generator.time_based().node();
        });
    }
    go = true;
    for (std::thread& worker : workers) {
        worker.join();
    }

    for (std::size_t t = 0; t < threads; ++t) {
        ASSERT_EQ(seen[t], generator.node());
    }
}

/**
 * @brief An entropy failure is reported, retried on the next call and never
 * replaced by a fallback node.
 */
void test_node_entropy_failure_has_no_fallback()
{
    int calls = 0;
    NodeIdentifier node(std::nullopt, [&calls]() -> std::uint64_t {
        if (++calls <= 2) {
            throw chronoid::infra::EntropyError("device unavailable");
        }
        return 0x0000123456789ABCULL;
    });

    ASSERT_THROWS(node.value(), chronoid::infra::EntropyError);
    ASSERT_THROWS(node.value(), chronoid::infra::EntropyError);
    ASSERT_EQ(calls, 2);

    std::uint64_t value = node.value();
    ASSERT_EQ(calls, 3);
    ASSERT_EQ(value, static_cast<std::uint64_t>(0x923456789ABCULL));
    ASSERT_EQ(node.value(), value);
    ASSERT_EQ(calls, 3);
}

/**
 * @brief A generator whose node cannot be chosen mints nothing.
 */
void test_time_based_propagates_entropy_error()
{
    GeneratorOptions options;
    options.clock_seq = 9;
    TimeUuidGenerator generator(ClockSequence::TickSource(), options, []() -> std::uint64_t {
        throw chronoid::infra::EntropyError("device unavailable");
    });

    ASSERT_THROWS(generator.time_based(), chronoid::infra::EntropyError);
    ASSERT_THROWS(generator.node(), chronoid::infra::EntropyError);
    ASSERT_EQ(generator.last_tick(), static_cast<std::uint64_t>(0));
}

// ============================================================================
// IdentifierAssembler
// ============================================================================

/**
 * @brief Fields land at their RFC 4122 positions in the wire layout.
 */
void test_assembler_layout()
{
    Identifier id = IdentifierAssembler::build(0x0123456789ABCDEFULL, 0x1234, 0x8899AABBCCDDULL);

    ASSERT_EQ(id.most_significant_bits(), static_cast<std::uint64_t>(0x89ABCDEF45671123ULL));
    ASSERT_EQ(id.least_significant_bits(), static_cast<std::uint64_t>(0x92348899AABBCCDDULL));
    ASSERT_EQ(id.timestamp(), static_cast<std::uint64_t>(0x0123456789ABCDEFULL));
    ASSERT_EQ(static_cast<int>(id.clock_sequence()), 0x1234);
    ASSERT_EQ(id.node(), static_cast<std::uint64_t>(0x8899AABBCCDDULL));
    ASSERT_EQ(id.version(), 1);
    ASSERT_EQ(id.variant(), 2);

    Identifier::Bytes bytes = id.to_bytes();
    const Identifier::Bytes expected = {0x89, 0xAB, 0xCD, 0xEF, 0x45, 0x67, 0x11, 0x23,
                                        0x92, 0x34, 0x88, 0x99, 0xAA, 0xBB, 0xCC, 0xDD};
    ASSERT_TRUE(bytes == expected);
    ASSERT_TRUE(Identifier::from_bytes(bytes) == id);
}

/**
 * @brief Oversized inputs are truncated and never disturb version/variant bits.
 */
void test_assembler_truncates_fields()
{
    Identifier id = IdentifierAssembler::build(0xFFFFFFFFFFFFFFFFULL, 0xFFFF, 0xFFFFFFFFFFFFFFFFULL);

    ASSERT_EQ(id.timestamp(), static_cast<std::uint64_t>(0x0FFFFFFFFFFFFFFFULL));
    ASSERT_EQ(static_cast<int>(id.clock_sequence()), 0x3FFF);
    ASSERT_EQ(id.node(), static_cast<std::uint64_t>(0xFFFFFFFFFFFFULL));
    ASSERT_EQ(id.version(), 1);
    ASSERT_EQ(id.variant(), 2);
}

// ============================================================================
// RangeBoundary
// ============================================================================

void test_internal_ticks_known_values()
{
    ASSERT_EQ(RangeBoundary::to_internal_ticks(0), static_cast<std::uint64_t>(0x01B21DD213814000ULL));
    ASSERT_EQ(RangeBoundary::to_internal_ticks(1),
              static_cast<std::uint64_t>(0x01B21DD213814000ULL + 10000));
    ASSERT_EQ(RangeBoundary::to_internal_ticks(-12219292800000LL), static_cast<std::uint64_t>(0));
    ASSERT_EQ(RangeBoundary::to_internal_ticks(-1),
              static_cast<std::uint64_t>(0x01B21DD213814000ULL - 10000));
}

void test_unix_millis_round_trip()
{
    std::mt19937_64 rng(20121015);
    std::uniform_int_distribution<std::int64_t> dist(0, 1LL << 45);
    TimeUuidGenerator generator;

    for (int i = 0; i < 10000; ++i) {
        std::int64_t m = dist(rng);
        Identifier id = generator.build(RangeBoundary::to_internal_ticks(m));
        ASSERT_EQ(RangeBoundary::extract_unix_millis(id), m);
    }

    ASSERT_EQ(RangeBoundary::extract_unix_millis(
                  IdentifierAssembler::build(RangeBoundary::to_internal_ticks(0) + 9999, 0, 0)),
              static_cast<std::int64_t>(0));
}

void test_boundary_fields()
{
    const std::int64_t t = 1350000000123LL;
    Identifier lo = Uuids::start_of(t);
    Identifier hi = Uuids::end_of(t);

    ASSERT_EQ(lo.version(), 1);
    ASSERT_EQ(lo.variant(), 2);
    ASSERT_EQ(lo.timestamp(), RangeBoundary::to_internal_ticks(t));
    ASSERT_EQ(static_cast<int>(lo.clock_sequence()), 0);
    ASSERT_EQ(lo.node(), static_cast<std::uint64_t>(0));

    ASSERT_EQ(hi.version(), 1);
    ASSERT_EQ(hi.variant(), 2);
    ASSERT_EQ(hi.timestamp(), RangeBoundary::to_internal_ticks(t) + 9999);
    ASSERT_EQ(static_cast<int>(hi.clock_sequence()), 0x3FFF);
    ASSERT_EQ(hi.node(), static_cast<std::uint64_t>(0xFFFFFFFFFFFFULL));

    ASSERT_EQ(Uuids::unix_timestamp(lo), t);
    ASSERT_EQ(Uuids::unix_timestamp(hi), t);
}

/**
 * @brief Any identifier minted within millisecond `t` sorts inside
 * `[start_of(t), end_of(t)]`, and consecutive milliseconds do not overlap.
 */
void test_boundary_containment()
{
    std::mt19937_64 rng(static_cast<std::uint64_t>(now_millis()));
    std::uniform_int_distribution<std::int32_t> tstamps;
    std::uniform_int_distribution<std::uint32_t> seqs(0, 0x3FFF);
    std::uniform_int_distribution<std::uint64_t> nodes(0, 0xFFFFFFFFFFFFULL);
    std::uniform_int_distribution<std::uint64_t> offsets(0, 9999);

    for (int i = 0; i < 10; ++i) {
        std::int64_t t = tstamps(rng);
        Identifier lo = Uuids::start_of(t);
        Identifier hi = Uuids::end_of(t);

        for (int j = 0; j < 10; ++j) {
            auto seq = static_cast<std::uint16_t>(seqs(rng));
            std::uint64_t node = nodes(rng);

            Identifier at_start = IdentifierAssembler::build(RangeBoundary::to_internal_ticks(t), seq, node);
            Identifier inside = IdentifierAssembler::build(
                RangeBoundary::to_internal_ticks(t) + offsets(rng), seq, node);

            ASSERT_TRUE(timeuuid_compare(lo, at_start) <= 0);
            ASSERT_TRUE(timeuuid_compare(hi, at_start) >= 0);
            ASSERT_TRUE(timeuuid_compare(lo, inside) <= 0);
            ASSERT_TRUE(timeuuid_compare(hi, inside) >= 0);
        }

        ASSERT_TRUE(timeuuid_compare(Uuids::end_of(t - 1), lo) < 0);
        ASSERT_TRUE(timeuuid_compare(hi, Uuids::start_of(t + 1)) < 0);
    }
}

/**
 * @brief A live identifier falls within the bounds of its own millisecond.
 */
void test_live_identifier_within_bounds()
{
    TimeUuidGenerator generator;
    Identifier id = generator.time_based();
    std::int64_t t = RangeBoundary::extract_unix_millis(id);

    ASSERT_TRUE(timeuuid_compare(Uuids::start_of(t), id) <= 0);
    ASSERT_TRUE(timeuuid_compare(Uuids::end_of(t), id) >= 0);
}
