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
 * @file main_test.cpp
 * @brief Central orchestrator for the Chronoid test suite.
 *
 * @details
 * Aggregates the infrastructure tests (configuration, logging, entropy) and
 * the identifier tests (clock, node, packing, range bounds, facade).
 */

#include "framework.hpp"

#include <iostream>

// ============================================================================
// Forward Declarations
// ============================================================================

// Infrastructure (infra_test.cpp)
void test_config_parse_full();
void test_config_defaults();
void test_config_numeric_node();
void test_config_rejects_invalid();
void test_config_load_file();
void test_logger_level();
void test_entropy_draws_differ();
void test_runner_counts_non_standard_throw();

// Time-based identifiers (timeuuid_test.cpp)
void test_facade_configure_then_range_bound_initializes();
void test_time_based_conformance();
void test_random_is_version_4();
void test_sequential_uniqueness();
void test_concurrent_uniqueness();
void test_strict_monotonicity();
void test_minting_order_matches_comparator();
void test_clock_frozen();
void test_clock_rewound();
void test_clock_frozen_concurrent();
void test_time_based_propagates_clock_error();
void test_wall_clock_ticks_track_system_clock();
void test_node_top_bit_and_width();
void test_node_chosen_once_across_threads();
void test_node_entropy_failure_has_no_fallback();
void test_time_based_propagates_entropy_error();
void test_assembler_layout();
void test_assembler_truncates_fields();
void test_internal_ticks_known_values();
void test_unix_millis_round_trip();
void test_boundary_fields();
void test_boundary_containment();
void test_live_identifier_within_bounds();

/**
 * @brief Test Suite Execution Entry Point.
 *
 * @return
 * - 0: All tests passed.
 * - 1: One or more assertions failed.
 */
int main()
{
    std::cout << "\033[36mInitiating Chronoid Test Suite...\033[0m" << std::endl;

    // --- 1. Infrastructure ---
    RUN_TEST(test_config_parse_full);
    RUN_TEST(test_config_defaults);
    RUN_TEST(test_config_numeric_node);
    RUN_TEST(test_config_rejects_invalid);
    RUN_TEST(test_config_load_file);
    RUN_TEST(test_logger_level);
    RUN_TEST(test_entropy_draws_differ);
    RUN_TEST(test_runner_counts_non_standard_throw);

    // --- 2. Time-based identifiers ---
    // The facade test must be the first use of Uuids; conformance follows
    // before any bulk test touches the clock.
    RUN_TEST(test_facade_configure_then_range_bound_initializes);
    RUN_TEST(test_time_based_conformance);
    RUN_TEST(test_random_is_version_4);
    RUN_TEST(test_clock_frozen);
    RUN_TEST(test_clock_rewound);
    RUN_TEST(test_clock_frozen_concurrent);
    RUN_TEST(test_time_based_propagates_clock_error);
    RUN_TEST(test_wall_clock_ticks_track_system_clock);
    RUN_TEST(test_node_top_bit_and_width);
    RUN_TEST(test_node_chosen_once_across_threads);
    RUN_TEST(test_node_entropy_failure_has_no_fallback);
    RUN_TEST(test_time_based_propagates_entropy_error);
    RUN_TEST(test_assembler_layout);
    RUN_TEST(test_assembler_truncates_fields);
    RUN_TEST(test_internal_ticks_known_values);
    RUN_TEST(test_unix_millis_round_trip);
    RUN_TEST(test_boundary_fields);
    RUN_TEST(test_boundary_containment);
    RUN_TEST(test_live_identifier_within_bounds);
    RUN_TEST(test_minting_order_matches_comparator);
    RUN_TEST(test_sequential_uniqueness);
    RUN_TEST(test_strict_monotonicity);
    RUN_TEST(test_concurrent_uniqueness);

    chronoid::test::print_summary();

    return (chronoid::test::failed_count == 0) ? 0 : 1;
}
