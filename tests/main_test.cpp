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
 * @brief Central orchestrator for the bsonoid test suite.
 *
 * @details
 * Aggregates the unit and integration tests of every subsystem:
 * Infrastructure, Codecs, Generator, Identifier Value and Extended JSON.
 */

#include "framework.hpp"

#include <iostream>

// ============================================================================
// Forward Declarations
// ============================================================================
// The following test functions are implemented in their respective
// translation units (e.g., infra_test.cpp, codec_test.cpp, etc.).

// Infrastructure Subsystem (infra_test.cpp)
void test_string_trim();
void test_string_trim_empty();
void test_string_to_lower();
void test_config_parse_level();
void test_config_parse_flag();
void test_config_from_env();
void test_logger_level_filter();

// Codec Subsystem (codec_test.cpp)
void test_hex_round_trip();
void test_hex_validate_normalizes_case();
void test_hex_validate_rejects();
void test_hex_lenient_decode();
void test_base64_round_trip();
void test_base64_rejects();
void test_endian_big_endian_layout();

// Generator Subsystem (generator_test.cpp)
void test_generator_layout();
void test_generator_counter_wraparound();
void test_generator_back_to_back();
void test_generator_uses_wall_clock();
void test_generator_process_unique_is_stable();
void test_generator_from_time_sentinel();
void test_generator_concurrent_uniqueness();

// Identifier Value Subsystem (object_id_test.cpp)
void test_oid_create_from_hex_string();
void test_oid_from_hex_validation();
void test_oid_create_from_time();
void test_oid_generate_sequence();
void test_oid_from_bytes();
void test_oid_base64();
void test_oid_from_like();
void test_oid_equality();
void test_oid_is_valid();
void test_oid_serialize_into();
void test_oid_byte_cache();
void test_oid_set_id();
void test_oid_ordering_and_hash();

// Extended JSON Subsystem (extended_json_test.cpp)
void test_ejson_round_trip();
void test_ejson_trust_boundary();
void test_ejson_parse_rejects();
void test_ejson_resolve_shapes();
void test_ejson_resolve_errors();
void test_ejson_is_valid();

/**
 * @brief Test Suite Execution Entry Point.
 *
 * @return
 * - 0: All tests passed (Success).
 * - 1: One or more assertions failed (Exit failure for CI pipelines).
 */
int main()
{
    std::cout << "\033[36mInitiating bsonoid Test Suite...\033[0m" << std::endl;

    // --- 1. Infrastructure Subsystem Tests ---
    RUN_TEST(test_string_trim);
    RUN_TEST(test_string_trim_empty);
    RUN_TEST(test_string_to_lower);
    RUN_TEST(test_config_parse_level);
    RUN_TEST(test_config_parse_flag);
    RUN_TEST(test_config_from_env);
    RUN_TEST(test_logger_level_filter);

    // --- 2. Codec Subsystem Tests ---
    // Hex, base64 and big-endian primitives underpinning every identifier form.
    RUN_TEST(test_hex_round_trip);
    RUN_TEST(test_hex_validate_normalizes_case);
    RUN_TEST(test_hex_validate_rejects);
    RUN_TEST(test_hex_lenient_decode);
    RUN_TEST(test_base64_round_trip);
    RUN_TEST(test_base64_rejects);
    RUN_TEST(test_endian_big_endian_layout);

    // --- 3. Generator Subsystem Tests ---
    RUN_TEST(test_generator_layout);
    RUN_TEST(test_generator_counter_wraparound);
    RUN_TEST(test_generator_back_to_back);
    RUN_TEST(test_generator_uses_wall_clock);
    RUN_TEST(test_generator_process_unique_is_stable);
    RUN_TEST(test_generator_from_time_sentinel);
    RUN_TEST(test_generator_concurrent_uniqueness);

    // --- 4. Identifier Value Subsystem Tests ---
    RUN_TEST(test_oid_create_from_hex_string);
    RUN_TEST(test_oid_from_hex_validation);
    RUN_TEST(test_oid_create_from_time);
    RUN_TEST(test_oid_generate_sequence);
    RUN_TEST(test_oid_from_bytes);
    RUN_TEST(test_oid_base64);
    RUN_TEST(test_oid_from_like);
    RUN_TEST(test_oid_equality);
    RUN_TEST(test_oid_is_valid);
    RUN_TEST(test_oid_serialize_into);
    RUN_TEST(test_oid_byte_cache);
    RUN_TEST(test_oid_set_id);
    RUN_TEST(test_oid_ordering_and_hash);

    // --- 5. Extended JSON Subsystem Tests ---
    // Verifies the {"$oid": ...} adapter and dynamic cJSON value resolution.
    RUN_TEST(test_ejson_round_trip);
    RUN_TEST(test_ejson_trust_boundary);
    RUN_TEST(test_ejson_parse_rejects);
    RUN_TEST(test_ejson_resolve_shapes);
    RUN_TEST(test_ejson_resolve_errors);
    RUN_TEST(test_ejson_is_valid);

    bsonoid::test::print_summary();

    return (bsonoid::test::failed_count == 0) ? 0 : 1;
}
