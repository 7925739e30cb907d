/*
 * TINYGUID COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 *
 * This source code is licensed under the TinyGUID Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file main_test.cpp
 * @brief Central Test Runner and Orchestrator for the TinyGUID test suite.
 *
 * @details
 * Test bodies live in their per-module files and are forward declared here.
 * The process exit code is 0 only when every test passed, so the binary can be
 * registered directly with CTest.
 */

#include "tinyguid/infra/logger.hpp"
#include "framework.hpp"

// ============================================================================
// Forward Declarations: Codec
// ============================================================================
void test_codec_hex_vectors();
void test_codec_base32_vectors();
void test_codec_base64url_vectors();
void test_codec_rejects_invalid_alphabet();
void test_codec_rejects_bad_length_and_trailing_bits();

// ============================================================================
// Forward Declarations: Counter
// ============================================================================
void test_counter_sequential_draws();
void test_counter_wraps_after_max();
void test_counter_rejects_out_of_range_start();
void test_counter_concurrent_draws_are_unique();

// ============================================================================
// Forward Declarations: Guid
// ============================================================================
void test_guid_binary_layout();
void test_guid_signed_field_extremes();
void test_guid_from_fields_rejects_out_of_range();
void test_guid_round_trip_all_forms();
void test_guid_parse_lenient_surface();
void test_guid_from_bytes_lengths();
void test_guid_rejects_foreign_version();
void test_guid_rejects_wrong_lengths();
void test_guid_wraps_codec_failures();
void test_guid_ark_form();
void test_guid_rejects_malformed_ark();
void test_guid_ark_tenant_is_canonical();
void test_guid_ordering();
void test_guid_ordering_tie_break();
void test_guid_equality_and_hash();
void test_guid_bytes_are_a_copy();
void test_guid_default_text_form();
void test_guid_try_parse();

// ============================================================================
// Forward Declarations: Generator
// ============================================================================
void test_generator_fixed_clock_sequence();
void test_generator_uses_resolver_origin();
void test_generator_counter_wraps();
void test_generator_truncates_timestamp();
void test_generator_rejects_out_of_range();
void test_generator_concurrent_uniqueness();
void test_generator_system_clock();

// ============================================================================
// Forward Declarations: Origin
// ============================================================================
void test_origin_combine();
void test_origin_memoized();
void test_origin_concurrent_first_lookup();
void test_origin_override_and_reset();
void test_origin_machine_id();
void test_origin_fallbacks();
void test_origin_environment();
void test_origin_parse_machine_id();
void test_origin_compare_addresses();
void test_origin_rejects_null_source();

// ============================================================================
// Forward Declarations: JSON
// ============================================================================
void test_json_to_json();
void test_json_from_json();
void test_json_rejects_bad_documents();
void test_json_describe();

// ============================================================================
// Forward Declarations: Command Line Tool
// ============================================================================
void test_cli_generate_prints_only_identifiers();
void test_cli_generate_with_options();
void test_cli_origin_prints_only_the_number();
void test_cli_error_exit_codes();

// ============================================================================
// Forward Declarations: Infrastructure
// ============================================================================
void test_string_trim();
void test_string_trim_edge_cases();
void test_string_to_lower_and_starts_with();
void test_string_parse_int64();
void test_logger_parse_level();
void test_logger_threshold();

int main()
{
    // Fallback paths log warnings by design; keep the report readable.
    tinyguid::infra::Logger::set_level(tinyguid::infra::LogLevel::ERROR);

    std::cout << "\033[36m=== TinyGUID Unit Tests ===\033[0m\n" << std::endl;

    std::cout << "--- Codec ---" << std::endl;
    RUN_TEST(test_codec_hex_vectors);
    RUN_TEST(test_codec_base32_vectors);
    RUN_TEST(test_codec_base64url_vectors);
    RUN_TEST(test_codec_rejects_invalid_alphabet);
    RUN_TEST(test_codec_rejects_bad_length_and_trailing_bits);

    std::cout << "\n--- Counter ---" << std::endl;
    RUN_TEST(test_counter_sequential_draws);
    RUN_TEST(test_counter_wraps_after_max);
    RUN_TEST(test_counter_rejects_out_of_range_start);
    RUN_TEST(test_counter_concurrent_draws_are_unique);

    std::cout << "\n--- Guid ---" << std::endl;
    RUN_TEST(test_guid_binary_layout);
    RUN_TEST(test_guid_signed_field_extremes);
    RUN_TEST(test_guid_from_fields_rejects_out_of_range);
    RUN_TEST(test_guid_round_trip_all_forms);
    RUN_TEST(test_guid_parse_lenient_surface);
    RUN_TEST(test_guid_from_bytes_lengths);
    RUN_TEST(test_guid_rejects_foreign_version);
    RUN_TEST(test_guid_rejects_wrong_lengths);
    RUN_TEST(test_guid_wraps_codec_failures);
    RUN_TEST(test_guid_ark_form);
    RUN_TEST(test_guid_rejects_malformed_ark);
    RUN_TEST(test_guid_ark_tenant_is_canonical);
    RUN_TEST(test_guid_ordering);
    RUN_TEST(test_guid_ordering_tie_break);
    RUN_TEST(test_guid_equality_and_hash);
    RUN_TEST(test_guid_bytes_are_a_copy);
    RUN_TEST(test_guid_default_text_form);
    RUN_TEST(test_guid_try_parse);

    std::cout << "\n--- Generator ---" << std::endl;
    RUN_TEST(test_generator_fixed_clock_sequence);
    RUN_TEST(test_generator_uses_resolver_origin);
    RUN_TEST(test_generator_counter_wraps);
    RUN_TEST(test_generator_truncates_timestamp);
    RUN_TEST(test_generator_rejects_out_of_range);
    RUN_TEST(test_generator_concurrent_uniqueness);
    RUN_TEST(test_generator_system_clock);

    std::cout << "\n--- Origin ---" << std::endl;
    RUN_TEST(test_origin_combine);
    RUN_TEST(test_origin_memoized);
    RUN_TEST(test_origin_concurrent_first_lookup);
    RUN_TEST(test_origin_override_and_reset);
    RUN_TEST(test_origin_machine_id);
    RUN_TEST(test_origin_fallbacks);
    RUN_TEST(test_origin_environment);
    RUN_TEST(test_origin_parse_machine_id);
    RUN_TEST(test_origin_compare_addresses);
    RUN_TEST(test_origin_rejects_null_source);

    std::cout << "\n--- JSON ---" << std::endl;
    RUN_TEST(test_json_to_json);
    RUN_TEST(test_json_from_json);
    RUN_TEST(test_json_rejects_bad_documents);
    RUN_TEST(test_json_describe);

    std::cout << "\n--- Command Line Tool ---" << std::endl;
    RUN_TEST(test_cli_generate_prints_only_identifiers);
    RUN_TEST(test_cli_generate_with_options);
    RUN_TEST(test_cli_origin_prints_only_the_number);
    RUN_TEST(test_cli_error_exit_codes);

    std::cout << "\n--- Infrastructure ---" << std::endl;
    RUN_TEST(test_string_trim);
    RUN_TEST(test_string_trim_edge_cases);
    RUN_TEST(test_string_to_lower_and_starts_with);
    RUN_TEST(test_string_parse_int64);
    RUN_TEST(test_logger_parse_level);
    RUN_TEST(test_logger_threshold);

    tinyguid::test::print_summary();
    return tinyguid::test::failed_count == 0 ? 0 : 1;
}
