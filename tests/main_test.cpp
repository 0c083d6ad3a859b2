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
 * @brief Central orchestrator for the Conduit Test Suite.
 *
 * @details
 * This file serves as the main entry point for the testing environment. It
 * aggregates unit and integration tests across all subsystems: shared
 * infrastructure, request conditions, flash state, handler mappings, the
 * execution chain, async processing, the dispatcher and the HTTP transport.
 */

#include "framework.hpp"

#include <iostream>

// ============================================================================
// Forward Declarations
// ============================================================================
// The following test functions are implemented in their respective
// translation units (e.g., infra_test.cpp, dispatcher_test.cpp, etc.).

// Infrastructure Subsystem (infra_test.cpp)
void test_session_token_format();
void test_session_token_uniqueness();
void test_string_trim();
void test_string_split();
void test_string_url_codec();
void test_http_date();
void test_log_level_parsing();
void test_scheduler_delayed_task();
void test_scheduler_delayed_order();

// Request Conditions (condition_test.cpp)
void test_params_combine_is_union();
void test_params_matching();
void test_params_compare_more_specific_first();
void test_headers_case_insensitive_names();
void test_methods_matching();
void test_consumes_and_produces();
void test_path_matcher_match();
void test_path_matcher_extract_and_combine();
void test_path_matcher_compare();
void test_patterns_matching_sorts_best_first();
void test_mapping_info_ranking();
void test_mapping_info_combine();

// Flash Attributes (flash_test.cpp)
void test_flash_state_json();
void test_flash_round_trip();
void test_flash_target_mismatch();
void test_flash_most_specific_wins();
void test_flash_expiry();
void test_flash_sweep_expired();
void test_flash_save_preconditions();

// Execution Chain (chain_test.cpp)
void test_chain_full_lifecycle_order();
void test_chain_pre_handle_abort();
void test_chain_cleanup_runs_once();
void test_chain_cleanup_failure_is_contained();
void test_chain_cleanup_non_standard_failure_is_contained();
void test_chain_async_started_notifies_in_reverse();

// Handler Mappings (mapping_test.cpp)
void test_url_mapping_lookup();
void test_url_mapping_duplicate_registration();
void test_url_mapping_ambiguous_patterns();
void test_mapping_default_handler();
void test_mapped_interceptors();
void test_request_mapping_lookup();
void test_request_mapping_type_level_combine();
void test_request_mapping_ambiguity();

// Adapters and Views (adapter_test.cpp)
void test_adapters_support_by_type();
void test_handler_identity();
void test_result_states();
void test_redirect_view_target();
void test_json_view_render();
void test_view_resolvers();
void test_view_name_translation();
void test_accept_header_locale();
void test_url_view_controller();
void test_exception_resolvers();
void test_exception_resolvers_non_standard_failure();

// Async Processing (async_test.cpp)
void test_deferred_result_after_release();
void test_deferred_result_before_release();
void test_deferred_error_is_recorded();
void test_async_state_errors();
void test_async_cancel();
void test_async_completion_listeners();
void test_async_callable_on_scheduler();
void test_async_timeout();

// Dispatcher Pipeline (dispatcher_test.cpp)
void test_dispatch_happy_path();
void test_dispatch_interceptor_veto();
void test_dispatch_unresolved_exception_propagates();
void test_dispatch_resolved_exception();
void test_dispatch_exception_view();
void test_dispatch_no_handler();
void test_dispatch_missing_param_falls_through();
void test_dispatch_default_view_name();
void test_dispatch_unknown_view_fails();
void test_dispatch_flash_across_redirect();
void test_dispatch_not_modified();
void test_dispatch_configuration_errors_propagate();
void test_dispatch_async_deferred();
void test_dispatch_async_error_is_resolved();
void test_dispatch_async_timeout_resumes_once();
void test_dispatch_async_start_then_throw_cancels();
void test_dispatch_async_without_scheduler_fails_fast();
void test_dispatch_events_and_context();

// HTTP Codec (codec_test.cpp)
void test_codec_completeness();
void test_codec_parse_request();
void test_codec_parse_form_body();
void test_codec_rejects_malformed_requests();
void test_codec_serialize();

// Configuration (config_test.cpp)
void test_settings_defaults_and_overrides();
void test_settings_validation();

/**
 * @brief Test Suite Execution Entry Point.
 *
 * Orchestrates the sequential execution of registered test cases.
 *
 * @return
 * - 0: All tests passed (Success).
 * - 1: One or more assertions failed (Exit failure for CI pipelines).
 */
int main()
{
    std::cout << "\033[36mInitiating Conduit Test Suite...\033[0m" << std::endl;

    // --- 1. Infrastructure Subsystem Tests ---
    // Verifies identifiers, string and date helpers, and the scheduler.
    RUN_TEST(test_session_token_format);
    RUN_TEST(test_session_token_uniqueness);
    RUN_TEST(test_string_trim);
    RUN_TEST(test_string_split);
    RUN_TEST(test_string_url_codec);
    RUN_TEST(test_http_date);
    RUN_TEST(test_log_level_parsing);
    RUN_TEST(test_scheduler_delayed_task);
    RUN_TEST(test_scheduler_delayed_order);

    // --- 2. Request Conditions Tests ---
    // Verifies combine, matching and ranking of every condition type.
    RUN_TEST(test_params_combine_is_union);
    RUN_TEST(test_params_matching);
    RUN_TEST(test_params_compare_more_specific_first);
    RUN_TEST(test_headers_case_insensitive_names);
    RUN_TEST(test_methods_matching);
    RUN_TEST(test_consumes_and_produces);
    RUN_TEST(test_path_matcher_match);
    RUN_TEST(test_path_matcher_extract_and_combine);
    RUN_TEST(test_path_matcher_compare);
    RUN_TEST(test_patterns_matching_sorts_best_first);
    RUN_TEST(test_mapping_info_ranking);
    RUN_TEST(test_mapping_info_combine);

    // --- 3. Flash Attributes Tests ---
    // Verifies storage, targeting and expiry of flash state.
    RUN_TEST(test_flash_state_json);
    RUN_TEST(test_flash_round_trip);
    RUN_TEST(test_flash_target_mismatch);
    RUN_TEST(test_flash_most_specific_wins);
    RUN_TEST(test_flash_expiry);
    RUN_TEST(test_flash_sweep_expired);
    RUN_TEST(test_flash_save_preconditions);

    // --- 4. Execution Chain Tests ---
    // Verifies interceptor ordering, vetoes and cleanup.
    RUN_TEST(test_chain_full_lifecycle_order);
    RUN_TEST(test_chain_pre_handle_abort);
    RUN_TEST(test_chain_cleanup_runs_once);
    RUN_TEST(test_chain_cleanup_failure_is_contained);
    RUN_TEST(test_chain_cleanup_non_standard_failure_is_contained);
    RUN_TEST(test_chain_async_started_notifies_in_reverse);

    // --- 5. Handler Mappings Tests ---
    // Verifies URL and request-mapping lookup and ambiguity detection.
    RUN_TEST(test_url_mapping_lookup);
    RUN_TEST(test_url_mapping_duplicate_registration);
    RUN_TEST(test_url_mapping_ambiguous_patterns);
    RUN_TEST(test_mapping_default_handler);
    RUN_TEST(test_mapped_interceptors);
    RUN_TEST(test_request_mapping_lookup);
    RUN_TEST(test_request_mapping_type_level_combine);
    RUN_TEST(test_request_mapping_ambiguity);

    // --- 6. Adapters and Views Tests ---
    // Verifies adapters, results, views and view-side strategies.
    RUN_TEST(test_adapters_support_by_type);
    RUN_TEST(test_handler_identity);
    RUN_TEST(test_result_states);
    RUN_TEST(test_redirect_view_target);
    RUN_TEST(test_json_view_render);
    RUN_TEST(test_view_resolvers);
    RUN_TEST(test_view_name_translation);
    RUN_TEST(test_accept_header_locale);
    RUN_TEST(test_url_view_controller);
    RUN_TEST(test_exception_resolvers);
    RUN_TEST(test_exception_resolvers_non_standard_failure);

    // --- 7. Async Processing Tests ---
    // Verifies deferred results, callables, timeouts and release.
    RUN_TEST(test_deferred_result_after_release);
    RUN_TEST(test_deferred_result_before_release);
    RUN_TEST(test_deferred_error_is_recorded);
    RUN_TEST(test_async_state_errors);
    RUN_TEST(test_async_cancel);
    RUN_TEST(test_async_completion_listeners);
    RUN_TEST(test_async_callable_on_scheduler);
    RUN_TEST(test_async_timeout);

    // --- 8. Dispatcher Pipeline Tests ---
    // Verifies full request handling, including the async re-entry.
    RUN_TEST(test_dispatch_happy_path);
    RUN_TEST(test_dispatch_interceptor_veto);
    RUN_TEST(test_dispatch_unresolved_exception_propagates);
    RUN_TEST(test_dispatch_resolved_exception);
    RUN_TEST(test_dispatch_exception_view);
    RUN_TEST(test_dispatch_no_handler);
    RUN_TEST(test_dispatch_missing_param_falls_through);
    RUN_TEST(test_dispatch_default_view_name);
    RUN_TEST(test_dispatch_unknown_view_fails);
    RUN_TEST(test_dispatch_flash_across_redirect);
    RUN_TEST(test_dispatch_not_modified);
    RUN_TEST(test_dispatch_configuration_errors_propagate);
    RUN_TEST(test_dispatch_async_deferred);
    RUN_TEST(test_dispatch_async_error_is_resolved);
    RUN_TEST(test_dispatch_async_timeout_resumes_once);
    RUN_TEST(test_dispatch_async_start_then_throw_cancels);
    RUN_TEST(test_dispatch_async_without_scheduler_fails_fast);
    RUN_TEST(test_dispatch_events_and_context);

    // --- 9. HTTP Codec Tests ---
    RUN_TEST(test_codec_completeness);
    RUN_TEST(test_codec_parse_request);
    RUN_TEST(test_codec_parse_form_body);
    RUN_TEST(test_codec_rejects_malformed_requests);
    RUN_TEST(test_codec_serialize);

    // --- 10. Configuration Tests ---
    RUN_TEST(test_settings_defaults_and_overrides);
    RUN_TEST(test_settings_validation);

    // Render the final results summary to stdout.
    conduit::test::print_summary();

    // Signal exit status: Non-zero if failures occurred.
    return (conduit::test::failed_count == 0) ? 0 : 1;
}
