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
 * @brief Central orchestrator for the tripstore test suite.
 *
 * @details
 * Aggregates unit and integration tests across every subsystem, from the
 * infrastructure primitives up to the command handler.
 */

#include "framework.hpp"

#include <iostream>

// ============================================================================
// Forward Declarations
// ============================================================================
// The following test functions are implemented in their respective
// translation units (e.g., infra_test.cpp, storage_test.cpp, etc.).

// Infrastructure (infra_test.cpp)
void test_uuid_length();
void test_uuid_uniqueness();
void test_timestamped_id_shape();
void test_string_trim();
void test_string_case_helpers();
void test_time_parse_and_normalize();
void test_time_date_range();
void test_time_file_stamp();
void test_sha256_known_vectors();
void test_sha256_file_matches_content();
void test_logger_parse_level();
void test_config_from_environment();
void test_scheduler_runs_tasks();
void test_scheduler_minimum_pool();

// Document Model (model_test.cpp)
void test_json_strict_parse();
void test_json_getters();
void test_json_numeric_dates();
void test_codec_preserves_links();
void test_codec_carries_unknown_fields();
void test_codec_reads_legacy_import_block();
void test_codec_rejects_non_objects();
void test_document_item_lookup();
void test_travel_reference_target();

// Schema Migration (migration_test.cpp)
void test_migrate_v1_extracts_accommodations();
void test_migrate_purges_dangling_links();
void test_migrate_synchronizes_both_sides();
void test_migrate_repairs_placeholder_locations();
void test_migrate_recreates_missing_accommodations();
void test_migrate_recreates_accommodation_under_referenced_location();
void test_migration_is_idempotent();
void test_consistent_document_is_untouched();
void test_migrate_rejects_invalid_versions();
void test_migration_chain_is_contiguous();

// Cross-Reference Links (link_test.cpp)
void test_index_forward_lookup();
void test_index_reverse_lookup_and_sub_routes();
void test_index_split_and_duplicate_links();
void test_index_unknown_owner_location();
void test_index_hydrate_from_references();
void test_index_rebuild_replaces_contents();
void test_validate_link_same_trip();
void test_validate_link_cross_trip();
void test_validate_itinerary_and_references();
void test_raise_if_invalid_reports_all();
void test_editor_relinks_expense();
void test_editor_unlinks_expense();
void test_editor_rejects_cross_trip_target();
void test_editor_strip_all();

// Persistence Engine (storage_test.cpp)
void test_engine_trip_id_validation();
void test_engine_atomic_write();
void test_recovery_offsets();
void test_recovery_salvage();
void test_store_save_and_load();
void test_store_recovers_corrupted_file();
void test_store_unrecoverable_file();
void test_store_fixes_id_mismatch();
void test_store_migrates_on_load();
void test_store_concurrent_saves();
void test_store_alternating_payload_saves();
void test_store_rejects_stale_schema_writes();
void test_write_queue_ordering();
void test_write_queue_propagates_failure();
void test_store_imports_legacy_layout();
void test_store_list_trips_sorted();

// Backup / Restore (backup_test.cpp)
void test_catalog_register_and_lookup();
void test_catalog_filter_and_search();
void test_catalog_stats();
void test_catalog_verify_integrity();
void test_catalog_remove();
void test_catalog_synchronize();
void test_catalog_garbage_collect();
void test_store_delete_and_restore_trip();
void test_store_delete_and_restore_finance();
void test_store_restore_rejections();
void test_store_uses_injected_catalog();

// Trip Service (service_test.cpp)
void test_service_create_trip();
void test_service_save_document_migrates();
void test_service_update_itinerary_publishes_updates();
void test_service_merges_accommodations();
void test_service_rejects_cross_trip_itinerary_link();
void test_service_update_finance();
void test_service_link_expense_and_index();
void test_service_import_expenses_dedupes();
void test_service_delete_and_restore_finance();
void test_service_concurrent_imports();
void test_service_restore_serializes_with_edits();
void test_service_edit_locks_are_released();

// Command Handler (api_test.cpp)
void test_handle_invalid_json();
void test_handle_unknown_action_and_missing_args();
void test_handle_create_then_load();
void test_handle_save_writes_current_version();
void test_handle_validate_link();
void test_handle_link_expense_rejected();
void test_handle_backup_actions();
void test_handle_exit();
/**
 * @brief Test Suite Execution Entry Point.
 *
 * @return
 * - 0: All tests passed.
 * - 1: One or more assertions failed.
 */
int main()
{
    std::cout << "\033[36mInitiating tripstore Test Suite...\033[0m" << std::endl;

    // --- 1. Infrastructure ---
    // Id generation, string/time helpers, checksums, config and the worker pool.
    RUN_TEST(test_uuid_length);
    RUN_TEST(test_uuid_uniqueness);
    RUN_TEST(test_timestamped_id_shape);
    RUN_TEST(test_string_trim);
    RUN_TEST(test_string_case_helpers);
    RUN_TEST(test_time_parse_and_normalize);
    RUN_TEST(test_time_date_range);
    RUN_TEST(test_time_file_stamp);
    RUN_TEST(test_sha256_known_vectors);
    RUN_TEST(test_sha256_file_matches_content);
    RUN_TEST(test_logger_parse_level);
    RUN_TEST(test_config_from_environment);
    RUN_TEST(test_scheduler_runs_tasks);
    RUN_TEST(test_scheduler_minimum_pool);

    // --- 2. Document Model ---
    // Strict JSON parsing and the document codec.
    RUN_TEST(test_json_strict_parse);
    RUN_TEST(test_json_getters);
    RUN_TEST(test_json_numeric_dates);
    RUN_TEST(test_codec_preserves_links);
    RUN_TEST(test_codec_carries_unknown_fields);
    RUN_TEST(test_codec_reads_legacy_import_block);
    RUN_TEST(test_codec_rejects_non_objects);
    RUN_TEST(test_document_item_lookup);
    RUN_TEST(test_travel_reference_target);

    // --- 3. Schema Migration ---
    // Version chain and the integrity sweep.
    RUN_TEST(test_migrate_v1_extracts_accommodations);
    RUN_TEST(test_migrate_purges_dangling_links);
    RUN_TEST(test_migrate_synchronizes_both_sides);
    RUN_TEST(test_migrate_repairs_placeholder_locations);
    RUN_TEST(test_migrate_recreates_missing_accommodations);
    RUN_TEST(test_migrate_recreates_accommodation_under_referenced_location);
    RUN_TEST(test_migration_is_idempotent);
    RUN_TEST(test_consistent_document_is_untouched);
    RUN_TEST(test_migrate_rejects_invalid_versions);
    RUN_TEST(test_migration_chain_is_contiguous);

    // --- 4. Cross-Reference Links ---
    // Link index, trip boundary validator and link editor.
    RUN_TEST(test_index_forward_lookup);
    RUN_TEST(test_index_reverse_lookup_and_sub_routes);
    RUN_TEST(test_index_split_and_duplicate_links);
    RUN_TEST(test_index_unknown_owner_location);
    RUN_TEST(test_index_hydrate_from_references);
    RUN_TEST(test_index_rebuild_replaces_contents);
    RUN_TEST(test_validate_link_same_trip);
    RUN_TEST(test_validate_link_cross_trip);
    RUN_TEST(test_validate_itinerary_and_references);
    RUN_TEST(test_raise_if_invalid_reports_all);
    RUN_TEST(test_editor_relinks_expense);
    RUN_TEST(test_editor_unlinks_expense);
    RUN_TEST(test_editor_rejects_cross_trip_target);
    RUN_TEST(test_editor_strip_all);

    // --- 5. Persistence Engine ---
    // Atomic writes, recovery, write ordering and legacy import.
    RUN_TEST(test_engine_trip_id_validation);
    RUN_TEST(test_engine_atomic_write);
    RUN_TEST(test_recovery_offsets);
    RUN_TEST(test_recovery_salvage);
    RUN_TEST(test_store_save_and_load);
    RUN_TEST(test_store_recovers_corrupted_file);
    RUN_TEST(test_store_unrecoverable_file);
    RUN_TEST(test_store_fixes_id_mismatch);
    RUN_TEST(test_store_migrates_on_load);
    RUN_TEST(test_store_concurrent_saves);
    RUN_TEST(test_store_alternating_payload_saves);
    RUN_TEST(test_store_rejects_stale_schema_writes);
    RUN_TEST(test_write_queue_ordering);
    RUN_TEST(test_write_queue_propagates_failure);
    RUN_TEST(test_store_imports_legacy_layout);
    RUN_TEST(test_store_list_trips_sorted);

    // --- 6. Backup / Restore ---
    // Catalog bookkeeping and the delete/restore hooks.
    RUN_TEST(test_catalog_register_and_lookup);
    RUN_TEST(test_catalog_filter_and_search);
    RUN_TEST(test_catalog_stats);
    RUN_TEST(test_catalog_verify_integrity);
    RUN_TEST(test_catalog_remove);
    RUN_TEST(test_catalog_synchronize);
    RUN_TEST(test_catalog_garbage_collect);
    RUN_TEST(test_store_delete_and_restore_trip);
    RUN_TEST(test_store_delete_and_restore_finance);
    RUN_TEST(test_store_restore_rejections);
    RUN_TEST(test_store_uses_injected_catalog);

    // --- 7. Trip Service ---
    // Edits, linking and imports end to end.
    RUN_TEST(test_service_create_trip);
    RUN_TEST(test_service_save_document_migrates);
    RUN_TEST(test_service_update_itinerary_publishes_updates);
    RUN_TEST(test_service_merges_accommodations);
    RUN_TEST(test_service_rejects_cross_trip_itinerary_link);
    RUN_TEST(test_service_update_finance);
    RUN_TEST(test_service_link_expense_and_index);
    RUN_TEST(test_service_import_expenses_dedupes);
    RUN_TEST(test_service_delete_and_restore_finance);
    RUN_TEST(test_service_concurrent_imports);
    RUN_TEST(test_service_restore_serializes_with_edits);
    RUN_TEST(test_service_edit_locks_are_released);

    // --- 8. Command Handler ---
    // JSON-In -> Service -> JSON-Out.
    RUN_TEST(test_handle_invalid_json);
    RUN_TEST(test_handle_unknown_action_and_missing_args);
    RUN_TEST(test_handle_create_then_load);
    RUN_TEST(test_handle_save_writes_current_version);
    RUN_TEST(test_handle_validate_link);
    RUN_TEST(test_handle_link_expense_rejected);
    RUN_TEST(test_handle_backup_actions);
    RUN_TEST(test_handle_exit);

    tripstore::test::print_summary();

    return (tripstore::test::failed_count == 0) ? 0 : 1;
}
