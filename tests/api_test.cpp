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
 * @file api_test.cpp
 * @brief Integration tests for the request handler and action dispatcher.
 *
 * @details
 * Every test drives the handler with raw JSON lines, exactly as the CLI
 * does, and inspects the decoded response envelope.
 */

#include "fixtures.hpp"
#include "framework.hpp"
#include "tripstore/api/handler.hpp"
#include "tripstore/infra/scheduler.hpp"
#include "tripstore/model/json.hpp"
#include "tripstore/service/trip_service.hpp"
#include "tripstore/storage/backup_catalog.hpp"
#include "tripstore/storage/store.hpp"

#include <cJSON.h>
#include <string>

using namespace tripstore;

namespace {

/**
 * @brief Handler wired to a store seeded with the sample trip.
 */
struct HandlerHarness {
    explicit HandlerHarness(const std::string& path)
        : dir(path), scheduler(2), catalog(dir.file("backup-metadata.json"), dir.file("backups")),
          store(dir.path, scheduler, catalog), service(store), handler(service)
    {
        store.save(test::sample_trip());
    }

    /// @brief Processes @p request and parses the response.
    json::Ptr call(const std::string& request) { return json::parse(handler.process(request)); }

    test::ScratchDir dir;
    infra::Scheduler scheduler;
    storage::FileBackupCatalog catalog;
    storage::Store store;
    service::TripService service;
    api::Handler handler;
};

std::string status_of(const json::Ptr& response)
{
    return json::get_string(response.get(), "status");
}

const cJSON* data_of(const json::Ptr& response)
{
    return cJSON_GetObjectItemCaseSensitive(response.get(), "data");
}

} // namespace

void test_handle_invalid_json()
{
    HandlerHarness h("./test_api_invalid");
    ASSERT_EQ(h.handler.process("{ \"action\": \"load\", "),
              std::string("{\"status\":\"error\",\"message\":\"Invalid JSON syntax\"}"));
    ASSERT_EQ(h.handler.process("[1,2]"),
              std::string("{\"status\":\"error\",\"message\":\"Invalid JSON syntax\"}"));

    auto empty = h.call("");
    ASSERT_EQ(json::get_string(empty.get(), "code"), std::string("VALIDATION"));
}

/**
 * @brief Unknown actions and missing arguments are reported as validation
 * errors without touching the store.
 */
void test_handle_unknown_action_and_missing_args()
{
    HandlerHarness h("./test_api_unknown");

    auto unknown = h.call(R"({"action":"teleport"})");
    ASSERT_EQ(status_of(unknown), std::string("error"));
    ASSERT_EQ(json::get_string(unknown.get(), "message"), std::string("Unknown action: teleport"));

    auto missing = h.call(R"({"action":"load"})");
    ASSERT_EQ(json::get_string(missing.get(), "code"), std::string("VALIDATION"));
    ASSERT_EQ(json::get_string(missing.get(), "message"), std::string("Missing argument: 'tripId'"));

    auto bad_id = h.call(R"({"action":"load","tripId":"../etc"})");
    ASSERT_EQ(json::get_string(bad_id.get(), "code"), std::string("INVALID_TRIP_ID"));

    auto absent = h.call(R"({"action":"load","tripId":"trip-zz"})");
    ASSERT_EQ(json::get_string(absent.get(), "code"), std::string("TRIP_NOT_FOUND"));
}

void test_handle_create_then_load()
{
    HandlerHarness h("./test_api_create");

    auto created = h.call(R"({"action":"create","title":"Iceland","startDate":"2027-07-01"})");
    ASSERT_EQ(status_of(created), std::string("ok"));
    const std::string id = json::get_string(data_of(created), "id");
    ASSERT_FALSE(id.empty());

    auto loaded = h.call(R"({"action":"load","tripId":")" + id + "\"}");
    ASSERT_EQ(status_of(loaded), std::string("ok"));
    ASSERT_EQ(json::get_string(data_of(loaded), "title"), std::string("Iceland"));
    ASSERT_EQ(*json::get_number(data_of(loaded), "schemaVersion"),
              static_cast<double>(migration::CURRENT_SCHEMA_VERSION));

    auto listed = h.call(R"({"action":"list_trips"})");
    ASSERT_EQ(cJSON_GetArraySize(data_of(listed)), 2);
}

void test_handle_save_writes_current_version()
{
    HandlerHarness h("./test_api_save");

    auto saved = h.call(R"({"action":"save","data":{"schemaVersion":2,"id":"trip-s","title":"Old"}})");
    ASSERT_EQ(status_of(saved), std::string("ok"));
    auto loaded = h.call(R"({"action":"load","tripId":"trip-s"})");
    ASSERT_EQ(*json::get_number(data_of(loaded), "schemaVersion"),
              static_cast<double>(migration::CURRENT_SCHEMA_VERSION));

    auto future = h.call(R"({"action":"save","data":{"schemaVersion":99,"id":"trip-f","title":"New"}})");
    ASSERT_EQ(json::get_string(future.get(), "code"), std::string("INVALID_SCHEMA_VERSION"));
    auto absent = h.call(R"({"action":"load","tripId":"trip-f"})");
    ASSERT_EQ(json::get_string(absent.get(), "code"), std::string("TRIP_NOT_FOUND"));
}

/**
 * @brief Validation results carry the primary code and one entry per
 * violation.
 */
void test_handle_validate_link()
{
    HandlerHarness h("./test_api_validate");

    auto ok = h.call(R"({"action":"validate_link","tripId":"trip-a","expenseId":"exp-4",
                         "travelItemType":"route","travelItemId":"route-1a"})");
    ASSERT_TRUE(json::get_bool(data_of(ok), "valid"));

    auto foreign = h.call(R"({"action":"validate_link","tripId":"trip-a","expenseId":"exp-b",
                              "travelItemType":"location","travelItemId":"loc-b"})");
    const cJSON* data = data_of(foreign);
    ASSERT_FALSE(json::get_bool(data, "valid"));
    ASSERT_EQ(json::get_string(data, "code"), std::string("CROSS_TRIP_EXPENSE"));
    ASSERT_EQ(cJSON_GetArraySize(cJSON_GetObjectItemCaseSensitive(data, "violations")), 2);

    auto half = h.call(R"({"action":"validate_link","tripId":"trip-a","expenseId":"exp-4",
                           "travelItemType":"spaceship","travelItemId":"x"})");
    ASSERT_EQ(json::get_string(half.get(), "code"), std::string("VALIDATION"));
}

/**
 * @brief A rejected link request returns its violations in the error body.
 */
void test_handle_link_expense_rejected()
{
    HandlerHarness h("./test_api_link");

    auto rejected = h.call(R"({"action":"link_expense","tripId":"trip-a","expenseId":"exp-1",
                               "travelItemType":"accommodation","travelItemId":"acc-b"})");
    ASSERT_EQ(status_of(rejected), std::string("error"));
    ASSERT_EQ(json::get_string(rejected.get(), "code"), std::string("CROSS_TRIP_TRAVEL_ITEM"));
    ASSERT_EQ(cJSON_GetArraySize(cJSON_GetObjectItemCaseSensitive(rejected.get(), "violations")), 1);

    auto linked = h.call(R"({"action":"link_expense","tripId":"trip-a","expenseId":"exp-4",
                             "travelItemType":"location","travelItemId":"loc-1"})");
    ASSERT_EQ(status_of(linked), std::string("ok"));

    auto index = h.call(R"({"action":"link_index","tripId":"trip-a"})");
    ASSERT_EQ(*json::get_number(data_of(index), "size"), 4.0);
}

void test_handle_backup_actions()
{
    HandlerHarness h("./test_api_backups");

    auto deleted = h.call(R"({"action":"delete_trip","tripId":"trip-a","reason":"test"})");
    ASSERT_EQ(status_of(deleted), std::string("ok"));
    const std::string backup_id = json::get_string(data_of(deleted), "id");

    auto listed = h.call(R"({"action":"list_backups","type":"trip"})");
    const cJSON* data = data_of(listed);
    ASSERT_EQ(cJSON_GetArraySize(cJSON_GetObjectItemCaseSensitive(data, "backups")), 1);
    const cJSON* stats = cJSON_GetObjectItemCaseSensitive(data, "stats");
    ASSERT_EQ(*json::get_number(stats, "totalCount"), 1.0);

    auto verified = h.call(R"({"action":"verify_backup","backupId":")" + backup_id + "\"}");
    ASSERT_TRUE(json::get_bool(data_of(verified), "valid"));

    auto restored = h.call(R"({"action":"restore_trip","backupId":")" + backup_id + "\"}");
    ASSERT_EQ(json::get_string(data_of(restored), "id"), std::string("trip-a"));

    auto conflict = h.call(R"({"action":"restore_trip","backupId":")" + backup_id + "\"}");
    ASSERT_EQ(json::get_string(conflict.get(), "code"), std::string("CONFLICT"));

    auto gc = h.call(R"({"action":"gc_backups","dryRun":true})");
    ASSERT_TRUE(json::get_bool(data_of(gc), "dryRun"));
    ASSERT_EQ(cJSON_GetArraySize(cJSON_GetObjectItemCaseSensitive(data_of(gc), "removed")), 0);
}

void test_handle_exit()
{
    HandlerHarness h("./test_api_exit");
    const std::string response = h.handler.process(R"({"action":"exit"})");
    ASSERT_TRUE(api::Handler::is_goodbye(response));
    ASSERT_FALSE(api::Handler::is_goodbye(h.handler.process(R"({"action":"list_trips"})")));
}
