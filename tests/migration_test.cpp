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
 * @file migration_test.cpp
 * @brief Unit tests for the schema migration chain and its repair routines.
 *
 * @details
 * Documents are written as JSON the way older builds stored them, decoded,
 * and pushed through `Migrator::migrate_to_latest`. Each test pins one
 * repair and checks the audit trail it leaves.
 */

#include "fixtures.hpp"
#include "framework.hpp"
#include "tripstore/core/error.hpp"
#include "tripstore/migration/migrator.hpp"
#include "tripstore/migration/steps.hpp"
#include "tripstore/model/codec.hpp"

#include <algorithm>
#include <string>

using namespace tripstore;
using migration::Migrator;
using model::ItemKind;

namespace {

bool links_contain(const std::vector<model::CostTrackingLink>& links, const std::string& expense_id)
{
    return std::any_of(links.begin(), links.end(),
                       [&](const model::CostTrackingLink& l) { return l.expense_id == expense_id; });
}

std::size_t count_op(const migration::MigrationResult& result, const std::string& op)
{
    return static_cast<std::size_t>(
        std::count_if(result.audit.begin(), result.audit.end(),
                      [&](const migration::AuditEntry& e) { return e.operation == op; }));
}

} // namespace

/**
 * @brief Version 1 layout: accommodation text embedded in the location and
 * an accommodation-category expense linked to the location.
 *
 * Expected outcome:
 * 1. A first-class accommodation is extracted and listed by the location.
 * 2. The expense link and reference move to the accommodation.
 * 3. The embedded fields are gone and the version is current.
 */
void test_migrate_v1_extracts_accommodations()
{
    const std::string raw = R"({
        "schemaVersion": 1, "id": "trip-v1", "title": "Old trip",
        "travelData": {"locations": [{
            "id": "loc-1", "name": "Lisbon",
            "accommodationData": "---\nname: \"Casa Azul\"\n---\nCheck-in 15:00",
            "isAccommodationPublic": true,
            "costTrackingLinks": [{"expenseId": "exp-h"}, {"expenseId": "exp-f"}]
        }], "routes": []},
        "costData": {"expenses": [
            {"id": "exp-h", "amount": 300, "category": "Accommodation",
             "travelReference": {"type": "location", "locationId": "loc-1"}},
            {"id": "exp-f", "amount": 20, "category": "Food",
             "travelReference": {"type": "location", "locationId": "loc-1"}}
        ]}
    })";

    auto result = Migrator::migrate_to_latest(model::codec::deserialize(raw));
    const model::TripDocument& doc = result.document;

    ASSERT_EQ(result.from_version, 1);
    ASSERT_EQ(result.to_version, migration::CURRENT_SCHEMA_VERSION);
    ASSERT_EQ(doc.accommodations.size(), static_cast<size_t>(1));

    const model::Accommodation& extracted = doc.accommodations[0];
    ASSERT_EQ(extracted.name, std::string("Casa Azul"));
    ASSERT_EQ(extracted.location_id, std::string("loc-1"));
    ASSERT_TRUE(extracted.is_public);
    ASSERT_TRUE(links_contain(extracted.cost_tracking_links, "exp-h"));

    const model::Location* lisbon = doc.find_location("loc-1");
    ASSERT_FALSE(lisbon->legacy_accommodation_data.has_value());
    ASSERT_EQ(lisbon->accommodation_ids.size(), static_cast<size_t>(1));
    ASSERT_EQ(lisbon->accommodation_ids[0], extracted.id);
    ASSERT_FALSE(links_contain(lisbon->cost_tracking_links, "exp-h"));
    ASSERT_TRUE(links_contain(lisbon->cost_tracking_links, "exp-f"));

    const model::Expense* hotel = doc.find_expense("exp-h");
    ASSERT_TRUE(hotel->travel_reference->type == ItemKind::Accommodation);
    ASSERT_EQ(hotel->travel_reference->accommodation_id, extracted.id);

    ASSERT_EQ(count_op(result, migration::op::EXTRACT_ACCOMMODATION), static_cast<size_t>(1));
    ASSERT_TRUE(result.changed());
}

/**
 * @brief Links naming expenses that do not exist are purged; duplicates collapse.
 */
void test_migrate_purges_dangling_links()
{
    const std::string raw = R"({
        "schemaVersion": 3, "id": "trip-v3", "title": "T",
        "travelData": {"locations": [{"id": "loc-1", "name": "Rome",
            "costTrackingLinks": [{"expenseId": "exp-1"}, {"expenseId": "exp-gone"},
                                  {"expenseId": "exp-1"}]}],
            "routes": [{"id": "r-1", "from": "Rome", "to": "Pisa",
                        "costTrackingLinks": [{"expenseId": "exp-other-trip"}]}]},
        "costData": {"expenses": [{"id": "exp-1", "amount": 5,
            "travelReference": {"type": "location", "locationId": "loc-1"}}]}
    })";

    auto result = Migrator::migrate_to_latest(model::codec::deserialize(raw));
    const model::TripDocument& doc = result.document;

    const auto& links = doc.find_location("loc-1")->cost_tracking_links;
    ASSERT_EQ(links.size(), static_cast<size_t>(1));
    ASSERT_EQ(links[0].expense_id, std::string("exp-1"));
    ASSERT_TRUE(doc.find_route("r-1")->cost_tracking_links.empty());
    ASSERT_EQ(count_op(result, migration::op::PURGE_LINK), static_cast<size_t>(2));
    ASSERT_EQ(count_op(result, migration::op::DEDUPE_LINK), static_cast<size_t>(1));
}

/**
 * @brief Each half of a link is restored from the other.
 */
void test_migrate_synchronizes_both_sides()
{
    const std::string raw = R"({
        "schemaVersion": 4, "id": "trip-v4", "title": "T",
        "travelData": {"locations": [{"id": "loc-1", "name": "Rome",
                                      "costTrackingLinks": [{"expenseId": "exp-b"}]}],
                       "routes": [{"id": "r-1", "from": "Rome", "to": "Pisa"}]},
        "costData": {"expenses": [
            {"id": "exp-a", "amount": 5, "description": "Train ticket",
             "travelReference": {"type": "route", "routeId": "r-1"}},
            {"id": "exp-b", "amount": 7},
            {"id": "exp-c", "amount": 9,
             "travelReference": {"type": "location", "locationId": "loc-missing"}}
        ]}
    })";

    auto result = Migrator::migrate_to_latest(model::codec::deserialize(raw));
    const model::TripDocument& doc = result.document;

    ASSERT_TRUE(links_contain(doc.find_route("r-1")->cost_tracking_links, "exp-a"));

    const model::Expense* b = doc.find_expense("exp-b");
    ASSERT_TRUE(b->travel_reference.has_value());
    ASSERT_TRUE(b->travel_reference->type == ItemKind::Location);
    ASSERT_EQ(b->travel_reference->location_id, std::string("loc-1"));
    ASSERT_EQ(b->travel_reference->description, std::string("Rome"));

    ASSERT_FALSE(doc.find_expense("exp-c")->travel_reference.has_value());
    ASSERT_EQ(count_op(result, migration::op::CLEAR_TRAVEL_REFERENCE), static_cast<size_t>(1));
}

/**
 * @brief An accommodation bound to the placeholder location is rebound to the
 * location that lists it; one nobody lists is only reported.
 */
void test_migrate_repairs_placeholder_locations()
{
    const std::string raw = R"({
        "schemaVersion": 5, "id": "trip-v5", "title": "T",
        "travelData": {"locations": [{"id": "loc-1", "name": "Rome",
                                      "accommodationIds": ["acc-1"]}], "routes": []},
        "accommodations": [
            {"id": "acc-1", "name": "Hotel", "locationId": "temp-location"},
            {"id": "acc-2", "name": "Hostel", "locationId": "temp-location"}
        ]
    })";

    auto result = Migrator::migrate_to_latest(model::codec::deserialize(raw));
    const model::TripDocument& doc = result.document;

    ASSERT_EQ(doc.find_accommodation("acc-1")->location_id, std::string("loc-1"));
    ASSERT_EQ(doc.find_accommodation("acc-2")->location_id,
              std::string(migration::PLACEHOLDER_LOCATION_ID));
    ASSERT_EQ(count_op(result, migration::op::REBIND_ACCOMMODATION), static_cast<size_t>(1));
    ASSERT_TRUE(count_op(result, migration::op::ORPHANED_ACCOMMODATION) >= static_cast<size_t>(1));
}

/**
 * @brief Accommodations that are listed or referenced but missing are recreated
 * as placeholders flagged for review.
 */
void test_migrate_recreates_missing_accommodations()
{
    const std::string raw = R"({
        "schemaVersion": 6, "id": "trip-v6", "title": "T",
        "travelData": {"locations": [{"id": "loc-1", "name": "Rome",
                                      "accommodationIds": ["acc-9"]}], "routes": []},
        "accommodations": [],
        "costData": {"expenses": [
            {"id": "exp-1", "amount": 100,
             "travelReference": {"type": "accommodation", "accommodationId": "acc-77",
                                 "description": "Villa Borghese B&B"}}
        ]}
    })";

    auto result = Migrator::migrate_to_latest(model::codec::deserialize(raw));
    const model::TripDocument& doc = result.document;

    const model::Accommodation* listed = doc.find_accommodation("acc-9");
    ASSERT_TRUE(listed != nullptr);
    ASSERT_TRUE(listed->needs_review);
    ASSERT_EQ(listed->location_id, std::string("loc-1"));
    ASSERT_EQ(listed->name, std::string("Accommodation in Rome"));

    const model::Accommodation* referenced = doc.find_accommodation("acc-77");
    ASSERT_TRUE(referenced != nullptr);
    ASSERT_EQ(referenced->name, std::string("Villa Borghese B&B"));
    ASSERT_TRUE(links_contain(referenced->cost_tracking_links, "exp-1"));

    ASSERT_EQ(doc.find_expense("exp-1")->travel_reference->accommodation_id,
              std::string("acc-77"));
}

/**
 * @brief An accommodation known only through an expense reference that also
 * names its location is recreated under that location.
 */
void test_migrate_recreates_accommodation_under_referenced_location()
{
    const std::string raw = R"({
        "schemaVersion": 6, "id": "trip-v6", "title": "T",
        "travelData": {"locations": [{"id": "loc-1", "name": "Lisbon"}], "routes": []},
        "accommodations": [],
        "costData": {"expenses": [
            {"id": "exp-1", "amount": 80,
             "travelReference": {"type": "accommodation", "accommodationId": "acc-x",
                                 "locationId": "loc-1"}}
        ]}
    })";

    auto result = Migrator::migrate_to_latest(model::codec::deserialize(raw));
    const model::TripDocument& doc = result.document;

    const model::Accommodation* acc = doc.find_accommodation("acc-x");
    ASSERT_TRUE(acc != nullptr);
    ASSERT_EQ(acc->location_id, std::string("loc-1"));
    ASSERT_EQ(acc->name, std::string("Accommodation in Lisbon"));
    ASSERT_TRUE(links_contain(acc->cost_tracking_links, "exp-1"));

    const auto& listed = doc.find_location("loc-1")->accommodation_ids;
    ASSERT_TRUE(std::find(listed.begin(), listed.end(), "acc-x") != listed.end());
    ASSERT_EQ(count_op(result, migration::op::ORPHANED_ACCOMMODATION), static_cast<size_t>(0));

    auto again = Migrator::migrate_to_latest(doc);
    ASSERT_FALSE(again.changed());
}

/**
 * @brief A second pass over a migrated document changes nothing.
 */
void test_migration_is_idempotent()
{
    const std::string raw = R"({
        "schemaVersion": 1, "id": "trip-idem", "title": "T",
        "travelData": {"locations": [{"id": "loc-1", "name": "Rome",
            "accommodationData": "Hotel Roma", "costTrackingLinks": [{"expenseId": "gone"}]}],
            "routes": []},
        "costData": {"expenses": [{"id": "exp-1", "amount": 1,
            "travelReference": {"type": "location", "locationId": "loc-1"}}]}
    })";

    auto first = Migrator::migrate_to_latest(model::codec::deserialize(raw));
    ASSERT_TRUE(first.changed());

    const std::string once = model::codec::serialize(first.document);
    auto second = Migrator::migrate_to_latest(first.document);
    ASSERT_FALSE(second.changed());
    ASSERT_EQ(second.mutations, static_cast<size_t>(0));
    ASSERT_EQ(model::codec::serialize(second.document), once);
}

void test_consistent_document_is_untouched()
{
    auto result = Migrator::migrate_to_latest(test::sample_trip());
    ASSERT_FALSE(result.changed());
    ASSERT_EQ(result.document.updated_at, std::string("2026-01-01T10:00:00.000Z"));
}

/**
 * @brief Missing, zero, negative and future versions are rejected.
 */
void test_migrate_rejects_invalid_versions()
{
    model::TripDocument doc = test::sample_trip();
    doc.schema_version = 0;
    ASSERT_THROWS(Migrator::migrate_to_latest(doc), InvalidSchemaVersionError);
    doc.schema_version = -2;
    ASSERT_THROWS(Migrator::migrate_to_latest(doc), InvalidSchemaVersionError);
    doc.schema_version = migration::CURRENT_SCHEMA_VERSION + 1;
    ASSERT_THROWS(Migrator::migrate_to_latest(doc), InvalidSchemaVersionError);
}

/**
 * @brief Every intermediate version is visited exactly once, in order.
 */
void test_migration_chain_is_contiguous()
{
    const auto& steps = migration::chain();
    ASSERT_EQ(steps.size(), static_cast<size_t>(migration::CURRENT_SCHEMA_VERSION - 1));
    for (std::size_t i = 0; i < steps.size(); ++i) {
        ASSERT_EQ(steps[i].from, static_cast<int>(i) + 1);
    }

    for (int start = 1; start <= migration::CURRENT_SCHEMA_VERSION; ++start) {
        model::TripDocument doc = test::sample_trip();
        doc.schema_version = start;
        auto result = Migrator::migrate_to_latest(doc);
        ASSERT_EQ(result.to_version, migration::CURRENT_SCHEMA_VERSION);
        ASSERT_TRUE(result.to_version >= result.from_version);
    }
}
