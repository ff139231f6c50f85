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
 * @file link_test.cpp
 * @brief Unit tests for the link index, the trip boundary validator and the
 * link editor.
 */

#include "fixtures.hpp"
#include "framework.hpp"
#include "tripstore/core/error.hpp"
#include "tripstore/links/boundary_validator.hpp"
#include "tripstore/links/link_editor.hpp"
#include "tripstore/links/link_index.hpp"

#include <string>

using namespace tripstore;
using links::BoundaryValidator;
using links::ItemRef;
using links::LinkIndex;
using model::ItemKind;

// ============================================================================
// Link index
// ============================================================================

/**
 * @brief Forward lookups describe the declaring item, including the owning
 * location name for accommodations.
 */
void test_index_forward_lookup()
{
    const auto doc = test::sample_trip();
    LinkIndex index = LinkIndex::build(links::ItineraryView::of(doc));

    ASSERT_EQ(index.trip_id(), std::string("trip-a"));
    ASSERT_EQ(index.size(), static_cast<size_t>(3));

    auto location = index.lookup("exp-1");
    ASSERT_TRUE(location.has_value());
    ASSERT_TRUE(location->kind == ItemKind::Location);
    ASSERT_EQ(location->name, std::string("Lisbon"));
    ASSERT_EQ(location->trip_title, std::string("Portugal"));

    auto hotel = index.lookup("exp-2");
    ASSERT_EQ(hotel->name, std::string("Hotel Lis"));
    ASSERT_EQ(hotel->location_name, std::string("Lisbon"));

    auto train = index.lookup("exp-3");
    ASSERT_EQ(train->name, std::string("Lisbon → Porto"));

    ASSERT_FALSE(index.lookup("exp-4").has_value());
    ASSERT_FALSE(index.has("exp-4"));
}

void test_index_reverse_lookup_and_sub_routes()
{
    auto doc = test::sample_trip();
    doc.itinerary->routes[0].sub_routes[0].cost_tracking_links.push_back(test::link_to("exp-4"));
    doc.itinerary->locations[0].cost_tracking_links.push_back(test::link_to("exp-9"));

    LinkIndex index = LinkIndex::build(links::ItineraryView::of(doc));

    auto sub = index.lookup("exp-4");
    ASSERT_TRUE(sub.has_value());
    ASSERT_EQ(sub->id, std::string("route-1a"));

    const auto at_lisbon = index.expenses_for(ItemKind::Location, "loc-1");
    ASSERT_EQ(at_lisbon.size(), static_cast<size_t>(2));
    ASSERT_EQ(at_lisbon[0], std::string("exp-1"));
    ASSERT_EQ(at_lisbon[1], std::string("exp-9"));
    ASSERT_TRUE(index.reverse_lookup(ItemKind::Route, "nowhere").empty());
}

/**
 * @brief A split expense linked from two items reports both; duplicate links
 * from the same item collapse.
 */
void test_index_split_and_duplicate_links()
{
    auto doc = test::sample_trip();
    doc.accommodations[0].cost_tracking_links.push_back(test::link_to("exp-1"));
    doc.accommodations[0].cost_tracking_links.push_back(test::link_to("exp-1"));

    LinkIndex index = LinkIndex::build(links::ItineraryView::of(doc));
    const auto all = index.lookup_all("exp-1");
    ASSERT_EQ(all.size(), static_cast<size_t>(2));
    ASSERT_TRUE(all[0].kind == ItemKind::Location);
    ASSERT_TRUE(all[1].kind == ItemKind::Accommodation);
    ASSERT_EQ(index.reverse_lookup(ItemKind::Accommodation, "acc-1").size(), static_cast<size_t>(2));
}

void test_index_unknown_owner_location()
{
    auto doc = test::sample_trip();
    doc.accommodations[0].location_id = "loc-404";
    LinkIndex index = LinkIndex::build(links::ItineraryView::of(doc));
    ASSERT_EQ(index.lookup("exp-2")->location_name, std::string("Unknown location"));
}

/**
 * @brief Expenses carrying only a travel reference are added by hydration;
 * references to unknown items are ignored.
 */
void test_index_hydrate_from_references()
{
    auto doc = test::sample_trip();
    doc.itinerary->locations[0].cost_tracking_links.clear();
    doc.finance->expenses.push_back(
        test::expense("exp-5", 1.0, test::reference_to(ItemKind::Route, "route-404")));

    LinkIndex index = LinkIndex::build(links::ItineraryView::of(doc));
    ASSERT_FALSE(index.has("exp-1"));

    ASSERT_EQ(index.hydrate(doc.finance->expenses), static_cast<size_t>(1));
    ASSERT_EQ(index.lookup("exp-1")->id, std::string("loc-1"));
    ASSERT_FALSE(index.has("exp-5"));
    ASSERT_EQ(index.hydrate(doc.finance->expenses), static_cast<size_t>(0));
}

void test_index_rebuild_replaces_contents()
{
    LinkIndex index = LinkIndex::build(links::ItineraryView::of(test::sample_trip()));
    ASSERT_TRUE(index.has("exp-1"));

    index.rebuild(links::ItineraryView::of(test::sample_trip("trip-b")));
    ASSERT_EQ(index.trip_id(), std::string("trip-b"));

    model::TripDocument empty;
    empty.id = "trip-empty";
    index.rebuild(links::ItineraryView::of(empty));
    ASSERT_EQ(index.size(), static_cast<size_t>(0));
}

// ============================================================================
// Boundary validator
// ============================================================================

void test_validate_link_same_trip()
{
    const auto doc = test::sample_trip();
    auto ok = BoundaryValidator::validate_link(doc, "exp-4", ItemRef{ItemKind::Route, "route-1a"});
    ASSERT_TRUE(ok.valid);
    ASSERT_TRUE(ok.violations.empty());

    auto unlink = BoundaryValidator::validate_link(doc, "exp-1", std::nullopt);
    ASSERT_TRUE(unlink.valid);
}

/**
 * @brief An item from another trip and an expense from another trip are both
 * reported; the expense error is the primary code.
 */
void test_validate_link_cross_trip()
{
    const auto doc = test::sample_trip();

    auto item = BoundaryValidator::validate_link(doc, "exp-1", ItemRef{ItemKind::Location, "loc-9"});
    ASSERT_FALSE(item.valid);
    ASSERT_TRUE(*item.code == ErrorCode::CROSS_TRIP_TRAVEL_ITEM);
    ASSERT_EQ(item.messages()[0], std::string("Travel item loc-9 not found in trip trip-a"));

    auto both = BoundaryValidator::validate_link(doc, "exp-b1", ItemRef{ItemKind::Location, "loc-9"});
    ASSERT_EQ(both.violations.size(), static_cast<size_t>(2));
    ASSERT_TRUE(*both.code == ErrorCode::CROSS_TRIP_EXPENSE);
    ASSERT_EQ(both.messages()[0], std::string("Expense exp-b1 not found in trip trip-a"));

    auto wrong_kind =
        BoundaryValidator::validate_link(doc, "exp-1", ItemRef{ItemKind::Accommodation, "loc-1"});
    ASSERT_FALSE(wrong_kind.valid);
}

void test_validate_itinerary_and_references()
{
    auto doc = test::sample_trip();
    doc.itinerary->locations[0].cost_tracking_links.push_back(test::link_to("exp-foreign"));
    doc.accommodations[0].cost_tracking_links.push_back(test::link_to("exp-foreign"));
    doc.finance->expenses[3].travel_reference = test::reference_to(ItemKind::Route, "route-foreign");

    auto itinerary = BoundaryValidator::validate_itinerary_links(doc);
    ASSERT_FALSE(itinerary.valid);
    ASSERT_EQ(itinerary.violations.size(), static_cast<size_t>(1));
    ASSERT_TRUE(*itinerary.code == ErrorCode::CROSS_TRIP_EXPENSE);

    auto references = BoundaryValidator::validate_expense_references(doc);
    ASSERT_FALSE(references.valid);
    ASSERT_TRUE(*references.code == ErrorCode::CROSS_TRIP_TRAVEL_ITEM);
    ASSERT_EQ(references.violations[0].entity_id, std::string("route-foreign"));

    ASSERT_TRUE(BoundaryValidator::validate_expense_references(test::sample_trip()).valid);
}

/**
 * @brief The raised error carries every message and a summary of the count.
 */
void test_raise_if_invalid_reports_all()
{
    const auto doc = test::sample_trip();
    auto result = BoundaryValidator::validate_link(doc, "exp-x", ItemRef{ItemKind::Route, "r-x"});

    bool thrown = false;
    try {
        result.raise_if_invalid();
    } catch (const ValidationError& e) {
        thrown = true;
        ASSERT_TRUE(e.code() == ErrorCode::CROSS_TRIP_EXPENSE);
        ASSERT_EQ(e.violations().size(), static_cast<size_t>(2));
        ASSERT_EQ(std::string(e.what()),
                  std::string("Expense exp-x not found in trip trip-a (+1 more)"));
    }
    ASSERT_TRUE(thrown);

    BoundaryValidator::validate_link(doc, "exp-1", std::nullopt).raise_if_invalid();
}

// ============================================================================
// Link editor
// ============================================================================

/**
 * @brief Relinking moves both halves: the old item loses the link and the
 * reference points at the new item.
 */
void test_editor_relinks_expense()
{
    auto doc = test::sample_trip();
    links::LinkEditor editor(doc);

    auto result = editor.apply("exp-1", ItemRef{ItemKind::Accommodation, "acc-1"});
    ASSERT_TRUE(result.valid);

    ASSERT_TRUE(doc.find_location("loc-1")->cost_tracking_links.empty());
    const auto& hotel_links = doc.find_accommodation("acc-1")->cost_tracking_links;
    ASSERT_EQ(hotel_links.size(), static_cast<size_t>(2));
    ASSERT_EQ(hotel_links[1].expense_id, std::string("exp-1"));

    const auto& ref = *doc.find_expense("exp-1")->travel_reference;
    ASSERT_TRUE(ref.type == ItemKind::Accommodation);
    ASSERT_EQ(ref.accommodation_id, std::string("acc-1"));
    ASSERT_EQ(ref.location_id, std::string("loc-1"));
    ASSERT_EQ(ref.description, std::string("Hotel Lis"));
}

void test_editor_unlinks_expense()
{
    auto doc = test::sample_trip();
    links::LinkEditor editor(doc);

    ASSERT_TRUE(editor.apply("exp-3", std::nullopt).valid);
    ASSERT_TRUE(doc.find_route("route-1")->cost_tracking_links.empty());
    ASSERT_FALSE(doc.find_expense("exp-3")->travel_reference.has_value());
}

/**
 * @brief A rejected request leaves the document untouched.
 */
void test_editor_rejects_cross_trip_target()
{
    auto doc = test::sample_trip();
    links::LinkEditor editor(doc);

    auto result = editor.apply("exp-1", ItemRef{ItemKind::Location, "loc-of-trip-b"});
    ASSERT_FALSE(result.valid);
    ASSERT_EQ(doc.find_location("loc-1")->cost_tracking_links.size(), static_cast<size_t>(1));
    ASSERT_EQ(doc.find_expense("exp-1")->travel_reference->location_id, std::string("loc-1"));
}

void test_editor_strip_all()
{
    auto doc = test::sample_trip();
    links::LinkEditor editor(doc);
    ASSERT_EQ(editor.detach("exp-2"), static_cast<size_t>(1));
    ASSERT_EQ(editor.strip_all(), static_cast<size_t>(2));
    ASSERT_TRUE(doc.find_location("loc-1")->cost_tracking_links.empty());
}
