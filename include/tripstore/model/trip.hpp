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
 * @file trip.hpp
 * @brief Typed shape of a trip document and its nested entities.
 *
 * @details
 * A `TripDocument` is the unit of persistence and consistency: one file per
 * trip, holding the itinerary (locations, routes, journey periods), the
 * first-class accommodations and the finance section (budgets, expenses).
 *
 * Links between an expense and an itinerary item are stored twice:
 * - itinerary side: a `CostTrackingLink` in the item's `cost_tracking_links`;
 * - finance side: the expense's `travel_reference`.
 *
 * Every entity keeps the JSON of fields it does not model in `extra`, so a
 * load/save cycle never drops data written by other tools. Optional string
 * fields use the empty string for "absent".
 */

#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace tripstore::model {

/**
 * @enum ItemKind
 * @brief Discriminator of the three link-bearing itinerary entities.
 */
enum class ItemKind { Location, Accommodation, Route };

/// @brief `location`, `accommodation` or `route`.
const char* to_string(ItemKind kind);

/**
 * @brief Parses an item kind (case-insensitive).
 *
 * `transportation` is accepted as a historical alias of `route`.
 */
std::optional<ItemKind> parse_item_kind(const std::string& text);

struct Coordinates {
    double lat = 0.0;
    double lng = 0.0;
};

/// @brief Itinerary-side half of an expense link.
struct CostTrackingLink {
    std::string expense_id;
    std::string description;
    std::string extra; ///< `splitMode`, `splitValue` and other carried fields.
};

/// @brief Expense-side half of a link: which itinerary item the expense belongs to.
struct TravelReference {
    ItemKind type = ItemKind::Location;
    std::string location_id;
    std::string accommodation_id;
    std::string route_id;
    std::string description;
    std::string extra;

    /// @brief The id field selected by `type`.
    const std::string& item_id() const;

    /// @brief Points the reference at (@p kind, @p id), clearing the other ids.
    void target(ItemKind kind, const std::string& id);
};

/// @brief A social or blog post attached to a location visit.
struct PostRef {
    std::string id;
    std::string url;
    std::string title;
    std::string extra;
};

struct Location {
    std::string id;
    std::string name;
    std::optional<Coordinates> coordinates;
    std::string date;
    std::string end_date;
    std::string notes;
    std::vector<std::string> accommodation_ids;
    std::vector<CostTrackingLink> cost_tracking_links;
    std::vector<PostRef> instagram_posts;
    std::vector<PostRef> tiktok_posts;
    std::vector<PostRef> blog_posts;

    /// Pre-extraction layout: raw accommodation text embedded in the location.
    std::optional<std::string> legacy_accommodation_data;
    std::optional<bool> legacy_accommodation_public;

    std::string extra;
};

struct Accommodation {
    std::string id;
    std::string name;
    std::string location_id;
    std::string accommodation_data;
    bool is_public = false;
    std::vector<CostTrackingLink> cost_tracking_links;
    std::string created_at;
    std::string updated_at;

    /// Set on placeholders synthesized during repair; cleared by a human edit.
    bool needs_review = false;

    std::string extra;
};

struct Route {
    std::string id;
    std::string type = "other"; ///< walk, bike, car, bus, train, plane, ferry, boat, metro, other.
    std::string from;
    std::string to;
    std::string date;
    std::string departure_time;
    std::string arrival_time;
    std::optional<Coordinates> from_coordinates;
    std::optional<Coordinates> to_coordinates;
    std::vector<CostTrackingLink> cost_tracking_links;
    std::vector<Route> sub_routes;
    std::string extra;

    /// @brief `"<from> → <to>"`.
    std::string display_name() const;
};

struct Expense {
    std::string id;
    std::string date;
    double amount = 0.0;
    std::string currency;
    std::string category;
    std::string country;
    std::string description;
    std::string notes;
    bool is_general_expense = false;
    std::string expense_type = "actual"; ///< `actual` or `planned`.
    std::string original_planned_id;
    std::optional<TravelReference> travel_reference;
    std::string import_hash;
    std::string external_transaction_id;
    std::string extra;
};

struct BudgetItem {
    std::string id;
    std::string country;
    std::optional<double> amount;
    std::string currency;
    std::string notes;
    std::string extra; ///< Budget periods and other carried fields.
};

/// @brief Bookkeeping left behind by the bank-statement import flow.
struct ImportMetadata {
    std::string mappings_json; ///< Opaque category mappings (JSON), "" when absent.
    std::vector<std::string> imported_transaction_hashes;
};

struct Finance {
    double overall_budget = 0.0;
    std::optional<double> reserved_budget;
    std::string currency = "EUR";
    std::vector<BudgetItem> country_budgets;
    std::vector<Expense> expenses;
    std::vector<std::string> custom_categories;
    ImportMetadata import_metadata;
    std::string extra;

    const Expense* find_expense(const std::string& id) const;
    Expense* find_expense(const std::string& id);
};

struct Itinerary {
    std::vector<Location> locations;
    std::vector<Route> routes;
    std::string days_json = "[]"; ///< Journey periods, carried verbatim.
    std::string extra;
};

/// @brief One human-readable change notice.
struct TripUpdate {
    std::string id;
    std::string created_at;
    std::string message;
};

/// @brief Upper bound on `TripDocument::public_updates`.
constexpr std::size_t MAX_PUBLIC_UPDATES = 100;

/**
 * @struct TripDocument
 * @brief The aggregate persisted as `trip-<id>.json`.
 *
 * `schema_version == 0` means the field was absent in the source file.
 */
struct TripDocument {
    int schema_version = 0;
    std::string id;
    std::string title;
    std::string description;
    std::string start_date;
    std::string end_date;
    std::string created_at;
    std::string updated_at;
    std::optional<Itinerary> itinerary;
    std::vector<Accommodation> accommodations;
    std::optional<Finance> finance;
    std::vector<TripUpdate> public_updates;
    std::string extra;

    const Location* find_location(const std::string& id) const;
    Location* find_location(const std::string& id);
    const Accommodation* find_accommodation(const std::string& id) const;
    Accommodation* find_accommodation(const std::string& id);

    /// @brief Searches top-level routes and, recursively, their sub-routes.
    const Route* find_route(const std::string& id) const;
    Route* find_route(const std::string& id);

    const Expense* find_expense(const std::string& id) const;
    Expense* find_expense(const std::string& id);

    /// @brief True if an item of @p kind with @p id exists in this document.
    bool has_item(ItemKind kind, const std::string& id) const;

    /**
     * @brief The link-bearing array of an item, or nullptr if the item is absent.
     */
    std::vector<CostTrackingLink>* links_of(ItemKind kind, const std::string& id);

    /// @brief Human name of an item (route: `"<from> → <to>"`), "" if absent.
    std::string item_display_name(ItemKind kind, const std::string& id) const;
};

/// @brief Callback for `for_each_item`: kind, item id, the item's link array.
using ItemVisitor = std::function<void(ItemKind, const std::string&, std::vector<CostTrackingLink>&)>;
using ConstItemVisitor =
    std::function<void(ItemKind, const std::string&, const std::vector<CostTrackingLink>&)>;

/**
 * @brief Visits every link-bearing item of a document.
 *
 * Order: locations, accommodations, then routes with their sub-routes
 * depth-first (sub-routes are reported as `ItemKind::Route`).
 */
void for_each_item(TripDocument& doc, const ItemVisitor& visit);
void for_each_item(const TripDocument& doc, const ConstItemVisitor& visit);

} // namespace tripstore::model
