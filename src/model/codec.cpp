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
 * @file codec.cpp
 * @brief Implementation of the trip document codec.
 */

#include "tripstore/model/codec.hpp"

#include <stdexcept>

namespace tripstore::model::codec {

namespace {

// ============================================================================
// Shared fragments
// ============================================================================

std::optional<Coordinates> coordinates_from(const cJSON* obj, const char* key)
{
    const cJSON* node = cJSON_GetObjectItemCaseSensitive(obj, key);
    if (cJSON_IsArray(node) && cJSON_GetArraySize(node) >= 2) {
        const cJSON* lat = cJSON_GetArrayItem(node, 0);
        const cJSON* lng = cJSON_GetArrayItem(node, 1);
        if (cJSON_IsNumber(lat) && cJSON_IsNumber(lng)) {
            return Coordinates{lat->valuedouble, lng->valuedouble};
        }
    }
    if (cJSON_IsObject(node)) {
        auto lat = json::get_number(node, "lat");
        auto lng = json::get_number(node, "lng");
        if (lat && lng) {
            return Coordinates{*lat, *lng};
        }
    }
    return std::nullopt;
}

void add_coordinates(cJSON* obj, const char* key, const std::optional<Coordinates>& coords)
{
    if (!coords) {
        return;
    }
    const double pair[2] = {coords->lat, coords->lng};
    cJSON_AddItemToObject(obj, key, cJSON_CreateDoubleArray(pair, 2));
}

std::vector<CostTrackingLink> links_from(const cJSON* obj)
{
    std::vector<CostTrackingLink> links;
    const cJSON* array = cJSON_GetObjectItemCaseSensitive(obj, "costTrackingLinks");
    const cJSON* node = nullptr;
    cJSON_ArrayForEach(node, array)
    {
        if (!cJSON_IsObject(node)) {
            continue;
        }
        CostTrackingLink link;
        link.expense_id = json::get_string(node, "expenseId");
        link.description = json::get_string(node, "description");
        link.extra = json::collect_extras(node, {"expenseId", "description"});
        links.push_back(std::move(link));
    }
    return links;
}

void add_links(cJSON* obj, const std::vector<CostTrackingLink>& links)
{
    cJSON* array = cJSON_AddArrayToObject(obj, "costTrackingLinks");
    for (const auto& link : links) {
        cJSON* node = cJSON_CreateObject();
        cJSON_AddStringToObject(node, "expenseId", link.expense_id.c_str());
        json::add_string_if(node, "description", link.description);
        json::merge_extras(node, link.extra);
        cJSON_AddItemToArray(array, node);
    }
}

std::vector<PostRef> posts_from(const cJSON* obj, const char* key)
{
    std::vector<PostRef> posts;
    const cJSON* array = cJSON_GetObjectItemCaseSensitive(obj, key);
    const cJSON* node = nullptr;
    cJSON_ArrayForEach(node, array)
    {
        if (!cJSON_IsObject(node)) {
            continue;
        }
        PostRef post;
        post.id = json::get_string(node, "id");
        post.url = json::get_string(node, "url");
        post.title = json::get_string(node, "title");
        post.extra = json::collect_extras(node, {"id", "url", "title"});
        posts.push_back(std::move(post));
    }
    return posts;
}

void add_posts(cJSON* obj, const char* key, const std::vector<PostRef>& posts)
{
    if (posts.empty()) {
        return;
    }
    cJSON* array = cJSON_AddArrayToObject(obj, key);
    for (const auto& post : posts) {
        cJSON* node = cJSON_CreateObject();
        json::add_string_if(node, "id", post.id);
        json::add_string_if(node, "url", post.url);
        json::add_string_if(node, "title", post.title);
        json::merge_extras(node, post.extra);
        cJSON_AddItemToArray(array, node);
    }
}

/// Adds a verbatim JSON fragment, falling back to @p fallback when it does not parse.
void add_fragment(cJSON* obj, const char* key, const std::string& text, cJSON* fallback)
{
    cJSON* node = json::parse_fragment(text);
    if (node) {
        cJSON_Delete(fallback);
        cJSON_AddItemToObject(obj, key, node);
    } else if (fallback) {
        cJSON_AddItemToObject(obj, key, fallback);
    }
}

std::optional<TravelReference> travel_reference_from(const cJSON* obj)
{
    const cJSON* node = cJSON_GetObjectItemCaseSensitive(obj, "travelReference");
    if (!cJSON_IsObject(node)) {
        return std::nullopt;
    }

    TravelReference ref;
    ref.location_id = json::get_string(node, "locationId");
    ref.accommodation_id = json::get_string(node, "accommodationId");
    ref.route_id = json::get_string(node, "routeId");
    ref.description = json::get_string(node, "description");
    ref.extra = json::collect_extras(
        node, {"type", "locationId", "accommodationId", "routeId", "description"});

    auto kind = parse_item_kind(json::get_string(node, "type"));
    if (kind) {
        ref.type = *kind;
    } else if (!ref.accommodation_id.empty()) {
        ref.type = ItemKind::Accommodation;
    } else if (!ref.route_id.empty()) {
        ref.type = ItemKind::Route;
    } else if (!ref.location_id.empty()) {
        ref.type = ItemKind::Location;
    } else {
        return std::nullopt;
    }
    return ref;
}

void add_travel_reference(cJSON* obj, const std::optional<TravelReference>& ref)
{
    if (!ref) {
        return;
    }
    cJSON* node = cJSON_AddObjectToObject(obj, "travelReference");
    cJSON_AddStringToObject(node, "type", to_string(ref->type));
    json::add_string_if(node, "locationId", ref->location_id);
    json::add_string_if(node, "accommodationId", ref->accommodation_id);
    json::add_string_if(node, "routeId", ref->route_id);
    json::add_string_if(node, "description", ref->description);
    json::merge_extras(node, ref->extra);
}

BudgetItem budget_from(const cJSON* node)
{
    BudgetItem item;
    item.id = json::get_string(node, "id");
    item.country = json::get_string(node, "country");
    item.amount = json::get_number(node, "amount");
    item.currency = json::get_string(node, "currency");
    item.notes = json::get_string(node, "notes");
    item.extra = json::collect_extras(node, {"id", "country", "amount", "currency", "notes"});
    return item;
}

cJSON* budget_to(const BudgetItem& item)
{
    cJSON* node = cJSON_CreateObject();
    cJSON_AddStringToObject(node, "id", item.id.c_str());
    cJSON_AddStringToObject(node, "country", item.country.c_str());
    if (item.amount) {
        cJSON_AddNumberToObject(node, "amount", *item.amount);
    }
    json::add_string_if(node, "currency", item.currency);
    json::add_string_if(node, "notes", item.notes);
    json::merge_extras(node, item.extra);
    return node;
}

ImportMetadata import_metadata_from(const cJSON* finance)
{
    ImportMetadata meta;
    const cJSON* node = cJSON_GetObjectItemCaseSensitive(finance, "importMetadata");
    if (!cJSON_IsObject(node)) {
        node = cJSON_GetObjectItemCaseSensitive(finance, "ynabImportData");
    }
    if (!cJSON_IsObject(node)) {
        return meta;
    }
    const cJSON* mappings = cJSON_GetObjectItemCaseSensitive(node, "mappings");
    if (mappings) {
        meta.mappings_json = json::print(mappings);
    }
    meta.imported_transaction_hashes = json::get_string_array(node, "importedTransactionHashes");
    return meta;
}

} // namespace

// ============================================================================
// Entities
// ============================================================================

json::Ptr location_to_json(const Location& location)
{
    json::Ptr node(cJSON_CreateObject());
    cJSON* obj = node.get();
    cJSON_AddStringToObject(obj, "id", location.id.c_str());
    cJSON_AddStringToObject(obj, "name", location.name.c_str());
    add_coordinates(obj, "coordinates", location.coordinates);
    json::add_string_if(obj, "date", location.date);
    json::add_string_if(obj, "endDate", location.end_date);
    json::add_string_if(obj, "notes", location.notes);
    json::add_string_array(obj, "accommodationIds", location.accommodation_ids);
    add_links(obj, location.cost_tracking_links);
    add_posts(obj, "instagramPosts", location.instagram_posts);
    add_posts(obj, "tikTokPosts", location.tiktok_posts);
    add_posts(obj, "blogPosts", location.blog_posts);
    if (location.legacy_accommodation_data) {
        cJSON_AddStringToObject(obj, "accommodationData",
                                location.legacy_accommodation_data->c_str());
    }
    if (location.legacy_accommodation_public) {
        cJSON_AddBoolToObject(obj, "isAccommodationPublic", *location.legacy_accommodation_public);
    }
    json::merge_extras(obj, location.extra);
    return node;
}

Location location_from_json(const cJSON* obj)
{
    Location location;
    location.id = json::get_string(obj, "id");
    location.name = json::get_string(obj, "name");
    location.coordinates = coordinates_from(obj, "coordinates");
    location.date = json::get_date(obj, "date");
    location.end_date = json::get_date(obj, "endDate");
    location.notes = json::get_string(obj, "notes");
    location.accommodation_ids = json::get_string_array(obj, "accommodationIds");
    location.cost_tracking_links = links_from(obj);
    location.instagram_posts = posts_from(obj, "instagramPosts");
    location.tiktok_posts = posts_from(obj, "tikTokPosts");
    location.blog_posts = posts_from(obj, "blogPosts");

    const cJSON* data = cJSON_GetObjectItemCaseSensitive(obj, "accommodationData");
    if (cJSON_IsString(data) && data->valuestring) {
        location.legacy_accommodation_data = std::string(data->valuestring);
    }
    location.legacy_accommodation_public = json::get_optional_bool(obj, "isAccommodationPublic");

    location.extra = json::collect_extras(
        obj, {"id", "name", "coordinates", "date", "endDate", "notes", "accommodationIds",
              "costTrackingLinks", "instagramPosts", "tikTokPosts", "blogPosts",
              "accommodationData", "isAccommodationPublic"});
    return location;
}

json::Ptr accommodation_to_json(const Accommodation& accommodation)
{
    json::Ptr node(cJSON_CreateObject());
    cJSON* obj = node.get();
    cJSON_AddStringToObject(obj, "id", accommodation.id.c_str());
    cJSON_AddStringToObject(obj, "name", accommodation.name.c_str());
    cJSON_AddStringToObject(obj, "locationId", accommodation.location_id.c_str());
    cJSON_AddStringToObject(obj, "accommodationData", accommodation.accommodation_data.c_str());
    cJSON_AddBoolToObject(obj, "isAccommodationPublic", accommodation.is_public);
    add_links(obj, accommodation.cost_tracking_links);
    json::add_string_if(obj, "createdAt", accommodation.created_at);
    json::add_string_if(obj, "updatedAt", accommodation.updated_at);
    if (accommodation.needs_review) {
        cJSON_AddBoolToObject(obj, "needsReview", 1);
    }
    json::merge_extras(obj, accommodation.extra);
    return node;
}

Accommodation accommodation_from_json(const cJSON* obj)
{
    Accommodation accommodation;
    accommodation.id = json::get_string(obj, "id");
    accommodation.name = json::get_string(obj, "name");
    accommodation.location_id = json::get_string(obj, "locationId");
    accommodation.accommodation_data = json::get_string(obj, "accommodationData");
    accommodation.is_public = json::get_bool(obj, "isAccommodationPublic");
    accommodation.cost_tracking_links = links_from(obj);
    accommodation.created_at = json::get_date(obj, "createdAt");
    accommodation.updated_at = json::get_date(obj, "updatedAt");
    accommodation.needs_review = json::get_bool(obj, "needsReview");
    accommodation.extra = json::collect_extras(
        obj, {"id", "name", "locationId", "accommodationData", "isAccommodationPublic",
              "costTrackingLinks", "createdAt", "updatedAt", "needsReview"});
    return accommodation;
}

std::vector<Accommodation> accommodations_from_json(const cJSON* array)
{
    std::vector<Accommodation> out;
    const cJSON* node = nullptr;
    cJSON_ArrayForEach(node, array)
    {
        if (cJSON_IsObject(node)) {
            out.push_back(accommodation_from_json(node));
        }
    }
    return out;
}

json::Ptr route_to_json(const Route& route)
{
    json::Ptr node(cJSON_CreateObject());
    cJSON* obj = node.get();
    cJSON_AddStringToObject(obj, "id", route.id.c_str());
    cJSON_AddStringToObject(obj, "type", route.type.c_str());
    cJSON_AddStringToObject(obj, "from", route.from.c_str());
    cJSON_AddStringToObject(obj, "to", route.to.c_str());
    json::add_string_if(obj, "date", route.date);
    json::add_string_if(obj, "departureTime", route.departure_time);
    json::add_string_if(obj, "arrivalTime", route.arrival_time);
    add_coordinates(obj, "fromCoordinates", route.from_coordinates);
    add_coordinates(obj, "toCoordinates", route.to_coordinates);
    add_links(obj, route.cost_tracking_links);
    if (!route.sub_routes.empty()) {
        cJSON* subs = cJSON_AddArrayToObject(obj, "subRoutes");
        for (const auto& sub : route.sub_routes) {
            cJSON_AddItemToArray(subs, route_to_json(sub).release());
        }
    }
    json::merge_extras(obj, route.extra);
    return node;
}

Route route_from_json(const cJSON* obj)
{
    Route route;
    route.id = json::get_string(obj, "id");
    route.type = json::get_string(obj, "type", json::get_string(obj, "transportType", "other"));
    route.from = json::get_string(obj, "from");
    route.to = json::get_string(obj, "to");
    route.date = json::get_date(obj, "date");
    route.departure_time = json::get_date(obj, "departureTime");
    route.arrival_time = json::get_date(obj, "arrivalTime");
    route.from_coordinates = coordinates_from(obj, "fromCoordinates");
    route.to_coordinates = coordinates_from(obj, "toCoordinates");
    route.cost_tracking_links = links_from(obj);

    const cJSON* subs = cJSON_GetObjectItemCaseSensitive(obj, "subRoutes");
    const cJSON* sub = nullptr;
    cJSON_ArrayForEach(sub, subs)
    {
        if (cJSON_IsObject(sub)) {
            route.sub_routes.push_back(route_from_json(sub));
        }
    }

    route.extra = json::collect_extras(
        obj, {"id", "type", "transportType", "from", "to", "date", "departureTime", "arrivalTime",
              "fromCoordinates", "toCoordinates", "costTrackingLinks", "subRoutes"});
    return route;
}

json::Ptr expense_to_json(const Expense& expense)
{
    json::Ptr node(cJSON_CreateObject());
    cJSON* obj = node.get();
    cJSON_AddStringToObject(obj, "id", expense.id.c_str());
    json::add_string_if(obj, "date", expense.date);
    cJSON_AddNumberToObject(obj, "amount", expense.amount);
    cJSON_AddStringToObject(obj, "currency", expense.currency.c_str());
    cJSON_AddStringToObject(obj, "category", expense.category.c_str());
    json::add_string_if(obj, "country", expense.country);
    cJSON_AddStringToObject(obj, "description", expense.description.c_str());
    json::add_string_if(obj, "notes", expense.notes);
    cJSON_AddBoolToObject(obj, "isGeneralExpense", expense.is_general_expense);
    cJSON_AddStringToObject(obj, "expenseType", expense.expense_type.c_str());
    json::add_string_if(obj, "originalPlannedId", expense.original_planned_id);
    add_travel_reference(obj, expense.travel_reference);
    json::add_string_if(obj, "importHash", expense.import_hash);
    json::add_string_if(obj, "externalTransactionId", expense.external_transaction_id);
    json::merge_extras(obj, expense.extra);
    return node;
}

Expense expense_from_json(const cJSON* obj)
{
    Expense expense;
    expense.id = json::get_string(obj, "id");
    expense.date = json::get_date(obj, "date");
    expense.amount = json::get_number(obj, "amount").value_or(0.0);
    expense.currency = json::get_string(obj, "currency");
    expense.category = json::get_string(obj, "category");
    expense.country = json::get_string(obj, "country");
    expense.description = json::get_string(obj, "description");
    expense.notes = json::get_string(obj, "notes");
    expense.is_general_expense = json::get_bool(obj, "isGeneralExpense");
    expense.expense_type = json::get_string(obj, "expenseType", "actual");
    expense.original_planned_id = json::get_string(obj, "originalPlannedId");
    expense.travel_reference = travel_reference_from(obj);
    expense.import_hash = json::get_string(obj, "importHash", json::get_string(obj, "hash"));
    expense.external_transaction_id = json::get_string(
        obj, "externalTransactionId", json::get_string(obj, "ynabTransactionId"));
    expense.extra = json::collect_extras(
        obj, {"id", "date", "amount", "currency", "category", "country", "description", "notes",
              "isGeneralExpense", "expenseType", "originalPlannedId", "travelReference",
              "importHash", "hash", "externalTransactionId", "ynabTransactionId"});
    return expense;
}

std::vector<Expense> expenses_from_json(const cJSON* array)
{
    std::vector<Expense> out;
    const cJSON* node = nullptr;
    cJSON_ArrayForEach(node, array)
    {
        if (cJSON_IsObject(node)) {
            out.push_back(expense_from_json(node));
        }
    }
    return out;
}

// ============================================================================
// Sections
// ============================================================================

json::Ptr itinerary_to_json(const Itinerary& itinerary)
{
    json::Ptr node(cJSON_CreateObject());
    cJSON* obj = node.get();

    cJSON* locations = cJSON_AddArrayToObject(obj, "locations");
    for (const auto& location : itinerary.locations) {
        cJSON_AddItemToArray(locations, location_to_json(location).release());
    }
    cJSON* routes = cJSON_AddArrayToObject(obj, "routes");
    for (const auto& route : itinerary.routes) {
        cJSON_AddItemToArray(routes, route_to_json(route).release());
    }
    add_fragment(obj, "days", itinerary.days_json, cJSON_CreateArray());
    json::merge_extras(obj, itinerary.extra);
    return node;
}

Itinerary itinerary_from_json(const cJSON* obj)
{
    Itinerary itinerary;
    const cJSON* node = nullptr;

    cJSON_ArrayForEach(node, cJSON_GetObjectItemCaseSensitive(obj, "locations"))
    {
        if (cJSON_IsObject(node)) {
            itinerary.locations.push_back(location_from_json(node));
        }
    }
    cJSON_ArrayForEach(node, cJSON_GetObjectItemCaseSensitive(obj, "routes"))
    {
        if (cJSON_IsObject(node)) {
            itinerary.routes.push_back(route_from_json(node));
        }
    }
    const cJSON* days = cJSON_GetObjectItemCaseSensitive(obj, "days");
    if (cJSON_IsArray(days)) {
        itinerary.days_json = json::print(days);
    }
    itinerary.extra = json::collect_extras(obj, {"locations", "routes", "days"});
    return itinerary;
}

json::Ptr finance_to_json(const Finance& finance)
{
    json::Ptr node(cJSON_CreateObject());
    cJSON* obj = node.get();
    cJSON_AddNumberToObject(obj, "overallBudget", finance.overall_budget);
    if (finance.reserved_budget) {
        cJSON_AddNumberToObject(obj, "reservedBudget", *finance.reserved_budget);
    }
    cJSON_AddStringToObject(obj, "currency", finance.currency.c_str());

    cJSON* budgets = cJSON_AddArrayToObject(obj, "countryBudgets");
    for (const auto& budget : finance.country_budgets) {
        cJSON_AddItemToArray(budgets, budget_to(budget));
    }
    cJSON* expenses = cJSON_AddArrayToObject(obj, "expenses");
    for (const auto& expense : finance.expenses) {
        cJSON_AddItemToArray(expenses, expense_to_json(expense).release());
    }
    json::add_string_array(obj, "customCategories", finance.custom_categories);

    const ImportMetadata& meta = finance.import_metadata;
    if (!meta.mappings_json.empty() || !meta.imported_transaction_hashes.empty()) {
        cJSON* import = cJSON_AddObjectToObject(obj, "importMetadata");
        add_fragment(import, "mappings", meta.mappings_json, cJSON_CreateArray());
        json::add_string_array(import, "importedTransactionHashes",
                               meta.imported_transaction_hashes);
    }
    json::merge_extras(obj, finance.extra);
    return node;
}

Finance finance_from_json(const cJSON* obj)
{
    Finance finance;
    finance.overall_budget = json::get_number(obj, "overallBudget").value_or(0.0);
    finance.reserved_budget = json::get_number(obj, "reservedBudget");
    finance.currency = json::get_string(obj, "currency", "EUR");

    const cJSON* node = nullptr;
    cJSON_ArrayForEach(node, cJSON_GetObjectItemCaseSensitive(obj, "countryBudgets"))
    {
        if (cJSON_IsObject(node)) {
            finance.country_budgets.push_back(budget_from(node));
        }
    }
    finance.expenses = expenses_from_json(cJSON_GetObjectItemCaseSensitive(obj, "expenses"));
    finance.custom_categories = json::get_string_array(obj, "customCategories");
    finance.import_metadata = import_metadata_from(obj);
    finance.extra = json::collect_extras(
        obj, {"overallBudget", "reservedBudget", "currency", "countryBudgets", "expenses",
              "customCategories", "importMetadata", "ynabImportData"});
    return finance;
}

// ============================================================================
// Document
// ============================================================================

json::Ptr to_json(const TripDocument& doc)
{
    json::Ptr node(cJSON_CreateObject());
    cJSON* obj = node.get();
    cJSON_AddNumberToObject(obj, "schemaVersion", doc.schema_version);
    cJSON_AddStringToObject(obj, "id", doc.id.c_str());
    cJSON_AddStringToObject(obj, "title", doc.title.c_str());
    cJSON_AddStringToObject(obj, "description", doc.description.c_str());
    json::add_string_if(obj, "startDate", doc.start_date);
    json::add_string_if(obj, "endDate", doc.end_date);
    json::add_string_if(obj, "createdAt", doc.created_at);
    json::add_string_if(obj, "updatedAt", doc.updated_at);

    if (doc.itinerary) {
        cJSON_AddItemToObject(obj, "travelData", itinerary_to_json(*doc.itinerary).release());
    }

    cJSON* accommodations = cJSON_AddArrayToObject(obj, "accommodations");
    for (const auto& accommodation : doc.accommodations) {
        cJSON_AddItemToArray(accommodations, accommodation_to_json(accommodation).release());
    }

    if (doc.finance) {
        cJSON_AddItemToObject(obj, "costData", finance_to_json(*doc.finance).release());
    }

    cJSON* updates = cJSON_AddArrayToObject(obj, "publicUpdates");
    for (const auto& update : doc.public_updates) {
        cJSON* entry = cJSON_CreateObject();
        cJSON_AddStringToObject(entry, "id", update.id.c_str());
        cJSON_AddStringToObject(entry, "createdAt", update.created_at.c_str());
        cJSON_AddStringToObject(entry, "message", update.message.c_str());
        cJSON_AddItemToArray(updates, entry);
    }

    json::merge_extras(obj, doc.extra);
    return node;
}

TripDocument from_json(const cJSON* root)
{
    if (!cJSON_IsObject(root)) {
        throw std::invalid_argument("Trip document must be a JSON object");
    }

    TripDocument doc;
    const cJSON* version = cJSON_GetObjectItemCaseSensitive(root, "schemaVersion");
    if (cJSON_IsNumber(version)) {
        doc.schema_version = version->valueint;
    }
    doc.id = json::get_string(root, "id");
    doc.title = json::get_string(root, "title");
    doc.description = json::get_string(root, "description");
    doc.start_date = json::get_date(root, "startDate");
    doc.end_date = json::get_date(root, "endDate");
    doc.created_at = json::get_date(root, "createdAt");
    doc.updated_at = json::get_date(root, "updatedAt");

    const cJSON* travel = cJSON_GetObjectItemCaseSensitive(root, "travelData");
    if (cJSON_IsObject(travel)) {
        doc.itinerary = itinerary_from_json(travel);
    }

    doc.accommodations =
        accommodations_from_json(cJSON_GetObjectItemCaseSensitive(root, "accommodations"));

    const cJSON* cost = cJSON_GetObjectItemCaseSensitive(root, "costData");
    if (cJSON_IsObject(cost)) {
        doc.finance = finance_from_json(cost);
    }

    const cJSON* node = nullptr;
    cJSON_ArrayForEach(node, cJSON_GetObjectItemCaseSensitive(root, "publicUpdates"))
    {
        if (!cJSON_IsObject(node)) {
            continue;
        }
        TripUpdate update;
        update.id = json::get_string(node, "id");
        update.created_at = json::get_date(node, "createdAt");
        update.message = json::get_string(node, "message");
        doc.public_updates.push_back(std::move(update));
    }

    doc.extra = json::collect_extras(
        root, {"schemaVersion", "id", "title", "description", "startDate", "endDate",
               "createdAt", "updatedAt", "travelData", "accommodations", "costData",
               "publicUpdates"});
    return doc;
}

std::string serialize(const TripDocument& doc, bool pretty)
{
    return json::print(to_json(doc).get(), pretty);
}

TripDocument deserialize(const std::string& raw)
{
    std::size_t offset = 0;
    json::Ptr root = json::parse(raw, &offset);
    if (!root) {
        throw std::invalid_argument("Malformed trip document at byte " + std::to_string(offset));
    }
    return from_json(root.get());
}

} // namespace tripstore::model::codec
