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
 * @file trip.cpp
 * @brief Lookup helpers on the trip document model.
 */

#include "tripstore/model/trip.hpp"

#include "tripstore/infra/string.hpp"

namespace tripstore::model {

namespace {

template <typename Vec> auto find_by_id(Vec& items, const std::string& id) -> decltype(&items[0])
{
    for (auto& item : items) {
        if (item.id == id) {
            return &item;
        }
    }
    return nullptr;
}

const Route* find_route_in(const std::vector<Route>& routes, const std::string& id)
{
    for (const auto& route : routes) {
        if (route.id == id) {
            return &route;
        }
        if (const Route* nested = find_route_in(route.sub_routes, id)) {
            return nested;
        }
    }
    return nullptr;
}

void visit_routes(std::vector<Route>& routes, const ItemVisitor& visit)
{
    for (auto& route : routes) {
        visit(ItemKind::Route, route.id, route.cost_tracking_links);
        visit_routes(route.sub_routes, visit);
    }
}

void visit_routes(const std::vector<Route>& routes, const ConstItemVisitor& visit)
{
    for (const auto& route : routes) {
        visit(ItemKind::Route, route.id, route.cost_tracking_links);
        visit_routes(route.sub_routes, visit);
    }
}

} // namespace

const char* to_string(ItemKind kind)
{
    switch (kind) {
    case ItemKind::Location:
        return "location";
    case ItemKind::Accommodation:
        return "accommodation";
    case ItemKind::Route:
        return "route";
    }
    return "location";
}

std::optional<ItemKind> parse_item_kind(const std::string& text)
{
    const std::string key = infra::String::to_lower(infra::String::trim(text));
    if (key == "location") {
        return ItemKind::Location;
    }
    if (key == "accommodation") {
        return ItemKind::Accommodation;
    }
    if (key == "route" || key == "transportation") {
        return ItemKind::Route;
    }
    return std::nullopt;
}

const std::string& TravelReference::item_id() const
{
    switch (type) {
    case ItemKind::Accommodation:
        return accommodation_id;
    case ItemKind::Route:
        return route_id;
    case ItemKind::Location:
        break;
    }
    return location_id;
}

void TravelReference::target(ItemKind kind, const std::string& id)
{
    type = kind;
    location_id.clear();
    accommodation_id.clear();
    route_id.clear();
    switch (kind) {
    case ItemKind::Location:
        location_id = id;
        break;
    case ItemKind::Accommodation:
        accommodation_id = id;
        break;
    case ItemKind::Route:
        route_id = id;
        break;
    }
}

std::string Route::display_name() const
{
    return from + " \xE2\x86\x92 " + to;
}

const Expense* Finance::find_expense(const std::string& id) const
{
    return find_by_id(expenses, id);
}

Expense* Finance::find_expense(const std::string& id)
{
    return find_by_id(expenses, id);
}

const Location* TripDocument::find_location(const std::string& id) const
{
    return itinerary ? find_by_id(itinerary->locations, id) : nullptr;
}

Location* TripDocument::find_location(const std::string& id)
{
    return itinerary ? find_by_id(itinerary->locations, id) : nullptr;
}

const Accommodation* TripDocument::find_accommodation(const std::string& id) const
{
    return find_by_id(accommodations, id);
}

Accommodation* TripDocument::find_accommodation(const std::string& id)
{
    return find_by_id(accommodations, id);
}

const Route* TripDocument::find_route(const std::string& id) const
{
    return itinerary ? find_route_in(itinerary->routes, id) : nullptr;
}

Route* TripDocument::find_route(const std::string& id)
{
    return const_cast<Route*>(static_cast<const TripDocument*>(this)->find_route(id));
}

const Expense* TripDocument::find_expense(const std::string& id) const
{
    return finance ? finance->find_expense(id) : nullptr;
}

Expense* TripDocument::find_expense(const std::string& id)
{
    return finance ? finance->find_expense(id) : nullptr;
}

bool TripDocument::has_item(ItemKind kind, const std::string& id) const
{
    if (id.empty()) {
        return false;
    }
    switch (kind) {
    case ItemKind::Location:
        return find_location(id) != nullptr;
    case ItemKind::Accommodation:
        return find_accommodation(id) != nullptr;
    case ItemKind::Route:
        return find_route(id) != nullptr;
    }
    return false;
}

std::vector<CostTrackingLink>* TripDocument::links_of(ItemKind kind, const std::string& id)
{
    switch (kind) {
    case ItemKind::Location:
        if (Location* location = find_location(id)) {
            return &location->cost_tracking_links;
        }
        break;
    case ItemKind::Accommodation:
        if (Accommodation* accommodation = find_accommodation(id)) {
            return &accommodation->cost_tracking_links;
        }
        break;
    case ItemKind::Route:
        if (Route* route = find_route(id)) {
            return &route->cost_tracking_links;
        }
        break;
    }
    return nullptr;
}

std::string TripDocument::item_display_name(ItemKind kind, const std::string& id) const
{
    switch (kind) {
    case ItemKind::Location:
        if (const Location* location = find_location(id)) {
            return location->name;
        }
        break;
    case ItemKind::Accommodation:
        if (const Accommodation* accommodation = find_accommodation(id)) {
            return accommodation->name;
        }
        break;
    case ItemKind::Route:
        if (const Route* route = find_route(id)) {
            return route->display_name();
        }
        break;
    }
    return "";
}

void for_each_item(TripDocument& doc, const ItemVisitor& visit)
{
    if (doc.itinerary) {
        for (auto& location : doc.itinerary->locations) {
            visit(ItemKind::Location, location.id, location.cost_tracking_links);
        }
    }
    for (auto& accommodation : doc.accommodations) {
        visit(ItemKind::Accommodation, accommodation.id, accommodation.cost_tracking_links);
    }
    if (doc.itinerary) {
        visit_routes(doc.itinerary->routes, visit);
    }
}

void for_each_item(const TripDocument& doc, const ConstItemVisitor& visit)
{
    if (doc.itinerary) {
        for (const auto& location : doc.itinerary->locations) {
            visit(ItemKind::Location, location.id, location.cost_tracking_links);
        }
    }
    for (const auto& accommodation : doc.accommodations) {
        visit(ItemKind::Accommodation, accommodation.id, accommodation.cost_tracking_links);
    }
    if (doc.itinerary) {
        visit_routes(doc.itinerary->routes, visit);
    }
}

} // namespace tripstore::model
