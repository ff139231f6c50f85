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
 * @file link_index.cpp
 * @brief Construction and queries of the expense <-> item link index.
 */

#include "tripstore/links/link_index.hpp"

#include <algorithm>
#include <unordered_map>

namespace tripstore::links {

using model::ItemKind;

namespace {

constexpr const char* kUnknownLocation = "Unknown location";

std::string item_key(ItemKind kind, const std::string& id)
{
    return std::string(model::to_string(kind)) + ":" + id;
}

} // namespace

bool TravelDescriptor::operator==(const TravelDescriptor& other) const
{
    return kind == other.kind && id == other.id && name == other.name &&
           location_name == other.location_name && trip_title == other.trip_title;
}

ItineraryView ItineraryView::of(const model::TripDocument& doc)
{
    ItineraryView view;
    view.trip_id = doc.id;
    view.trip_title = doc.title;
    if (doc.itinerary) {
        view.locations = doc.itinerary->locations;
        view.routes = doc.itinerary->routes;
    }
    view.accommodations = doc.accommodations;
    return view;
}

LinkIndex LinkIndex::build(const ItineraryView& view)
{
    LinkIndex index;
    index.rebuild(view);
    return index;
}

void LinkIndex::rebuild(const ItineraryView& view)
{
    trip_id_ = view.trip_id;
    forward_.clear();
    reverse_.clear();
    items_.clear();

    std::unordered_map<std::string, const model::Location*> locations_by_id;

    for (const auto& location : view.locations) {
        locations_by_id.emplace(location.id, &location);

        TravelDescriptor descriptor{ItemKind::Location, location.id, location.name, "",
                                    view.trip_title};
        items_[item_key(ItemKind::Location, location.id)] = descriptor;
        for (const auto& link : location.cost_tracking_links) {
            add(link.expense_id, descriptor);
        }
    }

    for (const auto& accommodation : view.accommodations) {
        auto owner = locations_by_id.find(accommodation.location_id);
        TravelDescriptor descriptor{
            ItemKind::Accommodation, accommodation.id, accommodation.name,
            owner != locations_by_id.end() ? owner->second->name : kUnknownLocation,
            view.trip_title};
        items_[item_key(ItemKind::Accommodation, accommodation.id)] = descriptor;
        for (const auto& link : accommodation.cost_tracking_links) {
            add(link.expense_id, descriptor);
        }
    }

    // Sub-routes are indexed under their own id, after their parent.
    std::vector<const model::Route*> pending;
    for (auto it = view.routes.rbegin(); it != view.routes.rend(); ++it) {
        pending.push_back(&*it);
    }
    while (!pending.empty()) {
        const model::Route* route = pending.back();
        pending.pop_back();

        TravelDescriptor descriptor{ItemKind::Route, route->id, route->display_name(), "",
                                    view.trip_title};
        items_[item_key(ItemKind::Route, route->id)] = descriptor;
        for (const auto& link : route->cost_tracking_links) {
            add(link.expense_id, descriptor);
        }
        for (auto it = route->sub_routes.rbegin(); it != route->sub_routes.rend(); ++it) {
            pending.push_back(&*it);
        }
    }
}

void LinkIndex::add(const std::string& expense_id, const TravelDescriptor& descriptor)
{
    if (expense_id.empty()) {
        return;
    }

    auto& descriptors = forward_[expense_id];
    if (std::find(descriptors.begin(), descriptors.end(), descriptor) == descriptors.end()) {
        descriptors.push_back(descriptor);
    }

    auto& expenses = reverse_[{descriptor.kind, descriptor.id}];
    if (std::find(expenses.begin(), expenses.end(), expense_id) == expenses.end()) {
        expenses.push_back(expense_id);
    }
}

std::size_t LinkIndex::hydrate(const std::vector<model::Expense>& expenses)
{
    std::size_t added = 0;
    for (const auto& expense : expenses) {
        if (!expense.travel_reference || has(expense.id)) {
            continue;
        }
        const auto& ref = *expense.travel_reference;
        auto item = items_.find(item_key(ref.type, ref.item_id()));
        if (item == items_.end()) {
            continue;
        }
        add(expense.id, item->second);
        ++added;
    }
    return added;
}

std::optional<TravelDescriptor> LinkIndex::lookup(const std::string& expense_id) const
{
    auto it = forward_.find(expense_id);
    if (it == forward_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.front();
}

std::vector<TravelDescriptor> LinkIndex::lookup_all(const std::string& expense_id) const
{
    auto it = forward_.find(expense_id);
    return it == forward_.end() ? std::vector<TravelDescriptor>() : it->second;
}

std::vector<std::string> LinkIndex::reverse_lookup(ItemKind kind, const std::string& item_id) const
{
    auto it = reverse_.find({kind, item_id});
    return it == reverse_.end() ? std::vector<std::string>() : it->second;
}

bool LinkIndex::has(const std::string& expense_id) const
{
    return forward_.count(expense_id) > 0;
}

} // namespace tripstore::links
