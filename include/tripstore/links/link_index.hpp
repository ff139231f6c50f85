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
 * @file link_index.hpp
 * @brief Bidirectional lookup between expenses and the itinerary items they belong to.
 *
 * @details
 * The index is built from the itinerary of exactly one trip, so data from
 * another trip can never enter it. It is read-only tooling over a loaded
 * document:
 * - **Forward:** expense id -> descriptor of the declaring item.
 * - **Reverse:** (kind, item id) -> expense ids, in declaration order.
 *
 * Duplicate and dangling links are tolerated; a link whose expense does not
 * exist still appears (the index does not look at expenses at all), and
 * enforcing validity is left to the boundary validator and the migration
 * engine.
 */

#pragma once

#include "tripstore/model/trip.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tripstore::links {

/**
 * @struct TravelDescriptor
 * @brief Tagged description of an itinerary item.
 *
 * `location_name` is only meaningful for accommodations; route names are
 * `"<from> → <to>"`.
 */
struct TravelDescriptor {
    model::ItemKind kind = model::ItemKind::Location;
    std::string id;
    std::string name;
    std::string location_name;
    std::string trip_title;

    bool operator==(const TravelDescriptor& other) const;
};

/**
 * @struct ItineraryView
 * @brief The slice of one trip the index is built from.
 */
struct ItineraryView {
    std::string trip_id;
    std::string trip_title;
    std::vector<model::Location> locations;
    std::vector<model::Accommodation> accommodations;
    std::vector<model::Route> routes;

    /// @brief Copies the itinerary-side data out of @p doc.
    static ItineraryView of(const model::TripDocument& doc);
};

/**
 * @class LinkIndex
 * @brief Forward and reverse maps over one trip's cost tracking links.
 */
class LinkIndex {
  public:
    LinkIndex() = default;

    /// @brief Single-pass construction over locations, accommodations and routes.
    static LinkIndex build(const ItineraryView& view);

    /// @brief Replaces the contents in place with an index over @p view.
    void rebuild(const ItineraryView& view);

    /**
     * @brief Adds forward entries for expenses that only carry a
     * `travelReference` (legacy data without item-side links).
     *
     * References to items missing from the view are ignored.
     *
     * @return std::size_t Number of expenses added.
     */
    std::size_t hydrate(const std::vector<model::Expense>& expenses);

    /// @brief First declared descriptor for @p expense_id.
    std::optional<TravelDescriptor> lookup(const std::string& expense_id) const;

    /// @brief Every descriptor for @p expense_id (split expenses), in declaration order.
    std::vector<TravelDescriptor> lookup_all(const std::string& expense_id) const;

    /// @brief Expense ids linked from (@p kind, @p item_id), in declaration order.
    std::vector<std::string> reverse_lookup(model::ItemKind kind,
                                            const std::string& item_id) const;

    /// @brief Same as `reverse_lookup`.
    std::vector<std::string> expenses_for(model::ItemKind kind, const std::string& item_id) const
    {
        return reverse_lookup(kind, item_id);
    }

    bool has(const std::string& expense_id) const;

    /// @brief Number of distinct expense ids in the forward map.
    std::size_t size() const { return forward_.size(); }

    const std::string& trip_id() const { return trip_id_; }

  private:
    void add(const std::string& expense_id, const TravelDescriptor& descriptor);

    std::string trip_id_;
    std::unordered_map<std::string, std::vector<TravelDescriptor>> forward_;
    std::map<std::pair<model::ItemKind, std::string>, std::vector<std::string>> reverse_;
    std::unordered_map<std::string, TravelDescriptor> items_;
};

} // namespace tripstore::links
