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
 * @file fixtures.hpp
 * @brief Shared test environments and sample trips.
 */

#pragma once

#include "tripstore/core/error.hpp"
#include "tripstore/migration/migrator.hpp"
#include "tripstore/model/trip.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>

namespace tripstore::test {

/**
 * @class ScratchDir
 * @brief RAII "clean room" directory for file-backed tests.
 *
 * - **Setup**: purges the directory before the suite touches it.
 * - **Teardown**: removes it when the owning object goes away.
 */
class ScratchDir {
  public:
    explicit ScratchDir(std::string path) : path(std::move(path)) { reset(); }

    ~ScratchDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    /// @brief Empties the directory to prevent cross-test leakage.
    void reset() const
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
        std::filesystem::create_directories(path);
    }

    std::string file(const std::string& name) const { return path + "/" + name; }

    const std::string path;
};

inline std::string read_text(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void write_text(const std::string& path, const std::string& content)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

/**
 * @brief Runs @p action and returns the code of the @p E it throws, if any.
 */
template <typename E, typename F>
std::optional<ErrorCode> code_thrown(F&& action)
{
    try {
        action();
    } catch (const E& e) {
        return e.code();
    }
    return std::nullopt;
}

inline model::CostTrackingLink link_to(const std::string& expense_id)
{
    model::CostTrackingLink link;
    link.expense_id = expense_id;
    link.description = "expense " + expense_id;
    return link;
}

inline model::Expense expense(const std::string& id, double amount,
                              std::optional<model::TravelReference> reference = std::nullopt)
{
    model::Expense e;
    e.id = id;
    e.date = "2026-05-02T00:00:00.000Z";
    e.amount = amount;
    e.currency = "EUR";
    e.category = "Food";
    e.description = "Expense " + id;
    e.travel_reference = std::move(reference);
    return e;
}

inline model::TravelReference reference_to(model::ItemKind kind, const std::string& id)
{
    model::TravelReference ref;
    ref.target(kind, id);
    return ref;
}

/**
 * @brief A consistent, current-version trip.
 *
 * | Item          | Links  | Expense reference     |
 * |---------------|--------|-----------------------|
 * | loc-1 Lisbon  | exp-1  | exp-1 -> loc-1        |
 * | acc-1 (loc-1) | exp-2  | exp-2 -> acc-1        |
 * | route-1       | exp-3  | exp-3 -> route-1      |
 * | route-1a      |        | (sub-route of route-1)|
 * |               |        | exp-4 general         |
 */
inline model::TripDocument sample_trip(const std::string& id = "trip-a")
{
    using model::ItemKind;

    model::TripDocument doc;
    doc.schema_version = migration::CURRENT_SCHEMA_VERSION;
    doc.id = id;
    doc.title = "Portugal";
    doc.description = "Spring trip";
    doc.start_date = "2026-05-01T00:00:00.000Z";
    doc.end_date = "2026-05-10T00:00:00.000Z";
    doc.created_at = "2026-01-01T10:00:00.000Z";
    doc.updated_at = "2026-01-01T10:00:00.000Z";

    model::Location lisbon;
    lisbon.id = "loc-1";
    lisbon.name = "Lisbon";
    lisbon.date = "2026-05-01T00:00:00.000Z";
    lisbon.end_date = "2026-05-04T00:00:00.000Z";
    lisbon.accommodation_ids = {"acc-1"};
    lisbon.cost_tracking_links = {link_to("exp-1")};

    model::Accommodation hotel;
    hotel.id = "acc-1";
    hotel.name = "Hotel Lis";
    hotel.location_id = "loc-1";
    hotel.accommodation_data = "Check-in 15:00";
    hotel.cost_tracking_links = {link_to("exp-2")};
    hotel.created_at = "2026-01-01T10:00:00.000Z";
    hotel.updated_at = "2026-01-01T10:00:00.000Z";

    model::Route train;
    train.id = "route-1";
    train.type = "train";
    train.from = "Lisbon";
    train.to = "Porto";
    train.date = "2026-05-04T00:00:00.000Z";
    train.cost_tracking_links = {link_to("exp-3")};

    model::Route bus;
    bus.id = "route-1a";
    bus.type = "bus";
    bus.from = "Porto Campanha";
    bus.to = "Porto Centro";
    train.sub_routes.push_back(bus);

    model::Itinerary itinerary;
    itinerary.locations = {lisbon};
    itinerary.routes = {train};
    doc.itinerary = itinerary;
    doc.accommodations = {hotel};

    model::Finance finance;
    finance.overall_budget = 2000.0;
    finance.currency = "EUR";
    finance.expenses = {expense("exp-1", 40.0, reference_to(ItemKind::Location, "loc-1")),
                        expense("exp-2", 300.0, reference_to(ItemKind::Accommodation, "acc-1")),
                        expense("exp-3", 35.0, reference_to(ItemKind::Route, "route-1")),
                        expense("exp-4", 12.5)};
    finance.expenses[3].is_general_expense = true;
    doc.finance = finance;

    return doc;
}

} // namespace tripstore::test
