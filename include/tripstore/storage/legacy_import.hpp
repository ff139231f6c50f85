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
 * @file legacy_import.hpp
 * @brief Reader of the historical split layout (`travel-<id>.json` + `cost-<id>.json`).
 *
 * @details
 * Before trips were unified, the itinerary and the finance data of one trip
 * lived in two files; the cost file points at its trip through `tripId`.
 * A found pair is combined into a version-1 document (legacy files predate
 * accommodation extraction), which the `Store` then migrates, persists as
 * `trip-<id>.json` and retires the legacy files.
 */

#pragma once

#include "tripstore/model/trip.hpp"
#include "tripstore/storage/engine.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tripstore::storage {

struct LegacyBundle {
    model::TripDocument document;
    std::string travel_path; ///< "" when the trip only had a cost file.
    std::string cost_path;   ///< "" when no matching cost file exists.
};

/**
 * @class LegacyImport
 * @brief Locates and combines legacy files of one trip.
 */
class LegacyImport {
  public:
    explicit LegacyImport(const Engine& engine) : engine_(engine) {}

    /**
     * @brief Combines the legacy files of @p trip_id.
     * @return The bundle, or `std::nullopt` if no legacy file belongs to the trip.
     */
    std::optional<LegacyBundle> find(const std::string& trip_id) const;

    /// @brief Deletes the legacy files named in @p bundle.
    void retire(const LegacyBundle& bundle) const;

    /// @brief Trip ids that exist only in legacy files.
    std::vector<std::string> list_ids() const;

  private:
    const Engine& engine_;
};

} // namespace tripstore::storage
