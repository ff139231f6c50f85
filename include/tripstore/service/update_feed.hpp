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
 * @file update_feed.hpp
 * @brief Human-readable change notices derived from itinerary edits.
 *
 * @details
 * Notices are computed by diffing the stored itinerary against an incoming
 * one:
 * - new locations, cancelled (removed) locations, rescheduled locations;
 * - new Instagram, TikTok and blog posts on an existing location;
 * - new routes with both endpoints named.
 */

#pragma once

#include "tripstore/model/trip.hpp"

#include <vector>

namespace tripstore::service {

/**
 * @class UpdateFeed
 * @brief Builds and publishes `publicUpdates` entries.
 */
class UpdateFeed {
  public:
    /**
     * @brief Notices for replacing @p previous's itinerary lists.
     *
     * @param previous The stored document.
     * @param locations Incoming locations, or nullptr when not replaced.
     * @param routes Incoming routes, or nullptr when not replaced.
     */
    static std::vector<model::TripUpdate> diff(const model::TripDocument& previous,
                                               const std::vector<model::Location>* locations,
                                               const std::vector<model::Route>* routes);

    /**
     * @brief Puts @p updates in front of `doc.public_updates`, keeping the
     * newest `MAX_PUBLIC_UPDATES`.
     */
    static void publish(model::TripDocument& doc, const std::vector<model::TripUpdate>& updates);
};

} // namespace tripstore::service
