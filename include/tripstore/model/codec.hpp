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
 * @file codec.hpp
 * @brief Conversion between cJSON trees and the typed trip model.
 *
 * @details
 * The on-disk key names are those of the historical file format:
 * the itinerary lives under `travelData`, the finance section under
 * `costData`, accommodations at the top level.
 *
 * Decoding is lenient by design of the data it meets: absent fields take
 * defaults, dates are revived into canonical ISO strings and unknown members
 * are carried in each entity's `extra`. Encoding always emits link arrays
 * (possibly empty) so that every item is visibly link-bearing.
 */

#pragma once

#include "tripstore/model/json.hpp"
#include "tripstore/model/trip.hpp"

#include <string>
#include <vector>

namespace tripstore::model::codec {

/**
 * @brief Encodes a whole document.
 * @return json::Ptr Owning tree rooted at the document object.
 */
json::Ptr to_json(const TripDocument& doc);

/**
 * @brief Decodes a whole document from a parsed tree.
 * @throws std::invalid_argument if @p root is not a JSON object.
 */
TripDocument from_json(const cJSON* root);

/// @brief Encodes and prints a document (pretty-printed by default).
std::string serialize(const TripDocument& doc, bool pretty = true);

/**
 * @brief Parses and decodes raw bytes.
 * @throws std::invalid_argument on malformed input (message carries the offset).
 */
TripDocument deserialize(const std::string& raw);

// Entity-level codecs, used by the command handler for section payloads.

json::Ptr itinerary_to_json(const Itinerary& itinerary);
Itinerary itinerary_from_json(const cJSON* obj);

json::Ptr finance_to_json(const Finance& finance);
Finance finance_from_json(const cJSON* obj);

json::Ptr accommodation_to_json(const Accommodation& accommodation);
Accommodation accommodation_from_json(const cJSON* obj);
std::vector<Accommodation> accommodations_from_json(const cJSON* array);

json::Ptr expense_to_json(const Expense& expense);
Expense expense_from_json(const cJSON* obj);
std::vector<Expense> expenses_from_json(const cJSON* array);

json::Ptr location_to_json(const Location& location);
Location location_from_json(const cJSON* obj);

json::Ptr route_to_json(const Route& route);
Route route_from_json(const cJSON* obj);

} // namespace tripstore::model::codec
