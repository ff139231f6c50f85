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
 * @file steps.hpp
 * @brief Version transitions and the repair routines they are built from.
 *
 * @details
 * Each version transition `vN_to_vN+1` takes a document by value and returns
 * the transformed copy; every change it makes is recorded in the `AuditLog`.
 * The transitions are compositions of the repair routines below, which work
 * in place and return whether they changed anything. The routines are also
 * reused outside the chain: the integrity sweep after every migration, and
 * the service layer after finance edits.
 *
 * All routines are idempotent: a second application on their own output is a
 * no-op that records nothing.
 */

#pragma once

#include "tripstore/migration/audit.hpp"
#include "tripstore/model/trip.hpp"

#include <vector>

namespace tripstore::migration {

/// @brief Location id assigned to accommodations created before their location existed.
constexpr const char* PLACEHOLDER_LOCATION_ID = "temp-location";

// ============================================================================
// Repair routines (in place)
// ============================================================================

/**
 * @brief Turns embedded location accommodation text into Accommodation entities.
 *
 * For each location carrying `accommodationData`:
 * - creates an accommodation (id derived from the location id) bound to the
 *   location, unless one listed by the location already holds the same text;
 * - appends its id to the location's `accommodationIds`;
 * - clears the embedded fields.
 *
 * Then, for every location that owns accommodations, links to expenses whose
 * category is `accommodation` move from the location to its first
 * accommodation, and those expenses' travel references are retargeted. This
 * second part also fixes documents where an earlier extraction created the
 * accommodation but left the links behind.
 */
bool extract_accommodations(model::TripDocument& doc, AuditLog& log);

/**
 * @brief Drops itinerary links whose expense is not in the finance section.
 *
 * Duplicate links to the same expense on one item are collapsed as well.
 */
bool purge_dangling_links(model::TripDocument& doc, AuditLog& log);

/**
 * @brief Makes both halves of every link present.
 *
 * - An expense `travelReference` to an existing item without a matching
 *   link gains one on that item.
 * - A reference to a missing location or route is cleared; a reference to a
 *   missing accommodation is kept for `recreate_missing_accommodations`.
 * - A link whose expense has no `travelReference` sets one, described by the
 *   item's display name.
 */
bool synchronize_links(model::TripDocument& doc, AuditLog& log);

/**
 * @brief Rebinds accommodations whose `locationId` is the placeholder, empty
 * or unknown, to the location that lists them.
 *
 * Accommodations with no listing location are left alone and reported as a
 * non-mutating observation.
 */
bool repair_placeholder_locations(model::TripDocument& doc, AuditLog& log);

/**
 * @brief Synthesizes accommodations referenced by a location or an expense
 * but absent from the document.
 *
 * Placeholders carry a best-effort name, the owning location when one lists
 * the id, `needsReview = true`, and links for every expense referencing them.
 */
bool recreate_missing_accommodations(model::TripDocument& doc, AuditLog& log);

/**
 * @brief Runs purge, synchronize, placeholder repair and recreation in order.
 *
 * Applied after every migration so that current-version documents with fresh
 * drift are repaired too.
 */
bool integrity_sweep(model::TripDocument& doc, AuditLog& log);

// ============================================================================
// Version transitions
// ============================================================================

model::TripDocument v1_to_v2(model::TripDocument doc, AuditLog& log);
model::TripDocument v2_to_v3(model::TripDocument doc, AuditLog& log);
model::TripDocument v3_to_v4(model::TripDocument doc, AuditLog& log);
model::TripDocument v4_to_v5(model::TripDocument doc, AuditLog& log);
model::TripDocument v5_to_v6(model::TripDocument doc, AuditLog& log);
model::TripDocument v6_to_v7(model::TripDocument doc, AuditLog& log);

/**
 * @struct Step
 * @brief One entry of the migration chain.
 */
struct Step {
    int from;         ///< Version the step accepts; it produces `from + 1`.
    const char* name; ///< Short description for logs.
    model::TripDocument (*apply)(model::TripDocument, AuditLog&);
};

/// @brief The ordered chain, one step per version transition.
const std::vector<Step>& chain();

} // namespace tripstore::migration
