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
 * @file boundary_validator.hpp
 * @brief Write-time check that both ends of a link live in the same trip.
 *
 * @details
 * A link is valid only when the expense and the travel item are both found
 * in the document being edited. Both checks always run, so a caller gets the
 * complete list of violations in one answer:
 *
 * @code
 * auto result = BoundaryValidator::validate_link(doc, "exp-1", ItemRef{ItemKind::Location, "loc-9"});
 * if (!result.valid) {
 *     // result.code == ErrorCode::CROSS_TRIP_TRAVEL_ITEM
 *     // result.messages() == {"Travel item loc-9 not found in trip <id>"}
 * }
 * @endcode
 */

#pragma once

#include "tripstore/core/error.hpp"
#include "tripstore/model/trip.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tripstore::links {

/// @brief Names one itinerary item of a trip.
struct ItemRef {
    model::ItemKind kind = model::ItemKind::Location;
    std::string id;
};

/// @brief One failed existence check.
struct Violation {
    ErrorCode code;
    std::string entity_id;
    std::string message;
};

/**
 * @struct LinkValidation
 * @brief Outcome of a boundary check.
 *
 * `code` is the primary error: `CROSS_TRIP_EXPENSE` wins over
 * `CROSS_TRIP_TRAVEL_ITEM` when both kinds of violation are present.
 */
struct LinkValidation {
    bool valid = true;
    std::optional<ErrorCode> code;
    std::vector<Violation> violations;

    std::vector<std::string> messages() const;

    /// @brief Throws `ValidationError` carrying every message when invalid.
    void raise_if_invalid() const;
};

/**
 * @class BoundaryValidator
 * @brief Stateless same-trip checks over a loaded document.
 */
class BoundaryValidator {
  public:
    /**
     * @brief Checks a link (or, with no @p target, an unlink) request.
     *
     * @param doc The trip being edited.
     * @param expense_id Expense that must exist in `doc.finance`.
     * @param target Item that must exist in the itinerary; `std::nullopt` for unlink.
     */
    static LinkValidation validate_link(const model::TripDocument& doc,
                                        const std::string& expense_id,
                                        const std::optional<ItemRef>& target);

    /// @brief Every itinerary-side link must name an expense of this trip.
    static LinkValidation validate_itinerary_links(const model::TripDocument& doc);

    /// @brief Every expense `travelReference` must resolve to an item of this trip.
    static LinkValidation validate_expense_references(const model::TripDocument& doc);

    static std::string expense_not_found(const std::string& expense_id,
                                         const std::string& trip_id);
    static std::string item_not_found(const std::string& item_id, const std::string& trip_id);
};

} // namespace tripstore::links
