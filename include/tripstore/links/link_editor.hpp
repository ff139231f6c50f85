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
 * @file link_editor.hpp
 * @brief Applies link and unlink requests to both halves of a link.
 */

#pragma once

#include "tripstore/links/boundary_validator.hpp"
#include "tripstore/model/trip.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace tripstore::links {

/**
 * @class LinkEditor
 * @brief Mutates one document in place; an expense keeps at most one active link.
 */
class LinkEditor {
  public:
    explicit LinkEditor(model::TripDocument& doc) : doc_(doc) {}

    /**
     * @brief Validates and applies a link (or an unlink when @p target is empty).
     *
     * On success any previous link of the expense is removed from every item
     * (sub-routes included), the expense's `travelReference` is rewritten and
     * the target item gains a `CostTrackingLink`. On failure the document is
     * untouched and the validation result is returned.
     */
    LinkValidation apply(const std::string& expense_id, const std::optional<ItemRef>& target);

    /// @brief Removes every itinerary-side link to @p expense_id. Returns the count removed.
    std::size_t detach(const std::string& expense_id);

    /// @brief Empties every `costTrackingLinks` array. Returns the count removed.
    std::size_t strip_all();

  private:
    model::TripDocument& doc_;
};

} // namespace tripstore::links
