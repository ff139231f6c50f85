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
 * @file link_editor.cpp
 * @brief Implementation of link and unlink edits.
 */

#include "tripstore/links/link_editor.hpp"

#include "tripstore/infra/logger.hpp"

#include <algorithm>
#include <iterator>

namespace tripstore::links {

using infra::Logger;
using infra::LogLevel;

LinkValidation LinkEditor::apply(const std::string& expense_id,
                                 const std::optional<ItemRef>& target)
{
    LinkValidation result = BoundaryValidator::validate_link(doc_, expense_id, target);
    if (!result.valid) {
        return result;
    }

    model::Expense* expense = doc_.find_expense(expense_id);
    detach(expense_id);

    if (!target) {
        expense->travel_reference.reset();
        Logger::log(LogLevel::DEBUG, "Links: Trip " + doc_.id + ": unlinked expense " + expense_id);
        return result;
    }

    model::TravelReference ref;
    ref.target(target->kind, target->id);
    ref.description = doc_.item_display_name(target->kind, target->id);
    if (target->kind == model::ItemKind::Accommodation) {
        ref.location_id = doc_.find_accommodation(target->id)->location_id;
    }
    expense->travel_reference = ref;

    model::CostTrackingLink link;
    link.expense_id = expense_id;
    link.description = expense->description;
    doc_.links_of(target->kind, target->id)->push_back(link);

    Logger::log(LogLevel::DEBUG, "Links: Trip " + doc_.id + ": linked expense " + expense_id +
                                     " to " + model::to_string(target->kind) + " " + target->id);
    return result;
}

std::size_t LinkEditor::detach(const std::string& expense_id)
{
    std::size_t removed = 0;
    model::for_each_item(doc_, [&](model::ItemKind, const std::string&,
                                   std::vector<model::CostTrackingLink>& links) {
        auto tail = std::remove_if(links.begin(), links.end(), [&](const auto& link) {
            return link.expense_id == expense_id;
        });
        removed += static_cast<std::size_t>(std::distance(tail, links.end()));
        links.erase(tail, links.end());
    });
    return removed;
}

std::size_t LinkEditor::strip_all()
{
    std::size_t removed = 0;
    model::for_each_item(doc_, [&](model::ItemKind, const std::string&,
                                   std::vector<model::CostTrackingLink>& links) {
        removed += links.size();
        links.clear();
    });
    return removed;
}

} // namespace tripstore::links
