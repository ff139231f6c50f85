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
 * @file boundary_validator.cpp
 * @brief Implementation of the same-trip link checks.
 */

#include "tripstore/links/boundary_validator.hpp"

namespace tripstore::links {

namespace {

void add_violation(LinkValidation& result, ErrorCode code, const std::string& entity_id,
                   std::string message)
{
    for (const auto& existing : result.violations) {
        if (existing.message == message) {
            return;
        }
    }
    result.valid = false;
    result.violations.push_back(Violation{code, entity_id, std::move(message)});

    if (!result.code || code == ErrorCode::CROSS_TRIP_EXPENSE) {
        result.code = code;
    }
}

} // namespace

std::vector<std::string> LinkValidation::messages() const
{
    std::vector<std::string> out;
    out.reserve(violations.size());
    for (const auto& violation : violations) {
        out.push_back(violation.message);
    }
    return out;
}

void LinkValidation::raise_if_invalid() const
{
    if (valid) {
        return;
    }
    const auto all = messages();
    std::string summary = all.front();
    if (all.size() > 1) {
        summary += " (+" + std::to_string(all.size() - 1) + " more)";
    }
    throw ValidationError(code.value_or(ErrorCode::VALIDATION), summary, all);
}

std::string BoundaryValidator::expense_not_found(const std::string& expense_id,
                                                 const std::string& trip_id)
{
    return "Expense " + expense_id + " not found in trip " + trip_id;
}

std::string BoundaryValidator::item_not_found(const std::string& item_id,
                                              const std::string& trip_id)
{
    return "Travel item " + item_id + " not found in trip " + trip_id;
}

LinkValidation BoundaryValidator::validate_link(const model::TripDocument& doc,
                                                const std::string& expense_id,
                                                const std::optional<ItemRef>& target)
{
    LinkValidation result;

    if (doc.find_expense(expense_id) == nullptr) {
        add_violation(result, ErrorCode::CROSS_TRIP_EXPENSE, expense_id,
                      expense_not_found(expense_id, doc.id));
    }

    if (target && !doc.has_item(target->kind, target->id)) {
        add_violation(result, ErrorCode::CROSS_TRIP_TRAVEL_ITEM, target->id,
                      item_not_found(target->id, doc.id));
    }

    return result;
}

LinkValidation BoundaryValidator::validate_itinerary_links(const model::TripDocument& doc)
{
    LinkValidation result;
    model::for_each_item(doc, [&](model::ItemKind, const std::string&,
                                  const std::vector<model::CostTrackingLink>& links) {
        for (const auto& link : links) {
            if (doc.find_expense(link.expense_id) == nullptr) {
                add_violation(result, ErrorCode::CROSS_TRIP_EXPENSE, link.expense_id,
                              expense_not_found(link.expense_id, doc.id));
            }
        }
    });
    return result;
}

LinkValidation BoundaryValidator::validate_expense_references(const model::TripDocument& doc)
{
    LinkValidation result;
    if (!doc.finance) {
        return result;
    }
    for (const auto& expense : doc.finance->expenses) {
        if (!expense.travel_reference) {
            continue;
        }
        const auto& ref = *expense.travel_reference;
        if (!doc.has_item(ref.type, ref.item_id())) {
            add_violation(result, ErrorCode::CROSS_TRIP_TRAVEL_ITEM, ref.item_id(),
                          item_not_found(ref.item_id(), doc.id));
        }
    }
    return result;
}

} // namespace tripstore::links
