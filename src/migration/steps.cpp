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
 * @file steps.cpp
 * @brief Repair routines and version transitions of the migration chain.
 */

#include "tripstore/migration/steps.hpp"

#include "tripstore/infra/string.hpp"
#include "tripstore/infra/time.hpp"

#include <algorithm>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace tripstore::migration {

using infra::String;
using model::Accommodation;
using model::CostTrackingLink;
using model::Expense;
using model::ItemKind;
using model::Location;
using model::TravelReference;
using model::TripDocument;

namespace {

constexpr std::size_t kMaxDerivedNameLength = 80;

std::unordered_set<std::string> expense_id_set(const TripDocument& doc)
{
    std::unordered_set<std::string> ids;
    if (doc.finance) {
        for (const auto& expense : doc.finance->expenses) {
            ids.insert(expense.id);
        }
    }
    return ids;
}

std::unordered_map<std::string, Expense*> expense_map(TripDocument& doc)
{
    std::unordered_map<std::string, Expense*> map;
    if (doc.finance) {
        for (auto& expense : doc.finance->expenses) {
            map.emplace(expense.id, &expense);
        }
    }
    return map;
}

bool has_link(const std::vector<CostTrackingLink>& links, const std::string& expense_id)
{
    return std::any_of(links.begin(), links.end(), [&](const CostTrackingLink& link) {
        return link.expense_id == expense_id;
    });
}

std::string link_description(const Expense& expense)
{
    if (expense.travel_reference && !expense.travel_reference->description.empty()) {
        return expense.travel_reference->description;
    }
    return expense.description;
}

/**
 * Picks a display name out of free-form accommodation text: a `name:` line
 * (front matter) wins, otherwise the first non-empty line without markdown
 * heading marks.
 */
std::string derive_accommodation_name(const std::string& text, const std::string& location_name)
{
    std::istringstream lines(text);
    std::string line;
    std::string first;
    while (std::getline(lines, line)) {
        std::string trimmed = String::trim(line);
        if (trimmed.empty() || trimmed == "---") {
            continue;
        }
        if (String::starts_with(String::to_lower(trimmed), "name:")) {
            std::string value = String::trim(trimmed.substr(5));
            if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
                value.back() == value.front()) {
                value = value.substr(1, value.size() - 2);
            }
            if (!value.empty()) {
                return value.substr(0, kMaxDerivedNameLength);
            }
        }
        if (first.empty()) {
            while (!trimmed.empty() && trimmed.front() == '#') {
                trimmed.erase(trimmed.begin());
            }
            first = String::trim(trimmed);
        }
    }
    if (!first.empty()) {
        return first.substr(0, kMaxDerivedNameLength);
    }
    return location_name.empty() ? "Accommodation" : "Accommodation in " + location_name;
}

std::string unique_accommodation_id(const TripDocument& doc, const std::string& base)
{
    std::string candidate = base;
    int suffix = 2;
    while (doc.find_accommodation(candidate)) {
        candidate = base + "-" + std::to_string(suffix++);
    }
    return candidate;
}

/// Moves accommodation-category expense links of @p location onto its first accommodation.
void move_accommodation_links(TripDocument& doc, Location& location, AuditLog& log)
{
    if (!doc.finance) {
        return;
    }

    Accommodation* target = nullptr;
    for (const auto& id : location.accommodation_ids) {
        if ((target = doc.find_accommodation(id)) != nullptr) {
            break;
        }
    }
    if (!target) {
        return;
    }

    auto is_accommodation_expense = [](const Expense* expense) {
        return expense && String::iequals(String::trim(expense->category), "accommodation");
    };

    std::vector<CostTrackingLink> kept;
    for (auto& link : location.cost_tracking_links) {
        Expense* expense = doc.find_expense(link.expense_id);
        if (!is_accommodation_expense(expense)) {
            kept.push_back(std::move(link));
            continue;
        }
        if (!has_link(target->cost_tracking_links, link.expense_id)) {
            target->cost_tracking_links.push_back(link);
        }
        log.record(op::MOVE_LINK, "accommodation", target->id, link.expense_id,
                   "accommodation expense linked to location " + location.id);
    }
    location.cost_tracking_links = std::move(kept);

    for (auto& expense : doc.finance->expenses) {
        if (!is_accommodation_expense(&expense) || !expense.travel_reference) {
            continue;
        }
        TravelReference& ref = *expense.travel_reference;
        if (ref.type == ItemKind::Location && ref.location_id == location.id) {
            ref.target(ItemKind::Accommodation, target->id);
            if (!has_link(target->cost_tracking_links, expense.id)) {
                target->cost_tracking_links.push_back({expense.id, link_description(expense), ""});
                log.record(op::MOVE_LINK, "accommodation", target->id, expense.id,
                           "travel reference retargeted from location " + location.id);
            }
        }
    }
}

} // namespace

// ============================================================================
// Repair routines
// ============================================================================

bool extract_accommodations(TripDocument& doc, AuditLog& log)
{
    if (!doc.itinerary) {
        return false;
    }

    const std::size_t before = log.mutation_count();
    const std::string now = infra::Time::now_iso();

    for (auto& location : doc.itinerary->locations) {
        const std::string text =
            location.legacy_accommodation_data ? String::trim(*location.legacy_accommodation_data)
                                               : std::string();

        if (!text.empty()) {
            bool already_extracted = false;
            for (const auto& id : location.accommodation_ids) {
                const Accommodation* existing = doc.find_accommodation(id);
                if (existing && String::trim(existing->accommodation_data) == text) {
                    already_extracted = true;
                    break;
                }
            }

            if (!already_extracted) {
                Accommodation accommodation;
                accommodation.id = unique_accommodation_id(doc, "acc-" + location.id);
                accommodation.name = derive_accommodation_name(text, location.name);
                accommodation.location_id = location.id;
                accommodation.accommodation_data = *location.legacy_accommodation_data;
                accommodation.is_public = location.legacy_accommodation_public.value_or(false);
                accommodation.created_at = now;
                accommodation.updated_at = now;

                location.accommodation_ids.push_back(accommodation.id);
                log.record(op::EXTRACT_ACCOMMODATION, "accommodation", accommodation.id,
                           location.id, "embedded accommodation text");
                doc.accommodations.push_back(std::move(accommodation));
            }
        }

        if (location.legacy_accommodation_data || location.legacy_accommodation_public) {
            location.legacy_accommodation_data.reset();
            location.legacy_accommodation_public.reset();
            log.record(op::CLEAR_LEGACY_FIELDS, "location", location.id, "",
                       "embedded accommodation fields removed");
        }

        move_accommodation_links(doc, location, log);
    }

    return log.mutation_count() > before;
}

bool purge_dangling_links(TripDocument& doc, AuditLog& log)
{
    const std::size_t before = log.mutation_count();
    const auto valid = expense_id_set(doc);

    model::for_each_item(doc, [&](ItemKind kind, const std::string& id,
                                  std::vector<CostTrackingLink>& links) {
        std::unordered_set<std::string> seen;
        std::vector<CostTrackingLink> kept;
        kept.reserve(links.size());

        for (auto& link : links) {
            if (valid.count(link.expense_id) == 0) {
                log.record(op::PURGE_LINK, model::to_string(kind), id, link.expense_id,
                           "expense does not exist in this trip");
                continue;
            }
            if (!seen.insert(link.expense_id).second) {
                log.record(op::DEDUPE_LINK, model::to_string(kind), id, link.expense_id,
                           "duplicate link");
                continue;
            }
            kept.push_back(std::move(link));
        }
        links = std::move(kept);
    });

    return log.mutation_count() > before;
}

bool synchronize_links(TripDocument& doc, AuditLog& log)
{
    const std::size_t before = log.mutation_count();

    // Expense side first: every reference must be mirrored by a link.
    if (doc.finance) {
        for (auto& expense : doc.finance->expenses) {
            if (!expense.travel_reference) {
                continue;
            }
            const ItemKind kind = expense.travel_reference->type;
            const std::string item_id = expense.travel_reference->item_id();

            if (item_id.empty()) {
                expense.travel_reference.reset();
                log.record(op::CLEAR_TRAVEL_REFERENCE, "expense", expense.id, "",
                           "reference names no item");
                continue;
            }

            std::vector<CostTrackingLink>* links = doc.links_of(kind, item_id);
            if (!links) {
                if (kind == ItemKind::Accommodation) {
                    continue;
                }
                expense.travel_reference.reset();
                log.record(op::CLEAR_TRAVEL_REFERENCE, "expense", expense.id, item_id,
                           std::string(model::to_string(kind)) + " " + item_id +
                               " does not exist");
                continue;
            }

            if (!has_link(*links, expense.id)) {
                links->push_back({expense.id, link_description(expense), ""});
                log.record(op::ADD_LINK, model::to_string(kind), item_id, expense.id,
                           "mirrors expense travel reference");
            }
        }
    }

    // Item side: every link must be mirrored by a reference.
    auto expenses = expense_map(doc);
    model::for_each_item(doc, [&](ItemKind kind, const std::string& id,
                                  std::vector<CostTrackingLink>& links) {
        for (const auto& link : links) {
            auto it = expenses.find(link.expense_id);
            if (it == expenses.end() || it->second->travel_reference) {
                continue;
            }
            TravelReference ref;
            ref.target(kind, id);
            ref.description = doc.item_display_name(kind, id);
            it->second->travel_reference = ref;
            log.record(op::ADD_TRAVEL_REFERENCE, "expense", link.expense_id, id,
                       std::string(model::to_string(kind)) + " " + id);
        }
    });

    return log.mutation_count() > before;
}

bool repair_placeholder_locations(TripDocument& doc, AuditLog& log)
{
    const std::size_t before = log.mutation_count();

    for (auto& accommodation : doc.accommodations) {
        if (!accommodation.location_id.empty() &&
            accommodation.location_id != PLACEHOLDER_LOCATION_ID &&
            doc.find_location(accommodation.location_id)) {
            continue;
        }

        const Location* owner = nullptr;
        if (doc.itinerary) {
            for (const auto& location : doc.itinerary->locations) {
                const auto& ids = location.accommodation_ids;
                if (std::find(ids.begin(), ids.end(), accommodation.id) != ids.end()) {
                    owner = &location;
                    break;
                }
            }
        }

        if (owner) {
            const std::string previous = accommodation.location_id;
            accommodation.location_id = owner->id;
            log.record(op::REBIND_ACCOMMODATION, "accommodation", accommodation.id, owner->id,
                       "previous location id '" + previous + "'");
        } else {
            log.record(op::ORPHANED_ACCOMMODATION, "accommodation", accommodation.id,
                       accommodation.location_id, "no location lists this accommodation", false);
        }
    }

    return log.mutation_count() > before;
}

bool recreate_missing_accommodations(TripDocument& doc, AuditLog& log)
{
    const std::size_t before = log.mutation_count();
    const std::string now = infra::Time::now_iso();

    auto create = [&](const std::string& id, const Location* owner) {
        Accommodation accommodation;
        accommodation.id = id;
        accommodation.location_id = owner ? owner->id : std::string();
        accommodation.created_at = now;
        accommodation.updated_at = now;
        accommodation.needs_review = true;

        if (doc.finance) {
            for (const auto& expense : doc.finance->expenses) {
                const auto& ref = expense.travel_reference;
                if (!ref || ref->type != ItemKind::Accommodation || ref->accommodation_id != id) {
                    continue;
                }
                if (accommodation.name.empty() && !ref->description.empty()) {
                    accommodation.name = ref->description;
                }
                accommodation.cost_tracking_links.push_back(
                    {expense.id, link_description(expense), ""});
            }
        }
        if (accommodation.name.empty()) {
            accommodation.name =
                owner ? "Accommodation in " + owner->name : std::string("Recovered accommodation");
        }

        log.record(op::RECREATE_ACCOMMODATION, "accommodation", id,
                   owner ? owner->id : std::string(),
                   owner ? "owned by location" : "referenced by expense");
        if (!owner) {
            log.record(op::ORPHANED_ACCOMMODATION, "accommodation", id, "",
                       "owning location cannot be derived", false);
        }
        doc.accommodations.push_back(std::move(accommodation));
    };

    if (doc.itinerary) {
        for (const auto& location : doc.itinerary->locations) {
            for (const auto& id : location.accommodation_ids) {
                if (!id.empty() && !doc.find_accommodation(id)) {
                    create(id, &location);
                }
            }
        }
    }

    if (doc.finance) {
        for (const auto& expense : doc.finance->expenses) {
            const auto& ref = expense.travel_reference;
            if (ref && ref->type == ItemKind::Accommodation && !ref->accommodation_id.empty() &&
                !doc.find_accommodation(ref->accommodation_id)) {
                Location* owner = doc.find_location(ref->location_id);
                if (owner && std::find(owner->accommodation_ids.begin(),
                                       owner->accommodation_ids.end(),
                                       ref->accommodation_id) == owner->accommodation_ids.end()) {
                    owner->accommodation_ids.push_back(ref->accommodation_id);
                }
                create(ref->accommodation_id, owner);
            }
        }
    }

    return log.mutation_count() > before;
}

bool integrity_sweep(TripDocument& doc, AuditLog& log)
{
    bool changed = purge_dangling_links(doc, log);
    changed = synchronize_links(doc, log) || changed;
    changed = repair_placeholder_locations(doc, log) || changed;
    changed = recreate_missing_accommodations(doc, log) || changed;
    return changed;
}

// ============================================================================
// Version transitions
// ============================================================================

namespace {

TripDocument finish_step(TripDocument doc, int to_version)
{
    doc.schema_version = to_version;
    doc.updated_at = infra::Time::now_iso();
    return doc;
}

} // namespace

TripDocument v1_to_v2(TripDocument doc, AuditLog& log)
{
    extract_accommodations(doc, log);
    return finish_step(std::move(doc), 2);
}

TripDocument v2_to_v3(TripDocument doc, AuditLog& log)
{
    // Documents written by the first extraction still carry accommodation
    // links on their locations; the same routine completes them.
    extract_accommodations(doc, log);
    return finish_step(std::move(doc), 3);
}

TripDocument v3_to_v4(TripDocument doc, AuditLog& log)
{
    purge_dangling_links(doc, log);
    return finish_step(std::move(doc), 4);
}

TripDocument v4_to_v5(TripDocument doc, AuditLog& log)
{
    synchronize_links(doc, log);
    return finish_step(std::move(doc), 5);
}

TripDocument v5_to_v6(TripDocument doc, AuditLog& log)
{
    repair_placeholder_locations(doc, log);
    return finish_step(std::move(doc), 6);
}

TripDocument v6_to_v7(TripDocument doc, AuditLog& log)
{
    recreate_missing_accommodations(doc, log);
    return finish_step(std::move(doc), 7);
}

const std::vector<Step>& chain()
{
    static const std::vector<Step> steps = {
        {1, "extract embedded accommodations", &v1_to_v2},
        {2, "complete accommodation extraction", &v2_to_v3},
        {3, "purge dangling expense links", &v3_to_v4},
        {4, "synchronize bidirectional links", &v4_to_v5},
        {5, "repair placeholder location references", &v5_to_v6},
        {6, "recreate missing accommodations", &v6_to_v7},
    };
    return steps;
}

} // namespace tripstore::migration
