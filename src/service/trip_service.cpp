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
 * @file trip_service.cpp
 * @brief Implementation of the trip operations.
 */

#include "tripstore/service/trip_service.hpp"

#include "tripstore/core/error.hpp"
#include "tripstore/infra/id_generator.hpp"
#include "tripstore/infra/logger.hpp"
#include "tripstore/infra/string.hpp"
#include "tripstore/infra/time.hpp"
#include "tripstore/links/link_editor.hpp"
#include "tripstore/migration/migrator.hpp"
#include "tripstore/service/update_feed.hpp"

#include <unordered_set>

namespace tripstore::service {

using infra::Logger;
using infra::LogLevel;
using model::Accommodation;
using model::TripDocument;

namespace {

std::int64_t stamp_of(const std::string& iso)
{
    return infra::Time::parse_iso(iso).value_or(0);
}

/// Ids still referenced from the itinerary or the finance section.
std::unordered_set<std::string> referenced_accommodations(const TripDocument& doc)
{
    std::unordered_set<std::string> ids;
    if (doc.itinerary) {
        for (const auto& location : doc.itinerary->locations) {
            ids.insert(location.accommodation_ids.begin(), location.accommodation_ids.end());
        }
    }
    if (doc.finance) {
        for (const auto& expense : doc.finance->expenses) {
            if (expense.travel_reference &&
                expense.travel_reference->type == model::ItemKind::Accommodation) {
                ids.insert(expense.travel_reference->accommodation_id);
            }
        }
    }
    return ids;
}

std::vector<Accommodation> merge_accommodations(const TripDocument& doc,
                                                const std::vector<Accommodation>& incoming)
{
    const std::string now = infra::Time::now_iso();
    std::vector<Accommodation> merged;
    std::unordered_set<std::string> incoming_ids;

    for (const auto& candidate : incoming) {
        incoming_ids.insert(candidate.id);
        const Accommodation* stored = doc.find_accommodation(candidate.id);

        if (stored && stamp_of(stored->updated_at) > stamp_of(candidate.updated_at)) {
            merged.push_back(*stored);
            continue;
        }

        Accommodation next = candidate;
        if (next.created_at.empty()) {
            next.created_at = stored && !stored->created_at.empty() ? stored->created_at : now;
        }
        if (next.updated_at.empty()) {
            next.updated_at = now;
        }
        merged.push_back(std::move(next));
    }

    const auto referenced = referenced_accommodations(doc);
    for (const auto& stored : doc.accommodations) {
        if (incoming_ids.count(stored.id) == 0 && referenced.count(stored.id) > 0) {
            merged.push_back(stored);
        }
    }
    return merged;
}

} // namespace

TripDocument TripService::require(const std::string& trip_id)
{
    auto doc = store_.load(trip_id);
    if (!doc) {
        throw NotFoundError(ErrorCode::TRIP_NOT_FOUND, "Trip " + trip_id + " not found");
    }
    return std::move(*doc);
}

TripService::EditGuard::EditGuard(TripService& service, const std::string& trip_id)
    : service_(service), trip_id_(trip_id)
{
    {
        std::unique_lock<std::mutex> registry(service_.locks_mutex_);
        auto& slot = service_.locks_[trip_id_];
        if (!slot) {
            slot = std::make_shared<std::mutex>();
        }
        mutex_ = slot;
    }
    lock_ = std::unique_lock<std::mutex>(*mutex_);
}

TripService::EditGuard::~EditGuard()
{
    lock_.unlock();
    lock_.release();

    std::unique_lock<std::mutex> registry(service_.locks_mutex_);
    mutex_.reset();
    auto it = service_.locks_.find(trip_id_);
    if (it != service_.locks_.end() && it->second.use_count() == 1) {
        service_.locks_.erase(it);
    }
}

std::size_t TripService::edit_lock_count()
{
    std::unique_lock<std::mutex> registry(locks_mutex_);
    return locks_.size();
}

TripDocument TripService::commit(TripDocument doc)
{
    auto result = migration::Migrator::migrate_to_latest(std::move(doc));
    result.document.updated_at = infra::Time::now_iso();
    store_.save(result.document);
    return std::move(result.document);
}

std::optional<TripDocument> TripService::load_document(const std::string& trip_id)
{
    return store_.load(trip_id);
}

void TripService::save_document(TripDocument doc)
{
    if (doc.schema_version == 0) {
        doc.schema_version = migration::CURRENT_SCHEMA_VERSION;
    }
    storage::Engine::require_valid_id(doc.id);
    EditGuard guard(*this, doc.id);
    commit(std::move(doc));
}

TripDocument TripService::create_trip(const std::string& title, const std::string& description,
                                      const std::string& start_date, const std::string& end_date)
{
    if (infra::String::trim(title).empty()) {
        throw ValidationError(ErrorCode::VALIDATION, "Trip title is required",
                              {"Trip title is required"});
    }

    const std::string now = infra::Time::now_iso();
    TripDocument doc;
    doc.schema_version = migration::CURRENT_SCHEMA_VERSION;
    doc.id = infra::IdGenerator::timestamped("trip", true);
    doc.title = infra::String::trim(title);
    doc.description = description;
    doc.start_date = infra::Time::normalize_iso(start_date);
    doc.end_date = infra::Time::normalize_iso(end_date);
    doc.created_at = now;
    doc.updated_at = now;
    doc.itinerary = model::Itinerary{};

    store_.save(doc);
    Logger::log(LogLevel::INFO, "Service: Created trip " + doc.id + " (" + doc.title + ")");
    return doc;
}

TripDocument TripService::update_itinerary(const std::string& trip_id, const ItineraryPatch& patch)
{
    EditGuard guard(*this, trip_id);

    const TripDocument previous = require(trip_id);
    TripDocument doc = previous;

    if (patch.title && !patch.title->empty()) {
        doc.title = *patch.title;
    }
    if (patch.description && !patch.description->empty()) {
        doc.description = *patch.description;
    }
    if (patch.start_date && !patch.start_date->empty()) {
        doc.start_date = infra::Time::normalize_iso(*patch.start_date);
    }
    if (patch.end_date && !patch.end_date->empty()) {
        doc.end_date = infra::Time::normalize_iso(*patch.end_date);
    }

    if (!doc.itinerary) {
        doc.itinerary = model::Itinerary{};
    }
    if (patch.locations) {
        doc.itinerary->locations = *patch.locations;
    }
    if (patch.routes) {
        doc.itinerary->routes = *patch.routes;
    }
    if (patch.days_json) {
        doc.itinerary->days_json = *patch.days_json;
    }
    if (patch.accommodations) {
        doc.accommodations = merge_accommodations(doc, *patch.accommodations);
    }

    links::BoundaryValidator::validate_itinerary_links(doc).raise_if_invalid();

    UpdateFeed::publish(doc, UpdateFeed::diff(previous, patch.locations ? &*patch.locations : nullptr,
                                              patch.routes ? &*patch.routes : nullptr));

    TripDocument saved = commit(std::move(doc));
    Logger::log(LogLevel::INFO, "Service: Updated itinerary of trip " + trip_id);
    return saved;
}

TripDocument TripService::update_finance(const std::string& trip_id, const FinancePatch& patch)
{
    EditGuard guard(*this, trip_id);

    TripDocument doc = require(trip_id);
    model::Finance finance = doc.finance.value_or(model::Finance{});

    if (patch.overall_budget) {
        finance.overall_budget = *patch.overall_budget;
    }
    if (patch.reserved_budget) {
        finance.reserved_budget = patch.reserved_budget;
    }
    if (patch.currency && !patch.currency->empty()) {
        finance.currency = *patch.currency;
    }
    if (patch.country_budgets) {
        finance.country_budgets = *patch.country_budgets;
    }
    if (patch.expenses) {
        finance.expenses = *patch.expenses;
    }
    if (patch.custom_categories) {
        finance.custom_categories = *patch.custom_categories;
    }
    if (patch.import_metadata) {
        finance.import_metadata = *patch.import_metadata;
    }
    doc.finance = std::move(finance);

    links::BoundaryValidator::validate_expense_references(doc).raise_if_invalid();

    TripDocument saved = commit(std::move(doc));
    Logger::log(LogLevel::INFO, "Service: Updated cost data of trip " + trip_id);
    return saved;
}

links::LinkValidation TripService::validate_link(const std::string& trip_id,
                                                 const std::string& expense_id,
                                                 const std::optional<links::ItemRef>& target)
{
    const TripDocument doc = require(trip_id);
    return links::BoundaryValidator::validate_link(doc, expense_id, target);
}

TripDocument TripService::link_expense(const std::string& trip_id, const std::string& expense_id,
                                       const std::optional<links::ItemRef>& target)
{
    EditGuard guard(*this, trip_id);

    TripDocument doc = require(trip_id);
    links::LinkEditor(doc).apply(expense_id, target).raise_if_invalid();
    return commit(std::move(doc));
}

links::LinkIndex TripService::build_link_index(const std::string& trip_id)
{
    const TripDocument doc = require(trip_id);
    links::LinkIndex index = links::LinkIndex::build(links::ItineraryView::of(doc));
    if (doc.finance) {
        const std::size_t hydrated = index.hydrate(doc.finance->expenses);
        if (hydrated > 0) {
            Logger::log(LogLevel::DEBUG, "Service: Link index of trip " + trip_id + " hydrated " +
                                             std::to_string(hydrated) + " references");
        }
    }
    return index;
}

ImportReport TripService::import_expenses(const std::string& trip_id,
                                          std::vector<model::Expense> expenses)
{
    EditGuard guard(*this, trip_id);

    TripDocument doc = require(trip_id);
    if (!doc.finance) {
        doc.finance = model::Finance{};
    }
    model::Finance& finance = *doc.finance;

    auto& imported = finance.import_metadata.imported_transaction_hashes;
    std::unordered_set<std::string> hashes(imported.begin(), imported.end());
    std::unordered_set<std::string> external_ids;
    std::unordered_set<std::string> expense_ids;
    for (const auto& expense : finance.expenses) {
        if (!expense.import_hash.empty()) {
            hashes.insert(expense.import_hash);
        }
        if (!expense.external_transaction_id.empty()) {
            external_ids.insert(expense.external_transaction_id);
        }
        expense_ids.insert(expense.id);
    }

    ImportReport report;
    for (auto& expense : expenses) {
        if ((!expense.import_hash.empty() && hashes.count(expense.import_hash) > 0) ||
            (!expense.external_transaction_id.empty() &&
             external_ids.count(expense.external_transaction_id) > 0)) {
            ++report.skipped;
            continue;
        }
        if (expense.id.empty() || expense_ids.count(expense.id) > 0) {
            expense.id = infra::IdGenerator::timestamped("expense");
        }

        if (!expense.import_hash.empty()) {
            hashes.insert(expense.import_hash);
            imported.push_back(expense.import_hash);
        }
        if (!expense.external_transaction_id.empty()) {
            external_ids.insert(expense.external_transaction_id);
        }
        expense_ids.insert(expense.id);
        report.added_ids.push_back(expense.id);
        finance.expenses.push_back(std::move(expense));
    }

    if (report.added_ids.empty()) {
        return report;
    }

    links::BoundaryValidator::validate_expense_references(doc).raise_if_invalid();
    commit(std::move(doc));

    Logger::log(LogLevel::INFO, "Service: Imported " + std::to_string(report.added_ids.size()) +
                                    " expenses into trip " + trip_id + " (" +
                                    std::to_string(report.skipped) + " duplicates skipped)");
    return report;
}

storage::BackupRecord TripService::delete_trip(const std::string& trip_id, const std::string& reason)
{
    EditGuard guard(*this, trip_id);
    return store_.remove_trip(trip_id, reason);
}

storage::BackupRecord TripService::delete_finance(const std::string& trip_id,
                                                  const std::string& reason)
{
    EditGuard guard(*this, trip_id);
    return store_.remove_finance(trip_id, reason);
}

TripDocument TripService::restore_trip(const std::string& backup_id, bool overwrite)
{
    auto record = store_.catalog().get_backup_by_id(backup_id);
    if (!record) {
        throw NotFoundError(ErrorCode::BACKUP_NOT_FOUND, "Backup " + backup_id + " not found");
    }
    EditGuard guard(*this, record->original_id);
    return store_.restore_trip(backup_id, overwrite);
}

TripDocument TripService::restore_finance(const std::string& backup_id,
                                          const std::string& target_trip_id, bool overwrite)
{
    auto record = store_.catalog().get_backup_by_id(backup_id);
    if (!record) {
        throw NotFoundError(ErrorCode::BACKUP_NOT_FOUND, "Backup " + backup_id + " not found");
    }
    EditGuard guard(*this, target_trip_id.empty() ? record->original_id : target_trip_id);
    return store_.restore_finance(backup_id, target_trip_id, overwrite);
}

} // namespace tripstore::service
