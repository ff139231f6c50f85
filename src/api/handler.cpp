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
 * @file handler.cpp
 * @brief Implementation of the command dispatcher.
 *
 * @details
 * Request lifecycle:
 * 1. **Ingest**: parse the raw line as JSON.
 * 2. **Decode**: read the `action` and its arguments.
 * 3. **Execute**: route to the trip service or the backup catalog.
 * 4. **Respond**: marshal the result, or the typed error, into JSON.
 */

#include "tripstore/api/handler.hpp"

#include "tripstore/core/error.hpp"
#include "tripstore/infra/logger.hpp"
#include "tripstore/model/codec.hpp"
#include "tripstore/model/json.hpp"

#include <cJSON.h>

#include <stdexcept>

namespace tripstore::api {

using infra::Logger;
using infra::LogLevel;
using model::ItemKind;

namespace {

const char* kGoodbye = "{\"status\":\"goodbye\",\"message\":\"Closing connection\"}";

std::string require_arg(const cJSON* req, const char* key)
{
    std::string value = json::get_string(req, key);
    if (value.empty()) {
        throw ValidationError(ErrorCode::VALIDATION,
                              std::string("Missing argument: '") + key + "'");
    }
    return value;
}

const cJSON* require_object(const cJSON* req, const char* key)
{
    const cJSON* node = cJSON_GetObjectItemCaseSensitive(req, key);
    if (!cJSON_IsObject(node)) {
        throw ValidationError(ErrorCode::VALIDATION,
                              std::string("Missing payload: '") + key + "'");
    }
    return node;
}

bool has(const cJSON* obj, const char* key)
{
    return cJSON_GetObjectItemCaseSensitive(obj, key) != nullptr;
}

std::optional<std::string> optional_string(const cJSON* obj, const char* key)
{
    const cJSON* node = cJSON_GetObjectItemCaseSensitive(obj, key);
    if (!cJSON_IsString(node)) {
        return std::nullopt;
    }
    return std::string(node->valuestring);
}

/// Absent type and id mean "unlink"; a type without an id (or the reverse) is rejected.
std::optional<links::ItemRef> item_ref_of(const cJSON* req)
{
    const std::string type = json::get_string(req, "travelItemType");
    const std::string id = json::get_string(req, "travelItemId");
    if (type.empty() && id.empty()) {
        return std::nullopt;
    }
    const auto kind = model::parse_item_kind(type);
    if (!kind || id.empty()) {
        throw ValidationError(ErrorCode::VALIDATION,
                              "Invalid travel item: type '" + type + "', id '" + id + "'");
    }
    return links::ItemRef{*kind, id};
}

// ============================================================================
// Encoders
// ============================================================================

json::Ptr summary_to_json(const storage::TripSummary& summary)
{
    json::Ptr node(cJSON_CreateObject());
    cJSON_AddStringToObject(node.get(), "id", summary.id.c_str());
    cJSON_AddStringToObject(node.get(), "title", summary.title.c_str());
    json::add_string_if(node.get(), "startDate", summary.start_date);
    json::add_string_if(node.get(), "endDate", summary.end_date);
    json::add_string_if(node.get(), "createdAt", summary.created_at);
    json::add_string_if(node.get(), "updatedAt", summary.updated_at);
    cJSON_AddBoolToObject(node.get(), "hasTravelData", summary.has_itinerary);
    cJSON_AddBoolToObject(node.get(), "hasCostData", summary.has_finance);
    cJSON_AddBoolToObject(node.get(), "legacy", summary.legacy);
    return node;
}

json::Ptr validation_to_json(const links::LinkValidation& result)
{
    json::Ptr node(cJSON_CreateObject());
    cJSON_AddBoolToObject(node.get(), "valid", result.valid);
    if (result.code) {
        cJSON_AddStringToObject(node.get(), "code", to_string(*result.code));
    }
    cJSON* violations = cJSON_AddArrayToObject(node.get(), "violations");
    for (const auto& violation : result.violations) {
        cJSON* entry = cJSON_CreateObject();
        cJSON_AddStringToObject(entry, "code", to_string(violation.code));
        cJSON_AddStringToObject(entry, "entityId", violation.entity_id.c_str());
        cJSON_AddStringToObject(entry, "message", violation.message.c_str());
        cJSON_AddItemToArray(violations, entry);
    }
    return node;
}

cJSON* descriptor_to_json(const links::TravelDescriptor& descriptor)
{
    cJSON* node = cJSON_CreateObject();
    cJSON_AddStringToObject(node, "type", model::to_string(descriptor.kind));
    cJSON_AddStringToObject(node, "id", descriptor.id.c_str());
    cJSON_AddStringToObject(node, "name", descriptor.name.c_str());
    json::add_string_if(node, "locationName", descriptor.location_name);
    cJSON_AddStringToObject(node, "tripTitle", descriptor.trip_title.c_str());
    return node;
}

json::Ptr stats_to_json(const storage::StorageStats& stats)
{
    json::Ptr node(cJSON_CreateObject());
    cJSON_AddNumberToObject(node.get(), "totalCount", static_cast<double>(stats.total_count));
    cJSON_AddNumberToObject(node.get(), "totalSize", static_cast<double>(stats.total_size));
    cJSON_AddNumberToObject(node.get(), "averageSize", stats.average_size);
    json::add_string_if(node.get(), "oldestBackup", stats.oldest_backup);
    json::add_string_if(node.get(), "newestBackup", stats.newest_backup);

    cJSON* by_type = cJSON_AddObjectToObject(node.get(), "byType");
    auto usage = [&](const char* key, const storage::TypeUsage& u) {
        cJSON* entry = cJSON_AddObjectToObject(by_type, key);
        cJSON_AddNumberToObject(entry, "count", static_cast<double>(u.count));
        cJSON_AddNumberToObject(entry, "size", static_cast<double>(u.size));
    };
    usage("trip", stats.trip);
    usage("cost", stats.cost);
    return node;
}

json::Ptr records_to_json(const std::vector<storage::BackupRecord>& records)
{
    json::Ptr array(cJSON_CreateArray());
    for (const auto& record : records) {
        cJSON_AddItemToArray(array.get(), storage::to_json(record));
    }
    return array;
}

json::Ptr strings_to_json(const std::vector<std::string>& values)
{
    json::Ptr array(cJSON_CreateArray());
    for (const auto& value : values) {
        cJSON_AddItemToArray(array.get(), cJSON_CreateString(value.c_str()));
    }
    return array;
}

// ============================================================================
// Decoders
// ============================================================================

service::ItineraryPatch itinerary_patch_of(const cJSON* data)
{
    service::ItineraryPatch patch;
    patch.title = optional_string(data, "title");
    patch.description = optional_string(data, "description");
    patch.start_date = optional_string(data, "startDate");
    patch.end_date = optional_string(data, "endDate");

    const cJSON* travel = cJSON_GetObjectItemCaseSensitive(data, "travelData");
    if (!cJSON_IsObject(travel)) {
        travel = data;
    }

    const cJSON* node = nullptr;
    if (cJSON_IsArray(cJSON_GetObjectItemCaseSensitive(travel, "locations"))) {
        patch.locations.emplace();
        cJSON_ArrayForEach(node, cJSON_GetObjectItemCaseSensitive(travel, "locations"))
        {
            if (cJSON_IsObject(node)) {
                patch.locations->push_back(model::codec::location_from_json(node));
            }
        }
    }
    if (cJSON_IsArray(cJSON_GetObjectItemCaseSensitive(travel, "routes"))) {
        patch.routes.emplace();
        cJSON_ArrayForEach(node, cJSON_GetObjectItemCaseSensitive(travel, "routes"))
        {
            if (cJSON_IsObject(node)) {
                patch.routes->push_back(model::codec::route_from_json(node));
            }
        }
    }
    const cJSON* days = cJSON_GetObjectItemCaseSensitive(travel, "days");
    if (cJSON_IsArray(days)) {
        patch.days_json = json::print(days);
    }

    const cJSON* accommodations = cJSON_GetObjectItemCaseSensitive(data, "accommodations");
    if (cJSON_IsArray(accommodations)) {
        patch.accommodations = model::codec::accommodations_from_json(accommodations);
    }
    return patch;
}

service::FinancePatch finance_patch_of(const cJSON* data)
{
    const model::Finance parsed = model::codec::finance_from_json(data);

    service::FinancePatch patch;
    if (has(data, "overallBudget")) {
        patch.overall_budget = parsed.overall_budget;
    }
    if (has(data, "reservedBudget")) {
        patch.reserved_budget = parsed.reserved_budget;
    }
    patch.currency = optional_string(data, "currency");
    if (has(data, "countryBudgets")) {
        patch.country_budgets = parsed.country_budgets;
    }
    if (has(data, "expenses")) {
        patch.expenses = parsed.expenses;
    }
    if (has(data, "customCategories")) {
        patch.custom_categories = parsed.custom_categories;
    }
    if (has(data, "importMetadata") || has(data, "ynabImportData")) {
        patch.import_metadata = parsed.import_metadata;
    }
    return patch;
}

// ============================================================================
// Dispatch
// ============================================================================

json::Ptr link_index_of(service::TripService& service, const cJSON* req)
{
    const std::string trip_id = require_arg(req, "tripId");
    const links::LinkIndex index = service.build_link_index(trip_id);

    json::Ptr node(cJSON_CreateObject());
    cJSON_AddStringToObject(node.get(), "tripId", index.trip_id().c_str());
    cJSON_AddNumberToObject(node.get(), "size", static_cast<double>(index.size()));

    const auto target = item_ref_of(req);
    if (target) {
        cJSON_AddItemToObject(node.get(), "expenseIds",
                              strings_to_json(index.reverse_lookup(target->kind, target->id))
                                  .release());
        return node;
    }

    std::vector<std::string> expense_ids;
    const std::string single = json::get_string(req, "expenseId");
    if (!single.empty()) {
        expense_ids.push_back(single);
    } else if (auto doc = service.load_document(trip_id); doc && doc->finance) {
        for (const auto& expense : doc->finance->expenses) {
            expense_ids.push_back(expense.id);
        }
    }

    cJSON* links = cJSON_AddArrayToObject(node.get(), "links");
    for (const auto& expense_id : expense_ids) {
        const auto descriptors = index.lookup_all(expense_id);
        if (descriptors.empty()) {
            continue;
        }
        cJSON* entry = cJSON_CreateObject();
        cJSON_AddStringToObject(entry, "expenseId", expense_id.c_str());
        cJSON* items = cJSON_AddArrayToObject(entry, "items");
        for (const auto& descriptor : descriptors) {
            cJSON_AddItemToArray(items, descriptor_to_json(descriptor));
        }
        cJSON_AddItemToArray(links, entry);
    }
    return node;
}

json::Ptr dispatch(service::TripService& service, const storage::GcOptions& gc_defaults,
                   const std::string& action, const cJSON* req)
{
    storage::BackupCatalog& catalog = service.store().catalog();

    if (action == "load") {
        const std::string trip_id = require_arg(req, "tripId");
        auto doc = service.load_document(trip_id);
        if (!doc) {
            throw NotFoundError(ErrorCode::TRIP_NOT_FOUND, "Trip " + trip_id + " not found");
        }
        return model::codec::to_json(*doc);
    }
    if (action == "save") {
        model::TripDocument doc = model::codec::from_json(require_object(req, "data"));
        const std::string id = doc.id;
        service.save_document(std::move(doc));
        json::Ptr node(cJSON_CreateObject());
        cJSON_AddStringToObject(node.get(), "id", id.c_str());
        return node;
    }
    if (action == "create") {
        return model::codec::to_json(service.create_trip(
            json::get_string(req, "title"), json::get_string(req, "description"),
            json::get_string(req, "startDate"), json::get_string(req, "endDate")));
    }
    if (action == "update_itinerary") {
        const std::string trip_id = require_arg(req, "tripId");
        return model::codec::to_json(
            service.update_itinerary(trip_id, itinerary_patch_of(require_object(req, "data"))));
    }
    if (action == "update_finance") {
        const std::string trip_id = require_arg(req, "tripId");
        return model::codec::to_json(
            service.update_finance(trip_id, finance_patch_of(require_object(req, "data"))));
    }
    if (action == "validate_link") {
        return validation_to_json(service.validate_link(
            require_arg(req, "tripId"), require_arg(req, "expenseId"), item_ref_of(req)));
    }
    if (action == "link_expense") {
        return model::codec::to_json(service.link_expense(
            require_arg(req, "tripId"), require_arg(req, "expenseId"), item_ref_of(req)));
    }
    if (action == "link_index") {
        return link_index_of(service, req);
    }
    if (action == "import_expenses") {
        const std::string trip_id = require_arg(req, "tripId");
        const cJSON* expenses = cJSON_GetObjectItemCaseSensitive(req, "expenses");
        if (!cJSON_IsArray(expenses)) {
            throw ValidationError(ErrorCode::VALIDATION, "Missing payload: 'expenses'");
        }
        const service::ImportReport report =
            service.import_expenses(trip_id, model::codec::expenses_from_json(expenses));
        json::Ptr node(cJSON_CreateObject());
        cJSON_AddItemToObject(node.get(), "addedIds", strings_to_json(report.added_ids).release());
        cJSON_AddNumberToObject(node.get(), "skipped", static_cast<double>(report.skipped));
        return node;
    }
    if (action == "list_trips") {
        json::Ptr array(cJSON_CreateArray());
        for (const auto& summary : service.list_trips()) {
            cJSON_AddItemToArray(array.get(), summary_to_json(summary).release());
        }
        return array;
    }
    if (action == "delete_trip") {
        return json::Ptr(storage::to_json(
            service.delete_trip(require_arg(req, "tripId"), json::get_string(req, "reason"))));
    }
    if (action == "delete_finance") {
        return json::Ptr(storage::to_json(
            service.delete_finance(require_arg(req, "tripId"), json::get_string(req, "reason"))));
    }
    if (action == "restore_trip") {
        return model::codec::to_json(service.restore_trip(require_arg(req, "backupId"),
                                                          json::get_bool(req, "overwrite")));
    }
    if (action == "restore_finance") {
        return model::codec::to_json(service.restore_finance(
            require_arg(req, "backupId"), json::get_string(req, "targetTripId"),
            json::get_bool(req, "overwrite")));
    }
    if (action == "list_backups") {
        storage::BackupFilter filter;
        const std::string type = json::get_string(req, "type");
        if (!type.empty()) {
            filter.type = storage::parse_backup_type(type);
            if (!filter.type) {
                throw ValidationError(ErrorCode::VALIDATION, "Unknown backup type: " + type);
            }
        }
        filter.date_from = json::get_string(req, "dateFrom");
        filter.date_to = json::get_string(req, "dateTo");
        filter.query = json::get_string(req, "query");

        json::Ptr node(cJSON_CreateObject());
        cJSON_AddItemToObject(node.get(), "backups",
                              records_to_json(catalog.list_backups(filter)).release());
        cJSON_AddItemToObject(node.get(), "stats",
                              stats_to_json(catalog.storage_stats()).release());
        return node;
    }
    if (action == "verify_backup") {
        const storage::IntegrityReport report =
            catalog.verify_integrity(require_arg(req, "backupId"));
        json::Ptr node(cJSON_CreateObject());
        cJSON_AddStringToObject(node.get(), "backupId", report.backup_id.c_str());
        cJSON_AddBoolToObject(node.get(), "valid", report.ok());
        cJSON_AddBoolToObject(node.get(), "fileExists", report.file_exists);
        cJSON_AddStringToObject(node.get(), "expectedChecksum",
                                report.expected_checksum.c_str());
        cJSON_AddStringToObject(node.get(), "actualChecksum", report.actual_checksum.c_str());
        return node;
    }
    if (action == "sync_backups") {
        const storage::SyncReport report = catalog.synchronize();
        json::Ptr node(cJSON_CreateObject());
        cJSON_AddNumberToObject(node.get(), "added", static_cast<double>(report.added));
        cJSON_AddNumberToObject(node.get(), "removed", static_cast<double>(report.removed));
        cJSON_AddItemToObject(node.get(), "errors", strings_to_json(report.errors).release());
        return node;
    }
    if (action == "gc_backups") {
        storage::GcOptions options = gc_defaults;
        if (auto days = json::get_number(req, "retentionDays")) {
            options.retention_days = static_cast<int>(*days);
        }
        if (auto keep = json::get_number(req, "keepLatest")) {
            options.keep_latest = *keep < 0 ? 0 : static_cast<std::size_t>(*keep);
        }
        options.dry_run = json::get_bool(req, "dryRun");

        json::Ptr node(cJSON_CreateObject());
        cJSON_AddBoolToObject(node.get(), "dryRun", options.dry_run);
        cJSON_AddItemToObject(node.get(), "removed",
                              records_to_json(catalog.garbage_collect(options)).release());
        return node;
    }

    throw ValidationError(ErrorCode::VALIDATION, "Unknown action: " + action);
}

std::string error_response(const char* code, const std::string& message,
                           const std::vector<std::string>& violations = {})
{
    json::Ptr root(cJSON_CreateObject());
    cJSON_AddStringToObject(root.get(), "status", "error");
    if (code) {
        cJSON_AddStringToObject(root.get(), "code", code);
    }
    cJSON_AddStringToObject(root.get(), "message", message.c_str());
    if (!violations.empty()) {
        cJSON_AddItemToObject(root.get(), "violations", strings_to_json(violations).release());
    }
    return json::print(root.get());
}

} // namespace

std::string Handler::process(const std::string& raw_json)
{
    if (raw_json.empty()) {
        return error_response(to_string(ErrorCode::VALIDATION), "Empty request payload");
    }

    json::Ptr req = json::parse(raw_json);
    if (!req || !cJSON_IsObject(req.get())) {
        return "{\"status\":\"error\",\"message\":\"Invalid JSON syntax\"}";
    }

    const std::string action = json::get_string(req.get(), "action");
    if (action == "exit") {
        return kGoodbye;
    }

    try {
        json::Ptr data = dispatch(service_, gc_defaults_, action, req.get());

        json::Ptr root(cJSON_CreateObject());
        cJSON_AddStringToObject(root.get(), "status", "ok");
        cJSON_AddItemToObject(root.get(), "data", data.release());
        return json::print(root.get());
    } catch (const ValidationError& e) {
        return error_response(to_string(e.code()), e.what(), e.violations());
    } catch (const Error& e) {
        return error_response(to_string(e.code()), e.what());
    } catch (const std::invalid_argument& e) {
        return error_response(to_string(ErrorCode::VALIDATION), e.what());
    } catch (const std::exception& e) {
        Logger::log(LogLevel::ERROR, "Handler: Action '" + action + "' failed: " + e.what());
        return error_response(nullptr, e.what());
    }
}

bool Handler::is_goodbye(const std::string& response)
{
    return response == kGoodbye;
}

} // namespace tripstore::api
