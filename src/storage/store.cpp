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
 * @file store.cpp
 * @brief Implementation of the trip store.
 */

#include "tripstore/storage/store.hpp"

#include "tripstore/core/error.hpp"
#include "tripstore/infra/logger.hpp"
#include "tripstore/infra/time.hpp"
#include "tripstore/links/link_editor.hpp"
#include "tripstore/migration/migrator.hpp"
#include "tripstore/model/codec.hpp"
#include "tripstore/model/json.hpp"
#include "tripstore/storage/recovery.hpp"

#include <cJSON.h>

#include <algorithm>
#include <filesystem>
#include <map>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace tripstore::storage {

using infra::Logger;
using infra::LogLevel;
using migration::Migrator;

namespace {

std::optional<TripSummary> summarize(const cJSON* root)
{
    if (!cJSON_IsObject(root)) {
        return std::nullopt;
    }
    TripSummary summary;
    summary.id = json::get_string(root, "id");
    summary.title = json::get_string(root, "title");
    summary.start_date = json::get_date(root, "startDate");
    summary.end_date = json::get_date(root, "endDate");
    summary.created_at = json::get_date(root, "createdAt");
    summary.updated_at = json::get_date(root, "updatedAt");
    summary.has_itinerary = cJSON_IsObject(cJSON_GetObjectItemCaseSensitive(root, "travelData"));
    summary.has_finance = cJSON_IsObject(cJSON_GetObjectItemCaseSensitive(root, "costData"));
    return summary;
}

} // namespace

Store::Store(std::string data_dir, infra::Scheduler& scheduler, BackupCatalog& catalog)
    : engine_(std::move(data_dir)), legacy_(engine_), catalog_(catalog), writes_(scheduler)
{
    engine_.init();
}

std::optional<model::TripDocument> Store::load(const std::string& trip_id)
{
    Engine::require_valid_id(trip_id);

    const auto raw = Engine::read_file(engine_.trip_path(trip_id));
    if (!raw) {
        auto bundle = legacy_.find(trip_id);
        if (!bundle) {
            return std::nullopt;
        }
        auto result = Migrator::migrate_to_latest(std::move(bundle->document));
        save(result.document);
        legacy_.retire(*bundle);
        Logger::log(LogLevel::INFO, "Store: Imported legacy trip " + trip_id);
        return std::move(result.document);
    }

    model::TripDocument doc;
    bool recovered = false;

    std::size_t error_offset = 0;
    json::Ptr root = json::parse(*raw, &error_offset);
    if (root && cJSON_IsObject(root.get())) {
        doc = model::codec::from_json(root.get());
    } else {
        Logger::log(LogLevel::WARN, "Store: Trip " + trip_id + " failed to parse at byte " +
                                        std::to_string(error_offset) + ", attempting recovery");
        auto salvaged = Recovery::salvage(*raw, trip_id);
        if (!salvaged) {
            Logger::log(LogLevel::ERROR,
                        "Store: Trip " + trip_id + " is corrupted beyond recovery");
            return std::nullopt;
        }
        engine_.quarantine(trip_id, *raw);
        Logger::log(LogLevel::WARN, "Store: Recovered trip " + trip_id + " from the first " +
                                        std::to_string(salvaged->kept_bytes) + " bytes");
        doc = std::move(salvaged->document);
        recovered = true;
    }

    if (doc.id.empty()) {
        doc.id = trip_id;
    } else if (doc.id != trip_id) {
        Logger::log(LogLevel::WARN, "Store: File of trip " + trip_id + " carries id " + doc.id);
        doc.id = trip_id;
    }

    auto result = Migrator::migrate_to_latest(std::move(doc));
    if (recovered || result.changed()) {
        save(result.document);
    }
    return std::move(result.document);
}

void Store::save(const model::TripDocument& doc)
{
    save_async(doc).get();
}

std::shared_future<void> Store::save_async(const model::TripDocument& doc)
{
    Engine::require_valid_id(doc.id);
    if (doc.schema_version != migration::CURRENT_SCHEMA_VERSION) {
        throw InvalidSchemaVersionError("Refusing to write trip " + doc.id + " at schema version " +
                                        std::to_string(doc.schema_version));
    }

    const std::string path = engine_.trip_path(doc.id);
    std::string content = model::codec::serialize(doc);

    return writes_.submit(path, [path, content = std::move(content)]() {
        Engine::write_atomic(path, content);
    });
}

bool Store::exists(const std::string& trip_id) const
{
    if (!Engine::valid_trip_id(trip_id)) {
        return false;
    }
    std::error_code ec;
    return fs::exists(engine_.trip_path(trip_id), ec) ||
           fs::exists(engine_.legacy_travel_path(trip_id), ec);
}

std::vector<TripSummary> Store::list_trips() const
{
    std::vector<TripSummary> trips;
    std::set<std::string> seen;

    for (const auto& id : engine_.list_trip_ids()) {
        const auto raw = Engine::read_file(engine_.trip_path(id));
        json::Ptr root = raw ? json::parse(*raw) : json::Ptr();
        auto summary = root ? summarize(root.get()) : std::nullopt;
        if (!summary) {
            Logger::log(LogLevel::WARN, "Store: Skipping unreadable trip file for " + id);
            continue;
        }
        summary->id = id;
        seen.insert(id);
        trips.push_back(std::move(*summary));
    }

    for (const auto& id : legacy_.list_ids()) {
        if (seen.count(id) > 0) {
            continue;
        }
        auto bundle = legacy_.find(id);
        if (!bundle) {
            continue;
        }
        TripSummary summary;
        summary.id = id;
        summary.title = bundle->document.title;
        summary.start_date = bundle->document.start_date;
        summary.end_date = bundle->document.end_date;
        summary.created_at = bundle->document.created_at;
        summary.updated_at = bundle->document.updated_at;
        summary.has_itinerary = bundle->document.itinerary.has_value();
        summary.has_finance = bundle->document.finance.has_value();
        summary.legacy = true;
        trips.push_back(std::move(summary));
    }

    std::stable_sort(trips.begin(), trips.end(), [](const auto& a, const auto& b) {
        return infra::Time::parse_iso(a.created_at).value_or(0) >
               infra::Time::parse_iso(b.created_at).value_or(0);
    });
    return trips;
}

std::string Store::write_backup(const model::TripDocument& doc, BackupType type,
                                const std::string& reason)
{
    json::Ptr root = model::codec::to_json(doc);

    cJSON* meta = cJSON_AddObjectToObject(root.get(), "backupMetadata");
    cJSON_AddStringToObject(meta, "deletedAt", infra::Time::now_iso().c_str());
    cJSON_AddStringToObject(meta, "originalId", doc.id.c_str());
    cJSON_AddStringToObject(meta, "backupType", to_string(type));
    json::add_string_if(meta, "reason", reason);

    fs::create_directories(engine_.backups_dir());
    const std::string path = engine_.backup_path(to_string(type), doc.id);
    Engine::write_atomic(path, json::print(root.get(), true));
    return path;
}

model::TripDocument Store::read_backup(const BackupRecord& record) const
{
    const auto raw = Engine::read_file(record.file_path);
    if (!raw) {
        throw NotFoundError(ErrorCode::BACKUP_NOT_FOUND,
                            "Backup file " + record.file_path + " is missing");
    }
    json::Ptr root = json::parse(*raw);
    if (!root || !cJSON_IsObject(root.get())) {
        throw std::runtime_error("Backup file " + record.file_path + " is not valid JSON");
    }
    cJSON_DeleteItemFromObjectCaseSensitive(root.get(), "backupMetadata");
    return model::codec::from_json(root.get());
}

BackupRecord Store::remove_trip(const std::string& trip_id, const std::string& reason)
{
    auto doc = load(trip_id);
    if (!doc) {
        throw NotFoundError(ErrorCode::TRIP_NOT_FOUND, "Trip " + trip_id + " not found");
    }

    const std::string path = write_backup(*doc, BackupType::Trip, reason);
    BackupRecord record = catalog_.add_backup_metadata(trip_id, BackupType::Trip, doc->title,
                                                       path, reason);

    const std::string live = engine_.trip_path(trip_id);
    writes_.submit(live, [live]() { Engine::remove_file(live); }).get();

    Logger::log(LogLevel::INFO, "Store: Deleted trip " + trip_id + " (backup " + record.id + ")");
    return record;
}

BackupRecord Store::remove_finance(const std::string& trip_id, const std::string& reason)
{
    auto doc = load(trip_id);
    if (!doc) {
        throw NotFoundError(ErrorCode::TRIP_NOT_FOUND, "Trip " + trip_id + " not found");
    }
    if (!doc->finance) {
        throw NotFoundError(ErrorCode::TRIP_NOT_FOUND, "Trip " + trip_id + " has no cost data");
    }

    const std::string path = write_backup(*doc, BackupType::Cost, reason);
    BackupRecord record = catalog_.add_backup_metadata(trip_id, BackupType::Cost, doc->title,
                                                       path, reason);

    doc->finance.reset();
    const std::size_t stripped = links::LinkEditor(*doc).strip_all();
    doc->updated_at = infra::Time::now_iso();
    save(*doc);

    Logger::log(LogLevel::INFO, "Store: Deleted cost data of trip " + trip_id + " (" +
                                    std::to_string(stripped) + " links removed, backup " +
                                    record.id + ")");
    return record;
}

model::TripDocument Store::restore_trip(const std::string& backup_id, bool overwrite)
{
    auto record = catalog_.get_backup_by_id(backup_id);
    if (!record) {
        throw NotFoundError(ErrorCode::BACKUP_NOT_FOUND, "Backup " + backup_id + " not found");
    }
    if (record->type != BackupType::Trip) {
        throw ValidationError(ErrorCode::VALIDATION, "Backup " + backup_id + " is not a trip backup");
    }

    model::TripDocument snapshot = read_backup(*record);
    if (snapshot.id.empty()) {
        snapshot.id = record->original_id;
    }
    Engine::require_valid_id(snapshot.id);

    if (exists(snapshot.id) && !overwrite) {
        throw ConflictError("Trip " + snapshot.id + " already exists");
    }

    auto result = Migrator::migrate_to_latest(std::move(snapshot));
    result.document.updated_at = infra::Time::now_iso();
    save(result.document);

    Logger::log(LogLevel::INFO,
                "Store: Restored trip " + result.document.id + " from backup " + backup_id);
    return std::move(result.document);
}

model::TripDocument Store::restore_finance(const std::string& backup_id,
                                           const std::string& target_trip_id, bool overwrite)
{
    auto record = catalog_.get_backup_by_id(backup_id);
    if (!record) {
        throw NotFoundError(ErrorCode::BACKUP_NOT_FOUND, "Backup " + backup_id + " not found");
    }
    if (record->type != BackupType::Cost) {
        throw ValidationError(ErrorCode::VALIDATION, "Backup " + backup_id + " is not a cost backup");
    }

    const std::string trip_id = target_trip_id.empty() ? record->original_id : target_trip_id;
    auto current = load(trip_id);
    if (!current) {
        throw NotFoundError(ErrorCode::TRIP_NOT_FOUND, "Trip " + trip_id + " not found");
    }
    if (current->finance && !overwrite) {
        throw ConflictError("Trip " + trip_id + " already has cost data");
    }

    model::TripDocument snapshot = read_backup(*record);
    if (snapshot.schema_version == 0) {
        snapshot.schema_version = migration::CURRENT_SCHEMA_VERSION;
    }
    auto restored = Migrator::migrate_to_latest(std::move(snapshot)).document;
    if (!restored.finance) {
        throw ValidationError(ErrorCode::VALIDATION,
                              "Backup " + backup_id + " holds no cost data");
    }

    model::TripDocument doc = std::move(*current);
    doc.finance = std::move(restored.finance);

    // Links on the live itinerary are newer than the snapshot's references.
    std::map<std::string, std::pair<model::ItemKind, std::string>> itinerary_side;
    model::for_each_item(doc, [&](model::ItemKind kind, const std::string& id,
                                  const std::vector<model::CostTrackingLink>& links) {
        for (const auto& link : links) {
            itinerary_side.emplace(link.expense_id, std::make_pair(kind, id));
        }
    });

    for (auto& expense : doc.finance->expenses) {
        auto live = itinerary_side.find(expense.id);
        if (live == itinerary_side.end()) {
            continue;
        }
        if (!expense.travel_reference) {
            expense.travel_reference = model::TravelReference{};
        }
        expense.travel_reference->target(live->second.first, live->second.second);
        expense.travel_reference->description =
            doc.item_display_name(live->second.first, live->second.second);
    }

    // The sweep mirrors the remaining references onto the itinerary and
    // drops whatever no longer resolves.
    auto result = Migrator::migrate_to_latest(std::move(doc));
    result.document.updated_at = infra::Time::now_iso();
    save(result.document);

    Logger::log(LogLevel::INFO,
                "Store: Restored cost data of trip " + trip_id + " from backup " + backup_id);
    return std::move(result.document);
}

} // namespace tripstore::storage
