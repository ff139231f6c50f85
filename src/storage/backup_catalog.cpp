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
 * @file backup_catalog.cpp
 * @brief Implementation of the file-backed backup catalog.
 *
 * @details
 * Catalog file shape:
 * @code
 * {
 *   "version": "1.0.0",
 *   "lastUpdated": "...",
 *   "backups": [ { "id": "backup-...", "originalId": "...", ... } ],
 *   "storageStats": { "totalSize": 0, "totalCount": 0, "lastCalculated": "..." }
 * }
 * @endcode
 */

#include "tripstore/storage/backup_catalog.hpp"

#include "tripstore/core/error.hpp"
#include "tripstore/infra/checksum.hpp"
#include "tripstore/infra/id_generator.hpp"
#include "tripstore/infra/logger.hpp"
#include "tripstore/infra/string.hpp"
#include "tripstore/infra/time.hpp"
#include "tripstore/model/json.hpp"
#include "tripstore/storage/engine.hpp"

#include <cJSON.h>

#include <algorithm>
#include <filesystem>
#include <map>
#include <system_error>

namespace fs = std::filesystem;

namespace tripstore::storage {

using infra::Logger;
using infra::LogLevel;

namespace {

constexpr const char* kCatalogVersion = "1.0.0";
constexpr std::int64_t kMillisPerDay = 24LL * 60 * 60 * 1000;

std::int64_t millis_of(const std::string& iso)
{
    return infra::Time::parse_iso(iso).value_or(0);
}

void sort_newest_first(std::vector<BackupRecord>& records)
{
    std::stable_sort(records.begin(), records.end(), [](const auto& a, const auto& b) {
        return millis_of(a.deleted_at) > millis_of(b.deleted_at);
    });
}

BackupRecord record_from_json(const cJSON* node)
{
    BackupRecord record;
    record.id = json::get_string(node, "id");
    record.original_id = json::get_string(node, "originalId");
    record.type = parse_backup_type(json::get_string(node, "type")).value_or(BackupType::Trip);
    record.title = json::get_string(node, "title");
    record.deleted_at = json::get_date(node, "deletedAt");
    record.file_path = json::get_string(node, "filePath");
    record.file_size = static_cast<std::uintmax_t>(json::get_number(node, "fileSize").value_or(0));
    record.checksum = json::get_string(node, "checksum");
    record.deletion_reason = json::get_string(node, "deletionReason");
    record.backup_version = json::get_string(node, "backupVersion", kCatalogVersion);
    return record;
}

std::vector<BackupRecord>::iterator find_record(std::vector<BackupRecord>& records,
                                                const std::string& id)
{
    return std::find_if(records.begin(), records.end(),
                        [&](const BackupRecord& r) { return r.id == id; });
}

} // namespace

const char* to_string(BackupType type)
{
    return type == BackupType::Cost ? "cost" : "trip";
}

std::optional<BackupType> parse_backup_type(const std::string& text)
{
    const std::string lowered = infra::String::to_lower(text);
    if (lowered == "trip") {
        return BackupType::Trip;
    }
    if (lowered == "cost") {
        return BackupType::Cost;
    }
    return std::nullopt;
}

cJSON* to_json(const BackupRecord& record)
{
    cJSON* node = cJSON_CreateObject();
    cJSON_AddStringToObject(node, "id", record.id.c_str());
    cJSON_AddStringToObject(node, "originalId", record.original_id.c_str());
    cJSON_AddStringToObject(node, "type", to_string(record.type));
    cJSON_AddStringToObject(node, "title", record.title.c_str());
    cJSON_AddStringToObject(node, "deletedAt", record.deleted_at.c_str());
    cJSON_AddStringToObject(node, "filePath", record.file_path.c_str());
    cJSON_AddNumberToObject(node, "fileSize", static_cast<double>(record.file_size));
    cJSON_AddStringToObject(node, "checksum", record.checksum.c_str());
    json::add_string_if(node, "deletionReason", record.deletion_reason);
    cJSON_AddStringToObject(node, "backupVersion", record.backup_version.c_str());
    return node;
}

std::vector<BackupRecord> BackupCatalog::search(const std::string& query)
{
    BackupFilter filter;
    filter.query = query;
    return list_backups(filter);
}

std::vector<BackupRecord> filter_backups(std::vector<BackupRecord> records,
                                         const BackupFilter& filter)
{
    const auto from = filter.date_from.empty() ? std::nullopt
                                               : infra::Time::parse_iso(filter.date_from);
    const auto to = filter.date_to.empty() ? std::nullopt : infra::Time::parse_iso(filter.date_to);

    auto rejected = [&](const BackupRecord& r) {
        if (filter.type && r.type != *filter.type) {
            return true;
        }
        const std::int64_t at = millis_of(r.deleted_at);
        if (from && at < *from) {
            return true;
        }
        if (to && at > *to) {
            return true;
        }
        if (!filter.query.empty()) {
            using infra::String;
            return !(String::icontains(r.title, filter.query) ||
                     String::icontains(r.original_id, filter.query) ||
                     String::icontains(r.deletion_reason, filter.query));
        }
        return false;
    };

    records.erase(std::remove_if(records.begin(), records.end(), rejected), records.end());
    sort_newest_first(records);
    return records;
}

StorageStats compute_stats(const std::vector<BackupRecord>& records)
{
    StorageStats stats;
    stats.total_count = records.size();

    std::int64_t oldest = 0;
    std::int64_t newest = 0;
    for (const auto& record : records) {
        stats.total_size += record.file_size;
        TypeUsage& usage = record.type == BackupType::Cost ? stats.cost : stats.trip;
        ++usage.count;
        usage.size += record.file_size;

        const std::int64_t at = millis_of(record.deleted_at);
        if (stats.oldest_backup.empty() || at < oldest) {
            oldest = at;
            stats.oldest_backup = record.deleted_at;
        }
        if (stats.newest_backup.empty() || at > newest) {
            newest = at;
            stats.newest_backup = record.deleted_at;
        }
    }
    if (stats.total_count > 0) {
        stats.average_size =
            static_cast<double>(stats.total_size) / static_cast<double>(stats.total_count);
    }
    return stats;
}

FileBackupCatalog::FileBackupCatalog(std::string catalog_path, std::string backups_dir)
    : catalog_path_(std::move(catalog_path)), backups_dir_(std::move(backups_dir))
{
}

std::vector<BackupRecord> FileBackupCatalog::load() const
{
    std::vector<BackupRecord> records;

    const auto raw = Engine::read_file(catalog_path_);
    if (!raw) {
        return records;
    }

    json::Ptr root = json::parse(*raw);
    if (!root) {
        Logger::log(LogLevel::WARN, "Backup: Catalog " + catalog_path_ +
                                        " is unreadable, starting from an empty catalog");
        return records;
    }

    const cJSON* backups = cJSON_GetObjectItemCaseSensitive(root.get(), "backups");
    const cJSON* item = nullptr;
    cJSON_ArrayForEach(item, backups)
    {
        if (cJSON_IsObject(item)) {
            records.push_back(record_from_json(item));
        }
    }
    return records;
}

void FileBackupCatalog::store(const std::vector<BackupRecord>& records) const
{
    const std::string now = infra::Time::now_iso();
    const StorageStats stats = compute_stats(records);

    json::Ptr root(cJSON_CreateObject());
    cJSON_AddStringToObject(root.get(), "version", kCatalogVersion);
    cJSON_AddStringToObject(root.get(), "lastUpdated", now.c_str());

    cJSON* backups = cJSON_AddArrayToObject(root.get(), "backups");
    for (const auto& record : records) {
        cJSON_AddItemToArray(backups, to_json(record));
    }

    cJSON* summary = cJSON_AddObjectToObject(root.get(), "storageStats");
    cJSON_AddNumberToObject(summary, "totalSize", static_cast<double>(stats.total_size));
    cJSON_AddNumberToObject(summary, "totalCount", static_cast<double>(stats.total_count));
    cJSON_AddStringToObject(summary, "lastCalculated", now.c_str());

    const fs::path parent = fs::path(catalog_path_).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }
    Engine::write_atomic(catalog_path_, json::print(root.get(), true));
}

BackupRecord FileBackupCatalog::make_record(const std::string& original_id, BackupType type,
                                            const std::string& title,
                                            const std::string& file_path,
                                            const std::string& reason) const
{
    const auto content = Engine::read_file(file_path);
    if (!content) {
        throw std::runtime_error("Backup: file " + file_path + " does not exist");
    }

    BackupRecord record;
    record.id = infra::IdGenerator::timestamped("backup");
    record.original_id = original_id;
    record.type = type;
    record.title = title;
    record.deleted_at = infra::Time::now_iso();
    record.file_path = file_path;
    record.file_size = content->size();
    record.checksum = infra::Checksum::sha256_hex(*content);
    record.deletion_reason = reason;
    return record;
}

BackupRecord FileBackupCatalog::add_backup_metadata(const std::string& original_id,
                                                    BackupType type, const std::string& title,
                                                    const std::string& file_path,
                                                    const std::string& reason)
{
    std::unique_lock<std::mutex> lock(mutex_);

    BackupRecord record = make_record(original_id, type, title, file_path, reason);
    auto records = load();
    records.push_back(record);
    store(records);

    Logger::log(LogLevel::INFO, "Backup: Registered " + record.id + " (" + to_string(type) +
                                    " of " + original_id + ")");
    return record;
}

std::optional<BackupRecord> FileBackupCatalog::get_backup_by_id(const std::string& id)
{
    std::unique_lock<std::mutex> lock(mutex_);
    auto records = load();
    auto it = find_record(records, id);
    if (it == records.end()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<BackupRecord> FileBackupCatalog::list_backups(const BackupFilter& filter)
{
    std::unique_lock<std::mutex> lock(mutex_);
    return filter_backups(load(), filter);
}

StorageStats FileBackupCatalog::storage_stats()
{
    std::unique_lock<std::mutex> lock(mutex_);
    return compute_stats(load());
}

void FileBackupCatalog::remove(const std::string& id, bool delete_file)
{
    std::unique_lock<std::mutex> lock(mutex_);
    auto records = load();
    auto it = find_record(records, id);
    if (it == records.end()) {
        throw NotFoundError(ErrorCode::BACKUP_NOT_FOUND, "Backup " + id + " not found");
    }
    if (delete_file) {
        Engine::remove_file(it->file_path);
    }
    records.erase(it);
    store(records);
    Logger::log(LogLevel::INFO, "Backup: Removed " + id);
}

IntegrityReport FileBackupCatalog::verify_integrity(const std::string& id)
{
    std::unique_lock<std::mutex> lock(mutex_);
    auto records = load();
    auto it = find_record(records, id);
    if (it == records.end()) {
        throw NotFoundError(ErrorCode::BACKUP_NOT_FOUND, "Backup " + id + " not found");
    }

    IntegrityReport report;
    report.backup_id = id;
    report.expected_checksum = it->checksum;

    const auto content = Engine::read_file(it->file_path);
    if (content) {
        report.file_exists = true;
        report.actual_checksum = infra::Checksum::sha256_hex(*content);
    }
    if (!report.ok()) {
        Logger::log(LogLevel::WARN, "Backup: Integrity check failed for " + id);
    }
    return report;
}

SyncReport FileBackupCatalog::synchronize()
{
    std::unique_lock<std::mutex> lock(mutex_);
    SyncReport report;
    auto records = load();

    std::vector<std::string> on_disk;
    std::error_code ec;
    if (fs::is_directory(backups_dir_, ec)) {
        for (const auto& entry : fs::directory_iterator(backups_dir_)) {
            const std::string name = entry.path().filename().string();
            if (entry.is_regular_file() && infra::String::starts_with(name, "deleted-") &&
                infra::String::ends_with(name, ".json")) {
                on_disk.push_back(name);
            }
        }
    }
    std::sort(on_disk.begin(), on_disk.end());

    auto tracked = [&](const std::string& name) {
        return std::any_of(records.begin(), records.end(), [&](const BackupRecord& r) {
            return fs::path(r.file_path).filename().string() == name;
        });
    };

    std::vector<BackupRecord> added;
    for (const auto& name : on_disk) {
        if (tracked(name)) {
            continue;
        }
        const std::string path = backups_dir_ + "/" + name;
        try {
            const auto content = Engine::read_file(path);
            json::Ptr root = content ? json::parse(*content) : json::Ptr();
            if (!root) {
                report.errors.push_back("Failed to process " + name + ": not valid JSON");
                continue;
            }
            std::string original_id = json::get_string(root.get(), "id");
            const cJSON* meta = cJSON_GetObjectItemCaseSensitive(root.get(), "backupMetadata");
            if (cJSON_IsObject(meta)) {
                original_id = json::get_string(meta, "originalId", original_id);
            }
            const BackupType type = infra::String::starts_with(name, "deleted-cost-")
                                        ? BackupType::Cost
                                        : BackupType::Trip;
            added.push_back(make_record(original_id, type,
                                        json::get_string(root.get(), "title", "Unknown"), path,
                                        "synchronized"));
        } catch (const std::exception& e) {
            report.errors.push_back("Failed to process " + name + ": " + e.what());
        }
    }

    const std::size_t before = records.size();
    records.erase(std::remove_if(records.begin(), records.end(),
                                 [&](const BackupRecord& r) {
                                     std::error_code exists_ec;
                                     return !fs::exists(r.file_path, exists_ec);
                                 }),
                  records.end());
    report.removed = before - records.size();
    report.added = added.size();
    records.insert(records.end(), added.begin(), added.end());

    if (report.added > 0 || report.removed > 0) {
        store(records);
    }
    Logger::log(LogLevel::INFO, "Backup: Synchronized catalog (+" + std::to_string(report.added) +
                                    ", -" + std::to_string(report.removed) + ")");
    return report;
}

std::vector<BackupRecord> FileBackupCatalog::garbage_collect(const GcOptions& options)
{
    std::unique_lock<std::mutex> lock(mutex_);
    auto records = load();
    sort_newest_first(records);

    const std::int64_t cutoff =
        infra::Time::now_millis() - static_cast<std::int64_t>(options.retention_days) * kMillisPerDay;

    std::map<std::string, std::size_t> seen;
    std::vector<BackupRecord> kept;
    std::vector<BackupRecord> expired;
    for (auto& record : records) {
        const std::size_t rank = seen[record.original_id]++;
        if (rank >= options.keep_latest && millis_of(record.deleted_at) < cutoff) {
            expired.push_back(std::move(record));
        } else {
            kept.push_back(std::move(record));
        }
    }

    if (options.dry_run || expired.empty()) {
        return expired;
    }

    for (const auto& record : expired) {
        std::error_code ec;
        fs::remove(record.file_path, ec);
        if (ec) {
            Logger::log(LogLevel::WARN, "Backup: Could not delete " + record.file_path + ": " +
                                            ec.message());
        }
    }
    store(kept);
    Logger::log(LogLevel::INFO,
                "Backup: Garbage collection removed " + std::to_string(expired.size()) + " backups");
    return expired;
}

} // namespace tripstore::storage
