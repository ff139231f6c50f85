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
 * @file backup_catalog.hpp
 * @brief Metadata registry of deletion backups.
 *
 * @details
 * The `Store` writes the backup file itself and then registers it here. The
 * catalog is an injected collaborator: production code uses
 * `FileBackupCatalog` (a JSON file next to the trip files), tests may supply
 * an in-memory implementation.
 */

#pragma once

#include <cJSON.h>

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tripstore::storage {

enum class BackupType { Trip, Cost };

/// @brief `trip` or `cost`.
const char* to_string(BackupType type);
std::optional<BackupType> parse_backup_type(const std::string& text);

/**
 * @struct BackupRecord
 * @brief Catalog entry of one backup file.
 */
struct BackupRecord {
    std::string id; ///< `backup-<ms>-<rand>`
    std::string original_id;
    BackupType type = BackupType::Trip;
    std::string title;
    std::string deleted_at;
    std::string file_path;
    std::uintmax_t file_size = 0;
    std::string checksum; ///< SHA-256 hex of the file content.
    std::string deletion_reason;
    std::string backup_version = "1.0.0";
};

/// @brief Criteria of `list_backups`; empty members do not filter.
struct BackupFilter {
    std::optional<BackupType> type;
    std::string date_from;
    std::string date_to;
    std::string query; ///< Case-insensitive match on title, original id or reason.
};

struct TypeUsage {
    std::size_t count = 0;
    std::uintmax_t size = 0;
};

struct StorageStats {
    std::size_t total_count = 0;
    std::uintmax_t total_size = 0;
    double average_size = 0.0;
    std::string oldest_backup;
    std::string newest_backup;
    TypeUsage trip;
    TypeUsage cost;
};

struct IntegrityReport {
    std::string backup_id;
    bool file_exists = false;
    std::string expected_checksum;
    std::string actual_checksum;

    bool ok() const { return file_exists && expected_checksum == actual_checksum; }
};

struct SyncReport {
    std::size_t added = 0;
    std::size_t removed = 0;
    std::vector<std::string> errors;
};

struct GcOptions {
    int retention_days = 30;
    std::size_t keep_latest = 5; ///< Per original id, regardless of age.
    bool dry_run = false;
};

/**
 * @class BackupCatalog
 * @brief Interface of the backup/restore hook consumed by the `Store`.
 */
class BackupCatalog {
  public:
    virtual ~BackupCatalog() = default;

    /**
     * @brief Registers an already written backup file.
     * @throws std::runtime_error if the file cannot be read.
     */
    virtual BackupRecord add_backup_metadata(const std::string& original_id, BackupType type,
                                             const std::string& title,
                                             const std::string& file_path,
                                             const std::string& reason) = 0;

    virtual std::optional<BackupRecord> get_backup_by_id(const std::string& id) = 0;

    /// @brief Matching records, newest first.
    virtual std::vector<BackupRecord> list_backups(const BackupFilter& filter) = 0;

    std::vector<BackupRecord> search(const std::string& query);

    virtual StorageStats storage_stats() = 0;

    /**
     * @brief Drops a record, and its file when @p delete_file is set.
     * @throws NotFoundError with `BACKUP_NOT_FOUND`.
     */
    virtual void remove(const std::string& id, bool delete_file) = 0;

    /// @throws NotFoundError with `BACKUP_NOT_FOUND`.
    virtual IntegrityReport verify_integrity(const std::string& id) = 0;

    /// @brief Reconciles the records with the files present on disk.
    virtual SyncReport synchronize() = 0;

    /// @brief Applies the retention policy; returns the records removed (or that would be).
    virtual std::vector<BackupRecord> garbage_collect(const GcOptions& options) = 0;
};

/**
 * @class FileBackupCatalog
 * @brief Catalog persisted as `backup-metadata.json`.
 *
 * The file is re-read on every call and rewritten atomically, so several
 * processes sharing a data directory see each other's changes. Calls within
 * one process are serialized by a mutex.
 */
class FileBackupCatalog : public BackupCatalog {
  public:
    FileBackupCatalog(std::string catalog_path, std::string backups_dir);

    BackupRecord add_backup_metadata(const std::string& original_id, BackupType type,
                                     const std::string& title, const std::string& file_path,
                                     const std::string& reason) override;
    std::optional<BackupRecord> get_backup_by_id(const std::string& id) override;
    std::vector<BackupRecord> list_backups(const BackupFilter& filter) override;
    StorageStats storage_stats() override;
    void remove(const std::string& id, bool delete_file) override;
    IntegrityReport verify_integrity(const std::string& id) override;
    SyncReport synchronize() override;
    std::vector<BackupRecord> garbage_collect(const GcOptions& options) override;

  private:
    std::vector<BackupRecord> load() const;
    void store(const std::vector<BackupRecord>& records) const;
    BackupRecord make_record(const std::string& original_id, BackupType type,
                             const std::string& title, const std::string& file_path,
                             const std::string& reason) const;

    std::string catalog_path_;
    std::string backups_dir_;
    std::mutex mutex_;
};

/// @brief Applies @p filter and sorts newest first.
std::vector<BackupRecord> filter_backups(std::vector<BackupRecord> records,
                                         const BackupFilter& filter);

/// @brief Catalog entry form of @p record; the caller owns the node.
cJSON* to_json(const BackupRecord& record);

/// @brief Aggregates usage over @p records.
StorageStats compute_stats(const std::vector<BackupRecord>& records);

} // namespace tripstore::storage
