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
 * @file store.hpp
 * @brief Concurrent-safe persistence of trip documents.
 *
 * @details
 * The `Store` is the orchestration layer above the file `Engine`:
 * - **Load:** read, parse, recover from corruption, migrate, persist upgrades.
 * - **Save:** serialize, then replace the file atomically, with writes to
 *   one trip chained through the `WriteQueue`.
 * - **Delete:** snapshot into `backups/`, register with the catalog, then remove.
 * - **Restore:** rebuild a trip or its finance section from a snapshot.
 *
 * Reads never wait for writes; atomic replacement guarantees they observe
 * either the previous or the next complete file.
 */

#pragma once

#include "tripstore/infra/scheduler.hpp"
#include "tripstore/model/trip.hpp"
#include "tripstore/storage/backup_catalog.hpp"
#include "tripstore/storage/engine.hpp"
#include "tripstore/storage/legacy_import.hpp"
#include "tripstore/storage/write_queue.hpp"

#include <future>
#include <optional>
#include <string>
#include <vector>

namespace tripstore::storage {

/// @brief Listing entry of one trip.
struct TripSummary {
    std::string id;
    std::string title;
    std::string start_date;
    std::string end_date;
    std::string created_at;
    std::string updated_at;
    bool has_itinerary = false;
    bool has_finance = false;
    bool legacy = false; ///< Still stored in the split layout.
};

/**
 * @class Store
 * @brief One file per trip, serialized writers, lock-free readers.
 */
class Store {
  public:
    /**
     * @brief Opens (and creates if needed) a data directory.
     *
     * @param data_dir Root of the trip files.
     * @param scheduler Pool that runs queued writes; must outlive the store.
     * @param catalog Backup registry; must outlive the store.
     */
    Store(std::string data_dir, infra::Scheduler& scheduler, BackupCatalog& catalog);

    /**
     * @brief Loads, repairs and migrates a trip.
     *
     * A damaged file is salvaged when a complete prefix survives; the original
     * bytes are quarantined and the salvaged document written back. A
     * migration that changed the document is persisted before returning.
     *
     * @return The document, or `std::nullopt` if the trip does not exist or
     * could not be recovered.
     * @throws ValidationError (`INVALID_TRIP_ID`) for malformed ids.
     * @throws InvalidSchemaVersionError for documents no migration can start from.
     */
    std::optional<model::TripDocument> load(const std::string& trip_id);

    /// @brief Persists @p doc and waits for the write to complete.
    void save(const model::TripDocument& doc);

    /**
     * @brief Queues a write of @p doc; the content is captured immediately.
     * @return std::shared_future<void> Ready once the file was replaced.
     */
    std::shared_future<void> save_async(const model::TripDocument& doc);

    /// @brief True if a unified or legacy file exists for @p trip_id.
    bool exists(const std::string& trip_id) const;

    /// @brief Summaries of every readable trip, most recently created first.
    std::vector<TripSummary> list_trips() const;

    /**
     * @brief Backs a trip up, then deletes its file.
     * @throws NotFoundError (`TRIP_NOT_FOUND`).
     */
    BackupRecord remove_trip(const std::string& trip_id, const std::string& reason = "");

    /**
     * @brief Backs the trip up, then drops its finance section and every
     * itinerary-side link.
     * @throws NotFoundError (`TRIP_NOT_FOUND`) if the trip or its finance is absent.
     */
    BackupRecord remove_finance(const std::string& trip_id, const std::string& reason = "");

    /**
     * @brief Recreates a deleted trip from a `trip` backup.
     * @throws NotFoundError (`BACKUP_NOT_FOUND`), ConflictError when the trip
     * exists and @p overwrite is false.
     */
    model::TripDocument restore_trip(const std::string& backup_id, bool overwrite = false);

    /**
     * @brief Puts the finance section of a `cost` backup back onto a trip.
     *
     * Itinerary-side links added since the backup are merged with the restored
     * expense references by expense id; links that no longer resolve are
     * dropped by the integrity sweep.
     *
     * @param target_trip_id Trip to restore onto; the backup's original id when empty.
     * @throws NotFoundError, ConflictError when the trip already has finance
     * data and @p overwrite is false.
     */
    model::TripDocument restore_finance(const std::string& backup_id,
                                        const std::string& target_trip_id = "",
                                        bool overwrite = false);

    /// @brief Waits for every queued write.
    void flush() { writes_.drain(); }

    const Engine& engine() const { return engine_; }
    BackupCatalog& catalog() { return catalog_; }

  private:
    std::string write_backup(const model::TripDocument& doc, BackupType type,
                             const std::string& reason);
    model::TripDocument read_backup(const BackupRecord& record) const;

    Engine engine_;
    LegacyImport legacy_;
    BackupCatalog& catalog_;
    WriteQueue writes_;
};

} // namespace tripstore::storage
