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
 * @file engine.hpp
 * @brief Low-level file layer of the trip store.
 *
 * @details
 * The `Engine` owns the on-disk layout and nothing else: it knows where a
 * trip file, a deletion backup or a quarantined file lives, and it performs
 * the raw reads and atomic replacements. It has no notion of document
 * structure or write ordering; those belong to the `Store`.
 *
 * **Layout:**
 * - `<root>/trip-<id>.json`
 * - `<root>/travel-<id>.json`, `<root>/cost-<id>.json` (legacy split layout)
 * - `<root>/backups/deleted-<trip|cost>-<id>-<stamp>.json`
 * - `<root>/backups/corrupted-trip-<id>-<stamp>.json.corrupt`
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace tripstore::storage {

/**
 * @class Engine
 * @brief Path resolution plus crash-safe file replacement.
 */
class Engine {
  public:
    /**
     * @brief Configures the file layer.
     * @param base_path Root directory holding the trip files.
     */
    explicit Engine(std::string base_path);

    /**
     * @brief Creates the root and `backups/` directories if absent.
     * @throws std::filesystem::filesystem_error if the filesystem refuses.
     */
    void init() const;

    /// @brief True for ids matching `^[A-Za-z0-9_-]{1,200}$`.
    static bool valid_trip_id(const std::string& trip_id);

    /**
     * @brief Rejects ids that could escape the data directory.
     * @throws ValidationError with `INVALID_TRIP_ID`.
     */
    static void require_valid_id(const std::string& trip_id);

    std::string trip_path(const std::string& trip_id) const;
    std::string legacy_travel_path(const std::string& trip_id) const;
    std::string legacy_cost_path(const std::string& cost_id) const;
    std::string backups_dir() const;
    const std::string& base_path() const { return base_path_; }

    /**
     * @brief Path of a new deletion backup (`kind` is `trip` or `cost`).
     */
    std::string backup_path(const std::string& kind, const std::string& trip_id) const;

    /**
     * @brief Copies raw bytes that failed to parse into the quarantine area.
     * @return std::string Path of the quarantine file.
     */
    std::string quarantine(const std::string& trip_id, const std::string& raw) const;

    /// @brief Ids of every `trip-<id>.json` under the root, sorted.
    std::vector<std::string> list_trip_ids() const;

    /// @brief File names under the root starting with @p prefix and ending in `.json`.
    std::vector<std::string> list_files(const std::string& prefix) const;

    /**
     * @brief Reads a whole file in binary mode.
     * @return The bytes, or `std::nullopt` if the file does not exist.
     * @throws std::runtime_error if the file exists but cannot be read.
     */
    static std::optional<std::string> read_file(const std::string& path);

    /**
     * @brief Replaces @p path with @p content atomically.
     *
     * Content goes to a uniquely named temporary file in the same directory,
     * which is then renamed onto @p path. A reader sees either the old or the
     * new file, never a mix. On failure the temporary file is removed, the
     * target is left untouched and the error propagates.
     *
     * @throws std::runtime_error or std::filesystem::filesystem_error.
     */
    static void write_atomic(const std::string& path, const std::string& content);

    /// @brief Deletes @p path. Returns false if it did not exist.
    static bool remove_file(const std::string& path);

  private:
    std::string base_path_;
};

} // namespace tripstore::storage
