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
 * @file config.hpp
 * @brief Runtime configuration for the trip store.
 *
 * @details
 * Resolution order for every setting: explicit value (command line), then
 * environment, then built-in default.
 *
 * | Setting          | Environment                                         | Default     |
 * |------------------|-----------------------------------------------------|-------------|
 * | data directory   | `TRIPSTORE_DATA_DIR`, `TEST_DATA_DIR`, `DATA_DIR`   | `./data`    |
 * | worker threads   | `TRIPSTORE_WORKERS`                                 | hw threads  |
 * | log level        | `TRIPSTORE_LOG_LEVEL`                               | `info`      |
 * | backup retention | `TRIPSTORE_BACKUP_RETENTION_DAYS`                   | 30          |
 * | backups kept     | `TRIPSTORE_BACKUP_KEEP_LATEST`                      | 5           |
 */

#pragma once

#include "tripstore/infra/logger.hpp"

#include <cstddef>
#include <string>

namespace tripstore::infra {

/**
 * @struct Config
 * @brief Immutable-after-startup settings shared by the store and the CLI.
 */
struct Config {
    std::string data_dir = "./data";
    std::size_t workers = 4;
    LogLevel log_level = LogLevel::INFO;
    int backup_retention_days = 30;
    int backup_keep_latest = 5;

    /// @brief `<data_dir>/backups`.
    std::string backups_dir() const;

    /// @brief `<data_dir>/backup-metadata.json`.
    std::string catalog_path() const;

    /**
     * @brief Builds a configuration from the process environment.
     *
     * @param data_dir_override Non-empty value wins over every environment
     * variable (typically the first CLI argument).
     */
    static Config from_environment(const std::string& data_dir_override = "");
};

} // namespace tripstore::infra
