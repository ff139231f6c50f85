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
 * @file config.cpp
 * @brief Environment-driven configuration resolution.
 */

#include "tripstore/infra/config.hpp"

#include "tripstore/infra/string.hpp"

#include <cstdlib>
#include <stdexcept>
#include <thread>

namespace tripstore::infra {

namespace {

std::string env(const char* name)
{
    const char* value = std::getenv(name);
    return value ? String::trim(value) : std::string();
}

/// Positive integer from the environment, or @p fallback when unset or malformed.
long env_positive(const char* name, long fallback)
{
    const std::string raw = env(name);
    if (raw.empty()) {
        return fallback;
    }
    try {
        long value = std::stol(raw);
        if (value > 0) {
            return value;
        }
    } catch (const std::exception&) {
        Logger::log(LogLevel::WARN,
                    std::string("Config: Ignoring non-numeric ") + name + "='" + raw + "'");
    }
    return fallback;
}

} // namespace

std::string Config::backups_dir() const
{
    return data_dir + "/backups";
}

std::string Config::catalog_path() const
{
    return data_dir + "/backup-metadata.json";
}

Config Config::from_environment(const std::string& data_dir_override)
{
    Config cfg;

    if (!data_dir_override.empty()) {
        cfg.data_dir = data_dir_override;
    } else {
        for (const char* name : {"TRIPSTORE_DATA_DIR", "TEST_DATA_DIR", "DATA_DIR"}) {
            std::string value = env(name);
            if (!value.empty()) {
                cfg.data_dir = value;
                break;
            }
        }
    }

    unsigned hw = std::thread::hardware_concurrency();
    cfg.workers = static_cast<std::size_t>(env_positive("TRIPSTORE_WORKERS", hw > 0 ? hw : 4));
    cfg.log_level = Logger::parse_level(env("TRIPSTORE_LOG_LEVEL"), LogLevel::INFO);
    cfg.backup_retention_days =
        static_cast<int>(env_positive("TRIPSTORE_BACKUP_RETENTION_DAYS", cfg.backup_retention_days));
    cfg.backup_keep_latest =
        static_cast<int>(env_positive("TRIPSTORE_BACKUP_KEEP_LATEST", cfg.backup_keep_latest));

    return cfg;
}

} // namespace tripstore::infra
