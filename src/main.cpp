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
 * @file main.cpp
 * @brief Application Entry Point (Bootstrap).
 *
 * @details
 * Startup sequence:
 * 1. Argument parsing and configuration from the environment.
 * 2. Signal handler registration (SIGINT/SIGTERM).
 * 3. Subsystem initialization (workers, backup catalog, store, service).
 * 4. Request loop: one JSON request per stdin line, one response per stdout line.
 */

#include "tripstore/api/handler.hpp"
#include "tripstore/infra/config.hpp"
#include "tripstore/infra/logger.hpp"
#include "tripstore/infra/scheduler.hpp"
#include "tripstore/service/trip_service.hpp"
#include "tripstore/storage/backup_catalog.hpp"
#include "tripstore/storage/store.hpp"

#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>

#include <signal.h>

using tripstore::infra::Logger;
using tripstore::infra::LogLevel;

/// @brief Set by the signal handler; polled between requests.
static volatile std::sig_atomic_t g_stop = 0;

/**
 * @brief Records the interrupt. Installed without `SA_RESTART`, so a blocked
 * read on stdin returns and the loop observes the flag.
 */
void signal_handler(int)
{
    g_stop = 1;
}

void install_signal_handlers()
{
    struct sigaction action {};
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);  // Ctrl+C
    sigaction(SIGTERM, &action, nullptr); // Docker Stop / Kill
}

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [DATA_PATH]\n"
              << "Options:\n"
              << "  DATA_PATH   Directory holding trip files (Default: $TRIPSTORE_DATA_DIR or ./data)\n"
              << "  --help      Show this help message\n"
              << "\n"
              << "Reads one JSON request per line on stdin and writes one response per line.\n"
              << "Environment: TRIPSTORE_DATA_DIR, TRIPSTORE_WORKERS, TRIPSTORE_LOG_LEVEL,\n"
              << "             TRIPSTORE_BACKUP_RETENTION_DAYS, TRIPSTORE_BACKUP_KEEP_LATEST\n";
}

int main(int argc, char* argv[])
{
    if (argc > 1 && std::string(argv[1]) == "--help") {
        print_help(argv[0]);
        return 0;
    }

    install_signal_handlers();

    try {
        const auto config = tripstore::infra::Config::from_environment(argc > 1 ? argv[1] : "");
        Logger::set_level(config.log_level);
        Logger::set_stderr_only(true);

        Logger::log(LogLevel::INFO, "System: Booting tripstore...");
        Logger::log(LogLevel::INFO, "Config: Data directory set to '" + config.data_dir + "'");
        Logger::log(LogLevel::INFO,
                    "Config: " + std::to_string(config.workers) + " write workers");

        tripstore::infra::Scheduler scheduler(config.workers);
        tripstore::storage::FileBackupCatalog catalog(config.catalog_path(),
                                                      config.backups_dir());
        tripstore::storage::Store store(config.data_dir, scheduler, catalog);
        tripstore::service::TripService service(store);

        const auto sync = catalog.synchronize();
        if (sync.added > 0 || sync.removed > 0) {
            Logger::log(LogLevel::INFO, "Backup: Catalog synchronized (+" +
                                            std::to_string(sync.added) + ", -" +
                                            std::to_string(sync.removed) + ")");
        }

        tripstore::storage::GcOptions gc_defaults;
        gc_defaults.retention_days = config.backup_retention_days;
        gc_defaults.keep_latest = static_cast<std::size_t>(config.backup_keep_latest);
        tripstore::api::Handler handler(service, gc_defaults);

        std::string line;
        while (!g_stop && std::getline(std::cin, line)) {
            if (line.find_first_not_of(" \t\r") == std::string::npos) {
                continue;
            }
            const std::string response = handler.process(line);
            std::cout << response << std::endl;
            if (tripstore::api::Handler::is_goodbye(response)) {
                break;
            }
        }

        if (g_stop) {
            Logger::log(LogLevel::WARN, "System: Interrupt received. Initiating graceful shutdown...");
        }
        store.flush();

    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    Logger::log(LogLevel::INFO, "System: Shutdown complete.");
    return 0;
}
