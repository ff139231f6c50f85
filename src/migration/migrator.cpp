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
 * @file migrator.cpp
 * @brief Implementation of the migration driver.
 */

#include "tripstore/migration/migrator.hpp"

#include "tripstore/core/error.hpp"
#include "tripstore/infra/logger.hpp"
#include "tripstore/infra/time.hpp"
#include "tripstore/migration/steps.hpp"

namespace tripstore::migration {

using infra::Logger;
using infra::LogLevel;

MigrationResult Migrator::migrate_to_latest(model::TripDocument doc)
{
    const int start = doc.schema_version;
    if (start < 1) {
        throw InvalidSchemaVersionError("Invalid schema version " +
                                        (start == 0 ? std::string("(missing)")
                                                    : std::to_string(start)) +
                                        " for trip " + doc.id);
    }
    if (start > CURRENT_SCHEMA_VERSION) {
        throw InvalidSchemaVersionError("Trip " + doc.id + " has schema version " +
                                        std::to_string(start) + ", newer than supported " +
                                        std::to_string(CURRENT_SCHEMA_VERSION));
    }

    AuditLog log(doc.id);

    for (const Step& step : chain()) {
        if (step.from != doc.schema_version) {
            continue;
        }
        Logger::log(LogLevel::DEBUG, "Migration: Trip " + doc.id + " v" +
                                         std::to_string(step.from) + " -> v" +
                                         std::to_string(step.from + 1) + " (" + step.name + ")");
        doc = step.apply(std::move(doc), log);
    }

    const std::size_t before_sweep = log.mutation_count();
    if (integrity_sweep(doc, log) && log.mutation_count() > before_sweep) {
        doc.updated_at = infra::Time::now_iso();
    }

    if (start != doc.schema_version) {
        Logger::log(LogLevel::INFO, "Migration: Trip " + doc.id + " upgraded from v" +
                                        std::to_string(start) + " to v" +
                                        std::to_string(doc.schema_version) + " (" +
                                        std::to_string(log.mutation_count()) + " repairs)");
    }

    MigrationResult result;
    result.from_version = start;
    result.to_version = doc.schema_version;
    result.audit = log.entries();
    result.mutations = log.mutation_count();
    result.document = std::move(doc);
    return result;
}

} // namespace tripstore::migration
