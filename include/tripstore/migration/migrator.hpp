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
 * @file migrator.hpp
 * @brief Driver that brings a document of any historical version to the current one.
 *
 * @details
 * The driver applies only the suffix of the chain the document needs (a v5
 * document starts at the v5 step), then runs the integrity sweep. The result
 * carries the audit trail so the persistence layer can decide whether the
 * document has to be written back.
 *
 * @code
 * auto result = tripstore::migration::Migrator::migrate_to_latest(std::move(doc));
 * if (result.changed()) {
 *     store.save(result.document);
 * }
 * @endcode
 */

#pragma once

#include "tripstore/migration/audit.hpp"
#include "tripstore/model/trip.hpp"

#include <vector>

namespace tripstore::migration {

/// @brief Schema version written by this build.
constexpr int CURRENT_SCHEMA_VERSION = 7;

/**
 * @struct MigrationResult
 * @brief Migrated document plus what was done to it.
 */
struct MigrationResult {
    model::TripDocument document;
    int from_version = 0;
    int to_version = 0;
    std::vector<AuditEntry> audit;
    std::size_t mutations = 0;

    bool version_changed() const { return from_version != to_version; }

    /// @brief True if the document differs from the input and must be persisted.
    bool changed() const { return version_changed() || mutations > 0; }
};

/**
 * @class Migrator
 * @brief Stateless migration driver.
 */
class Migrator {
  public:
    /**
     * @brief Upgrades @p doc to `CURRENT_SCHEMA_VERSION` and repairs it.
     *
     * Never throws for repairable inconsistencies; they are fixed and audited.
     *
     * @throws InvalidSchemaVersionError if `schemaVersion` is absent, below 1
     * or newer than this build understands.
     */
    static MigrationResult migrate_to_latest(model::TripDocument doc);
};

} // namespace tripstore::migration
