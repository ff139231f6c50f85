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
 * @file audit.hpp
 * @brief Structured record of every repair made while migrating a document.
 *
 * @details
 * Repairs are recorded as `AuditEntry` values instead of free text so that
 * callers and tests can query them by operation and entity. Each entry is also
 * mirrored to the `Logger` as it is recorded.
 */

#pragma once

#include "tripstore/infra/logger.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace tripstore::migration {

/// @brief Operation names used in `AuditEntry::operation`.
namespace op {
constexpr const char* EXTRACT_ACCOMMODATION = "extract-accommodation";
constexpr const char* MOVE_LINK = "move-link";
constexpr const char* CLEAR_LEGACY_FIELDS = "clear-legacy-fields";
constexpr const char* PURGE_LINK = "purge-link";
constexpr const char* DEDUPE_LINK = "dedupe-link";
constexpr const char* ADD_LINK = "add-link";
constexpr const char* ADD_TRAVEL_REFERENCE = "add-travel-reference";
constexpr const char* CLEAR_TRAVEL_REFERENCE = "clear-travel-reference";
constexpr const char* REBIND_ACCOMMODATION = "rebind-accommodation";
constexpr const char* ORPHANED_ACCOMMODATION = "orphaned-accommodation";
constexpr const char* RECREATE_ACCOMMODATION = "recreate-accommodation";
constexpr const char* UPGRADE_VERSION = "upgrade-version";
} // namespace op

/**
 * @struct AuditEntry
 * @brief One repair or observation.
 */
struct AuditEntry {
    std::string trip_id;
    std::string operation;   ///< One of the `op::` names.
    std::string entity_kind; ///< `location`, `accommodation`, `route`, `expense` or `trip`.
    std::string entity_id;   ///< The entity that was changed.
    std::string related_id;  ///< The other side (usually an expense id), may be empty.
    std::string reason;
    bool mutating = true;    ///< False for observations that left the document untouched.

    /**
     * @brief Human-readable rendering.
     *
     * A purged link renders as
     * `Removed invalid expense link <expenseId> from <kind> <itemId>`.
     */
    std::string message() const;
};

/**
 * @class AuditLog
 * @brief Ordered collection of audit entries for one trip.
 */
class AuditLog {
  public:
    explicit AuditLog(std::string trip_id);

    /**
     * @brief Appends an entry and mirrors it to the logger.
     *
     * @param mutating Pass false for observations (logged at WARN) that do not
     * alter the document and therefore must not trigger a re-save.
     */
    void record(const std::string& operation, const std::string& entity_kind,
                const std::string& entity_id, const std::string& related_id,
                const std::string& reason, bool mutating = true);

    const std::vector<AuditEntry>& entries() const { return entries_; }

    /// @brief Entries recorded under @p operation, in order.
    std::vector<AuditEntry> by_operation(const std::string& operation) const;

    /// @brief True if any entry's `message()` equals @p message.
    bool contains(const std::string& message) const;

    /// @brief Number of entries that changed the document.
    std::size_t mutation_count() const { return mutations_; }

    const std::string& trip_id() const { return trip_id_; }

  private:
    std::string trip_id_;
    std::vector<AuditEntry> entries_;
    std::size_t mutations_ = 0;
};

} // namespace tripstore::migration
