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
 * @file audit.cpp
 * @brief Audit trail rendering and bookkeeping.
 */

#include "tripstore/migration/audit.hpp"

#include <utility>

namespace tripstore::migration {

std::string AuditEntry::message() const
{
    if (operation == op::PURGE_LINK) {
        return "Removed invalid expense link " + related_id + " from " + entity_kind + " " +
               entity_id;
    }
    if (operation == op::DEDUPE_LINK) {
        return "Removed duplicate expense link " + related_id + " from " + entity_kind + " " +
               entity_id;
    }
    if (operation == op::EXTRACT_ACCOMMODATION) {
        return "Extracted accommodation " + entity_id + " from location " + related_id;
    }
    if (operation == op::MOVE_LINK) {
        return "Moved expense link " + related_id + " to accommodation " + entity_id;
    }
    if (operation == op::ADD_LINK) {
        return "Added expense link " + related_id + " to " + entity_kind + " " + entity_id;
    }
    if (operation == op::ADD_TRAVEL_REFERENCE) {
        return "Linked expense " + entity_id + " to " + reason;
    }
    if (operation == op::CLEAR_TRAVEL_REFERENCE) {
        return "Cleared travel reference of expense " + entity_id + " (" + reason + ")";
    }
    if (operation == op::REBIND_ACCOMMODATION) {
        return "Rebound accommodation " + entity_id + " to location " + related_id;
    }
    if (operation == op::ORPHANED_ACCOMMODATION) {
        return "Accommodation " + entity_id + " has no owning location";
    }
    if (operation == op::RECREATE_ACCOMMODATION) {
        return "Recreated missing accommodation " + entity_id +
               (related_id.empty() ? std::string() : " for location " + related_id);
    }
    std::string text = operation + " " + entity_kind + " " + entity_id;
    if (!reason.empty()) {
        text += ": " + reason;
    }
    return text;
}

AuditLog::AuditLog(std::string trip_id) : trip_id_(std::move(trip_id)) {}

void AuditLog::record(const std::string& operation, const std::string& entity_kind,
                      const std::string& entity_id, const std::string& related_id,
                      const std::string& reason, bool mutating)
{
    AuditEntry entry{trip_id_, operation, entity_kind, entity_id, related_id, reason, mutating};

    infra::Logger::log(mutating ? infra::LogLevel::INFO : infra::LogLevel::WARN,
                       "Migration: Trip " + trip_id_ + ": " + entry.message());

    if (mutating) {
        ++mutations_;
    }
    entries_.push_back(std::move(entry));
}

std::vector<AuditEntry> AuditLog::by_operation(const std::string& operation) const
{
    std::vector<AuditEntry> out;
    for (const auto& entry : entries_) {
        if (entry.operation == operation) {
            out.push_back(entry);
        }
    }
    return out;
}

bool AuditLog::contains(const std::string& message) const
{
    for (const auto& entry : entries_) {
        if (entry.message() == message) {
            return true;
        }
    }
    return false;
}

} // namespace tripstore::migration
