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
 * @file error.cpp
 * @brief Domain exception implementations.
 */

#include "tripstore/core/error.hpp"

#include <utility>

namespace tripstore {

const char* to_string(ErrorCode code)
{
    switch (code) {
    case ErrorCode::CROSS_TRIP_EXPENSE:
        return "CROSS_TRIP_EXPENSE";
    case ErrorCode::CROSS_TRIP_TRAVEL_ITEM:
        return "CROSS_TRIP_TRAVEL_ITEM";
    case ErrorCode::EXPENSE_NOT_FOUND:
        return "EXPENSE_NOT_FOUND";
    case ErrorCode::TRAVEL_ITEM_NOT_FOUND:
        return "TRAVEL_ITEM_NOT_FOUND";
    case ErrorCode::TRIP_NOT_FOUND:
        return "TRIP_NOT_FOUND";
    case ErrorCode::BACKUP_NOT_FOUND:
        return "BACKUP_NOT_FOUND";
    case ErrorCode::INVALID_SCHEMA_VERSION:
        return "INVALID_SCHEMA_VERSION";
    case ErrorCode::INVALID_TRIP_ID:
        return "INVALID_TRIP_ID";
    case ErrorCode::CONFLICT:
        return "CONFLICT";
    case ErrorCode::VALIDATION:
        return "VALIDATION";
    }
    return "UNKNOWN";
}

Error::Error(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code)
{
}

NotFoundError::NotFoundError(ErrorCode code, const std::string& message) : Error(code, message) {}

ValidationError::ValidationError(ErrorCode code, const std::string& message,
                                 std::vector<std::string> violations)
    : Error(code, message), violations_(std::move(violations))
{
}

ConflictError::ConflictError(const std::string& message) : Error(ErrorCode::CONFLICT, message) {}

InvalidSchemaVersionError::InvalidSchemaVersionError(const std::string& message)
    : Error(ErrorCode::INVALID_SCHEMA_VERSION, message)
{
}

} // namespace tripstore
