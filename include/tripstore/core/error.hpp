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
 * @file error.hpp
 * @brief Domain error taxonomy surfaced to callers.
 *
 * @details
 * Every exception raised for a condition the caller must react to derives
 * from `tripstore::Error` and carries a stable `ErrorCode`. Filesystem
 * failures are deliberately NOT wrapped: they reach the caller as
 * `std::filesystem::filesystem_error` or `std::runtime_error`.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace tripstore {

/**
 * @enum ErrorCode
 * @brief Machine-readable error codes; `to_string` gives the wire form.
 */
enum class ErrorCode {
    CROSS_TRIP_EXPENSE,
    CROSS_TRIP_TRAVEL_ITEM,
    EXPENSE_NOT_FOUND,
    TRAVEL_ITEM_NOT_FOUND,
    TRIP_NOT_FOUND,
    BACKUP_NOT_FOUND,
    INVALID_SCHEMA_VERSION,
    INVALID_TRIP_ID,
    CONFLICT,
    VALIDATION
};

/// @brief Stable upper-snake-case name of @p code.
const char* to_string(ErrorCode code);

/**
 * @class Error
 * @brief Base class of every domain exception.
 */
class Error : public std::runtime_error {
  public:
    Error(ErrorCode code, const std::string& message);

    ErrorCode code() const noexcept { return code_; }

  private:
    ErrorCode code_;
};

/// @brief A trip, expense, travel item or backup does not exist.
class NotFoundError : public Error {
  public:
    NotFoundError(ErrorCode code, const std::string& message);
};

/**
 * @class ValidationError
 * @brief A request was rejected; carries every violation, not just the first.
 */
class ValidationError : public Error {
  public:
    ValidationError(ErrorCode code, const std::string& message,
                    std::vector<std::string> violations = {});

    const std::vector<std::string>& violations() const noexcept { return violations_; }

  private:
    std::vector<std::string> violations_;
};

/// @brief The target already holds data and no overwrite was requested.
class ConflictError : public Error {
  public:
    explicit ConflictError(const std::string& message);
};

/// @brief A document's `schemaVersion` is missing, below 1 or above current.
class InvalidSchemaVersionError : public Error {
  public:
    explicit InvalidSchemaVersionError(const std::string& message);
};

} // namespace tripstore
