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
 * @file recovery.hpp
 * @brief Salvage of trip files damaged by interrupted or interleaved writes.
 *
 * @details
 * Typical damage is a complete document followed by NUL bytes or by the stale
 * tail of a longer, older version. Recovery cuts the bytes at the first
 * invalid position and walks back to the last closing brace that yields a
 * complete document for the expected trip.
 */

#pragma once

#include "tripstore/model/trip.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace tripstore::storage {

struct RecoveredDocument {
    model::TripDocument document;
    std::size_t error_offset = 0; ///< First invalid byte of the damaged input.
    std::size_t kept_bytes = 0;   ///< Length of the prefix that was salvaged.
};

/**
 * @class Recovery
 * @brief Stateless salvage routines.
 */
class Recovery {
  public:
    /// @brief Upper bound on candidate prefixes tried per file.
    static constexpr std::size_t MAX_ATTEMPTS = 256;

    /**
     * @brief Position of the first invalid byte, or `std::nullopt` if @p raw parses.
     */
    static std::optional<std::size_t> first_invalid_offset(const std::string& raw);

    /**
     * @brief Recovers the longest valid document prefix of @p raw.
     *
     * @param raw The damaged bytes.
     * @param expected_id Id the recovered document must carry.
     * @return The salvaged document, or `std::nullopt` when nothing usable is left.
     */
    static std::optional<RecoveredDocument> salvage(const std::string& raw,
                                                    const std::string& expected_id);
};

} // namespace tripstore::storage
