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
 * @file time.hpp
 * @brief UTC clock and ISO-8601 helpers.
 *
 * @details
 * Trip documents store every date as an ISO-8601 UTC string
 * (`2024-07-15T00:00:00.000Z`). These helpers produce such strings, parse the
 * forms found in historical files, and render the compact stamps used in
 * backup and quarantine file names. All conversions are pure arithmetic on the
 * proleptic Gregorian calendar; no process timezone is consulted.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace tripstore::infra {

/**
 * @class Time
 * @brief Static UTC time utilities.
 */
class Time {
  public:
    /// @brief Milliseconds since the Unix epoch.
    static std::int64_t now_millis();

    /// @brief Current instant as `YYYY-MM-DDTHH:MM:SS.mmmZ`.
    static std::string now_iso();

    /// @brief Formats epoch milliseconds as `YYYY-MM-DDTHH:MM:SS.mmmZ`.
    static std::string to_iso(std::int64_t millis);

    /**
     * @brief Parses an ISO-8601 date or date-time into epoch milliseconds.
     *
     * Accepted forms: `YYYY-MM-DD`, `YYYY-MM-DDTHH:MM`, `YYYY-MM-DDTHH:MM:SS`,
     * optional fraction, optional `Z` or `+HH:MM` / `-HH:MM` offset.
     *
     * @return std::nullopt if @p text is not a recognisable date.
     */
    static std::optional<std::int64_t> parse_iso(const std::string& text);

    /**
     * @brief Normalizes an ISO string to the canonical millisecond form.
     * @return The canonical string, or @p text unchanged when unparsable.
     */
    static std::string normalize_iso(const std::string& text);

    /// @brief File-name-safe stamp: ISO form with `:` and `.` replaced by `-`.
    static std::string file_stamp();

    /// @brief The `YYYY-MM-DD` calendar day (UTC) of an ISO string, or "".
    static std::string day_key(const std::string& iso);

    /**
     * @brief Human range for change notices.
     *
     * Renders `<start> - <end>` by calendar day, or just `<start>` when the end
     * is absent or on the same day. Returns "" for an unparsable start.
     */
    static std::string format_date_range(const std::string& start, const std::string& end);
};

} // namespace tripstore::infra
