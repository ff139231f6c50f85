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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * Stateless helpers used when comparing expense categories, matching backup
 * search queries and assembling human-readable change notices.
 */

#pragma once

#include <string>
#include <vector>

namespace tripstore::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace (`isspace` classes).
     *
     * @code
     * String::trim("  Hotel Aurora \n"); // "Hotel Aurora"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /// @brief ASCII lowercase copy.
    static std::string to_lower(const std::string& s);

    /// @brief ASCII case-insensitive equality.
    static bool iequals(const std::string& a, const std::string& b);

    /// @brief ASCII case-insensitive substring test. An empty needle always matches.
    static bool icontains(const std::string& haystack, const std::string& needle);

    static bool starts_with(const std::string& s, const std::string& prefix);
    static bool ends_with(const std::string& s, const std::string& suffix);

    /// @brief Replaces every occurrence of @p from (non-empty) with @p to.
    static std::string replace_all(std::string s, const std::string& from, const std::string& to);

    /// @brief Joins @p parts with @p separator.
    static std::string join(const std::vector<std::string>& parts, const std::string& separator);
};

} // namespace tripstore::infra
