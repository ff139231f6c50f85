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
 * @file id_generator.hpp
 * @brief Identifier generation for backups, change notices and temp files.
 */

#pragma once

#include <cstddef>
#include <string>

namespace tripstore::infra {

/**
 * @class IdGenerator
 * @brief Static, lock-free random identifier source.
 *
 * @details
 * Each thread owns its own Mersenne Twister seeded from `std::random_device`,
 * so concurrent save workers can mint temporary file names without contention.
 */
class IdGenerator {
  public:
    /**
     * @brief Generates an RFC 4122 Version 4 UUID.
     *
     * Canonical form `xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx`, `y` in `{8,9,a,b}`.
     * Used for unique temporary file names.
     */
    static std::string generate();

    /**
     * @brief Generates a short lowercase base-36 token.
     *
     * @param length Number of characters, e.g. 9 for `backup-<ms>-<token>`.
     * @return std::string Characters drawn from `[0-9a-z]`.
     */
    static std::string token(std::size_t length);

    /**
     * @brief Builds `<prefix>-<millis>-<token>` identifiers.
     *
     * @param prefix Leading tag such as `backup`.
     * @param base36_millis Render the millisecond clock in base 36 (change
     * notices) instead of decimal (backups).
     */
    static std::string timestamped(const std::string& prefix, bool base36_millis = false);
};

} // namespace tripstore::infra
