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
 * @file checksum.hpp
 * @brief Content digests for backup integrity verification.
 */

#pragma once

#include <string>

namespace tripstore::infra {

/**
 * @class Checksum
 * @brief SHA-256 digests rendered as lowercase hex.
 */
class Checksum {
  public:
    /**
     * @brief Hashes an in-memory buffer.
     * @throws std::runtime_error if the digest backend fails.
     */
    static std::string sha256_hex(const std::string& data);

    /**
     * @brief Streams a file through SHA-256.
     * @throws std::runtime_error if the file cannot be read.
     */
    static std::string sha256_file(const std::string& path);
};

} // namespace tripstore::infra
