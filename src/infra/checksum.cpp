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
 * @file checksum.cpp
 * @brief OpenSSL EVP implementation of the SHA-256 helpers.
 */

#include "tripstore/infra/checksum.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <stdexcept>
#include <vector>

namespace tripstore::infra {

namespace {

/// Owns an EVP digest context for the duration of one hash.
class DigestContext {
  public:
    DigestContext() : ctx_(EVP_MD_CTX_new())
    {
        if (!ctx_) {
            throw std::runtime_error("OpenSSL: EVP_MD_CTX_new failed");
        }
        if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
            EVP_MD_CTX_free(ctx_);
            throw std::runtime_error("OpenSSL: EVP_DigestInit_ex failed");
        }
    }

    ~DigestContext() { EVP_MD_CTX_free(ctx_); }

    DigestContext(const DigestContext&) = delete;
    DigestContext& operator=(const DigestContext&) = delete;

    void update(const char* data, std::size_t len)
    {
        if (len > 0 && EVP_DigestUpdate(ctx_, data, len) != 1) {
            throw std::runtime_error("OpenSSL: EVP_DigestUpdate failed");
        }
    }

    std::string hex()
    {
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int length = 0;
        if (EVP_DigestFinal_ex(ctx_, digest, &length) != 1) {
            throw std::runtime_error("OpenSSL: EVP_DigestFinal_ex failed");
        }

        static const char kHex[] = "0123456789abcdef";
        std::string out;
        out.reserve(length * 2);
        for (unsigned int i = 0; i < length; ++i) {
            out.push_back(kHex[digest[i] >> 4]);
            out.push_back(kHex[digest[i] & 0x0F]);
        }
        return out;
    }

  private:
    EVP_MD_CTX* ctx_;
};

} // namespace

std::string Checksum::sha256_hex(const std::string& data)
{
    DigestContext ctx;
    ctx.update(data.data(), data.size());
    return ctx.hex();
}

std::string Checksum::sha256_file(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Checksum: cannot open '" + path + "'");
    }

    DigestContext ctx;
    std::vector<char> buffer(64 * 1024);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        ctx.update(buffer.data(), static_cast<std::size_t>(file.gcount()));
    }
    if (file.bad()) {
        throw std::runtime_error("Checksum: read error on '" + path + "'");
    }
    return ctx.hex();
}

} // namespace tripstore::infra
