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
 * @file id_generator.cpp
 * @brief Implementation of the identifier generators.
 */

#include "tripstore/infra/id_generator.hpp"

#include "tripstore/infra/time.hpp"

#include <cstdint>
#include <cstdio>
#include <random>

namespace tripstore::infra {

namespace {

std::mt19937_64& engine()
{
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    return gen;
}

constexpr char kBase36[] = "0123456789abcdefghijklmnopqrstuvwxyz";

std::string to_base36(std::uint64_t value)
{
    if (value == 0) {
        return "0";
    }
    std::string out;
    while (value > 0) {
        out.insert(out.begin(), kBase36[value % 36]);
        value /= 36;
    }
    return out;
}

} // namespace

std::string IdGenerator::generate()
{
    std::uniform_int_distribution<std::uint64_t> dis;
    std::uint64_t hi = dis(engine());
    std::uint64_t lo = dis(engine());

    // Version nibble (0100) and RFC 4122 variant bits (10).
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buffer[37];
    std::snprintf(buffer, sizeof(buffer), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32), static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF), static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return std::string(buffer);
}

std::string IdGenerator::token(std::size_t length)
{
    std::uniform_int_distribution<int> dis(0, 35);
    std::string out;
    out.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        out.push_back(kBase36[dis(engine())]);
    }
    return out;
}

std::string IdGenerator::timestamped(const std::string& prefix, bool base36_millis)
{
    const std::int64_t millis = Time::now_millis();
    const std::string clock =
        base36_millis ? to_base36(static_cast<std::uint64_t>(millis)) : std::to_string(millis);
    return prefix + "-" + clock + "-" + token(9);
}

} // namespace tripstore::infra
