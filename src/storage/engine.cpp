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
 * @file engine.cpp
 * @brief Implementation of the file layer.
 *
 * @details
 * Every write goes through `write_atomic`: the payload is flushed to a
 * sibling temporary file (`<target>.tmp-<token>`) and then swapped into
 * place with `rename`, which is atomic within one filesystem.
 */

#include "tripstore/storage/engine.hpp"

#include "tripstore/core/error.hpp"
#include "tripstore/infra/id_generator.hpp"
#include "tripstore/infra/logger.hpp"
#include "tripstore/infra/string.hpp"
#include "tripstore/infra/time.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace tripstore::storage {

using infra::Logger;
using infra::LogLevel;

namespace {

constexpr std::size_t kMaxTripIdLength = 200;
constexpr const char* kTripPrefix = "trip-";
constexpr const char* kJsonSuffix = ".json";

} // namespace

Engine::Engine(std::string base_path) : base_path_(std::move(base_path)) {}

void Engine::init() const
{
    fs::create_directories(base_path_);
    fs::create_directories(backups_dir());
}

bool Engine::valid_trip_id(const std::string& trip_id)
{
    if (trip_id.empty() || trip_id.size() > kMaxTripIdLength) {
        return false;
    }
    return std::all_of(trip_id.begin(), trip_id.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
               c == '-' || c == '_';
    });
}

void Engine::require_valid_id(const std::string& trip_id)
{
    if (!valid_trip_id(trip_id)) {
        throw ValidationError(ErrorCode::INVALID_TRIP_ID, "Invalid trip id: '" + trip_id + "'");
    }
}

std::string Engine::trip_path(const std::string& trip_id) const
{
    return base_path_ + "/" + kTripPrefix + trip_id + kJsonSuffix;
}

std::string Engine::legacy_travel_path(const std::string& trip_id) const
{
    return base_path_ + "/travel-" + trip_id + kJsonSuffix;
}

std::string Engine::legacy_cost_path(const std::string& cost_id) const
{
    return base_path_ + "/cost-" + cost_id + kJsonSuffix;
}

std::string Engine::backups_dir() const
{
    return base_path_ + "/backups";
}

std::string Engine::backup_path(const std::string& kind, const std::string& trip_id) const
{
    return backups_dir() + "/deleted-" + kind + "-" + trip_id + "-" + infra::Time::file_stamp() +
           kJsonSuffix;
}

std::string Engine::quarantine(const std::string& trip_id, const std::string& raw) const
{
    fs::create_directories(backups_dir());
    const std::string path =
        backups_dir() + "/corrupted-trip-" + trip_id + "-" + infra::Time::file_stamp() + ".json.corrupt";
    write_atomic(path, raw);
    Logger::log(LogLevel::WARN, "Store: Quarantined corrupted file of trip " + trip_id + " at " + path);
    return path;
}

std::vector<std::string> Engine::list_files(const std::string& prefix) const
{
    std::vector<std::string> names;
    std::error_code ec;
    if (!fs::is_directory(base_path_, ec)) {
        return names;
    }
    for (const auto& entry : fs::directory_iterator(base_path_)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        const std::string name = entry.path().filename().string();
        if (infra::String::starts_with(name, prefix) && infra::String::ends_with(name, kJsonSuffix)) {
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> Engine::list_trip_ids() const
{
    std::vector<std::string> ids;
    const std::size_t prefix_len = std::char_traits<char>::length(kTripPrefix);
    const std::size_t suffix_len = std::char_traits<char>::length(kJsonSuffix);
    for (const auto& name : list_files(kTripPrefix)) {
        std::string id = name.substr(prefix_len, name.size() - prefix_len - suffix_len);
        if (valid_trip_id(id)) {
            ids.push_back(std::move(id));
        }
    }
    return ids;
}

std::optional<std::string> Engine::read_file(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            return std::nullopt;
        }
        throw std::runtime_error("Cannot open " + path + " for reading");
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw std::runtime_error("Read error on " + path);
    }
    return content;
}

void Engine::write_atomic(const std::string& path, const std::string& content)
{
    const std::string temp_path = path + ".tmp-" + infra::IdGenerator::token(12);

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open temporary file " + temp_path);
        }
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.flush();
        file.close();

        if (file.fail()) {
            std::error_code ec;
            fs::remove(temp_path, ec);
            throw std::runtime_error("Failed to write " + temp_path);
        }
    }

    try {
        fs::rename(temp_path, path);
    } catch (const fs::filesystem_error&) {
        std::error_code ec;
        fs::remove(temp_path, ec);
        throw;
    }
}

bool Engine::remove_file(const std::string& path)
{
    return fs::remove(path);
}

} // namespace tripstore::storage
