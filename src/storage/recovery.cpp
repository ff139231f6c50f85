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
 * @file recovery.cpp
 * @brief Implementation of prefix salvage.
 */

#include "tripstore/storage/recovery.hpp"

#include "tripstore/model/codec.hpp"
#include "tripstore/model/json.hpp"

#include <cJSON.h>

#include <algorithm>

namespace tripstore::storage {

std::optional<std::size_t> Recovery::first_invalid_offset(const std::string& raw)
{
    std::size_t offset = 0;
    if (json::parse(raw, &offset)) {
        return std::nullopt;
    }
    return offset;
}

std::optional<RecoveredDocument> Recovery::salvage(const std::string& raw,
                                                   const std::string& expected_id)
{
    const auto offset = first_invalid_offset(raw);
    if (!offset) {
        return std::nullopt;
    }

    const std::string head = raw.substr(0, std::min(*offset, raw.size()));

    std::size_t attempts = 0;
    std::size_t end = head.rfind('}');
    while (end != std::string::npos && attempts < MAX_ATTEMPTS) {
        ++attempts;

        const std::string candidate = head.substr(0, end + 1);
        json::Ptr root = json::parse(candidate);
        if (root && cJSON_IsObject(root.get())) {
            model::TripDocument doc = model::codec::from_json(root.get());
            if (!doc.id.empty() && doc.id == expected_id) {
                return RecoveredDocument{std::move(doc), *offset, candidate.size()};
            }
        }

        if (end == 0) {
            break;
        }
        end = head.rfind('}', end - 1);
    }

    return std::nullopt;
}

} // namespace tripstore::storage
