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
 * @file json.cpp
 * @brief cJSON helper implementations.
 */

#include "tripstore/model/json.hpp"

#include "tripstore/infra/time.hpp"

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <new>

namespace tripstore::json {

namespace {

constexpr double kMaxEpochMillis = 8.64e15;

} // namespace

Ptr parse(const std::string& raw, std::size_t* error_offset)
{
    const std::size_t npos = std::string::npos;
    std::size_t fail_at = npos;

    const char* end = nullptr;
    cJSON* root = cJSON_ParseWithLengthOpts(raw.data(), raw.size(), &end, 0);

    if (!root) {
        fail_at = end ? static_cast<std::size_t>(end - raw.data()) : 0;
    } else {
        std::size_t pos = end ? static_cast<std::size_t>(end - raw.data()) : raw.size();
        while (pos < raw.size() &&
               (raw[pos] == ' ' || raw[pos] == '\t' || raw[pos] == '\n' || raw[pos] == '\r')) {
            ++pos;
        }
        if (pos < raw.size()) {
            fail_at = pos;
        }
    }

    const std::size_t nul = raw.find('\0');
    if (nul != npos && (fail_at == npos || nul < fail_at)) {
        fail_at = nul;
    }

    if (fail_at != npos) {
        cJSON_Delete(root);
        if (error_offset) {
            *error_offset = fail_at;
        }
        return Ptr();
    }
    return Ptr(root);
}

std::string print(const cJSON* node, bool pretty)
{
    if (!node) {
        return "null";
    }
    char* text = pretty ? cJSON_Print(node) : cJSON_PrintUnformatted(node);
    if (!text) {
        throw std::bad_alloc();
    }
    std::string out(text);
    cJSON_free(text);
    return out;
}

std::string get_string(const cJSON* obj, const char* key, const std::string& fallback)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(obj, key);
    if (cJSON_IsString(item) && item->valuestring) {
        return item->valuestring;
    }
    if (cJSON_IsNumber(item)) {
        // Ids written by older clients were sometimes numeric.
        double value = item->valuedouble;
        if (std::floor(value) == value && std::fabs(value) < 9.0e15) {
            return std::to_string(static_cast<long long>(value));
        }
        return std::to_string(value);
    }
    return fallback;
}

std::optional<double> get_number(const cJSON* obj, const char* key)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(obj, key);
    if (cJSON_IsNumber(item)) {
        return item->valuedouble;
    }
    if (cJSON_IsString(item) && item->valuestring && *item->valuestring) {
        char* end = nullptr;
        double value = std::strtod(item->valuestring, &end);
        if (end && *end == '\0') {
            return value;
        }
    }
    return std::nullopt;
}

bool get_bool(const cJSON* obj, const char* key, bool fallback)
{
    auto value = get_optional_bool(obj, key);
    return value ? *value : fallback;
}

std::optional<bool> get_optional_bool(const cJSON* obj, const char* key)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(obj, key);
    if (cJSON_IsBool(item)) {
        return cJSON_IsTrue(item) != 0;
    }
    return std::nullopt;
}

std::vector<std::string> get_string_array(const cJSON* obj, const char* key)
{
    std::vector<std::string> out;
    const cJSON* array = cJSON_GetObjectItemCaseSensitive(obj, key);
    if (!cJSON_IsArray(array)) {
        return out;
    }
    const cJSON* item = nullptr;
    cJSON_ArrayForEach(item, array)
    {
        if (cJSON_IsString(item) && item->valuestring) {
            out.emplace_back(item->valuestring);
        }
    }
    return out;
}

std::string get_date(const cJSON* obj, const char* key)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(obj, key);
    if (cJSON_IsNumber(item)) {
        // Epoch milliseconds, bounded like a JavaScript Date.
        const double millis = item->valuedouble;
        if (!(millis >= -kMaxEpochMillis && millis <= kMaxEpochMillis)) {
            return "";
        }
        return infra::Time::to_iso(static_cast<std::int64_t>(millis));
    }
    if (cJSON_IsString(item) && item->valuestring) {
        return infra::Time::normalize_iso(item->valuestring);
    }
    return "";
}

void add_string_if(cJSON* obj, const char* key, const std::string& value)
{
    if (!value.empty()) {
        cJSON_AddStringToObject(obj, key, value.c_str());
    }
}

void add_string_array(cJSON* obj, const char* key, const std::vector<std::string>& values)
{
    cJSON* array = cJSON_AddArrayToObject(obj, key);
    for (const auto& value : values) {
        cJSON_AddItemToArray(array, cJSON_CreateString(value.c_str()));
    }
}

std::string collect_extras(const cJSON* obj, std::initializer_list<const char*> known)
{
    if (!cJSON_IsObject(obj)) {
        return "";
    }

    Ptr extras(cJSON_CreateObject());
    bool any = false;

    const cJSON* member = nullptr;
    cJSON_ArrayForEach(member, obj)
    {
        if (!member->string) {
            continue;
        }
        bool is_known = false;
        for (const char* name : known) {
            if (std::strcmp(member->string, name) == 0) {
                is_known = true;
                break;
            }
        }
        if (!is_known) {
            cJSON_AddItemToObject(extras.get(), member->string, cJSON_Duplicate(member, 1));
            any = true;
        }
    }
    return any ? print(extras.get()) : "";
}

void merge_extras(cJSON* obj, const std::string& extras)
{
    if (extras.empty()) {
        return;
    }
    Ptr parsed(cJSON_Parse(extras.c_str()));
    if (!cJSON_IsObject(parsed.get())) {
        return;
    }
    const cJSON* member = nullptr;
    cJSON_ArrayForEach(member, parsed.get())
    {
        if (member->string && !cJSON_HasObjectItem(obj, member->string)) {
            cJSON_AddItemToObject(obj, member->string, cJSON_Duplicate(member, 1));
        }
    }
}

cJSON* parse_fragment(const std::string& text)
{
    if (text.empty()) {
        return nullptr;
    }
    return cJSON_Parse(text.c_str());
}

} // namespace tripstore::json
