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
 * @file json.hpp
 * @brief Thin helpers over cJSON used by the codec, the catalog and the handler.
 *
 * @details
 * cJSON trees are owned through `json::Ptr` so that a decoding exception never
 * leaks a tree. Accessors are tolerant: a missing or mistyped field yields the
 * fallback instead of failing, matching how historical trip files omit fields.
 */

#pragma once

#include <cJSON.h>

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tripstore::json {

struct Deleter {
    void operator()(cJSON* node) const { cJSON_Delete(node); }
};

/// @brief Owning handle to a cJSON tree.
using Ptr = std::unique_ptr<cJSON, Deleter>;

/**
 * @brief Parses @p raw as exactly one JSON value.
 *
 * Unlike plain `cJSON_Parse`, the whole buffer must be consumed (trailing
 * whitespace allowed) and embedded NUL bytes are rejected, since cJSON's own
 * scanner would otherwise stop at or skip over them.
 *
 * @param raw Buffer to parse, possibly containing NUL bytes.
 * @param error_offset On failure, receives the byte offset of the first
 * invalid position (parser error, trailing data or first NUL, whichever is
 * earliest). May be null.
 * @return Ptr The parsed tree, or an empty pointer on failure.
 */
Ptr parse(const std::string& raw, std::size_t* error_offset = nullptr);

/// @brief Prints a tree; @p pretty selects `cJSON_Print` over the compact form.
std::string print(const cJSON* node, bool pretty = false);

std::string get_string(const cJSON* obj, const char* key, const std::string& fallback = "");
std::optional<double> get_number(const cJSON* obj, const char* key);
bool get_bool(const cJSON* obj, const char* key, bool fallback = false);
std::optional<bool> get_optional_bool(const cJSON* obj, const char* key);
std::vector<std::string> get_string_array(const cJSON* obj, const char* key);

/**
 * @brief Reads a date-typed field.
 *
 * ISO strings are normalized to `YYYY-MM-DDTHH:MM:SS.mmmZ`; epoch-millisecond
 * numbers are converted to that form; unparsable strings are kept verbatim.
 */
std::string get_date(const cJSON* obj, const char* key);

/// @brief Adds @p value under @p key unless it is empty.
void add_string_if(cJSON* obj, const char* key, const std::string& value);

/// @brief Adds a JSON array of strings.
void add_string_array(cJSON* obj, const char* key, const std::vector<std::string>& values);

/**
 * @brief Captures every member of @p obj not listed in @p known.
 * @return Compact JSON object text, or "" when nothing is left over.
 */
std::string collect_extras(const cJSON* obj, std::initializer_list<const char*> known);

/// @brief Re-attaches members captured by `collect_extras` that @p obj lacks.
void merge_extras(cJSON* obj, const std::string& extras);

/// @brief Parses carried JSON text into a node, or nullptr when empty/invalid.
cJSON* parse_fragment(const std::string& text);

} // namespace tripstore::json
