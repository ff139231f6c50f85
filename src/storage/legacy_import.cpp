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
 * @file legacy_import.cpp
 * @brief Implementation of the split-layout reader.
 */

#include "tripstore/storage/legacy_import.hpp"

#include "tripstore/infra/logger.hpp"
#include "tripstore/infra/string.hpp"
#include "tripstore/infra/time.hpp"
#include "tripstore/model/codec.hpp"
#include "tripstore/model/json.hpp"

#include <cJSON.h>

#include <set>

namespace tripstore::storage {

using infra::Logger;
using infra::LogLevel;

namespace {

/// Cost trackers sometimes used their own `cost-` id as trip id.
std::string strip_cost_prefix(std::string id)
{
    while (infra::String::starts_with(id, "cost-")) {
        id = id.substr(5);
    }
    return id;
}

json::Ptr read_json(const std::string& path)
{
    const auto raw = Engine::read_file(path);
    if (!raw) {
        return json::Ptr();
    }
    json::Ptr root = json::parse(*raw);
    if (!root || !cJSON_IsObject(root.get())) {
        Logger::log(LogLevel::WARN, "Store: Ignoring unreadable legacy file " + path);
        return json::Ptr();
    }
    return root;
}

bool is_travel_file(const cJSON* root)
{
    return cJSON_IsString(cJSON_GetObjectItemCaseSensitive(root, "id")) &&
           cJSON_IsString(cJSON_GetObjectItemCaseSensitive(root, "title")) &&
           cJSON_IsArray(cJSON_GetObjectItemCaseSensitive(root, "locations"));
}

bool is_cost_file(const cJSON* root)
{
    return cJSON_IsString(cJSON_GetObjectItemCaseSensitive(root, "tripId")) &&
           cJSON_IsArray(cJSON_GetObjectItemCaseSensitive(root, "expenses"));
}

void copy_member(cJSON* to, const char* to_key, const cJSON* from, const char* from_key)
{
    const cJSON* value = cJSON_GetObjectItemCaseSensitive(from, from_key);
    if (value && !cJSON_IsNull(value)) {
        cJSON_AddItemToObject(to, to_key, cJSON_Duplicate(value, 1));
    }
}

} // namespace

std::optional<LegacyBundle> LegacyImport::find(const std::string& trip_id) const
{
    LegacyBundle bundle;

    json::Ptr travel = read_json(engine_.legacy_travel_path(trip_id));
    if (travel && is_travel_file(travel.get())) {
        bundle.travel_path = engine_.legacy_travel_path(trip_id);
    } else {
        travel.reset();
    }

    json::Ptr cost;
    for (const auto& name : engine_.list_files("cost-")) {
        const std::string path = engine_.base_path() + "/" + name;
        json::Ptr candidate = read_json(path);
        if (candidate && is_cost_file(candidate.get()) &&
            strip_cost_prefix(json::get_string(candidate.get(), "tripId")) == trip_id) {
            cost = std::move(candidate);
            bundle.cost_path = path;
            break;
        }
    }

    if (!travel && !cost) {
        return std::nullopt;
    }

    const std::string now = infra::Time::now_iso();
    json::Ptr root(cJSON_CreateObject());
    cJSON_AddNumberToObject(root.get(), "schemaVersion", 1);
    cJSON_AddStringToObject(root.get(), "id", trip_id.c_str());

    if (travel) {
        const cJSON* t = travel.get();
        cJSON_AddStringToObject(root.get(), "title", json::get_string(t, "title").c_str());
        cJSON_AddStringToObject(root.get(), "description",
                                json::get_string(t, "description").c_str());
        copy_member(root.get(), "startDate", t, "startDate");
        copy_member(root.get(), "endDate", t, "endDate");
        copy_member(root.get(), "createdAt", t, "createdAt");

        cJSON* itinerary = cJSON_AddObjectToObject(root.get(), "travelData");
        copy_member(itinerary, "locations", t, "locations");
        copy_member(itinerary, "routes", t, "routes");
        copy_member(itinerary, "days", t, "days");
    } else {
        const cJSON* c = cost.get();
        cJSON_AddStringToObject(root.get(), "title", json::get_string(c, "tripTitle").c_str());
        cJSON_AddStringToObject(root.get(), "description", "");
        copy_member(root.get(), "startDate", c, "tripStartDate");
        copy_member(root.get(), "endDate", c, "tripEndDate");
        copy_member(root.get(), "createdAt", c, "createdAt");
    }
    if (!cJSON_HasObjectItem(root.get(), "createdAt")) {
        cJSON_AddStringToObject(root.get(), "createdAt", now.c_str());
    }
    cJSON_AddStringToObject(root.get(), "updatedAt", now.c_str());

    if (cost) {
        const cJSON* c = cost.get();
        cJSON* finance = cJSON_AddObjectToObject(root.get(), "costData");
        copy_member(finance, "overallBudget", c, "overallBudget");
        copy_member(finance, "reservedBudget", c, "reservedBudget");
        copy_member(finance, "currency", c, "currency");
        copy_member(finance, "countryBudgets", c, "countryBudgets");
        copy_member(finance, "expenses", c, "expenses");
        copy_member(finance, "customCategories", c, "customCategories");
        copy_member(finance, "ynabImportData", c, "ynabImportData");
    }

    bundle.document = model::codec::from_json(root.get());
    Logger::log(LogLevel::INFO, "Store: Found legacy data for trip " + trip_id +
                                    (travel ? " (travel" : " (") +
                                    (travel && cost ? " + " : "") + (cost ? "cost)" : ")"));
    return bundle;
}

void LegacyImport::retire(const LegacyBundle& bundle) const
{
    for (const std::string* path : {&bundle.travel_path, &bundle.cost_path}) {
        if (path->empty()) {
            continue;
        }
        try {
            Engine::remove_file(*path);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::WARN,
                        "Store: Could not remove legacy file " + *path + ": " + e.what());
        }
    }
}

std::vector<std::string> LegacyImport::list_ids() const
{
    std::set<std::string> ids;
    for (const auto& name : engine_.list_files("travel-")) {
        json::Ptr root = read_json(engine_.base_path() + "/" + name);
        if (root && is_travel_file(root.get())) {
            ids.insert(json::get_string(root.get(), "id"));
        }
    }
    for (const auto& name : engine_.list_files("cost-")) {
        json::Ptr root = read_json(engine_.base_path() + "/" + name);
        if (root && is_cost_file(root.get())) {
            ids.insert(strip_cost_prefix(json::get_string(root.get(), "tripId")));
        }
    }

    std::vector<std::string> out;
    for (const auto& id : ids) {
        if (Engine::valid_trip_id(id)) {
            out.push_back(id);
        }
    }
    return out;
}

} // namespace tripstore::storage
