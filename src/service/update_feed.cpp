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
 * @file update_feed.cpp
 * @brief Implementation of the itinerary change notices.
 */

#include "tripstore/service/update_feed.hpp"

#include "tripstore/infra/id_generator.hpp"
#include "tripstore/infra/string.hpp"
#include "tripstore/infra/time.hpp"

#include <string>
#include <unordered_map>
#include <unordered_set>

namespace tripstore::service {

using model::Location;
using model::PostRef;
using model::TripUpdate;

namespace {

TripUpdate notice(const std::string& created_at, std::string message)
{
    return TripUpdate{infra::IdGenerator::timestamped("update", true), created_at,
                      std::move(message)};
}

std::string range_of(const Location& location)
{
    return infra::Time::format_date_range(location.date, location.end_date);
}

/// Empty when the location has no parsable date.
std::string range_key(const Location& location)
{
    const std::string start = infra::Time::day_key(location.date);
    const std::string end =
        infra::Time::day_key(location.end_date.empty() ? location.date : location.end_date);
    if (start.empty() && end.empty()) {
        return "";
    }
    return start + "|" + end;
}

std::string location_reference(const Location& location)
{
    const std::string range = range_of(location);
    return range.empty() ? location.name : location.name + " on " + range;
}

std::string visit_reference(const Location& location)
{
    const std::string range = range_of(location);
    return range.empty() ? location.name + " visit" : location.name + " visit of " + range;
}

std::size_t count_new_posts(const std::vector<PostRef>& before, const std::vector<PostRef>& after)
{
    auto key_of = [](const PostRef& post) { return post.id.empty() ? post.url : post.id; };

    std::unordered_set<std::string> known;
    for (const auto& post : before) {
        const std::string key = key_of(post);
        if (!key.empty()) {
            known.insert(key);
        }
    }

    std::size_t fresh = 0;
    for (const auto& post : after) {
        const std::string key = key_of(post);
        if (!key.empty() && known.count(key) == 0) {
            ++fresh;
        }
    }
    return fresh;
}

void post_notice(std::vector<TripUpdate>& out, const std::string& created_at,
                 const Location& location, const char* label, std::size_t count)
{
    if (count == 0) {
        return;
    }
    out.push_back(notice(created_at, std::string("New ") + label + (count == 1 ? " post" : " posts") +
                                         " added to the " + visit_reference(location) + "."));
}

} // namespace

std::vector<TripUpdate> UpdateFeed::diff(const model::TripDocument& previous,
                                         const std::vector<Location>* locations,
                                         const std::vector<model::Route>* routes)
{
    std::vector<TripUpdate> out;
    const std::string created_at = infra::Time::now_iso();

    if (locations) {
        static const std::vector<Location> kNone;
        const auto& before = previous.itinerary ? previous.itinerary->locations : kNone;

        std::unordered_map<std::string, const Location*> before_by_id;
        for (const auto& location : before) {
            before_by_id.emplace(location.id, &location);
        }
        std::unordered_set<std::string> after_ids;
        for (const auto& location : *locations) {
            after_ids.insert(location.id);
        }

        for (const auto& location : *locations) {
            if (before_by_id.count(location.id) == 0) {
                out.push_back(notice(created_at, "New trip location added: " +
                                                     location_reference(location) + "."));
            }
        }

        for (const auto& location : before) {
            if (after_ids.count(location.id) > 0) {
                continue;
            }
            const std::string range = range_of(location);
            out.push_back(notice(created_at, range.empty()
                                                 ? "Visit to " + location.name + " cancelled."
                                                 : "Visit to " + location.name + " on " + range +
                                                       " cancelled."));
        }

        for (const auto& location : *locations) {
            auto found = before_by_id.find(location.id);
            if (found == before_by_id.end()) {
                continue;
            }
            const Location& old = *found->second;

            const std::string old_key = range_key(old);
            const std::string new_key = range_key(location);
            if (!old_key.empty() && !new_key.empty() && old_key != new_key) {
                const std::string old_range = range_of(old);
                const std::string new_range = range_of(location);
                if (!old_range.empty() && !new_range.empty()) {
                    out.push_back(notice(created_at, "Visit to " + location.name + " on " +
                                                         old_range + " rescheduled to " +
                                                         new_range + "."));
                }
            }

            post_notice(out, created_at, location, "Instagram",
                        count_new_posts(old.instagram_posts, location.instagram_posts));
            post_notice(out, created_at, location, "TikTok",
                        count_new_posts(old.tiktok_posts, location.tiktok_posts));
            post_notice(out, created_at, location, "blog",
                        count_new_posts(old.blog_posts, location.blog_posts));
        }
    }

    if (routes) {
        std::unordered_set<std::string> known;
        if (previous.itinerary) {
            for (const auto& route : previous.itinerary->routes) {
                known.insert(route.id);
            }
        }
        for (const auto& route : *routes) {
            if (known.count(route.id) > 0 || route.from.empty() || route.to.empty()) {
                continue;
            }
            const std::string transport =
                route.type.empty() ? "travel" : infra::String::to_lower(route.type);
            out.push_back(notice(created_at, "New " + transport + " route added between " +
                                                 route.from + " and " + route.to + "."));
        }
    }

    return out;
}

void UpdateFeed::publish(model::TripDocument& doc, const std::vector<TripUpdate>& updates)
{
    if (updates.empty()) {
        return;
    }
    std::vector<TripUpdate> merged(updates.begin(), updates.end());
    merged.insert(merged.end(), doc.public_updates.begin(), doc.public_updates.end());
    if (merged.size() > model::MAX_PUBLIC_UPDATES) {
        merged.resize(model::MAX_PUBLIC_UPDATES);
    }
    doc.public_updates = std::move(merged);
}

} // namespace tripstore::service
