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
 * @file time.cpp
 * @brief Implementation of the UTC clock and ISO-8601 helpers.
 *
 * @details
 * Calendar conversion uses Howard Hinnant's days-from-civil algorithm so the
 * result is independent of `TZ` and of `timegm` availability.
 */

#include "tripstore/infra/time.hpp"

#include "tripstore/infra/string.hpp"

#include <chrono>
#include <cctype>
#include <cstdio>

namespace tripstore::infra {

namespace {

constexpr std::int64_t kMillisPerDay = 86400000LL;

std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d)
{
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civil_from_days(std::int64_t z, std::int64_t& y, unsigned& m, unsigned& d)
{
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<std::int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y += m <= 2 ? 1 : 0;
}

/// Reads exactly @p width digits at @p pos.
bool read_digits(const std::string& s, std::size_t pos, std::size_t width, int& out)
{
    if (pos + width > s.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = pos; i < pos + width; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
            return false;
        }
        value = value * 10 + (s[i] - '0');
    }
    out = value;
    return true;
}

} // namespace

std::int64_t Time::now_millis()
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string Time::now_iso()
{
    return to_iso(now_millis());
}

std::string Time::to_iso(std::int64_t millis)
{
    std::int64_t days = millis / kMillisPerDay;
    std::int64_t rem = millis % kMillisPerDay;
    if (rem < 0) {
        rem += kMillisPerDay;
        days -= 1;
    }

    std::int64_t year = 0;
    unsigned month = 0;
    unsigned day = 0;
    civil_from_days(days, year, month, day);

    const int hh = static_cast<int>(rem / 3600000);
    const int mm = static_cast<int>((rem / 60000) % 60);
    const int ss = static_cast<int>((rem / 1000) % 60);
    const int ms = static_cast<int>(rem % 1000);

    char buffer[40];
    std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02uT%02d:%02d:%02d.%03dZ",
                  static_cast<long long>(year), month, day, hh, mm, ss, ms);
    return std::string(buffer);
}

std::optional<std::int64_t> Time::parse_iso(const std::string& raw)
{
    const std::string text = String::trim(raw);
    int year = 0;
    int month = 0;
    int day = 0;
    if (!read_digits(text, 0, 4, year) || text.size() < 10 || text[4] != '-' ||
        !read_digits(text, 5, 2, month) || text[7] != '-' || !read_digits(text, 8, 2, day)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return std::nullopt;
    }

    int hour = 0;
    int minute = 0;
    int second = 0;
    int millis = 0;
    int offset_minutes = 0;
    std::size_t pos = 10;

    if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
        if (!read_digits(text, pos + 1, 2, hour) || pos + 3 >= text.size() ||
            text[pos + 3] != ':' || !read_digits(text, pos + 4, 2, minute)) {
            return std::nullopt;
        }
        pos += 6;
        if (pos < text.size() && text[pos] == ':') {
            if (!read_digits(text, pos + 1, 2, second)) {
                return std::nullopt;
            }
            pos += 3;
        }
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            int scale = 100;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                millis += (text[pos] - '0') * scale;
                scale /= 10;
                ++pos;
            }
        }
        if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
            ++pos;
        } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
            const int sign = text[pos] == '-' ? -1 : 1;
            int oh = 0;
            int om = 0;
            if (!read_digits(text, pos + 1, 2, oh)) {
                return std::nullopt;
            }
            std::size_t next = pos + 3;
            if (next < text.size() && text[next] == ':') {
                ++next;
            }
            if (!read_digits(text, next, 2, om)) {
                return std::nullopt;
            }
            offset_minutes = sign * (oh * 60 + om);
            pos = next + 2;
        }
    }

    if (pos != text.size() || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    const std::int64_t days =
        days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    return days * kMillisPerDay + hour * 3600000LL + minute * 60000LL + second * 1000LL + millis -
           offset_minutes * 60000LL;
}

std::string Time::normalize_iso(const std::string& text)
{
    auto parsed = parse_iso(text);
    return parsed ? to_iso(*parsed) : text;
}

std::string Time::file_stamp()
{
    std::string stamp = now_iso();
    stamp = String::replace_all(stamp, ":", "-");
    return String::replace_all(stamp, ".", "-");
}

std::string Time::day_key(const std::string& iso)
{
    auto parsed = parse_iso(iso);
    if (!parsed) {
        return "";
    }
    return to_iso(*parsed).substr(0, 10);
}

std::string Time::format_date_range(const std::string& start, const std::string& end)
{
    const std::string start_day = day_key(start);
    if (start_day.empty()) {
        return "";
    }
    const std::string end_day = end.empty() ? std::string() : day_key(end);
    if (end_day.empty() || end_day == start_day) {
        return start_day;
    }
    return start_day + " - " + end_day;
}

} // namespace tripstore::infra
