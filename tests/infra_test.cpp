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
 * @file infra_test.cpp
 * @brief Unit tests for shared infrastructure primitives.
 *
 * @details
 * Covers id generation, string and time helpers, SHA-256 checksums, the
 * logger level parser, environment configuration and the worker pool.
 */

#include "fixtures.hpp"
#include "framework.hpp"
#include "tripstore/infra/checksum.hpp"
#include "tripstore/infra/config.hpp"
#include "tripstore/infra/id_generator.hpp"
#include "tripstore/infra/logger.hpp"
#include "tripstore/infra/scheduler.hpp"
#include "tripstore/infra/string.hpp"
#include "tripstore/infra/time.hpp"

#include <atomic>
#include <cstdlib>
#include <future>
#include <string>
#include <vector>

using namespace tripstore::infra;

/**
 * @brief A version 4 UUID is 32 hex digits and 4 hyphens.
 */
void test_uuid_length()
{
    std::string id = IdGenerator::generate();
    ASSERT_EQ(id.length(), static_cast<size_t>(36));
    ASSERT_EQ(id[14], '4');
}

void test_uuid_uniqueness()
{
    std::string id1 = IdGenerator::generate();
    std::string id2 = IdGenerator::generate();
    ASSERT_NE(id1, id2);
}

/**
 * @brief Timestamped ids are `<prefix>-<clock>-<9 char token>`.
 */
void test_timestamped_id_shape()
{
    const std::string decimal = IdGenerator::timestamped("backup");
    ASSERT_TRUE(String::starts_with(decimal, "backup-"));
    ASSERT_EQ(decimal.substr(decimal.rfind('-') + 1).size(), static_cast<size_t>(9));

    const std::string base36 = IdGenerator::timestamped("trip", true);
    const std::string clock = base36.substr(5, base36.rfind('-') - 5);
    ASSERT_TRUE(clock.size() < std::to_string(Time::now_millis()).size());
    ASSERT_NE(IdGenerator::timestamped("trip", true), IdGenerator::timestamped("trip", true));
}

void test_string_trim()
{
    ASSERT_EQ(String::trim("   hello trips   "), std::string("hello trips"));
    ASSERT_EQ(String::trim("  \t\n  \r "), std::string(""));
}

void test_string_case_helpers()
{
    ASSERT_TRUE(String::iequals("Accommodation", "accommodation"));
    ASSERT_FALSE(String::iequals("Accommodation", "accommodations"));
    ASSERT_TRUE(String::icontains("Deleted Portugal Trip", "portugal"));
    ASSERT_TRUE(String::ends_with("trip-1.json", ".json"));
    ASSERT_EQ(String::replace_all("a:b:c", ":", "-"), std::string("a-b-c"));
    ASSERT_EQ(String::join({"x", "y", "z"}, ", "), std::string("x, y, z"));
}

/**
 * @brief Dates and date-times in several spellings normalize to UTC ISO-8601.
 */
void test_time_parse_and_normalize()
{
    auto plain = Time::parse_iso("2026-05-01");
    auto zulu = Time::parse_iso("2026-05-01T00:00:00.000Z");
    auto offset = Time::parse_iso("2026-05-01T02:00:00+02:00");
    ASSERT_TRUE(plain.has_value());
    ASSERT_EQ(*plain, *zulu);
    ASSERT_EQ(*offset, *zulu);

    ASSERT_FALSE(Time::parse_iso("yesterday").has_value());
    ASSERT_FALSE(Time::parse_iso("2026-13-01").has_value());

    ASSERT_EQ(Time::normalize_iso("2026-05-01"), std::string("2026-05-01T00:00:00.000Z"));
    ASSERT_EQ(Time::normalize_iso("not a date"), std::string("not a date"));
    ASSERT_EQ(Time::to_iso(0), std::string("1970-01-01T00:00:00.000Z"));
}

void test_time_date_range()
{
    ASSERT_EQ(Time::format_date_range("2026-05-01", "2026-05-04"),
              std::string("2026-05-01 - 2026-05-04"));
    ASSERT_EQ(Time::format_date_range("2026-05-01", "2026-05-01"), std::string("2026-05-01"));
    ASSERT_EQ(Time::format_date_range("2026-05-01", ""), std::string("2026-05-01"));
    ASSERT_EQ(Time::format_date_range("", "2026-05-01"), std::string(""));
}

/**
 * @brief File stamps carry no characters that are awkward in file names.
 */
void test_time_file_stamp()
{
    const std::string stamp = Time::file_stamp();
    ASSERT_EQ(stamp.find(':'), std::string::npos);
    ASSERT_EQ(stamp.find('.'), std::string::npos);
}

/**
 * @brief Known-answer vectors from FIPS 180-2.
 */
void test_sha256_known_vectors()
{
    ASSERT_EQ(Checksum::sha256_hex(""),
              std::string("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"));
    ASSERT_EQ(Checksum::sha256_hex("abc"),
              std::string("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
}

void test_sha256_file_matches_content()
{
    tripstore::test::ScratchDir dir("./test_infra_checksum");
    const std::string path = dir.file("payload.json");
    tripstore::test::write_text(path, "{\"id\":\"trip-1\"}");
    ASSERT_EQ(Checksum::sha256_file(path), Checksum::sha256_hex("{\"id\":\"trip-1\"}"));
}

void test_logger_parse_level()
{
    ASSERT_TRUE(Logger::parse_level("debug") == LogLevel::DEBUG);
    ASSERT_TRUE(Logger::parse_level(" WARNING ") == LogLevel::WARN);
    ASSERT_TRUE(Logger::parse_level("chatty", LogLevel::ERROR) == LogLevel::ERROR);
}

/**
 * @brief A CLI data directory wins over the environment; malformed numbers
 * fall back to the defaults.
 */
void test_config_from_environment()
{
    setenv("TRIPSTORE_DATA_DIR", "/tmp/from-env", 1);
    setenv("TRIPSTORE_WORKERS", "3", 1);
    setenv("TRIPSTORE_BACKUP_KEEP_LATEST", "many", 1);

    Config env_cfg = Config::from_environment();
    ASSERT_EQ(env_cfg.data_dir, std::string("/tmp/from-env"));
    ASSERT_EQ(env_cfg.workers, static_cast<size_t>(3));
    ASSERT_EQ(env_cfg.backup_keep_latest, 5);
    ASSERT_EQ(env_cfg.catalog_path(), std::string("/tmp/from-env/backup-metadata.json"));
    ASSERT_EQ(env_cfg.backups_dir(), std::string("/tmp/from-env/backups"));

    Config cli_cfg = Config::from_environment("./cli-data");
    ASSERT_EQ(cli_cfg.data_dir, std::string("./cli-data"));

    unsetenv("TRIPSTORE_DATA_DIR");
    unsetenv("TRIPSTORE_WORKERS");
    unsetenv("TRIPSTORE_BACKUP_KEEP_LATEST");
}

/**
 * @brief Every enqueued task runs before the pool finishes draining.
 */
void test_scheduler_runs_tasks()
{
    std::atomic<int> counter{0};
    std::promise<void> last;
    std::future<void> last_done = last.get_future();
    {
        Scheduler scheduler(2);
        ASSERT_EQ(scheduler.size(), static_cast<size_t>(2));

        for (int i = 0; i < 49; ++i) {
            scheduler.enqueue([&counter] { counter.fetch_add(1); });
        }
        scheduler.enqueue([&counter, &last] {
            counter.fetch_add(1);
            last.set_value();
        });
        last_done.wait();
    }
    ASSERT_EQ(counter.load(), 50);
}

void test_scheduler_minimum_pool()
{
    Scheduler scheduler(0);
    ASSERT_TRUE(scheduler.size() >= static_cast<size_t>(2));
}
