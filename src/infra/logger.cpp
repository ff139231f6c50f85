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
 * @file logger.cpp
 * @brief Implementation of the thread-safe diagnostic logging utility.
 */

#include "tripstore/infra/logger.hpp"

#include "tripstore/infra/string.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace tripstore::infra {

std::mutex Logger::mutex_;
std::atomic<LogLevel> Logger::threshold_{LogLevel::INFO};
std::atomic<bool> Logger::stderr_only_{false};

/**
 * @brief Dispatches a formatted log entry to the appropriate stream.
 *
 * Operational Logic:
 * 1. **Filtering**: Drops the entry when below the configured threshold.
 * 2. **Synchronization**: Holds the console lock for the whole line.
 * 3. **Stream Segregation**: WARN and above go to `stderr`.
 */
void Logger::log(LogLevel level, const std::string& message)
{
    if (level < threshold_.load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    auto& stream = (level >= LogLevel::WARN || stderr_only_.load()) ? std::cerr : std::cout;

    // std::localtime uses a shared static buffer; the mutex covers it.
    stream << "[" << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S") << "] ";

    switch (level) {
    case LogLevel::TRACE:
        stream << "\033[90m[TRCE] ";
        break;
    case LogLevel::DEBUG:
        stream << "\033[36m[DBUG] ";
        break;
    case LogLevel::INFO:
        stream << "\033[32m[INFO] ";
        break;
    case LogLevel::WARN:
        stream << "\033[33m[WARN] ";
        break;
    case LogLevel::ERROR:
        stream << "\033[31m[FAIL] ";
        break;
    case LogLevel::FATAL:
        stream << "\033[1;31m[CRIT] ";
        break;
    }

    stream << message << "\033[0m" << std::endl;
}

void Logger::set_level(LogLevel level)
{
    threshold_.store(level);
}

LogLevel Logger::level()
{
    return threshold_.load();
}

void Logger::set_stderr_only(bool enabled)
{
    stderr_only_.store(enabled);
}

LogLevel Logger::parse_level(const std::string& name, LogLevel fallback)
{
    const std::string key = String::to_lower(String::trim(name));
    if (key == "trace") {
        return LogLevel::TRACE;
    }
    if (key == "debug") {
        return LogLevel::DEBUG;
    }
    if (key == "info") {
        return LogLevel::INFO;
    }
    if (key == "warn" || key == "warning") {
        return LogLevel::WARN;
    }
    if (key == "error") {
        return LogLevel::ERROR;
    }
    if (key == "fatal") {
        return LogLevel::FATAL;
    }
    return fallback;
}

} // namespace tripstore::infra
