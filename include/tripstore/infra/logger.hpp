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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for tripstore.
 *
 * @details
 * Declares the `Logger` class, the single reporting channel used by the
 * persistence engine, the migration chain and the command surface. Output is
 * serialized across threads so that concurrent save workers never interleave
 * partial lines on the console.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace tripstore::infra {

/**
 * @enum LogLevel
 * @brief Severity hierarchy for diagnostic messages.
 *
 * Levels below the configured threshold are discarded; levels at WARN and
 * above are routed to standard error.
 */
enum class LogLevel {
    TRACE, ///< Step-by-step execution detail (per-entity migration decisions).
    DEBUG, ///< Diagnostic information for development (queue hand-offs, paths).
    INFO,  ///< Nominal operational events (startup, saves, completed repairs).
    WARN,  ///< Recoverable anomalies (corrupted files, orphaned records).
    ERROR, ///< Failed operations that were reported to the caller.
    FATAL  ///< Unrecoverable failures that terminate the process.
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 *
 * @details
 * The Logger serializes writes to `std::cout` / `std::cerr` behind a single
 * mutex. A process-wide minimum level filters noise; it defaults to INFO and
 * is usually set once at startup from configuration.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * The line carries a timestamp, a coloured severity tag and the payload.
     * By convention payloads start with the emitting subsystem, e.g.
     * `"Store: ..."` or `"Migration: ..."`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * tripstore::infra::Logger::log(LogLevel::INFO, "Store: Data directory ready.");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that will be emitted.
     * @param level Messages strictly below this level are dropped.
     */
    static void set_level(LogLevel level);

    /// @brief Returns the currently active minimum severity.
    static LogLevel level();

    /**
     * @brief Sends every severity to `stderr`.
     *
     * Used when `stdout` carries protocol responses.
     */
    static void set_stderr_only(bool enabled);

    /**
     * @brief Parses a textual level name (case-insensitive).
     *
     * Accepts `trace`, `debug`, `info`, `warn`/`warning`, `error` and `fatal`.
     *
     * @param name The level name.
     * @param fallback Returned when @p name is not recognised.
     * @return LogLevel The parsed level.
     */
    static LogLevel parse_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

  private:
    /// @brief Guards the console streams.
    static std::mutex mutex_;

    /// @brief Minimum emitted severity.
    static std::atomic<LogLevel> threshold_;
    static std::atomic<bool> stderr_only_;
};

} // namespace tripstore::infra
