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
 * @file framework.hpp
 * @brief A lightweight, header-only unit testing micro-framework for tripstore.
 *
 * @details
 * ANSI-coloured terminal output, exception-protected execution blocks and
 * assertion macros that report the failing expression with file and line.
 */

#pragma once

#include <exception>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tripstore::test {

// ========================================================================
// Global Metrics
// ========================================================================

inline int passed_count = 0; ///< Cumulative successful test counter.
inline int failed_count = 0; ///< Cumulative failed test counter.

// ========================================================================
// Assertion Primitives
// ========================================================================

inline void report_failure(const char* file, int line, const std::string& detail)
{
    std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line << " -> " << detail << std::endl;
    failed_count++;
    throw std::runtime_error("Assertion failed");
}

/**
 * @brief Validates that two values compare equal.
 */
template <typename A, typename B>
void assert_eq(const A& val1, const B& val2, const char* file, int line, const char* expr)
{
    if (!(val1 == val2)) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " (" << val1 << " != " << val2 << ")"
                  << std::endl;
        failed_count++;
        throw std::runtime_error("Assertion failed");
    }
}

/**
 * @brief Validates that two values do NOT compare equal.
 */
template <typename A, typename B>
void assert_ne(const A& val1, const B& val2, const char* file, int line, const char* expr)
{
    if (val1 == val2) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " (" << val1 << " == " << val2 << ")"
                  << std::endl;
        failed_count++;
        throw std::runtime_error("Assertion failed");
    }
}

/**
 * @brief Validates that a boolean expression evaluates to true.
 */
inline void assert_true(bool cond, const char* file, int line, const char* expr)
{
    if (!cond) {
        report_failure(file, line, std::string("Assertion failed: ") + expr + " is FALSE");
    }
}

/**
 * @brief Validates that a boolean expression evaluates to false.
 */
inline void assert_false(bool cond, const char* file, int line, const char* expr)
{
    if (cond) {
        report_failure(file, line, std::string("Assertion failed: ") + expr + " is TRUE");
    }
}

/**
 * @brief Validates that @p body throws an exception of type @p E (or derived).
 */
template <typename E>
void assert_throws(const std::function<void()>& body, const char* file, int line, const char* expr,
                   const char* type)
{
    try {
        body();
    } catch (const E&) {
        return;
    } catch (const std::exception& e) {
        report_failure(file, line,
                       std::string("Expected ") + type + " from " + expr + ", got: " + e.what());
    }
    report_failure(file, line, std::string("Expected ") + type + " from " + expr + ", nothing thrown");
}

// ========================================================================
// Execution Orchestrator
// ========================================================================

/**
 * @brief Executes a test case within a protected execution context.
 */
inline void run(std::string_view name, const std::function<void()>& func)
{
    std::cout << "[RUN  ] " << name << "... " << std::flush;
    try {
        func();
        std::cout << "\r\033[32m[PASS]\033[0m " << name << "          " << std::endl;
        passed_count++;
    } catch (const std::exception& e) {
        // Assertion primitives have already counted and printed their failure.
        if (std::string(e.what()) != "Assertion failed") {
            std::cout << "\n\033[31m[FAIL]\033[0m Unexpected exception: " << e.what() << std::endl;
            failed_count++;
        }
        std::cout << "\r\033[31m[FAIL]\033[0m " << name << "          " << std::endl;
    }
}

/**
 * @brief Emits a summary report of the current test session.
 */
inline void print_summary()
{
    std::cout << "\n\033[36m=== tripstore Test Summary ===\033[0m" << std::endl;
    std::cout << "Passed: " << passed_count << std::endl;
    if (failed_count > 0) {
        std::cout << "Failed: \033[31m" << failed_count << "\033[0m" << std::endl;
    } else {
        std::cout << "Failed: 0" << std::endl;
    }
    std::cout << "Total:  " << (passed_count + failed_count) << std::endl;
}

} // namespace tripstore::test

// ============================================================================
// API Macros
// ============================================================================

/**
 * @def ASSERT_EQ
 * @brief Macro for equality assertions. Includes file and line metadata.
 */
#define ASSERT_EQ(a, b) tripstore::test::assert_eq((a), (b), __FILE__, __LINE__, #a " == " #b)

/**
 * @def ASSERT_NE
 * @brief Macro for inequality assertions. Includes file and line metadata.
 */
#define ASSERT_NE(a, b) tripstore::test::assert_ne((a), (b), __FILE__, __LINE__, #a " != " #b)

#define ASSERT_TRUE(a) tripstore::test::assert_true((a), __FILE__, __LINE__, #a)

#define ASSERT_FALSE(a) tripstore::test::assert_false((a), __FILE__, __LINE__, #a)

/**
 * @def ASSERT_THROWS
 * @brief Asserts that @p stmt throws @p type.
 */
#define ASSERT_THROWS(stmt, type)                                                                  \
    tripstore::test::assert_throws<type>([&]() { stmt; }, __FILE__, __LINE__, #stmt, #type)

/**
 * @def RUN_TEST
 * @brief Orchestrates the execution of a named test function.
 */
#define RUN_TEST(func_name) tripstore::test::run(#func_name, func_name)
