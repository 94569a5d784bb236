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
 * @brief A lightweight, header-only unit testing micro-framework for larder.
 *
 * @details
 * ANSI-colored terminal output, exception-protected test bodies and assertion
 * macros. A failed assertion aborts the current test only; an unexpected
 * `std::exception` escaping a test body is counted as a failure too.
 */

#pragma once

#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace larder::test {

// ========================================================================
// Global Metrics
// ========================================================================

inline int passed_count = 0; ///< Cumulative successful test counter.
inline int failed_count = 0; ///< Cumulative failed test counter.

/// @brief Thrown by the assertion primitives once the failure has been reported.
class AssertionFailure : public std::runtime_error {
  public:
    AssertionFailure() : std::runtime_error("Assertion failed") {}
};

// ========================================================================
// Assertion Primitives
// ========================================================================

template <typename T> void assert_eq(T val1, T val2, const char* file, int line, const char* expr)
{
    if (val1 != val2) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " (" << val1 << " != " << val2 << ")"
                  << std::endl;
        failed_count++;
        throw AssertionFailure();
    }
}

template <typename T> void assert_ne(T val1, T val2, const char* file, int line, const char* expr)
{
    if (val1 == val2) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " (" << val1 << " == " << val2 << ")"
                  << std::endl;
        failed_count++;
        throw AssertionFailure();
    }
}

inline void assert_true(bool cond, const char* file, int line, const char* expr)
{
    if (!cond) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " is FALSE" << std::endl;
        failed_count++;
        throw AssertionFailure();
    }
}

inline void assert_false(bool cond, const char* file, int line, const char* expr)
{
    if (cond) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " is TRUE" << std::endl;
        failed_count++;
        throw AssertionFailure();
    }
}

/**
 * @brief Validates that `func` throws an exception of type `E`.
 */
template <typename E>
void assert_throws(const std::function<void()>& func, const char* file, int line,
                   const char* expr)
{
    try {
        func();
    } catch (const E&) {
        return;
    }
    std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line << " -> Expected " << expr
              << " to throw" << std::endl;
    failed_count++;
    throw AssertionFailure();
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
    } catch (const AssertionFailure&) {
        // Already reported and counted by the assertion primitive.
        std::cout << "\r\033[31m[FAIL]\033[0m " << name << "          " << std::endl;
    } catch (const std::exception& e) {
        failed_count++;
        std::cout << "\r\033[31m[FAIL]\033[0m " << name << " -> Unexpected exception: " << e.what()
                  << std::endl;
    }
}

inline void print_summary()
{
    std::cout << "\n\033[36m=== larder Test Summary ===\033[0m" << std::endl;
    std::cout << "Passed: " << passed_count << std::endl;
    if (failed_count > 0) {
        std::cout << "Failed: \033[31m" << failed_count << "\033[0m" << std::endl;
    } else {
        std::cout << "Failed: 0" << std::endl;
    }
    std::cout << "Total:  " << (passed_count + failed_count) << std::endl;
}

} // namespace larder::test

// ============================================================================
// API Macros
// ============================================================================

#define ASSERT_EQ(a, b) larder::test::assert_eq((a), (b), __FILE__, __LINE__, #a " == " #b)
#define ASSERT_NE(a, b) larder::test::assert_ne((a), (b), __FILE__, __LINE__, #a " != " #b)
#define ASSERT_TRUE(a) larder::test::assert_true((a), __FILE__, __LINE__, #a)
#define ASSERT_FALSE(a) larder::test::assert_false((a), __FILE__, __LINE__, #a)

/**
 * @def ASSERT_THROWS
 * @brief Asserts that evaluating `stmt` throws `exc`.
 */
#define ASSERT_THROWS(stmt, exc)                                                                   \
    larder::test::assert_throws<exc>([&]() { stmt; }, __FILE__, __LINE__, #stmt)

#define RUN_TEST(func_name) larder::test::run(#func_name, func_name)
