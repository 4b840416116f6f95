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
 * @brief Unit tests for shared infrastructure primitives (Entropy, String, Logger).
 */

#include "ulidkit/infra/entropy.hpp"
#include "ulidkit/infra/logger.hpp"
#include "ulidkit/infra/string.hpp"
#include "framework.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using ulidkit::infra::LogLevel;
using ulidkit::infra::Logger;
using ulidkit::infra::String;

/**
 * @brief Verifies the system source fills exactly the requested range.
 *
 * Odd lengths exercise the partial last word. The guard bytes past the
 * requested range must stay untouched.
 */
void test_entropy_fill_bounds()
{
    std::vector<uint8_t> buffer(14, 0xCC);
    ulidkit::infra::SystemEntropy::instance().fill(buffer.data(), 10);
    ASSERT_EQ(buffer[10], static_cast<uint8_t>(0xCC));
    ASSERT_EQ(buffer[13], static_cast<uint8_t>(0xCC));
}

/**
 * @brief Sequential draws do not repeat (80 bits colliding is practically impossible).
 */
void test_entropy_uniqueness()
{
    std::vector<uint8_t> a(10), b(10);
    ulidkit::infra::SystemEntropy::instance().fill(a.data(), a.size());
    ulidkit::infra::SystemEntropy::instance().fill(b.data(), b.size());
    ASSERT_TRUE(a != b);
}

/**
 * @brief Tests the `String::trim` algorithm with nominal input.
 */
void test_string_trim()
{
    std::string dirty = "   01ARYZ6S41000G40R40M30E209 \n";
    std::string clean = String::trim(dirty);
    ASSERT_EQ(clean, std::string("01ARYZ6S41000G40R40M30E209"));
    ASSERT_EQ(String::trim("  a b  "), std::string("a b"));
}

/**
 * @brief Strings made only of whitespace collapse to empty.
 */
void test_string_trim_empty()
{
    std::string empty = "  \t\n  \r ";
    std::string result = String::trim(empty);
    ASSERT_EQ(result, std::string(""));
    ASSERT_EQ(result.length(), static_cast<size_t>(0));
}

void test_string_hex_conversion()
{
    std::vector<uint8_t> raw = {0x00, 0x01, 0xAB, 0xFF};
    ASSERT_EQ(String::to_hex(raw), std::string("0001ABFF"));
    ASSERT_TRUE(String::from_hex("0001abff") == raw);
    ASSERT_TRUE(String::from_hex("0001ABFF") == raw);
    ASSERT_TRUE(String::from_hex("").empty());

    ASSERT_THROWS(String::from_hex("ABC"), std::invalid_argument);
    ASSERT_THROWS(String::from_hex("0G"), std::invalid_argument);
}

void test_string_format_utc()
{
    ASSERT_EQ(String::format_utc_millis(0), std::string("1970-01-01T00:00:00.000Z"));
    ASSERT_EQ(String::format_utc_millis(1620900032009ULL), std::string("2021-05-13T10:00:32.009Z"));
    ASSERT_EQ(String::format_utc_millis(1469918176385ULL), std::string("2016-07-30T22:36:16.385Z"));
    ASSERT_EQ(String::format_utc_millis(0xFFFFFFFFFFULL), std::string("2004-11-03T19:53:47.775Z"));
}

void test_logger_levels()
{
    LogLevel level = LogLevel::INFO;
    ASSERT_TRUE(Logger::parse_level("TRACE", level));
    ASSERT_TRUE(level == LogLevel::TRACE);
    ASSERT_TRUE(Logger::parse_level("warning", level));
    ASSERT_TRUE(level == LogLevel::WARN);
    ASSERT_TRUE(Logger::parse_level("Error", level));
    ASSERT_TRUE(level == LogLevel::ERROR);
    ASSERT_FALSE(Logger::parse_level("verbose", level));
    ASSERT_TRUE(level == LogLevel::ERROR);

    LogLevel previous = Logger::level();
    Logger::set_level(LogLevel::FATAL);
    ASSERT_TRUE(Logger::level() == LogLevel::FATAL);
    Logger::log(LogLevel::ERROR, "Test: filtered entry.");
    Logger::set_level(previous);
}
