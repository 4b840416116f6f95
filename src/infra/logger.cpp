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
 *
 * @details
 * Formats each entry as `[YYYY-MM-DD HH:MM:SS] [TAG] message` with ANSI
 * color-coding per severity, and filters entries below the active threshold.
 */

#include "ulidkit/infra/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace ulidkit::infra {

std::mutex Logger::mutex_;
LogLevel Logger::threshold_ = LogLevel::WARN;

/**
 * @brief Dispatches a formatted log entry to standard error.
 *
 * Operational Logic:
 * 1. **Synchronization**: Acquires a `lock_guard` to prevent interleaved output.
 * 2. **Filtering**: Drops the entry if it is below the threshold.
 * 3. **Chronometry**: Captures the current system clock and formats it.
 * 4. **Stylization**: Injects ANSI escape sequences for visual categorization.
 */
void Logger::log(LogLevel level, const std::string& message)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < threshold_) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    auto& stream = std::cerr;

    // Note: Mutex protects std::localtime's internal static buffer.
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
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = level;
}

LogLevel Logger::level()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return threshold_;
}

bool Logger::parse_level(const std::string& name, LogLevel& out)
{
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (key == "trace") {
        out = LogLevel::TRACE;
    } else if (key == "debug") {
        out = LogLevel::DEBUG;
    } else if (key == "info") {
        out = LogLevel::INFO;
    } else if (key == "warn" || key == "warning") {
        out = LogLevel::WARN;
    } else if (key == "error") {
        out = LogLevel::ERROR;
    } else if (key == "fatal") {
        out = LogLevel::FATAL;
    } else {
        return false;
    }
    return true;
}

} // namespace ulidkit::infra
