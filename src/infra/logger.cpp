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
 * Formats each record as `[YYYY-MM-DD HH:MM:SS] [TAG] message` with ANSI
 * color-coding, filtered by the process-wide severity threshold.
 */

#include "oidkit/infra/logger.hpp"

#include "oidkit/infra/string.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace oidkit::infra {

// Output lock and severity threshold shared by every caller in the process.
std::mutex Logger::mutex_;
std::atomic<int> Logger::threshold_{static_cast<int>(LogLevel::INFO)};

namespace {

/// @brief ANSI color prefix and fixed-width tag for a severity.
const char* style_of(LogLevel level)
{
    switch (level) {
    case LogLevel::TRACE:
        return "\033[90m[TRCE] ";
    case LogLevel::DEBUG:
        return "\033[36m[DBUG] ";
    case LogLevel::INFO:
        return "\033[32m[INFO] ";
    case LogLevel::WARN:
        return "\033[33m[WARN] ";
    case LogLevel::ERROR:
        return "\033[31m[FAIL] ";
    case LogLevel::FATAL:
        return "\033[1;31m[CRIT] ";
    }
    return "[????] ";
}

} // namespace

/**
 * @brief Writes one formatted record if `level` clears the threshold.
 *
 * Operational Logic:
 * 1. **Filtering**: Drops records below the threshold before taking the lock.
 * 2. **Synchronization**: Serializes the whole record so lines never interleave.
 * 3. **Routing**: WARN and above go to `stderr`, the rest to `stdout`.
 * 4. **Formatting**: Timestamp, colored tag, payload, then a style reset.
 */
void Logger::log(LogLevel level, const std::string& message)
{
    // 1. Filtering: the threshold is read lock-free; a racing set_level only
    // decides whether this one record is shown.
    if (static_cast<int>(level) < threshold_.load(std::memory_order_relaxed)) {
        return;
    }

    // 2. Synchronization. The lock also covers std::localtime's static buffer.
    std::lock_guard<std::mutex> lock(mutex_);

    std::time_t time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

    // 3. Routing: WARN and above to stderr.
    std::ostream& stream = (level >= LogLevel::WARN) ? std::cerr : std::cout;

    // 4. Formatting: [YYYY-MM-DD HH:MM:SS] <style>[TAG] message<reset>
    stream << "[" << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S") << "] "
           << style_of(level) << message << "\033[0m" << std::endl;
}

void Logger::set_level(LogLevel level)
{
    threshold_.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel Logger::level()
{
    return static_cast<LogLevel>(threshold_.load(std::memory_order_relaxed));
}

bool Logger::parse_level(const std::string& name, LogLevel& out)
{
    std::string key = String::to_lower(String::trim(name));

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

} // namespace oidkit::infra
