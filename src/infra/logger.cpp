/*
 * TINYGUID COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 *
 * This source code is licensed under the TinyGUID Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file logger.cpp
 * @brief Implementation of the thread-safe diagnostic logging utility.
 *
 * @details
 * Formats each entry with a local timestamp, a severity tag and ANSI colours, and
 * applies the process-wide minimum level configured through `TINYGUID_LOG_LEVEL`
 * or `Logger::set_level`.
 */

#include "tinyguid/infra/logger.hpp"

#include "tinyguid/infra/string.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace tinyguid::infra {

std::mutex Logger::mutex_;
std::atomic<int> Logger::level_{static_cast<int>(Logger::initial_level())};

LogLevel Logger::initial_level()
{
    LogLevel parsed = LogLevel::INFO;
    const char* env = std::getenv("TINYGUID_LOG_LEVEL");
    if (env != nullptr && !parse_level(env, parsed)) {
        // The logger is not usable yet, so report straight to stderr.
        std::cerr << "[tinyguid] Ignoring unknown TINYGUID_LOG_LEVEL '" << env << "'"
                  << std::endl;
    }
    return parsed;
}

bool Logger::parse_level(std::string_view text, LogLevel& out)
{
    const std::string name = String::to_lower(String::trim(std::string(text)));

    if (name == "trace") {
        out = LogLevel::TRACE;
    } else if (name == "debug") {
        out = LogLevel::DEBUG;
    } else if (name == "info") {
        out = LogLevel::INFO;
    } else if (name == "warn" || name == "warning") {
        out = LogLevel::WARN;
    } else if (name == "error") {
        out = LogLevel::ERROR;
    } else if (name == "fatal") {
        out = LogLevel::FATAL;
    } else {
        return false;
    }
    return true;
}

void Logger::set_level(LogLevel level)
{
    level_.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel Logger::level()
{
    return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
}

bool Logger::enabled(LogLevel level)
{
    return static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
}

/**
 * @brief Dispatches a formatted log entry to the appropriate system stream.
 *
 * Operational Logic:
 * 1. **Filtering**: Drops entries below the configured minimum level.
 * 2. **Synchronization**: Acquires a `lock_guard` to prevent interleaved output.
 * 3. **Stream Segregation**: Routes messages to `stdout` or `stderr` based on severity.
 */
void Logger::log(LogLevel level, const std::string& message)
{
    if (!enabled(level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    auto& stream = (level >= LogLevel::WARN) ? std::cerr : std::cout;

    // Mutex also protects std::localtime's internal static buffer.
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

} // namespace tinyguid::infra
