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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for TinyGUID.
 *
 * @details
 * This header declares the `Logger` class, the single reporting interface of the
 * library and of the `tinyguidctl` tool. Output is serialized across threads and
 * filtered by a process-wide minimum severity, so that library code can emit
 * diagnostics (origin discovery, fallbacks to randomness) without flooding
 * applications that embed it.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <string_view>

namespace tinyguid::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details.
    DEBUG, ///< Diagnostic information (e.g., counter wraparound).
    INFO,  ///< Nominal operational events (e.g., resolved origin id).
    WARN,  ///< Non-blocking anomalies (e.g., fallback to random machine id).
    ERROR, ///< Recoverable runtime errors.
    FATAL  ///< Failures that end the current process.
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 *
 * @details
 * Messages below the configured minimum level are discarded before any formatting
 * takes place. The initial minimum level is read once from the `TINYGUID_LOG_LEVEL`
 * environment variable (`trace`, `debug`, `info`, `warn`, `error`, `fatal`) and
 * defaults to `INFO`.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * tinyguid::infra::Logger::log(LogLevel::INFO, "Origin: resolved origin id 1234");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Returns true when a message of @p level would be written.
     *
     * Callers building expensive messages check this first.
     */
    static bool enabled(LogLevel level);

    /// @brief Sets the process-wide minimum severity.
    static void set_level(LogLevel level);

    /// @brief Returns the process-wide minimum severity.
    static LogLevel level();

    /**
     * @brief Parses a textual level name (case-insensitive).
     *
     * @param text One of `trace`, `debug`, `info`, `warn`, `error`, `fatal`.
     * @param out Receives the parsed level on success; untouched otherwise.
     * @return true If @p text named a known level.
     */
    static bool parse_level(std::string_view text, LogLevel& out);

  private:
    /// @brief Reads `TINYGUID_LOG_LEVEL` on first use.
    static LogLevel initial_level();

    /// @brief Guards access to `std::cout` and `std::cerr`.
    static std::mutex mutex_;

    /// @brief Minimum severity, stored as the underlying enum value.
    static std::atomic<int> level_;
};

} // namespace tinyguid::infra
