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
 * @brief Thread-safe diagnostic logging facility for bsonoid.
 *
 * @details
 * This header declares the `Logger` class, the single reporting interface used by
 * the identifier library and the `oidtool` front-end. Output is serialized across
 * threads and filtered against a process-wide minimum severity so that library
 * diagnostics stay silent unless explicitly requested.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace bsonoid::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details (e.g., fast-path decisions).
    DEBUG, ///< Generator state transitions (initialization, counter wrap).
    INFO,  ///< Nominal operational events.
    WARN,  ///< Rejected or suspicious external input.
    ERROR, ///< Recoverable runtime errors.
    FATAL  ///< Failures that terminate the command line tool.
};

/**
 * @class Logger
 * @brief A static utility class providing system-wide logging capabilities.
 *
 * @details
 * Messages below the configured minimum level are discarded before the lock is
 * taken. Accepted messages are written atomically with a timestamp and a
 * color-coded severity tag.
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
     * bsonoid::infra::Logger::log(LogLevel::WARN, "ExtendedJson: unparsable document");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that will reach the console.
     * @param level Messages strictly below this level are dropped.
     */
    static void set_level(LogLevel level);

    /// @brief Returns the current minimum severity.
    static LogLevel level();

    /// @brief True if a message of @p level would currently be written.
    static bool enabled(LogLevel level);

  private:
    /// @brief Guards `std::cout` and `std::cerr` against interleaved output.
    static std::mutex mutex_;

    /// @brief Minimum accepted severity (defaults to `INFO`).
    static std::atomic<LogLevel> level_;
};

} // namespace bsonoid::infra
