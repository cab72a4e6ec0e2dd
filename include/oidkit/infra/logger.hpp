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
 * @brief Thread-safe diagnostic logging facility for oidkit.
 *
 * @details
 * This header declares the `Logger` class, the single reporting interface of the
 * library. Output to `stdout`/`stderr` is serialized across threads so that
 * records never interleave. A process-wide threshold lets host programs silence
 * records below a chosen severity.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace oidkit::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 *
 * Ordered from least to most severe; the threshold comparison relies on it.
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details.
    DEBUG, ///< Diagnostic information intended for development and troubleshooting.
    INFO,  ///< Nominal operational events.
    WARN,  ///< Non-blocking anomalies or potential misconfigurations.
    ERROR, ///< Recoverable runtime errors.
    FATAL  ///< Failures after which identifiers cannot be generated safely.
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 *
 * @details
 * An internal mutex serializes console access. The severity threshold is an
 * atomic, so changing it never blocks a concurrent writer.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * The output includes a timestamp, the severity tag, and the payload.
     * Records below the current threshold are discarded before locking.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * oidkit::infra::Logger::log(LogLevel::FATAL, "Registry: counter seeding failed");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /// @brief Sets the minimum severity that will be written. Default is `INFO`.
    static void set_level(LogLevel level);

    /// @brief Returns the current minimum severity.
    static LogLevel level();

    /**
     * @brief Parses a level name (`trace`, `debug`, `info`, `warn`, `error`, `fatal`).
     *
     * Matching ignores case and surrounding whitespace. `warning` is accepted
     * as an alias of `warn`.
     *
     * @param name The textual level.
     * @param out Receives the parsed level on success; untouched otherwise.
     * @return true If `name` denotes a known level.
     */
    static bool parse_level(const std::string& name, LogLevel& out);

  private:
    /// @brief Guards `std::cout` and `std::cerr` against interleaved records.
    static std::mutex mutex_;

    /// @brief Current threshold, stored as the underlying enum value.
    static std::atomic<int> threshold_;
};

} // namespace oidkit::infra
