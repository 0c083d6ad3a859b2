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
 * @brief Thread-safe diagnostic logging facility for the dispatch core.
 *
 * @details
 * Declares the `Logger` class used by every Conduit subsystem (mappings,
 * dispatcher, async manager, transport). Output is serialized through a single
 * mutex so that lines produced by concurrent request workers never interleave.
 * A process-wide threshold filters out entries below the configured severity.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace conduit::infra {

/**
 * @enum LogLevel
 * @brief Severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Per-interceptor and per-condition evaluation details.
    DEBUG, ///< Dispatch decisions (resolved handler, chosen adapter, view).
    INFO,  ///< Lifecycle events (startup, listener bound, shutdown).
    WARN,  ///< Recovered anomalies (swallowed cleanup failures, expired state).
    ERROR, ///< Request failures that escaped every exception resolver.
    FATAL  ///< Unrecoverable bootstrap failures.
};

/**
 * @class Logger
 * @brief Static, system-wide logging front end.
 *
 * @details
 * Entries at `WARN` and above are routed to `std::cerr`; the remaining levels
 * go to `std::cout`. Each line carries a local timestamp and a colored tag.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message if its level passes the threshold.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * conduit::infra::Logger::log(LogLevel::DEBUG, "Dispatch: GET /accounts/42");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that will be emitted.
     *
     * @param level Entries strictly below this level are discarded.
     */
    static void set_level(LogLevel level);

    /// @brief Returns the currently configured threshold.
    static LogLevel level();

    /**
     * @brief Tests whether a message at `level` would be written.
     *
     * Callers building expensive messages check this first.
     */
    static bool is_enabled(LogLevel level);

    /**
     * @brief Parses a case-insensitive level name ("trace" ... "fatal").
     *
     * @param name The textual level, as found in configuration files.
     * @param fallback Returned when `name` is not a known level.
     */
    static LogLevel parse_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

  private:
    /// @brief Serializes access to the standard streams.
    static std::mutex mutex_;

    /// @brief Process-wide threshold.
    static std::atomic<LogLevel> threshold_;
};

} // namespace conduit::infra
