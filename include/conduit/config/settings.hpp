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
 * @file settings.hpp
 * @brief Runtime configuration of the Conduit server.
 *
 * @details
 * Settings come from an optional JSON file; command-line arguments applied
 * afterwards in `main` take precedence. Example file:
 *
 * @code{.json}
 * {
 *   "port": 8080,
 *   "worker_threads": 8,
 *   "flash_ttl_seconds": 180,
 *   "async_timeout_ms": 30000,
 *   "log_level": "debug",
 *   "throw_if_no_handler_found": false
 * }
 * @endcode
 */

#pragma once

#include "conduit/infra/logger.hpp"

#include <cstddef>
#include <string>

namespace conduit::config {

struct Settings {
    int port = 8080;

    /// Zero means one worker per hardware thread.
    size_t worker_threads = 0;

    int flash_ttl_seconds = 180;

    long async_timeout_ms = 30000;

    infra::LogLevel log_level = infra::LogLevel::INFO;

    bool throw_if_no_handler_found = false;

    /**
     * @brief Overlays the keys present in `json` onto `defaults`.
     *
     * @throws std::invalid_argument on malformed JSON or a value of the wrong type.
     */
    static Settings parse(const std::string& json, Settings defaults);

    /// Same as `parse(json, Settings())`.
    static Settings parse(const std::string& json);

    /**
     * @brief Reads and parses a settings file.
     *
     * @throws std::runtime_error if the file cannot be read.
     */
    static Settings load_file(const std::string& path);
};

} // namespace conduit::config
