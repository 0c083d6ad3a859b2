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
 * @file time.hpp
 * @brief Wall-clock access and HTTP date conversion.
 *
 * @details
 * Flash state expiry and the not-modified check both work in epoch
 * milliseconds. Components that need deterministic time in tests accept a
 * `MillisClock` and default to `Time::now_millis`.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace conduit::infra {

/// @brief Source of "now" in epoch milliseconds.
using MillisClock = std::function<int64_t()>;

/**
 * @class Time
 * @brief Static helpers around the system clock.
 */
class Time {
  public:
    /// @brief Current wall-clock time in milliseconds since the Unix epoch.
    static int64_t now_millis();

    /**
     * @brief Parses an RFC 1123 date (`Sun, 06 Nov 1994 08:49:37 GMT`).
     *
     * @return Epoch milliseconds, or `-1` when the text is not a valid date.
     */
    static int64_t parse_http_date(const std::string& text);

    /// @brief Formats epoch milliseconds as an RFC 1123 date in GMT.
    static std::string format_http_date(int64_t epoch_millis);
};

} // namespace conduit::infra
