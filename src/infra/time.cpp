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
 * @file time.cpp
 * @brief Implementation of the clock and HTTP date helpers.
 */

#include "conduit/infra/time.hpp"

#include "conduit/infra/string.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

namespace conduit::infra {

int64_t Time::now_millis()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/**
 * @brief Parses an RFC 1123 date.
 *
 * The classic locale is imbued so that month and day names parse the same
 * regardless of the process locale. `timegm` interprets the broken-down
 * time as UTC.
 */
int64_t Time::parse_http_date(const std::string& text)
{
    std::string trimmed = String::trim(text);
    if (trimmed.empty()) {
        return -1;
    }

    std::tm tm{};
    std::istringstream in(trimmed);
    in.imbue(std::locale::classic());
    in >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
    if (in.fail()) {
        return -1;
    }

    std::string zone;
    in >> zone;
    if (!zone.empty() && zone != "GMT" && zone != "UTC") {
        return -1;
    }

    time_t seconds = timegm(&tm);
    if (seconds == static_cast<time_t>(-1)) {
        return -1;
    }
    return static_cast<int64_t>(seconds) * 1000;
}

std::string Time::format_http_date(int64_t epoch_millis)
{
    time_t seconds = static_cast<time_t>(epoch_millis / 1000);
    std::tm tm{};
    gmtime_r(&seconds, &tm);

    std::ostringstream out;
    out.imbue(std::locale::classic());
    out << std::put_time(&tm, "%a, %d %b %Y %H:%M:%S GMT");
    return out.str();
}

} // namespace conduit::infra
