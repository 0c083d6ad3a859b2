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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * Stateless text helpers shared by the HTTP model, the condition parsers and
 * the transport codec: trimming, case folding, tokenizing and URL decoding.
 */

#pragma once

#include <string>
#include <vector>

namespace conduit::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return A new string without surrounding whitespace; empty if `s` is blank.
     *
     * @code
     * std::string clean = conduit::infra::String::trim("  text/html \r\n"); // "text/html"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /// @brief ASCII lower-case copy of `s`.
    static std::string to_lower(const std::string& s);

    /// @brief ASCII case-insensitive equality.
    static bool iequals(const std::string& a, const std::string& b);

    /// @brief True if `s` begins with `prefix`.
    static bool starts_with(const std::string& s, const std::string& prefix);

    /// @brief True if `s` ends with `suffix`.
    static bool ends_with(const std::string& s, const std::string& suffix);

    /**
     * @brief Splits `s` on every occurrence of `delimiter`.
     *
     * Each token is trimmed. Empty tokens are dropped unless `keep_empty` is set.
     *
     * @code
     * String::split("a, b,,c", ',');        // {"a", "b", "c"}
     * String::split("/a//b", '/', true);    // {"", "a", "", "b"}
     * @endcode
     */
    static std::vector<std::string> split(const std::string& s, char delimiter,
                                          bool keep_empty = false);

    /**
     * @brief Decodes `%XX` escapes and, if `plus_as_space` is set, `+` characters.
     *
     * Malformed escapes are copied through verbatim.
     */
    static std::string url_decode(const std::string& s, bool plus_as_space = true);

    /// @brief Percent-encodes everything except unreserved characters (RFC 3986).
    static std::string url_encode(const std::string& s);
};

} // namespace conduit::infra
