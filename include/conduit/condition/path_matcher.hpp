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
 * @file path_matcher.hpp
 * @brief URL pattern matching with wildcards and URI template variables.
 *
 * @details
 * Supported syntax, evaluated segment by segment on `/`:
 * - `?` matches one character inside a segment.
 * - `*` matches zero or more characters inside a segment.
 * - `**` (alone in a segment) matches zero or more whole segments.
 * - `{name}` matches one or more characters inside a segment and captures them.
 */

#pragma once

#include <map>
#include <string>

namespace conduit::condition {

/// @brief Captured URI template variables (name -> decoded value).
using UriVariables = std::map<std::string, std::string>;

/**
 * @class PathMatcher
 * @brief Stateless pattern matcher and specificity comparator.
 */
class PathMatcher {
  public:
    /// @brief True if `path` contains any wildcard or template variable.
    static bool is_pattern(const std::string& path);

    /**
     * @brief Matches `path` against `pattern`.
     *
     * @param pattern The mapping pattern, e.g. `/accounts/{id}/**`.
     * @param path The request lookup path.
     * @param variables Receives captured template variables on success (optional).
     * @return true if the whole path is matched.
     *
     * @code
     * UriVariables vars;
     * PathMatcher::match("/accounts/{id}", "/accounts/42", &vars); // true, vars["id"] == "42"
     * @endcode
     */
    static bool match(const std::string& pattern, const std::string& path,
                      UriVariables* variables = nullptr);

    /**
     * @brief Returns the part of `path` covered by the pattern's wildcard tail.
     *
     * `("/docs/**", "/docs/cvs/commit.html")` yields `cvs/commit.html`;
     * a pattern without wildcards yields an empty string.
     */
    static std::string extract_path_within_pattern(const std::string& pattern,
                                                   const std::string& path);

    /**
     * @brief Joins a type-level and a method-level pattern.
     *
     * `("/accounts", "{id}")` yields `/accounts/{id}`; a trailing `/*` on the
     * first pattern is replaced by the second.
     */
    static std::string combine(const std::string& first, const std::string& second);

    /**
     * @brief Orders two patterns that both match `path` by specificity.
     *
     * Rules, in order: equal patterns tie; a pattern equal to `path` wins;
     * the catch-all `/**` loses; a prefix pattern (`.../**`) loses to one
     * that is not; fewer variables and wildcards (a `**` counts double) win;
     * a longer pattern wins; fewer `*` wins; fewer variables win.
     *
     * @return Negative if `a` is more specific, positive if `b` is, zero otherwise.
     */
    static int compare(const std::string& a, const std::string& b, const std::string& path);
};

} // namespace conduit::condition
