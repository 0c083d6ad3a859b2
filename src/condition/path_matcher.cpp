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
 * @file path_matcher.cpp
 * @brief Segment-wise pattern matching and the pattern specificity comparator.
 */

#include "conduit/condition/path_matcher.hpp"

#include "conduit/infra/string.hpp"

#include <regex>
#include <vector>

namespace conduit::condition {

using infra::String;

namespace {

/// Splits on `/` and drops empty segments, so `/a//b/` and `/a/b` are equivalent.
std::vector<std::string> segments(const std::string& path)
{
    std::vector<std::string> out;
    size_t begin = 0;
    while (begin <= path.size()) {
        size_t pos = path.find('/', begin);
        std::string seg = path.substr(begin, pos == std::string::npos ? std::string::npos
                                                                       : pos - begin);
        if (!seg.empty()) {
            out.push_back(seg);
        }
        if (pos == std::string::npos) {
            break;
        }
        begin = pos + 1;
    }
    return out;
}

bool has_wildcard(const std::string& segment)
{
    return segment.find_first_of("*?{") != std::string::npos;
}

/**
 * @brief Matches one path segment against one pattern segment.
 *
 * The pattern segment is translated to an anchored regular expression.
 * Template variables become capture groups; `{name:regex}` supplies its own
 * group body.
 */
bool match_segment(const std::string& pattern, const std::string& segment, UriVariables& vars)
{
    if (!has_wildcard(pattern)) {
        return pattern == segment;
    }

    std::string expr;
    std::vector<std::string> names;
    for (size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        if (c == '*') {
            expr += ".*";
        } else if (c == '?') {
            expr += ".";
        } else if (c == '{') {
            size_t close = pattern.find('}', i);
            if (close == std::string::npos) {
                expr += "\\{";
                continue;
            }
            std::string body = pattern.substr(i + 1, close - i - 1);
            size_t colon = body.find(':');
            if (colon == std::string::npos) {
                names.push_back(body);
                expr += "(.+)";
            } else {
                names.push_back(body.substr(0, colon));
                expr += "(" + body.substr(colon + 1) + ")";
            }
            i = close;
        } else if (std::string("\\^$.|+()[]}").find(c) != std::string::npos) {
            expr += '\\';
            expr += c;
        } else {
            expr += c;
        }
    }

    std::smatch m;
    if (!std::regex_match(segment, m, std::regex(expr))) {
        return false;
    }
    for (size_t g = 0; g < names.size() && g + 1 < m.size(); ++g) {
        vars[names[g]] = String::url_decode(m[g + 1].str(), false);
    }
    return true;
}

bool match_segments(const std::vector<std::string>& pattern, size_t pi,
                    const std::vector<std::string>& path, size_t si, UriVariables& vars)
{
    if (pi == pattern.size()) {
        return si == path.size();
    }

    if (pattern[pi] == "**") {
        // Try the shortest expansion first; captured variables are only kept on success.
        for (size_t k = si; k <= path.size(); ++k) {
            UriVariables attempt = vars;
            if (match_segments(pattern, pi + 1, path, k, attempt)) {
                vars = std::move(attempt);
                return true;
            }
        }
        return false;
    }

    if (si == path.size()) {
        return false;
    }

    UriVariables attempt = vars;
    if (!match_segment(pattern[pi], path[si], attempt)) {
        return false;
    }
    if (!match_segments(pattern, pi + 1, path, si + 1, attempt)) {
        return false;
    }
    vars = std::move(attempt);
    return true;
}

struct PatternInfo {
    int variables = 0;
    int single_wildcards = 0;
    int double_wildcards = 0;
    size_t length = 0;
    bool catch_all = false;
    bool prefix = false;

    explicit PatternInfo(const std::string& pattern)
    {
        catch_all = (pattern == "/**" || pattern == "**");
        prefix = String::ends_with(pattern, "/**");
        for (const std::string& seg : segments(pattern)) {
            if (seg == "**") {
                double_wildcards++;
                continue;
            }
            for (char c : seg) {
                if (c == '*')
                    single_wildcards++;
                else if (c == '{')
                    variables++;
            }
        }
        // Template variables count as one character each.
        static const std::regex var_re("\\{[^}]*\\}");
        length = std::regex_replace(pattern, var_re, "#").size();
    }

    int total() const
    {
        return variables + single_wildcards + 2 * double_wildcards;
    }
};

} // namespace

bool PathMatcher::is_pattern(const std::string& path)
{
    return path.find_first_of("*?{") != std::string::npos;
}

bool PathMatcher::match(const std::string& pattern, const std::string& path,
                        UriVariables* variables)
{
    UriVariables captured;
    bool matched = match_segments(segments(pattern), 0, segments(path), 0, captured);
    if (matched && variables) {
        *variables = std::move(captured);
    }
    return matched;
}

std::string PathMatcher::extract_path_within_pattern(const std::string& pattern,
                                                     const std::string& path)
{
    std::vector<std::string> pattern_parts = segments(pattern);
    std::vector<std::string> path_parts = segments(path);

    size_t first = pattern_parts.size();
    for (size_t i = 0; i < pattern_parts.size(); ++i) {
        if (has_wildcard(pattern_parts[i])) {
            first = i;
            break;
        }
    }

    std::string out;
    for (size_t i = first; i < path_parts.size(); ++i) {
        if (!out.empty()) {
            out += '/';
        }
        out += path_parts[i];
    }
    return out;
}

std::string PathMatcher::combine(const std::string& first, const std::string& second)
{
    if (first.empty()) {
        return second.empty() ? "" : (String::starts_with(second, "/") ? second : "/" + second);
    }
    if (second.empty()) {
        return first;
    }

    std::string base = first;
    if (String::ends_with(base, "/*")) {
        base = base.substr(0, base.size() - 2);
    }
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    std::string tail = second;
    while (!tail.empty() && tail.front() == '/') {
        tail.erase(tail.begin());
    }
    return base + "/" + tail;
}

int PathMatcher::compare(const std::string& a, const std::string& b, const std::string& path)
{
    if (a == b) {
        return 0;
    }
    if (a == path) {
        return -1;
    }
    if (b == path) {
        return 1;
    }

    PatternInfo ia(a);
    PatternInfo ib(b);

    if (ia.catch_all && ib.catch_all) {
        return 0;
    }
    if (ia.catch_all) {
        return 1;
    }
    if (ib.catch_all) {
        return -1;
    }

    if (ia.prefix && ib.double_wildcards == 0) {
        return 1;
    }
    if (ib.prefix && ia.double_wildcards == 0) {
        return -1;
    }

    if (ia.total() != ib.total()) {
        return ia.total() - ib.total();
    }
    if (ia.length != ib.length) {
        return ib.length > ia.length ? 1 : -1;
    }
    if (ia.single_wildcards != ib.single_wildcards) {
        return ia.single_wildcards - ib.single_wildcards;
    }
    return ia.variables - ib.variables;
}

} // namespace conduit::condition
