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
 * @file patterns_condition.cpp
 * @brief URL pattern condition.
 */

#include "conduit/condition/patterns_condition.hpp"

#include "conduit/condition/path_matcher.hpp"

#include <algorithm>

namespace conduit::condition {

namespace {

std::string normalize(const std::string& pattern)
{
    if (pattern.empty() || pattern.front() == '/') {
        return pattern;
    }
    return "/" + pattern;
}

void add_unique(std::vector<std::string>& set, const std::string& value)
{
    if (std::find(set.begin(), set.end(), value) == set.end()) {
        set.push_back(value);
    }
}

} // namespace

PatternsCondition::PatternsCondition() = default;

PatternsCondition::PatternsCondition(const std::vector<std::string>& patterns)
{
    for (const std::string& p : patterns) {
        add_unique(patterns_, normalize(p));
    }
}

const std::vector<std::string>& PatternsCondition::patterns() const
{
    return patterns_;
}

PatternsCondition PatternsCondition::combine(const PatternsCondition& other) const
{
    std::vector<std::string> merged = patterns_;
    for (const std::string& p : other.patterns_) {
        add_unique(merged, p);
    }
    return PatternsCondition(merged);
}

PatternsCondition PatternsCondition::concat(const PatternsCondition& other) const
{
    if (patterns_.empty()) {
        return other;
    }
    if (other.patterns_.empty()) {
        return *this;
    }
    std::vector<std::string> joined;
    for (const std::string& prefix : patterns_) {
        for (const std::string& suffix : other.patterns_) {
            add_unique(joined, PathMatcher::combine(prefix, suffix));
        }
    }
    return PatternsCondition(joined);
}

std::optional<PatternsCondition> PatternsCondition::matching(const http::Request& request) const
{
    if (patterns_.empty()) {
        return *this;
    }

    const std::string& path = request.path();
    std::vector<std::string> matches;
    for (const std::string& p : patterns_) {
        if (p == path || PathMatcher::match(p, path)) {
            matches.push_back(p);
        }
    }
    if (matches.empty()) {
        return std::nullopt;
    }

    std::stable_sort(matches.begin(), matches.end(),
                     [&path](const std::string& a, const std::string& b) {
                         return PathMatcher::compare(a, b, path) < 0;
                     });
    return PatternsCondition(matches);
}

int PatternsCondition::compare_to(const PatternsCondition& other,
                                  const http::Request& request) const
{
    size_t common = std::min(patterns_.size(), other.patterns_.size());
    for (size_t i = 0; i < common; ++i) {
        int result = PathMatcher::compare(patterns_[i], other.patterns_[i], request.path());
        if (result != 0) {
            return result;
        }
    }
    return static_cast<int>(other.patterns_.size()) - static_cast<int>(patterns_.size());
}

bool PatternsCondition::is_empty() const
{
    return patterns_.empty();
}

std::string PatternsCondition::to_string() const
{
    std::string out = "[";
    for (size_t i = 0; i < patterns_.size(); ++i) {
        if (i > 0) {
            out += " || ";
        }
        out += patterns_[i];
    }
    return out + "]";
}

bool PatternsCondition::operator==(const PatternsCondition& other) const
{
    if (patterns_.size() != other.patterns_.size()) {
        return false;
    }
    for (const std::string& p : patterns_) {
        if (std::find(other.patterns_.begin(), other.patterns_.end(), p) ==
            other.patterns_.end()) {
            return false;
        }
    }
    return true;
}

} // namespace conduit::condition
