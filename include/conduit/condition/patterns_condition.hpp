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
 * @file patterns_condition.hpp
 * @brief Condition over the request lookup path.
 */

#pragma once

#include "conduit/condition/request_condition.hpp"

#include <string>
#include <vector>

namespace conduit::condition {

/**
 * @class PatternsCondition
 * @brief The request path must match at least one of the listed URL patterns.
 *
 * @details
 * `combine` unions two pattern sets like every other condition; declaring a
 * type-level prefix for method-level patterns is done with `concat`.
 * `matching` keeps only the patterns that match, sorted most specific
 * first, and `compare_to` compares those sorted lists pairwise with the
 * path specificity comparator.
 */
class PatternsCondition final : public RequestCondition<PatternsCondition> {
  public:
    PatternsCondition();

    /// @brief Patterns lacking a leading `/` get one.
    explicit PatternsCondition(const std::vector<std::string>& patterns);

    const std::vector<std::string>& patterns() const;

    PatternsCondition combine(const PatternsCondition& other) const override;

    /**
     * @brief Cartesian join of this (prefix) and `other` (suffix) patterns.
     *
     * `{"/accounts"}` concat `{"/{id}", "/new"}` yields
     * `{"/accounts/{id}", "/accounts/new"}`. An empty side leaves the other
     * side unchanged.
     */
    PatternsCondition concat(const PatternsCondition& other) const;

    std::optional<PatternsCondition> matching(const http::Request& request) const override;

    int compare_to(const PatternsCondition& other, const http::Request& request) const override;

    bool is_empty() const override;

    std::string to_string() const override;

    bool operator==(const PatternsCondition& other) const;

  private:
    std::vector<std::string> patterns_;
};

} // namespace conduit::condition
