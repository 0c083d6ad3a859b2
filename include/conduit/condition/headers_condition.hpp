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
 * @file headers_condition.hpp
 * @brief Condition over request headers (`"X-Api-Version=2"`, `"!X-Legacy"`).
 */

#pragma once

#include "conduit/condition/name_value_expression.hpp"
#include "conduit/condition/request_condition.hpp"

#include <string>
#include <vector>

namespace conduit::condition {

/**
 * @class HeadersCondition
 * @brief All listed header expressions must hold.
 *
 * @details
 * `Accept` and `Content-Type` expressions are accepted here as plain
 * string comparisons; media type aware matching belongs to the produces
 * and consumes conditions.
 */
class HeadersCondition final : public ExpressionCondition<HeadersCondition, HeaderExpression> {
  public:
    HeadersCondition();

    explicit HeadersCondition(const std::vector<std::string>& expressions);

    explicit HeadersCondition(std::vector<HeaderExpression> expressions);

  protected:
    std::string infix() const override;
};

} // namespace conduit::condition
