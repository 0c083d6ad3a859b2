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
 * @file params_condition.hpp
 * @brief Condition over request parameters (`"mode=edit"`, `"!debug"`).
 */

#pragma once

#include "conduit/condition/name_value_expression.hpp"
#include "conduit/condition/request_condition.hpp"

#include <string>
#include <vector>

namespace conduit::condition {

/**
 * @class ParamsCondition
 * @brief All listed parameter expressions must hold.
 */
class ParamsCondition final : public ExpressionCondition<ParamsCondition, ParamExpression> {
  public:
    /// @brief The wildcard condition.
    ParamsCondition();

    /**
     * @brief Parses each string as a parameter expression.
     *
     * @code
     * ParamsCondition c({"mode=edit", "!debug"});
     * @endcode
     */
    explicit ParamsCondition(const std::vector<std::string>& expressions);

    explicit ParamsCondition(std::vector<ParamExpression> expressions);

  protected:
    std::string infix() const override;
};

} // namespace conduit::condition
