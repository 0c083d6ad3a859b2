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
 * @file params_condition.cpp
 * @brief Parameter condition construction.
 */

#include "conduit/condition/params_condition.hpp"

namespace conduit::condition {

namespace {

std::vector<ParamExpression> parse(const std::vector<std::string>& expressions)
{
    std::vector<ParamExpression> out;
    out.reserve(expressions.size());
    for (const std::string& e : expressions) {
        out.emplace_back(e);
    }
    return out;
}

} // namespace

ParamsCondition::ParamsCondition() : ExpressionCondition(std::vector<ParamExpression>{}) {}

ParamsCondition::ParamsCondition(const std::vector<std::string>& expressions)
    : ExpressionCondition(parse(expressions))
{
}

ParamsCondition::ParamsCondition(std::vector<ParamExpression> expressions)
    : ExpressionCondition(std::move(expressions))
{
}

std::string ParamsCondition::infix() const
{
    return " && ";
}

} // namespace conduit::condition
