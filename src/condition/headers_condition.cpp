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
 * @file headers_condition.cpp
 * @brief Header condition construction.
 */

#include "conduit/condition/headers_condition.hpp"

namespace conduit::condition {

namespace {

std::vector<HeaderExpression> parse(const std::vector<std::string>& expressions)
{
    std::vector<HeaderExpression> out;
    out.reserve(expressions.size());
    for (const std::string& e : expressions) {
        out.emplace_back(e);
    }
    return out;
}

} // namespace

HeadersCondition::HeadersCondition() : ExpressionCondition(std::vector<HeaderExpression>{}) {}

HeadersCondition::HeadersCondition(const std::vector<std::string>& expressions)
    : ExpressionCondition(parse(expressions))
{
}

HeadersCondition::HeadersCondition(std::vector<HeaderExpression> expressions)
    : ExpressionCondition(std::move(expressions))
{
}

std::string HeadersCondition::infix() const
{
    return " && ";
}

} // namespace conduit::condition
