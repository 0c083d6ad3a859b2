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
 * @file methods_condition.hpp
 * @brief Condition over the HTTP request method.
 */

#pragma once

#include "conduit/condition/request_condition.hpp"
#include "conduit/http/method.hpp"

#include <string>
#include <vector>

namespace conduit::condition {

/**
 * @class MethodsCondition
 * @brief The request method must be one of the listed methods.
 *
 * @details
 * This is a disjunction: `{GET, POST}` accepts either. An empty set accepts
 * every method. A `HEAD` request also satisfies a condition listing `GET`.
 * After `matching` the condition holds exactly the one method that applied,
 * so a reduced non-empty condition always outranks the wildcard.
 */
class MethodsCondition final : public RequestCondition<MethodsCondition> {
  public:
    MethodsCondition();

    explicit MethodsCondition(std::vector<http::Method> methods);

    const std::vector<http::Method>& methods() const;

    MethodsCondition combine(const MethodsCondition& other) const override;

    std::optional<MethodsCondition> matching(const http::Request& request) const override;

    int compare_to(const MethodsCondition& other, const http::Request& request) const override;

    bool is_empty() const override;

    std::string to_string() const override;

    bool operator==(const MethodsCondition& other) const;

  private:
    bool contains(http::Method method) const;

    std::vector<http::Method> methods_;
};

} // namespace conduit::condition
