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
 * @file request_condition.hpp
 * @brief The composable, comparable request-matching contract.
 *
 * @details
 * A condition is an immutable value. Handler mappings use three operations:
 *
 * 1. **combine**: merges a type-level and a method-level declaration.
 * 2. **matching**: reduces the condition to the part that holds for a
 *    request, or reports that it does not apply at all.
 * 3. **compare_to**: orders two already-reduced conditions by specificity,
 *    more specific first.
 *
 * `ExpressionCondition` implements all three for conditions that are plain
 * sets of discrete expressions.
 */

#pragma once

#include "conduit/http/request.hpp"

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace conduit::condition {

/**
 * @class RequestCondition
 * @brief Abstract condition over requests, parameterized by its own type.
 *
 * @tparam T The concrete condition type; `combine` and `matching` return it by value.
 */
template <typename T> class RequestCondition {
  public:
    /// @brief Secondary ordering consulted when the primary comparison ties.
    using TieBreaker = std::function<int()>;

    virtual ~RequestCondition() = default;

    /// @brief Conjunction of this condition and `other`. Pure.
    virtual T combine(const T& other) const = 0;

    /**
     * @brief Reduces the condition against `request`.
     *
     * @return The satisfied condition, or `std::nullopt` if it does not apply.
     */
    virtual std::optional<T> matching(const http::Request& request) const = 0;

    /**
     * @brief Compares two conditions already returned by `matching`.
     *
     * @return Negative if this is more specific, positive if `other` is, zero on a tie.
     */
    virtual int compare_to(const T& other, const http::Request& request) const = 0;

    /// @brief True for the wildcard condition that matches every request.
    virtual bool is_empty() const = 0;

    virtual std::string to_string() const = 0;

    /**
     * @brief `compare_to`, falling back to `tie_breaker` when it returns zero.
     */
    int compare_with(const T& other, const http::Request& request,
                     const TieBreaker& tie_breaker) const
    {
        int result = compare_to(other, request);
        if (result != 0 || !tie_breaker) {
            return result;
        }
        return tie_breaker();
    }
};

/**
 * @class ExpressionCondition
 * @brief A condition holding an insertion-ordered set of discrete expressions.
 *
 * @details
 * - `combine` returns the union of both expression sets.
 * - `matching` requires every expression to hold (conjunction).
 * - `compare_to` ranks the condition with more expressions first.
 *
 * @tparam Derived The concrete condition, constructible from `std::vector<Expression>`.
 * @tparam Expression An equality-comparable expression with `match` and `to_string`.
 */
template <typename Derived, typename Expression>
class ExpressionCondition : public RequestCondition<Derived> {
  public:
    const std::vector<Expression>& expressions() const
    {
        return expressions_;
    }

    size_t size() const
    {
        return expressions_.size();
    }

    Derived combine(const Derived& other) const override
    {
        std::vector<Expression> merged = expressions_;
        for (const Expression& e : other.expressions()) {
            add_unique(merged, e);
        }
        return Derived(std::move(merged));
    }

    std::optional<Derived> matching(const http::Request& request) const override
    {
        for (const Expression& e : expressions_) {
            if (!e.match(request)) {
                return std::nullopt;
            }
        }
        return static_cast<const Derived&>(*this);
    }

    int compare_to(const Derived& other, const http::Request&) const override
    {
        return static_cast<int>(other.size()) - static_cast<int>(size());
    }

    bool is_empty() const override
    {
        return expressions_.empty();
    }

    std::string to_string() const override
    {
        std::string out = "[";
        for (size_t i = 0; i < expressions_.size(); ++i) {
            if (i > 0) {
                out += infix();
            }
            out += expressions_[i].to_string();
        }
        return out + "]";
    }

    bool operator==(const Derived& other) const
    {
        if (expressions_.size() != other.expressions().size()) {
            return false;
        }
        for (const Expression& e : expressions_) {
            if (!contains(other.expressions(), e)) {
                return false;
            }
        }
        return true;
    }

  protected:
    explicit ExpressionCondition(std::vector<Expression> expressions)
    {
        for (Expression& e : expressions) {
            add_unique(expressions_, std::move(e));
        }
    }

    /// @brief Separator used by `to_string` (" && " or " || ").
    virtual std::string infix() const = 0;

    static bool contains(const std::vector<Expression>& set, const Expression& e)
    {
        for (const Expression& existing : set) {
            if (existing == e) {
                return true;
            }
        }
        return false;
    }

    static void add_unique(std::vector<Expression>& set, Expression e)
    {
        if (!contains(set, e)) {
            set.push_back(std::move(e));
        }
    }

    std::vector<Expression> expressions_;
};

} // namespace conduit::condition
