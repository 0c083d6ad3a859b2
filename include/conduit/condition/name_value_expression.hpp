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
 * @file name_value_expression.hpp
 * @brief Discrete `name`, `!name`, `name=value`, `name!=value` expressions.
 *
 * @details
 * These are the atoms of the params and headers conditions. The four forms
 * read as: present, absent, equal to, and not equal to (which also holds
 * when the name is absent).
 */

#pragma once

#include "conduit/condition/media_type.hpp"
#include "conduit/http/request.hpp"

#include <optional>
#include <string>

namespace conduit::condition {

/**
 * @class NameValueExpression
 * @brief Shared parsing, equality and match logic for name/value expressions.
 */
class NameValueExpression {
  public:
    virtual ~NameValueExpression() = default;

    const std::string& name() const;
    const std::optional<std::string>& value() const;
    bool is_negated() const;

    /**
     * @brief Evaluates the expression against `request`.
     *
     * With a value the request value is compared; without one, presence of
     * the name is tested. Negation inverts the outcome.
     */
    bool match(const http::Request& request) const;

    std::string to_string() const;

  protected:
    /// @brief Parses one of the four textual forms.
    explicit NameValueExpression(const std::string& expression);

    /// @brief Equality shared by the concrete expressions.
    bool equals(const NameValueExpression& other) const;

    virtual bool is_case_sensitive_name() const = 0;
    virtual bool match_name(const http::Request& request) const = 0;
    virtual bool match_value(const http::Request& request) const = 0;

    std::string name_;
    std::optional<std::string> value_;
    bool negated_;
};

/**
 * @class ParamExpression
 * @brief Expression over query/form parameters. Names are case-sensitive.
 */
class ParamExpression final : public NameValueExpression {
  public:
    explicit ParamExpression(const std::string& expression);

    bool operator==(const ParamExpression& other) const;

  protected:
    bool is_case_sensitive_name() const override;
    bool match_name(const http::Request& request) const override;
    bool match_value(const http::Request& request) const override;
};

/**
 * @class HeaderExpression
 * @brief Expression over request headers. Names are case-insensitive.
 */
class HeaderExpression final : public NameValueExpression {
  public:
    explicit HeaderExpression(const std::string& expression);

    bool operator==(const HeaderExpression& other) const;

  protected:
    bool is_case_sensitive_name() const override;
    bool match_name(const http::Request& request) const override;
    bool match_value(const http::Request& request) const override;
};

/**
 * @class MediaTypeExpression
 * @brief A media type, optionally negated with a leading `!`.
 */
class MediaTypeExpression {
  public:
    explicit MediaTypeExpression(const std::string& expression);

    const MediaType& media_type() const;
    bool is_negated() const;

    /// @brief True if `candidate` is compatible (or, when negated, incompatible).
    bool match(const MediaType& candidate) const;

    std::string to_string() const;

    bool operator==(const MediaTypeExpression& other) const;

  private:
    MediaType media_type_;
    bool negated_;
};

} // namespace conduit::condition
