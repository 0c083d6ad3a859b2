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
 * @file name_value_expression.cpp
 * @brief Parsing and evaluation of the condition expressions.
 */

#include "conduit/condition/name_value_expression.hpp"

#include "conduit/infra/string.hpp"

#include <stdexcept>

namespace conduit::condition {

using infra::String;

NameValueExpression::NameValueExpression(const std::string& expression) : negated_(false)
{
    std::string text = String::trim(expression);
    size_t eq = text.find('=');
    if (eq == std::string::npos) {
        negated_ = String::starts_with(text, "!");
        name_ = negated_ ? String::trim(text.substr(1)) : text;
    } else {
        negated_ = eq > 0 && text[eq - 1] == '!';
        name_ = String::trim(text.substr(0, negated_ ? eq - 1 : eq));
        value_ = String::trim(text.substr(eq + 1));
    }
    if (name_.empty()) {
        throw std::invalid_argument("Expression without a name: '" + expression + "'");
    }
}

const std::string& NameValueExpression::name() const
{
    return name_;
}

const std::optional<std::string>& NameValueExpression::value() const
{
    return value_;
}

bool NameValueExpression::is_negated() const
{
    return negated_;
}

bool NameValueExpression::match(const http::Request& request) const
{
    bool matched = value_ ? match_value(request) : match_name(request);
    return matched != negated_;
}

std::string NameValueExpression::to_string() const
{
    if (value_) {
        return name_ + (negated_ ? "!=" : "=") + *value_;
    }
    return (negated_ ? "!" : "") + name_;
}

bool NameValueExpression::equals(const NameValueExpression& other) const
{
    bool same_name = is_case_sensitive_name() ? name_ == other.name_
                                              : String::iequals(name_, other.name_);
    return same_name && value_ == other.value_ && negated_ == other.negated_;
}

// ----------------------------------------------------------------------------
// ParamExpression
// ----------------------------------------------------------------------------

ParamExpression::ParamExpression(const std::string& expression) : NameValueExpression(expression)
{
}

bool ParamExpression::operator==(const ParamExpression& other) const
{
    return equals(other);
}

bool ParamExpression::is_case_sensitive_name() const
{
    return true;
}

bool ParamExpression::match_name(const http::Request& request) const
{
    return request.has_param(name_);
}

bool ParamExpression::match_value(const http::Request& request) const
{
    std::optional<std::string> actual = request.param(name_);
    return actual && *actual == *value_;
}

// ----------------------------------------------------------------------------
// HeaderExpression
// ----------------------------------------------------------------------------

HeaderExpression::HeaderExpression(const std::string& expression)
    : NameValueExpression(expression)
{
}

bool HeaderExpression::operator==(const HeaderExpression& other) const
{
    return equals(other);
}

bool HeaderExpression::is_case_sensitive_name() const
{
    return false;
}

bool HeaderExpression::match_name(const http::Request& request) const
{
    return request.has_header(name_);
}

bool HeaderExpression::match_value(const http::Request& request) const
{
    std::optional<std::string> actual = request.header(name_);
    return actual && *actual == *value_;
}

// ----------------------------------------------------------------------------
// MediaTypeExpression
// ----------------------------------------------------------------------------

namespace {

std::string strip_negation(const std::string& expression)
{
    std::string text = String::trim(expression);
    return String::starts_with(text, "!") ? text.substr(1) : text;
}

} // namespace

MediaTypeExpression::MediaTypeExpression(const std::string& expression)
    : media_type_(MediaType::parse(strip_negation(expression))),
      negated_(String::starts_with(String::trim(expression), "!"))
{
}

const MediaType& MediaTypeExpression::media_type() const
{
    return media_type_;
}

bool MediaTypeExpression::is_negated() const
{
    return negated_;
}

bool MediaTypeExpression::match(const MediaType& candidate) const
{
    return media_type_.is_compatible_with(candidate) != negated_;
}

std::string MediaTypeExpression::to_string() const
{
    return (negated_ ? "!" : "") + media_type_.to_string();
}

bool MediaTypeExpression::operator==(const MediaTypeExpression& other) const
{
    return media_type_ == other.media_type_ && negated_ == other.negated_;
}

} // namespace conduit::condition
