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
 * @file methods_condition.cpp
 * @brief Request method condition.
 */

#include "conduit/condition/methods_condition.hpp"

#include <algorithm>

namespace conduit::condition {

using http::Method;

MethodsCondition::MethodsCondition() = default;

MethodsCondition::MethodsCondition(std::vector<Method> methods)
{
    for (Method m : methods) {
        if (!contains(m)) {
            methods_.push_back(m);
        }
    }
}

const std::vector<Method>& MethodsCondition::methods() const
{
    return methods_;
}

bool MethodsCondition::contains(Method method) const
{
    return std::find(methods_.begin(), methods_.end(), method) != methods_.end();
}

MethodsCondition MethodsCondition::combine(const MethodsCondition& other) const
{
    std::vector<Method> merged = methods_;
    merged.insert(merged.end(), other.methods_.begin(), other.methods_.end());
    return MethodsCondition(std::move(merged));
}

std::optional<MethodsCondition> MethodsCondition::matching(const http::Request& request) const
{
    if (methods_.empty()) {
        return *this;
    }
    if (contains(request.method())) {
        return MethodsCondition({request.method()});
    }
    if (request.method() == Method::HEAD && contains(Method::GET)) {
        return MethodsCondition({Method::GET});
    }
    return std::nullopt;
}

/**
 * @brief More listed methods rank first; between two single-method
 * conditions an explicit `HEAD` outranks `GET` for a HEAD request.
 */
int MethodsCondition::compare_to(const MethodsCondition& other,
                                 const http::Request& request) const
{
    if (other.methods_.size() != methods_.size()) {
        return static_cast<int>(other.methods_.size()) - static_cast<int>(methods_.size());
    }
    if (methods_.size() == 1 && request.method() == Method::HEAD) {
        if (contains(Method::HEAD) && other.contains(Method::GET)) {
            return -1;
        }
        if (contains(Method::GET) && other.contains(Method::HEAD)) {
            return 1;
        }
    }
    return 0;
}

bool MethodsCondition::is_empty() const
{
    return methods_.empty();
}

std::string MethodsCondition::to_string() const
{
    std::string out = "[";
    for (size_t i = 0; i < methods_.size(); ++i) {
        if (i > 0) {
            out += " || ";
        }
        out += http::to_string(methods_[i]);
    }
    return out + "]";
}

bool MethodsCondition::operator==(const MethodsCondition& other) const
{
    if (methods_.size() != other.methods_.size()) {
        return false;
    }
    for (Method m : methods_) {
        if (!other.contains(m)) {
            return false;
        }
    }
    return true;
}

} // namespace conduit::condition
