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
 * @file mapping_info.cpp
 * @brief Composite mapping condition.
 */

#include "conduit/condition/mapping_info.hpp"

namespace conduit::condition {

RequestMappingInfo::RequestMappingInfo(PatternsCondition patterns, MethodsCondition methods,
                                       ParamsCondition params, HeadersCondition headers,
                                       ConsumesCondition consumes, ProducesCondition produces)
    : patterns_(std::move(patterns)), methods_(std::move(methods)), params_(std::move(params)),
      headers_(std::move(headers)), consumes_(std::move(consumes)),
      produces_(std::move(produces))
{
}

RequestMappingInfo::Builder RequestMappingInfo::paths(const std::vector<std::string>& patterns)
{
    return Builder(patterns);
}

const PatternsCondition& RequestMappingInfo::patterns() const
{
    return patterns_;
}

const MethodsCondition& RequestMappingInfo::methods() const
{
    return methods_;
}

const ParamsCondition& RequestMappingInfo::params() const
{
    return params_;
}

const HeadersCondition& RequestMappingInfo::headers() const
{
    return headers_;
}

const ConsumesCondition& RequestMappingInfo::consumes() const
{
    return consumes_;
}

const ProducesCondition& RequestMappingInfo::produces() const
{
    return produces_;
}

RequestMappingInfo RequestMappingInfo::combine(const RequestMappingInfo& other) const
{
    return RequestMappingInfo(patterns_.concat(other.patterns_), methods_.combine(other.methods_),
                              params_.combine(other.params_), headers_.combine(other.headers_),
                              consumes_.combine(other.consumes_),
                              produces_.combine(other.produces_));
}

std::optional<RequestMappingInfo> RequestMappingInfo::matching(const http::Request& request) const
{
    std::optional<MethodsCondition> methods = methods_.matching(request);
    if (!methods) {
        return std::nullopt;
    }
    std::optional<ParamsCondition> params = params_.matching(request);
    if (!params) {
        return std::nullopt;
    }
    std::optional<HeadersCondition> headers = headers_.matching(request);
    if (!headers) {
        return std::nullopt;
    }
    std::optional<ConsumesCondition> consumes = consumes_.matching(request);
    if (!consumes) {
        return std::nullopt;
    }
    std::optional<ProducesCondition> produces = produces_.matching(request);
    if (!produces) {
        return std::nullopt;
    }
    std::optional<PatternsCondition> patterns = patterns_.matching(request);
    if (!patterns) {
        return std::nullopt;
    }
    return RequestMappingInfo(std::move(*patterns), std::move(*methods), std::move(*params),
                              std::move(*headers), std::move(*consumes), std::move(*produces));
}

int RequestMappingInfo::expression_count() const
{
    return static_cast<int>(methods_.methods().size() + params_.size() + headers_.size() +
                            consumes_.expressions().size() + produces_.expressions().size());
}

int RequestMappingInfo::compare_to(const RequestMappingInfo& other,
                                   const http::Request& request) const
{
    int result = other.expression_count() - expression_count();
    if (result != 0) {
        return result;
    }
    return patterns_.compare_with(other.patterns_, request, [&]() {
        return methods_.compare_to(other.methods_, request);
    });
}

bool RequestMappingInfo::is_empty() const
{
    return patterns_.is_empty() && methods_.is_empty() && params_.is_empty() &&
           headers_.is_empty() && consumes_.is_empty() && produces_.is_empty();
}

std::string RequestMappingInfo::to_string() const
{
    std::string out = "{" + patterns_.to_string();
    if (!methods_.is_empty())
        out += ",methods=" + methods_.to_string();
    if (!params_.is_empty())
        out += ",params=" + params_.to_string();
    if (!headers_.is_empty())
        out += ",headers=" + headers_.to_string();
    if (!consumes_.is_empty())
        out += ",consumes=" + consumes_.to_string();
    if (!produces_.is_empty())
        out += ",produces=" + produces_.to_string();
    return out + "}";
}

bool RequestMappingInfo::operator==(const RequestMappingInfo& other) const
{
    return patterns_ == other.patterns_ && methods_ == other.methods_ &&
           params_ == other.params_ && headers_ == other.headers_ &&
           consumes_ == other.consumes_ && produces_ == other.produces_;
}

// ----------------------------------------------------------------------------
// Builder
// ----------------------------------------------------------------------------

RequestMappingInfo::Builder::Builder(const std::vector<std::string>& patterns)
    : patterns_(patterns)
{
}

RequestMappingInfo::Builder& RequestMappingInfo::Builder::methods(
    const std::vector<http::Method>& methods)
{
    methods_ = methods;
    return *this;
}

RequestMappingInfo::Builder& RequestMappingInfo::Builder::params(
    const std::vector<std::string>& params)
{
    params_ = params;
    return *this;
}

RequestMappingInfo::Builder& RequestMappingInfo::Builder::headers(
    const std::vector<std::string>& headers)
{
    headers_ = headers;
    return *this;
}

RequestMappingInfo::Builder& RequestMappingInfo::Builder::consumes(
    const std::vector<std::string>& consumes)
{
    consumes_ = consumes;
    return *this;
}

RequestMappingInfo::Builder& RequestMappingInfo::Builder::produces(
    const std::vector<std::string>& produces)
{
    produces_ = produces;
    return *this;
}

RequestMappingInfo RequestMappingInfo::Builder::build() const
{
    return RequestMappingInfo(PatternsCondition(patterns_), MethodsCondition(methods_),
                              ParamsCondition(params_), HeadersCondition(headers_),
                              ConsumesCondition(consumes_), ProducesCondition(produces_));
}

} // namespace conduit::condition
