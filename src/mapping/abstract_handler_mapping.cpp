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
 * @file abstract_handler_mapping.cpp
 * @brief Chain assembly shared by all handler mappings.
 */

#include "conduit/mapping/abstract_handler_mapping.hpp"

#include "conduit/condition/path_matcher.hpp"
#include "conduit/infra/logger.hpp"

namespace conduit::mapping {

using condition::PathMatcher;
using condition::UriVariables;
using infra::Logger;
using infra::LogLevel;

const char* const HandlerMapping::BEST_MATCHING_PATTERN_ATTRIBUTE = "conduit.mapping.best_pattern";
const char* const HandlerMapping::PATH_WITHIN_MAPPING_ATTRIBUTE = "conduit.mapping.path_within";
const char* const HandlerMapping::URI_VARIABLES_ATTRIBUTE = "conduit.mapping.uri_variables";

AbstractHandlerMapping::AbstractHandlerMapping() : order_(LOWEST_PRECEDENCE) {}

std::shared_ptr<web::ExecutionChain> AbstractHandlerMapping::resolve(http::Request& request)
{
    web::Handler handler = lookup_handler(request);
    if (handler.empty()) {
        handler = default_handler_;
    }
    if (handler.empty()) {
        return nullptr;
    }

    auto chain = std::make_shared<web::ExecutionChain>(handler);
    for (const auto& interceptor : interceptors_) {
        auto mapped = std::dynamic_pointer_cast<MappedInterceptor>(interceptor);
        if (!mapped) {
            chain->add_interceptor(interceptor);
        } else if (mapped->matches(request.path())) {
            chain->add_interceptor(mapped->interceptor());
        }
    }

    if (Logger::is_enabled(LogLevel::TRACE)) {
        Logger::log(LogLevel::TRACE, "[" + request.id() + "] " + chain->to_string());
    }
    return chain;
}

int AbstractHandlerMapping::order() const
{
    return order_;
}

void AbstractHandlerMapping::set_order(int order)
{
    order_ = order;
}

void AbstractHandlerMapping::set_default_handler(web::Handler handler)
{
    default_handler_ = std::move(handler);
}

const web::Handler& AbstractHandlerMapping::default_handler() const
{
    return default_handler_;
}

void AbstractHandlerMapping::add_interceptor(std::shared_ptr<web::HandlerInterceptor> interceptor)
{
    interceptors_.push_back(std::move(interceptor));
}

void AbstractHandlerMapping::add_interceptor(std::vector<std::string> includes,
                                             std::vector<std::string> excludes,
                                             std::shared_ptr<web::HandlerInterceptor> interceptor)
{
    interceptors_.push_back(std::make_shared<MappedInterceptor>(
        std::move(includes), std::move(excludes), std::move(interceptor)));
}

void AbstractHandlerMapping::expose_match(http::Request& request, const std::string& pattern)
{
    UriVariables variables;
    PathMatcher::match(pattern, request.path(), &variables);
    request.set_attribute(BEST_MATCHING_PATTERN_ATTRIBUTE, pattern);
    request.set_attribute(PATH_WITHIN_MAPPING_ATTRIBUTE,
                          PathMatcher::extract_path_within_pattern(pattern, request.path()));
    request.set_attribute(URI_VARIABLES_ATTRIBUTE, variables);
}

} // namespace conduit::mapping
