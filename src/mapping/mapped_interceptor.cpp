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

#include "conduit/mapping/mapped_interceptor.hpp"

#include "conduit/condition/path_matcher.hpp"

namespace conduit::mapping {

using condition::PathMatcher;

MappedInterceptor::MappedInterceptor(std::vector<std::string> includes,
                                     std::vector<std::string> excludes,
                                     std::shared_ptr<web::HandlerInterceptor> interceptor)
    : includes_(std::move(includes)), excludes_(std::move(excludes)),
      interceptor_(std::move(interceptor))
{
}

bool MappedInterceptor::matches(const std::string& lookup_path) const
{
    for (const std::string& pattern : excludes_) {
        if (PathMatcher::match(pattern, lookup_path)) {
            return false;
        }
    }
    if (includes_.empty()) {
        return true;
    }
    for (const std::string& pattern : includes_) {
        if (PathMatcher::match(pattern, lookup_path)) {
            return true;
        }
    }
    return false;
}

const std::shared_ptr<web::HandlerInterceptor>& MappedInterceptor::interceptor() const
{
    return interceptor_;
}

bool MappedInterceptor::pre_handle(http::Request& request, http::Response& response,
                                   const web::Handler& handler)
{
    return interceptor_->pre_handle(request, response, handler);
}

void MappedInterceptor::post_handle(http::Request& request, http::Response& response,
                                    const web::Handler& handler, web::Result* result)
{
    interceptor_->post_handle(request, response, handler, result);
}

void MappedInterceptor::after_completion(http::Request& request, http::Response& response,
                                         const web::Handler& handler, std::exception_ptr error)
{
    interceptor_->after_completion(request, response, handler, error);
}

void MappedInterceptor::after_async_started(http::Request& request, http::Response& response,
                                            const web::Handler& handler)
{
    interceptor_->after_async_started(request, response, handler);
}

} // namespace conduit::mapping
