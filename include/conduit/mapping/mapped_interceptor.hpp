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
 * @file mapped_interceptor.hpp
 * @brief An interceptor limited to a set of URL patterns.
 */

#pragma once

#include "conduit/web/interceptor.hpp"

#include <memory>
#include <string>
#include <vector>

namespace conduit::mapping {

/**
 * @class MappedInterceptor
 * @brief Wraps an interceptor with include and exclude patterns.
 *
 * An empty include list covers every path. A path matching any exclude
 * pattern is never covered.
 */
class MappedInterceptor : public web::HandlerInterceptor {
  public:
    MappedInterceptor(std::vector<std::string> includes, std::vector<std::string> excludes,
                      std::shared_ptr<web::HandlerInterceptor> interceptor);

    bool matches(const std::string& lookup_path) const;

    const std::shared_ptr<web::HandlerInterceptor>& interceptor() const;

    bool pre_handle(http::Request& request, http::Response& response,
                    const web::Handler& handler) override;

    void post_handle(http::Request& request, http::Response& response,
                     const web::Handler& handler, web::Result* result) override;

    void after_completion(http::Request& request, http::Response& response,
                          const web::Handler& handler, std::exception_ptr error) override;

    void after_async_started(http::Request& request, http::Response& response,
                             const web::Handler& handler) override;

  private:
    std::vector<std::string> includes_;
    std::vector<std::string> excludes_;
    std::shared_ptr<web::HandlerInterceptor> interceptor_;
};

} // namespace conduit::mapping
