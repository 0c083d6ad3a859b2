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
 * @file abstract_handler_mapping.hpp
 * @brief Shared ordering, default handler and interceptor logic for mappings.
 */

#pragma once

#include "conduit/mapping/handler_mapping.hpp"
#include "conduit/mapping/mapped_interceptor.hpp"

#include <vector>

namespace conduit::mapping {

/**
 * @class AbstractHandlerMapping
 * @brief Builds the execution chain around whatever `lookup_handler` finds.
 *
 * @details
 * Plain interceptors apply to every handler of the mapping; a
 * `MappedInterceptor` is added only when its patterns cover the request
 * path. Both keep registration order.
 */
class AbstractHandlerMapping : public HandlerMapping {
  public:
    AbstractHandlerMapping();

    std::shared_ptr<web::ExecutionChain> resolve(http::Request& request) override;

    int order() const override;

    void set_order(int order);

    /// @brief Handler returned when `lookup_handler` finds nothing.
    void set_default_handler(web::Handler handler);

    const web::Handler& default_handler() const;

    void add_interceptor(std::shared_ptr<web::HandlerInterceptor> interceptor);

    /// @brief Convenience for adding a `MappedInterceptor`.
    void add_interceptor(std::vector<std::string> includes, std::vector<std::string> excludes,
                         std::shared_ptr<web::HandlerInterceptor> interceptor);

  protected:
    /// @return The handler for `request`, or an empty handler.
    virtual web::Handler lookup_handler(http::Request& request) = 0;

    /// @brief Publishes the matched pattern and its variables as request attributes.
    static void expose_match(http::Request& request, const std::string& pattern);

  private:
    int order_;
    web::Handler default_handler_;
    std::vector<std::shared_ptr<web::HandlerInterceptor>> interceptors_;
};

} // namespace conduit::mapping
