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
 * @file interceptor.hpp
 * @brief Cross-cutting callbacks around handler execution.
 */

#pragma once

#include "conduit/http/request.hpp"
#include "conduit/http/response.hpp"
#include "conduit/web/handler.hpp"
#include "conduit/web/result.hpp"

#include <exception>

namespace conduit::web {

/**
 * @class HandlerInterceptor
 * @brief Four callbacks; implement only the ones you need.
 *
 * @details
 * | Callback              | Order     | Runs when                                        |
 * |-----------------------|-----------|--------------------------------------------------|
 * | `pre_handle`          | forward   | before the handler; `false` stops the chain      |
 * | `post_handle`         | reverse   | after the handler completed normally             |
 * | `after_completion`    | reverse   | always, for every interceptor whose pre returned |
 * | `after_async_started` | reverse   | instead of post/after on the initiating async pass |
 */
class HandlerInterceptor {
  public:
    virtual ~HandlerInterceptor() = default;

    /**
     * @brief Gate in front of the handler.
     *
     * Returning `false` means the interceptor has dealt with the response
     * (e.g. written an error) and nothing further should run.
     */
    virtual bool pre_handle(http::Request&, http::Response&, const Handler&)
    {
        return true;
    }

    /**
     * @param result The handler's result; null if it wrote the response directly.
     */
    virtual void post_handle(http::Request&, http::Response&, const Handler&, Result*) {}

    /**
     * @param error The failure of this dispatch, or null on success.
     */
    virtual void after_completion(http::Request&, http::Response&, const Handler&,
                                  std::exception_ptr)
    {
    }

    virtual void after_async_started(http::Request&, http::Response&, const Handler&) {}
};

} // namespace conduit::web
