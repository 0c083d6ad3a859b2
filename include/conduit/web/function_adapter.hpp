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
 * @file function_adapter.hpp
 * @brief Plain callables as handlers.
 */

#pragma once

#include "conduit/web/adapter.hpp"

#include <functional>

namespace conduit::web {

/// @brief Handler shape for lambdas and free functions.
using HandlerFunction = std::function<std::optional<Result>(http::Request&, http::Response&)>;

/**
 * @brief Wraps `fn` into a `Handler` understood by `FunctionHandlerAdapter`.
 *
 * @code
 * auto hello = function_handler([](http::Request&, http::Response& resp) {
 *     resp.write("hello");
 *     return std::optional<Result>();
 * }, "hello");
 * @endcode
 */
Handler function_handler(HandlerFunction fn, const std::string& description = "function");

class FunctionHandlerAdapter : public HandlerAdapter {
  public:
    bool supports(const Handler& handler) const override;

    std::optional<Result> invoke(http::Request& request, http::Response& response,
                                 const Handler& handler) override;
};

} // namespace conduit::web
