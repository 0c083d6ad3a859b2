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

#include "conduit/web/function_adapter.hpp"

namespace conduit::web {

Handler function_handler(HandlerFunction fn, const std::string& description)
{
    return Handler::of(std::make_shared<HandlerFunction>(std::move(fn)), description);
}

bool FunctionHandlerAdapter::supports(const Handler& handler) const
{
    return handler.as<HandlerFunction>() != nullptr;
}

std::optional<Result> FunctionHandlerAdapter::invoke(http::Request& request,
                                                     http::Response& response,
                                                     const Handler& handler)
{
    return (*handler.as<HandlerFunction>())(request, response);
}

} // namespace conduit::web
