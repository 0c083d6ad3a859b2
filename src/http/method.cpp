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
 * @file method.cpp
 * @brief Request method parsing and formatting.
 */

#include "conduit/http/method.hpp"

namespace conduit::http {

std::optional<Method> parse_method(const std::string& token)
{
    if (token == "GET")
        return Method::GET;
    if (token == "HEAD")
        return Method::HEAD;
    if (token == "POST")
        return Method::POST;
    if (token == "PUT")
        return Method::PUT;
    if (token == "PATCH")
        return Method::PATCH;
    if (token == "DELETE")
        return Method::DELETE;
    if (token == "OPTIONS")
        return Method::OPTIONS;
    if (token == "TRACE")
        return Method::TRACE;
    return std::nullopt;
}

std::string to_string(Method method)
{
    switch (method) {
    case Method::GET:
        return "GET";
    case Method::HEAD:
        return "HEAD";
    case Method::POST:
        return "POST";
    case Method::PUT:
        return "PUT";
    case Method::PATCH:
        return "PATCH";
    case Method::DELETE:
        return "DELETE";
    case Method::OPTIONS:
        return "OPTIONS";
    case Method::TRACE:
        return "TRACE";
    }
    return "GET";
}

} // namespace conduit::http
