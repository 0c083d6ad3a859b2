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
 * @file method.hpp
 * @brief HTTP request methods understood by the dispatch core.
 */

#pragma once

#include <optional>
#include <string>

namespace conduit::http {

/**
 * @enum Method
 * @brief The request methods a mapping condition can be declared against.
 */
enum class Method { GET, HEAD, POST, PUT, PATCH, DELETE, OPTIONS, TRACE };

/**
 * @brief Parses a request-line token.
 *
 * Method names are case-sensitive (RFC 7230), so `"get"` is rejected.
 *
 * @return The method, or `std::nullopt` for an unknown token.
 */
std::optional<Method> parse_method(const std::string& token);

/// @brief Canonical upper-case name of `method`.
std::string to_string(Method method);

} // namespace conduit::http
