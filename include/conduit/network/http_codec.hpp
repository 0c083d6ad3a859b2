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
 * @file http_codec.hpp
 * @brief Minimal HTTP/1.1 message parsing and serialization.
 *
 * @details
 * Just enough of RFC 7230 for the demo transport: one request per
 * connection, `Content-Length` bodies only (no chunked encoding), and
 * `application/x-www-form-urlencoded` bodies merged into the parameters.
 */

#pragma once

#include "conduit/http/request.hpp"
#include "conduit/http/response.hpp"

#include <memory>
#include <string>

namespace conduit::network {

class HttpCodec {
  public:
    /**
     * @brief True once `raw` holds the full header block and the announced body.
     */
    static bool is_complete(const std::string& raw);

    /**
     * @brief Parses one request.
     *
     * @throws std::invalid_argument on a malformed request line, an unknown
     * method or a malformed header.
     */
    static std::shared_ptr<http::Request> parse_request(const std::string& raw);

    /**
     * @brief Serializes `response` with `Content-Length` and `Connection: close`.
     *
     * @param head_only Omit the body (HEAD requests); the length still describes it.
     */
    static std::string serialize(const http::Response& response, bool head_only = false);
};

} // namespace conduit::network
