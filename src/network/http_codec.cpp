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
 * @file http_codec.cpp
 * @brief HTTP/1.1 request parsing and response serialization.
 */

#include "conduit/network/http_codec.hpp"

#include "conduit/infra/string.hpp"

#include <sstream>
#include <stdexcept>

namespace conduit::network {

using infra::String;

namespace {

const std::string HEADER_END = "\r\n\r\n";

size_t content_length(const std::string& head)
{
    std::istringstream lines(head);
    std::string line;
    while (std::getline(lines, line)) {
        size_t colon = line.find(':');
        if (colon != std::string::npos &&
            String::iequals(String::trim(line.substr(0, colon)), "content-length")) {
            try {
                return static_cast<size_t>(std::stoul(String::trim(line.substr(colon + 1))));
            } catch (const std::logic_error&) {
                throw std::invalid_argument("Invalid Content-Length header");
            }
        }
    }
    return 0;
}

} // namespace

bool HttpCodec::is_complete(const std::string& raw)
{
    size_t end = raw.find(HEADER_END);
    if (end == std::string::npos) {
        return false;
    }
    return raw.size() >= end + HEADER_END.size() + content_length(raw.substr(0, end));
}

std::shared_ptr<http::Request> HttpCodec::parse_request(const std::string& raw)
{
    size_t end = raw.find(HEADER_END);
    std::string head = end == std::string::npos ? raw : raw.substr(0, end);
    std::string body = end == std::string::npos ? "" : raw.substr(end + HEADER_END.size());

    std::istringstream lines(head);
    std::string request_line;
    if (!std::getline(lines, request_line)) {
        throw std::invalid_argument("Empty request");
    }
    if (!request_line.empty() && request_line.back() == '\r') {
        request_line.pop_back();
    }

    std::istringstream parts(request_line);
    std::string method_token, target, version;
    parts >> method_token >> target >> version;
    if (target.empty() || !String::starts_with(version, "HTTP/")) {
        throw std::invalid_argument("Malformed request line: '" + request_line + "'");
    }
    std::optional<http::Method> method = http::parse_method(method_token);
    if (!method) {
        throw std::invalid_argument("Unsupported method: '" + method_token + "'");
    }

    auto request = std::make_shared<http::Request>(*method, target);

    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            throw std::invalid_argument("Malformed header: '" + line + "'");
        }
        std::string name = String::trim(line.substr(0, colon));
        std::string value = String::trim(line.substr(colon + 1));
        request->add_header(name, value);

        if (String::iequals(name, "cookie")) {
            for (const std::string& pair : String::split(value, ';')) {
                size_t eq = pair.find('=');
                if (eq != std::string::npos) {
                    request->set_cookie(String::trim(pair.substr(0, eq)),
                                        String::trim(pair.substr(eq + 1)));
                }
            }
        }
    }

    size_t length = content_length(head);
    if (body.size() > length) {
        body.resize(length);
    }

    std::optional<std::string> type = request->header("Content-Type");
    if (type && String::starts_with(String::to_lower(*type), "application/x-www-form-urlencoded")) {
        for (const std::string& pair : String::split(body, '&')) {
            size_t eq = pair.find('=');
            std::string name = String::url_decode(eq == std::string::npos ? pair : pair.substr(0, eq));
            if (!name.empty()) {
                request->add_param(name, eq == std::string::npos
                                             ? ""
                                             : String::url_decode(pair.substr(eq + 1)));
            }
        }
    }
    request->set_body(std::move(body));
    return request;
}

std::string HttpCodec::serialize(const http::Response& response, bool head_only)
{
    std::string out = "HTTP/1.1 " + std::to_string(response.status()) + " " +
                      http::Response::reason_phrase(response.status()) + "\r\n";
    for (const auto& header : response.headers()) {
        if (String::iequals(header.first, "content-length") ||
            String::iequals(header.first, "connection")) {
            continue;
        }
        out += header.first + ": " + header.second + "\r\n";
    }

    bool bodiless = response.status() == 304 || response.status() == 204;
    size_t length = bodiless ? 0 : response.body().size();
    out += "Content-Length: " + std::to_string(length) + "\r\n";
    out += "Connection: close\r\n\r\n";
    if (!head_only && !bodiless) {
        out += response.body();
    }
    return out;
}

} // namespace conduit::network
