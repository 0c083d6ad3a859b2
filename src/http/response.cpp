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
 * @file response.cpp
 * @brief Implementation of the buffered response model.
 */

#include "conduit/http/response.hpp"

#include "conduit/infra/string.hpp"

#include <algorithm>

namespace conduit::http {

using infra::String;

Response::Response() : status_(200), committed_(false) {}

int Response::status() const
{
    return status_;
}

void Response::set_status(int status)
{
    status_ = status;
}

void Response::set_header(const std::string& name, const std::string& value)
{
    remove_header(name);
    headers_.emplace_back(name, value);
}

void Response::add_header(const std::string& name, const std::string& value)
{
    headers_.emplace_back(name, value);
}

std::optional<std::string> Response::header(const std::string& name) const
{
    for (const auto& entry : headers_) {
        if (String::iequals(entry.first, name)) {
            return entry.second;
        }
    }
    return std::nullopt;
}

bool Response::has_header(const std::string& name) const
{
    return header(name).has_value();
}

void Response::remove_header(const std::string& name)
{
    headers_.erase(std::remove_if(headers_.begin(), headers_.end(),
                                  [&name](const std::pair<std::string, std::string>& entry) {
                                      return String::iequals(entry.first, name);
                                  }),
                   headers_.end());
}

const std::vector<std::pair<std::string, std::string>>& Response::headers() const
{
    return headers_;
}

void Response::set_content_type(const std::string& type)
{
    set_header("Content-Type", type);
}

const std::string& Response::body() const
{
    return body_;
}

void Response::set_body(std::string body)
{
    body_ = std::move(body);
}

void Response::write(const std::string& text)
{
    body_ += text;
}

void Response::send_redirect(const std::string& location)
{
    status_ = 302;
    set_header("Location", location);
}

void Response::send_error(int status, const std::string& message)
{
    status_ = status;
    set_content_type("text/plain; charset=utf-8");
    body_ = message.empty() ? reason_phrase(status) : message;
}

bool Response::is_redirect() const
{
    return status_ >= 300 && status_ < 400 && status_ != 304 && has_header("Location");
}

bool Response::is_committed() const
{
    return committed_;
}

void Response::commit()
{
    committed_ = true;
}

std::string Response::reason_phrase(int status)
{
    switch (status) {
    case 200:
        return "OK";
    case 201:
        return "Created";
    case 202:
        return "Accepted";
    case 204:
        return "No Content";
    case 301:
        return "Moved Permanently";
    case 302:
        return "Found";
    case 303:
        return "See Other";
    case 304:
        return "Not Modified";
    case 307:
        return "Temporary Redirect";
    case 308:
        return "Permanent Redirect";
    case 400:
        return "Bad Request";
    case 403:
        return "Forbidden";
    case 404:
        return "Not Found";
    case 405:
        return "Method Not Allowed";
    case 406:
        return "Not Acceptable";
    case 415:
        return "Unsupported Media Type";
    case 500:
        return "Internal Server Error";
    case 503:
        return "Service Unavailable";
    default:
        return "Unknown";
    }
}

} // namespace conduit::http
