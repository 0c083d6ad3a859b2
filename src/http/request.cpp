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
 * @file request.cpp
 * @brief Implementation of the inbound request model.
 */

#include "conduit/http/request.hpp"

#include "conduit/async/async_manager.hpp"
#include "conduit/infra/id_generator.hpp"
#include "conduit/infra/string.hpp"

namespace conduit::http {

using infra::String;

Request::Request(Method method, const std::string& target)
    : method_(method), id_(infra::IdGenerator::short_id()), dispatch_type_(DispatchType::REQUEST)
{
    size_t qpos = target.find('?');
    if (qpos == std::string::npos) {
        path_ = String::url_decode(target, false);
    } else {
        path_ = String::url_decode(target.substr(0, qpos), false);
        query_ = target.substr(qpos + 1);
    }
    if (path_.empty()) {
        path_ = "/";
    }
    parse_query();
}

Request::~Request() = default;

/**
 * @brief Decodes `a=1&b=2&a=3` into the multi-valued parameter map.
 *
 * A bare name (`flag`) is recorded with an empty value so that presence
 * checks still see it.
 */
void Request::parse_query()
{
    for (const std::string& pair : String::split(query_, '&')) {
        size_t eq = pair.find('=');
        std::string name = String::url_decode(eq == std::string::npos ? pair : pair.substr(0, eq));
        std::string value = eq == std::string::npos ? "" : String::url_decode(pair.substr(eq + 1));
        if (!name.empty()) {
            params_[name].push_back(value);
        }
    }
}

Method Request::method() const
{
    return method_;
}

const std::string& Request::path() const
{
    return path_;
}

const std::string& Request::query_string() const
{
    return query_;
}

const ParamMap& Request::params() const
{
    return params_;
}

std::optional<std::string> Request::param(const std::string& name) const
{
    auto it = params_.find(name);
    if (it == params_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.front();
}

bool Request::has_param(const std::string& name) const
{
    return params_.count(name) > 0;
}

void Request::add_param(const std::string& name, const std::string& value)
{
    params_[name].push_back(value);
}

std::optional<std::string> Request::header(const std::string& name) const
{
    auto it = headers_.find(String::to_lower(name));
    if (it == headers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Request::has_header(const std::string& name) const
{
    return headers_.count(String::to_lower(name)) > 0;
}

void Request::add_header(const std::string& name, const std::string& value)
{
    std::string key = String::to_lower(name);
    auto it = headers_.find(key);
    if (it == headers_.end()) {
        headers_[key] = value;
    } else {
        it->second += ", " + value;
    }
}

const std::map<std::string, std::string>& Request::headers() const
{
    return headers_;
}

std::optional<std::string> Request::cookie(const std::string& name) const
{
    auto it = cookies_.find(name);
    if (it == cookies_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Request::set_cookie(const std::string& name, const std::string& value)
{
    cookies_[name] = value;
}

const std::string& Request::body() const
{
    return body_;
}

void Request::set_body(std::string body)
{
    body_ = std::move(body);
}

const std::string& Request::session_id() const
{
    return session_id_;
}

void Request::set_session_id(const std::string& id)
{
    session_id_ = id;
}

const std::string& Request::id() const
{
    return id_;
}

void Request::set_attribute(const std::string& name, std::any value)
{
    attributes_[name] = std::move(value);
}

const std::any* Request::attribute(const std::string& name) const
{
    auto it = attributes_.find(name);
    return it == attributes_.end() ? nullptr : &it->second;
}

void Request::remove_attribute(const std::string& name)
{
    attributes_.erase(name);
}

Model& Request::model()
{
    return model_;
}

const Model& Request::model() const
{
    return model_;
}

DispatchType Request::dispatch_type() const
{
    return dispatch_type_;
}

void Request::set_dispatch_type(DispatchType type)
{
    dispatch_type_ = type;
}

async::AsyncManager& Request::async()
{
    if (!async_) {
        async_ = std::make_unique<async::AsyncManager>();
    }
    return *async_;
}

bool Request::is_async_started() const
{
    return async_ && async_->is_started();
}

} // namespace conduit::http
