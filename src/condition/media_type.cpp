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
 * @file media_type.cpp
 * @brief Media type parsing and inclusion rules.
 */

#include "conduit/condition/media_type.hpp"

#include "conduit/infra/string.hpp"

#include <stdexcept>

namespace conduit::condition {

using infra::String;

MediaType::MediaType(std::string type, std::string subtype)
    : type_(String::to_lower(type)), subtype_(String::to_lower(subtype))
{
}

MediaType MediaType::parse(const std::string& text)
{
    std::string value = String::trim(text.substr(0, text.find(';')));
    if (value == "*") {
        return all();
    }
    size_t slash = value.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 == value.size()) {
        throw std::invalid_argument("Invalid media type: '" + text + "'");
    }
    return MediaType(String::trim(value.substr(0, slash)), String::trim(value.substr(slash + 1)));
}

std::vector<MediaType> MediaType::parse_list(const std::string& text)
{
    std::vector<MediaType> out;
    for (const std::string& token : String::split(text, ',')) {
        out.push_back(parse(token));
    }
    return out;
}

MediaType MediaType::all()
{
    return MediaType("*", "*");
}

const std::string& MediaType::type() const
{
    return type_;
}

const std::string& MediaType::subtype() const
{
    return subtype_;
}

bool MediaType::is_wildcard_type() const
{
    return type_ == "*";
}

bool MediaType::is_wildcard_subtype() const
{
    return subtype_ == "*";
}

bool MediaType::includes(const MediaType& other) const
{
    if (is_wildcard_type()) {
        return true;
    }
    if (type_ != other.type_) {
        return false;
    }
    return is_wildcard_subtype() || subtype_ == other.subtype_;
}

bool MediaType::is_compatible_with(const MediaType& other) const
{
    return includes(other) || other.includes(*this);
}

std::string MediaType::to_string() const
{
    return type_ + "/" + subtype_;
}

bool MediaType::operator==(const MediaType& other) const
{
    return type_ == other.type_ && subtype_ == other.subtype_;
}

bool MediaType::operator!=(const MediaType& other) const
{
    return !(*this == other);
}

} // namespace conduit::condition
