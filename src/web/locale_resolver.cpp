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

#include "conduit/web/locale_resolver.hpp"

#include "conduit/infra/string.hpp"

namespace conduit::web {

using infra::String;

AcceptHeaderLocaleResolver::AcceptHeaderLocaleResolver(std::string default_locale)
    : default_locale_(std::move(default_locale))
{
}

std::string AcceptHeaderLocaleResolver::resolve_locale(const http::Request& request) const
{
    std::optional<std::string> header = request.header("Accept-Language");
    if (!header) {
        return default_locale_;
    }
    std::vector<std::string> ranges = String::split(*header, ',');
    if (ranges.empty()) {
        return default_locale_;
    }
    std::string tag = String::trim(ranges.front().substr(0, ranges.front().find(';')));
    if (tag.empty() || tag == "*") {
        return default_locale_;
    }
    return tag;
}

} // namespace conduit::web
