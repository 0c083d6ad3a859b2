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

#include "conduit/mapping/url_handler_mapping.hpp"

#include "conduit/condition/path_matcher.hpp"
#include "conduit/infra/logger.hpp"
#include "conduit/web/errors.hpp"

namespace conduit::mapping {

using condition::PathMatcher;
using infra::Logger;
using infra::LogLevel;

void UrlHandlerMapping::register_handler(const std::string& pattern, web::Handler handler)
{
    std::string key = !pattern.empty() && pattern.front() == '/' ? pattern : "/" + pattern;
    auto existing = handlers_.find(key);
    if (existing != handlers_.end()) {
        if (existing->second == handler) {
            return;
        }
        throw web::AmbiguousMappingError("Cannot map [" + handler.description() + "] to '" + key +
                                         "': already mapped to [" +
                                         existing->second.description() + "]");
    }
    handlers_.emplace(key, std::move(handler));
    Logger::log(LogLevel::DEBUG, "Mapped URL '" + key + "'");
}

const std::map<std::string, web::Handler>& UrlHandlerMapping::handlers() const
{
    return handlers_;
}

web::Handler UrlHandlerMapping::lookup_handler(http::Request& request)
{
    const std::string& path = request.path();

    auto direct = handlers_.find(path);
    if (direct != handlers_.end()) {
        expose_match(request, direct->first);
        return direct->second;
    }

    const std::string* best = nullptr;
    const web::Handler* handler = nullptr;
    bool tie = false;
    for (const auto& entry : handlers_) {
        if (!PathMatcher::match(entry.first, path)) {
            continue;
        }
        int cmp = best ? PathMatcher::compare(entry.first, *best, path) : -1;
        if (cmp < 0) {
            best = &entry.first;
            handler = &entry.second;
            tie = false;
        } else if (cmp == 0) {
            tie = true;
        }
    }

    if (!best) {
        return web::Handler();
    }
    if (tie) {
        throw web::AmbiguousMappingError("Ambiguous URL patterns for '" + path + "': '" + *best +
                                         "' and another equally specific pattern");
    }
    expose_match(request, *best);
    return *handler;
}

} // namespace conduit::mapping
