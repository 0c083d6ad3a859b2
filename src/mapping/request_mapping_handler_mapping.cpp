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
 * @file request_mapping_handler_mapping.cpp
 * @brief Condition-based handler lookup with ambiguity detection.
 */

#include "conduit/mapping/request_mapping_handler_mapping.hpp"

#include "conduit/infra/logger.hpp"
#include "conduit/web/errors.hpp"

#include <algorithm>

namespace conduit::mapping {

using condition::RequestMappingInfo;
using infra::Logger;
using infra::LogLevel;

void RequestMappingHandlerMapping::register_handler(const RequestMappingInfo& info,
                                                    web::Handler handler)
{
    for (const Registration& existing : registrations_) {
        if (existing.info == info) {
            throw web::AmbiguousMappingError("Ambiguous mapping: cannot map [" +
                                             handler.description() + "] to " + info.to_string() +
                                             ", already mapped to [" +
                                             existing.handler.description() + "]");
        }
    }
    registrations_.push_back(Registration{info, std::move(handler)});
    Logger::log(LogLevel::DEBUG, "Mapped " + info.to_string());
}

void RequestMappingHandlerMapping::register_handler(const RequestMappingInfo& type_level,
                                                    const RequestMappingInfo& method_level,
                                                    web::Handler handler)
{
    register_handler(type_level.combine(method_level), std::move(handler));
}

size_t RequestMappingHandlerMapping::size() const
{
    return registrations_.size();
}

web::Handler RequestMappingHandlerMapping::lookup_handler(http::Request& request)
{
    struct Match {
        RequestMappingInfo info;
        const web::Handler* handler;
    };

    std::vector<Match> matches;
    for (const Registration& registration : registrations_) {
        std::optional<RequestMappingInfo> matched = registration.info.matching(request);
        if (matched) {
            matches.push_back(Match{*matched, &registration.handler});
        }
    }
    if (matches.empty()) {
        return web::Handler();
    }

    std::stable_sort(matches.begin(), matches.end(), [&request](const Match& a, const Match& b) {
        return a.info.compare_to(b.info, request) < 0;
    });

    if (matches.size() > 1 && matches[0].info.compare_to(matches[1].info, request) == 0) {
        throw web::AmbiguousMappingError("Ambiguous handler methods mapped for '" +
                                         request.path() + "': {" +
                                         matches[0].handler->description() + ", " +
                                         matches[1].handler->description() + "}");
    }

    const Match& best = matches.front();
    const std::vector<std::string>& patterns = best.info.patterns().patterns();
    if (!patterns.empty()) {
        expose_match(request, patterns.front());
    }
    return *best.handler;
}

} // namespace conduit::mapping
