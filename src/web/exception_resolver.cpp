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
 * @file exception_resolver.cpp
 * @brief Stock exception resolvers.
 */

#include "conduit/web/exception_resolver.hpp"

#include "conduit/infra/logger.hpp"
#include "conduit/web/errors.hpp"

namespace conduit::web {

using infra::Logger;
using infra::LogLevel;

namespace {

std::string describe(std::exception_ptr error)
{
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

} // namespace

std::optional<Result> DefaultExceptionResolver::resolve(http::Request& request,
                                                        http::Response& response, const Handler*,
                                                        std::exception_ptr error)
{
    int status = 0;
    try {
        std::rethrow_exception(error);
    } catch (const NoHandlerFoundError&) {
        status = 404;
    } catch (const AsyncTimeoutError&) {
        status = 503;
    } catch (const ResponseStatusError& e) {
        status = e.status();
    } catch (...) {
        return std::nullopt;
    }

    Logger::log(LogLevel::DEBUG, "[" + request.id() + "] Resolved to status " +
                                     std::to_string(status) + ": " + describe(error));
    if (response.is_committed()) {
        Logger::log(LogLevel::WARN, "[" + request.id() + "] Response committed, cannot send " +
                                        std::to_string(status));
    } else {
        response.send_error(status);
    }
    return Result::handled();
}

void MappingExceptionResolver::set_default_view(const std::string& view_name, int status)
{
    default_mapping_ = Mapping{nullptr, view_name, status};
}

std::optional<Result> MappingExceptionResolver::resolve(http::Request& request, http::Response&,
                                                        const Handler*, std::exception_ptr error)
{
    const Mapping* selected = nullptr;
    for (const Mapping& mapping : mappings_) {
        if (mapping.matches(error)) {
            selected = &mapping;
            break;
        }
    }
    if (!selected && default_mapping_) {
        selected = &*default_mapping_;
    }
    if (!selected) {
        return std::nullopt;
    }

    Result result(selected->view_name);
    result.set_status(selected->status);
    result.add("exception", describe(error));
    Logger::log(LogLevel::DEBUG,
                "[" + request.id() + "] Mapped failure to view '" + selected->view_name + "'");
    return result;
}

} // namespace conduit::web
