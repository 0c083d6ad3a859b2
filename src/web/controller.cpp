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
 * @file controller.cpp
 * @brief Controller adapter and the URL-derived view controller.
 */

#include "conduit/web/controller.hpp"

#include "conduit/flash/flash_manager.hpp"
#include "conduit/mapping/handler_mapping.hpp"
#include "conduit/web/view_name_translator.hpp"

namespace conduit::web {

bool ControllerHandlerAdapter::supports(const Handler& handler) const
{
    return handler.as<Controller>() != nullptr;
}

std::optional<Result> ControllerHandlerAdapter::invoke(http::Request& request,
                                                       http::Response& response,
                                                       const Handler& handler)
{
    return handler.as<Controller>()->handle_request(request, response);
}

int64_t ControllerHandlerAdapter::last_modified(const http::Request& request,
                                                const Handler& handler) const
{
    auto probe = std::dynamic_pointer_cast<LastModified>(handler.as<Controller>());
    return probe ? probe->last_modified(request) : -1;
}

UrlViewController::UrlViewController(std::string prefix, std::string suffix)
    : prefix_(std::move(prefix)), suffix_(std::move(suffix))
{
}

std::optional<Result> UrlViewController::handle_request(http::Request& request, http::Response&)
{
    std::string lookup = request.path();
    const std::string* within =
        request.attribute_as<std::string>(mapping::HandlerMapping::PATH_WITHIN_MAPPING_ATTRIBUTE);
    if (within && !within->empty()) {
        lookup = *within;
    }

    Result result(prefix_ + DefaultViewNameTranslator::transform_path(lookup) + suffix_);
    const flash::FlashState* input =
        request.attribute_as<flash::FlashState>(flash::FlashManager::INPUT_ATTRIBUTE);
    if (input) {
        for (const auto& entry : input->attributes()) {
            result.add(entry.first, entry.second);
        }
    }
    return result;
}

} // namespace conduit::web
