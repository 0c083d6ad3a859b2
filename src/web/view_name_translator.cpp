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

#include "conduit/web/view_name_translator.hpp"

namespace conduit::web {

DefaultViewNameTranslator::DefaultViewNameTranslator(std::string prefix, std::string suffix)
    : prefix_(std::move(prefix)), suffix_(std::move(suffix))
{
}

std::string DefaultViewNameTranslator::view_name(const http::Request& request) const
{
    return prefix_ + transform_path(request.path()) + suffix_;
}

std::string DefaultViewNameTranslator::transform_path(const std::string& path)
{
    std::string out = path;
    if (!out.empty() && out.front() == '/') {
        out.erase(0, 1);
    }
    if (!out.empty() && out.back() == '/') {
        out.pop_back();
    }

    size_t slash = out.rfind('/');
    size_t dot = out.rfind('.');
    if (dot != std::string::npos && (slash == std::string::npos || dot > slash)) {
        out.erase(dot);
    }
    return out;
}

} // namespace conduit::web
