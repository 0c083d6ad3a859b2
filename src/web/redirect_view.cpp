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

#include "conduit/web/redirect_view.hpp"

#include "conduit/condition/path_matcher.hpp"
#include "conduit/infra/string.hpp"
#include "conduit/mapping/handler_mapping.hpp"

namespace conduit::web {

using infra::String;

RedirectView::RedirectView(std::string url, int status, bool expose_model_attributes)
    : url_(std::move(url)), status_(status), expose_model_attributes_(expose_model_attributes)
{
}

const std::string& RedirectView::url() const
{
    return url_;
}

int RedirectView::status() const
{
    return status_;
}

std::string RedirectView::target_url(const http::Model& model, const http::Request& request) const
{
    std::string target;
    const auto* vars = request.attribute_as<condition::UriVariables>(
        mapping::HandlerMapping::URI_VARIABLES_ATTRIBUTE);

    size_t pos = 0;
    while (pos < url_.size()) {
        size_t open = url_.find('{', pos);
        size_t close = open == std::string::npos ? std::string::npos : url_.find('}', open);
        if (close == std::string::npos) {
            target += url_.substr(pos);
            break;
        }
        target += url_.substr(pos, open - pos);
        std::string name = url_.substr(open + 1, close - open - 1);
        auto value = vars ? vars->find(name) : condition::UriVariables::const_iterator();
        if (vars && value != vars->end()) {
            target += String::url_encode(value->second);
        } else {
            target += url_.substr(open, close - open + 1);
        }
        pos = close + 1;
    }

    if (expose_model_attributes_ && !model.empty()) {
        size_t fragment = target.find('#');
        std::string anchor = fragment == std::string::npos ? "" : target.substr(fragment);
        target = target.substr(0, fragment);

        bool first = target.find('?') == std::string::npos;
        for (const auto& entry : model) {
            target += first ? "?" : "&";
            target += String::url_encode(entry.first) + "=" + String::url_encode(entry.second);
            first = false;
        }
        target += anchor;
    }
    return target;
}

void RedirectView::render(const http::Model& model, http::Request& request,
                          http::Response& response)
{
    response.set_status(status_);
    response.set_header("Location", target_url(model, request));
}

} // namespace conduit::web
