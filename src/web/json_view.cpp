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

#include "conduit/web/json_view.hpp"

#include "conduit/infra/json.hpp"

namespace conduit::web {

using infra::ScopedJson;

JsonView::JsonView(bool pretty) : pretty_(pretty) {}

std::string JsonView::content_type() const
{
    return "application/json";
}

std::string JsonView::to_json(const http::Model& model) const
{
    ScopedJson root(cJSON_CreateObject());
    for (const auto& entry : model) {
        cJSON_AddStringToObject(root.get(), entry.first.c_str(), entry.second.c_str());
    }
    if (!pretty_) {
        return root.print();
    }

    char* raw = cJSON_Print(root.get());
    if (!raw) {
        return "";
    }
    std::string out(raw);
    cJSON_free(raw);
    return out;
}

void JsonView::render(const http::Model& model, http::Request&, http::Response& response)
{
    response.set_content_type(content_type());
    response.set_body(to_json(model));
}

} // namespace conduit::web
