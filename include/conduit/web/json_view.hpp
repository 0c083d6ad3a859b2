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
 * @file json_view.hpp
 * @brief Renders the model as a flat JSON object.
 */

#pragma once

#include "conduit/web/view.hpp"

namespace conduit::web {

class JsonView : public View {
  public:
    explicit JsonView(bool pretty = false);

    std::string content_type() const override;

    void render(const http::Model& model, http::Request& request,
                http::Response& response) override;

    /// @brief The JSON text `render` would write for `model`.
    std::string to_json(const http::Model& model) const;

  private:
    bool pretty_;
};

} // namespace conduit::web
