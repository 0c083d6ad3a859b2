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
 * @file redirect_view.hpp
 * @brief View that answers with a redirect instead of a body.
 */

#pragma once

#include "conduit/web/view.hpp"

namespace conduit::web {

/**
 * @class RedirectView
 * @brief Sends `Location` for a target URL.
 *
 * @details
 * URI template variables captured by the handler mapping (`{id}`) are
 * expanded in the target. With `expose_model_attributes` the model is
 * appended as query parameters; flash state is the alternative that keeps
 * them out of the URL.
 */
class RedirectView : public View {
  public:
    /**
     * @param url Target URL, absolute or relative to the server root.
     * @param status 302 (default), 303 or 307.
     */
    explicit RedirectView(std::string url, int status = 302, bool expose_model_attributes = false);

    const std::string& url() const;

    int status() const;

    void render(const http::Model& model, http::Request& request,
                http::Response& response) override;

    /// @brief The target URL after variable expansion and query appending.
    std::string target_url(const http::Model& model, const http::Request& request) const;

  private:
    std::string url_;
    int status_;
    bool expose_model_attributes_;
};

} // namespace conduit::web
