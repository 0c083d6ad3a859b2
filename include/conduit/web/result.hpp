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
 * @file result.hpp
 * @brief Outcome of a handler invocation: what to render and with which model.
 */

#pragma once

#include "conduit/flash/flash_state.hpp"
#include "conduit/web/view.hpp"

#include <memory>
#include <optional>
#include <string>

namespace conduit::web {

/**
 * @class Result
 * @brief A view reference (name or instance), model values, an optional status
 * and the flash state to hand to the request after a redirect.
 *
 * @details
 * Handlers that write the response themselves return no `Result` at all.
 * A result that was explicitly `clear()`ed is skipped at render time, which
 * is how exception resolvers report "response already written".
 */
class Result {
  public:
    /// @brief Prefix that makes a view name a redirect.
    static const char* const REDIRECT_PREFIX;

    Result();

    explicit Result(const std::string& view_name);

    Result(const std::string& view_name, http::Model model);

    explicit Result(std::shared_ptr<View> view);

    /// @brief A result redirecting to `target` (`redirect:` view name).
    static Result redirect(const std::string& target);

    /// @brief A cleared result: the response has been written already.
    static Result handled();

    const std::string& view_name() const;

    void set_view_name(const std::string& name);

    const std::shared_ptr<View>& view() const;

    void set_view(std::shared_ptr<View> view);

    /// @brief True if the result references a view by name.
    bool is_reference() const;

    /// @brief True if either a view name or a view instance is set.
    bool has_view() const;

    http::Model& model();
    const http::Model& model() const;

    Result& add(const std::string& name, const std::string& value);

    const std::optional<int>& status() const;

    void set_status(int status);

    /// @brief Flash attributes for the next request; saved only on redirect.
    flash::FlashState& flash();
    const flash::FlashState& flash() const;

    /// @brief True if there is neither a view nor any model value.
    bool empty() const;

    /// @brief Drops view, model and status and marks the result as cleared.
    void clear();

    bool was_cleared() const;

    std::string to_string() const;

  private:
    std::string view_name_;
    std::shared_ptr<View> view_;
    http::Model model_;
    std::optional<int> status_;
    flash::FlashState flash_;
    bool cleared_;
};

} // namespace conduit::web
