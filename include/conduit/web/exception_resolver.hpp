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
 * @file exception_resolver.hpp
 * @brief Turns handler failures into renderable results.
 */

#pragma once

#include "conduit/http/request.hpp"
#include "conduit/http/response.hpp"
#include "conduit/web/handler.hpp"
#include "conduit/web/result.hpp"

#include <exception>
#include <functional>
#include <optional>
#include <vector>

namespace conduit::web {

/**
 * @class HandlerExceptionResolver
 * @brief One link of the exception resolution chain.
 */
class HandlerExceptionResolver {
  public:
    virtual ~HandlerExceptionResolver() = default;

    /**
     * @param handler The resolved handler, or null if resolution itself failed.
     * @return A substitute result (cleared if the response was written), or
     * `std::nullopt` to let the next resolver try.
     */
    virtual std::optional<Result> resolve(http::Request& request, http::Response& response,
                                          const Handler* handler, std::exception_ptr error) = 0;
};

/**
 * @class DefaultExceptionResolver
 * @brief Maps the framework's own errors to HTTP statuses.
 *
 * @details
 * - `NoHandlerFoundError` -> 404
 * - `AsyncTimeoutError` -> 503
 * - `ResponseStatusError` -> its status
 *
 * Everything else is declined.
 */
class DefaultExceptionResolver : public HandlerExceptionResolver {
  public:
    std::optional<Result> resolve(http::Request& request, http::Response& response,
                                  const Handler* handler, std::exception_ptr error) override;
};

/**
 * @class MappingExceptionResolver
 * @brief Maps exception types to error views.
 *
 * @code
 * resolver.map<AccountLockedError>("errors/locked", 423);
 * resolver.set_default_view("errors/generic", 500);
 * @endcode
 *
 * Mappings are tried in registration order. The error message is exposed
 * in the model under `exception`.
 */
class MappingExceptionResolver : public HandlerExceptionResolver {
  public:
    using Matcher = std::function<bool(std::exception_ptr)>;

    template <typename E> void map(const std::string& view_name, int status = 500)
    {
        mappings_.push_back({[](std::exception_ptr error) {
                                 try {
                                     std::rethrow_exception(error);
                                 } catch (const E&) {
                                     return true;
                                 } catch (...) {
                                     return false;
                                 }
                             },
                             view_name, status});
    }

    /// @brief View used when no mapping matches; unset means "decline".
    void set_default_view(const std::string& view_name, int status = 500);

    std::optional<Result> resolve(http::Request& request, http::Response& response,
                                  const Handler* handler, std::exception_ptr error) override;

  private:
    struct Mapping {
        Matcher matches;
        std::string view_name;
        int status;
    };

    std::vector<Mapping> mappings_;
    std::optional<Mapping> default_mapping_;
};

} // namespace conduit::web
