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
 * @file errors.hpp
 * @brief Exception taxonomy of the dispatch pipeline.
 *
 * @details
 * Only genuine failures are exceptions. "No handler", an interceptor that
 * stops the chain and an empty result are ordinary return values.
 *
 * `ConfigurationError` marks problems in how the dispatcher was wired
 * (ambiguous mappings, handlers no adapter supports). These are never
 * offered to exception resolvers.
 */

#pragma once

#include "conduit/http/method.hpp"

#include <stdexcept>
#include <string>

namespace conduit::web {

/**
 * @class DispatchError
 * @brief Base of every error raised by the dispatch core.
 */
class DispatchError : public std::runtime_error {
  public:
    explicit DispatchError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @class ConfigurationError
 * @brief The dispatcher or one of its mappings is wired inconsistently.
 */
class ConfigurationError : public DispatchError {
  public:
    explicit ConfigurationError(const std::string& message) : DispatchError(message) {}
};

/**
 * @class AmbiguousMappingError
 * @brief Two candidates of one mapping are equally specific for a request,
 * or the same mapping was registered twice.
 */
class AmbiguousMappingError : public ConfigurationError {
  public:
    explicit AmbiguousMappingError(const std::string& message) : ConfigurationError(message) {}
};

/**
 * @class AdapterNotFoundError
 * @brief No registered adapter supports the resolved handler.
 */
class AdapterNotFoundError : public ConfigurationError {
  public:
    explicit AdapterNotFoundError(const std::string& handler)
        : ConfigurationError("No adapter for handler [" + handler + "]")
    {
    }
};

/**
 * @class NoHandlerFoundError
 * @brief Raised instead of a plain 404 when the dispatcher is told to.
 */
class NoHandlerFoundError : public DispatchError {
  public:
    NoHandlerFoundError(http::Method method, const std::string& path)
        : DispatchError("No handler found for " + http::to_string(method) + " " + path),
          method_(method), path_(path)
    {
    }

    http::Method method() const
    {
        return method_;
    }

    const std::string& path() const
    {
        return path_;
    }

  private:
    http::Method method_;
    std::string path_;
};

/**
 * @class ResponseStatusError
 * @brief A handler failure that carries the HTTP status to answer with.
 */
class ResponseStatusError : public DispatchError {
  public:
    ResponseStatusError(int status, const std::string& reason)
        : DispatchError(reason), status_(status)
    {
    }

    int status() const
    {
        return status_;
    }

  private:
    int status_;
};

/// @brief No view resolver knows the view name of a result.
class ViewResolutionError : public DispatchError {
  public:
    explicit ViewResolutionError(const std::string& view_name)
        : DispatchError("Could not resolve view with name '" + view_name + "'")
    {
    }
};

/// @brief An async task did not complete within its timeout.
class AsyncTimeoutError : public DispatchError {
  public:
    AsyncTimeoutError() : DispatchError("Async request timed out") {}
};

/// @brief An async task was cancelled before it produced a value.
class AsyncCancelledError : public DispatchError {
  public:
    AsyncCancelledError() : DispatchError("Async request was cancelled") {}
};

/// @brief Async processing was driven out of order (e.g. started twice).
class AsyncStateError : public DispatchError {
  public:
    explicit AsyncStateError(const std::string& message) : DispatchError(message) {}
};

} // namespace conduit::web
