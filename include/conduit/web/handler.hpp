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
 * @file handler.hpp
 * @brief Type-erased reference to the application logic chosen for a request.
 */

#pragma once

#include <any>
#include <memory>
#include <string>
#include <typeinfo>

namespace conduit::web {

/**
 * @class Handler
 * @brief Holds a `std::shared_ptr<T>` of any handler shape.
 *
 * @details
 * The pointer is stored under the static type it was given to `of`, so an
 * adapter asks for exactly that type:
 *
 * @code
 * auto handler = Handler::of<Controller>(std::make_shared<AccountController>());
 * handler.as<Controller>();        // non-null
 * handler.as<AccountController>(); // null
 * @endcode
 *
 * Copies share the target. Equality is identity of the target object.
 */
class Handler {
  public:
    Handler() : identity_(nullptr) {}

    template <typename T>
    static Handler of(std::shared_ptr<T> target, const std::string& description = "")
    {
        Handler handler;
        handler.identity_ = target.get();
        handler.description_ = description.empty() ? typeid(T).name() : description;
        handler.target_ = std::move(target);
        return handler;
    }

    /// @brief The target as `T`, or null if it was stored under another type.
    template <typename T> std::shared_ptr<T> as() const
    {
        const std::shared_ptr<T>* target = std::any_cast<std::shared_ptr<T>>(&target_);
        return target ? *target : nullptr;
    }

    bool empty() const
    {
        return identity_ == nullptr;
    }

    explicit operator bool() const
    {
        return !empty();
    }

    /// @brief Human readable label for logs, e.g. the declaring method.
    const std::string& description() const
    {
        return description_;
    }

    bool operator==(const Handler& other) const
    {
        return identity_ == other.identity_;
    }

    bool operator!=(const Handler& other) const
    {
        return !(*this == other);
    }

  private:
    std::any target_;
    const void* identity_;
    std::string description_;
};

} // namespace conduit::web
