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
 * @file request_mapping_handler_mapping.hpp
 * @brief Maps full request conditions (patterns, methods, params, headers,
 * media types) to handlers.
 */

#pragma once

#include "conduit/condition/mapping_info.hpp"
#include "conduit/mapping/abstract_handler_mapping.hpp"

#include <vector>

namespace conduit::mapping {

/**
 * @class RequestMappingHandlerMapping
 * @brief Selects the most specific `RequestMappingInfo` that matches a request.
 *
 * @details
 * Every registered info is reduced with `matching`; the survivors are
 * ordered with `compare_to`. If the two best survivors compare equal the
 * request is ambiguous. A request that no info matches yields no handler.
 *
 * @code
 * mapping.register_handler(RequestMappingInfo::paths({"/accounts/{id}"})
 *                              .methods({Method::GET})
 *                              .params({"!edit"})
 *                              .build(),
 *                          show_account);
 * @endcode
 */
class RequestMappingHandlerMapping : public AbstractHandlerMapping {
  public:
    /// @throws web::AmbiguousMappingError if an equal info is already registered.
    void register_handler(const condition::RequestMappingInfo& info, web::Handler handler);

    /// @brief Registers `method_level` nested under a type-level declaration.
    void register_handler(const condition::RequestMappingInfo& type_level,
                          const condition::RequestMappingInfo& method_level, web::Handler handler);

    size_t size() const;

  protected:
    web::Handler lookup_handler(http::Request& request) override;

  private:
    struct Registration {
        condition::RequestMappingInfo info;
        web::Handler handler;
    };

    std::vector<Registration> registrations_;
};

} // namespace conduit::mapping
