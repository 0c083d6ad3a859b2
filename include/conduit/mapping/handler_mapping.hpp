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
 * @file handler_mapping.hpp
 * @brief Resolution of a request to an execution chain.
 */

#pragma once

#include "conduit/web/execution_chain.hpp"

#include <climits>
#include <memory>

namespace conduit::mapping {

/**
 * @class HandlerMapping
 * @brief One resolver in the dispatcher's ordered list.
 *
 * @details
 * Mappings are queried by ascending `order()`; the first non-null chain
 * wins. Mappings never compare their candidates with those of another
 * mapping.
 */
class HandlerMapping {
  public:
    static constexpr int LOWEST_PRECEDENCE = INT_MAX;

    /// @brief Request attribute: the pattern that matched (`std::string`).
    static const char* const BEST_MATCHING_PATTERN_ATTRIBUTE;

    /// @brief Request attribute: path covered by the pattern's wildcard tail (`std::string`).
    static const char* const PATH_WITHIN_MAPPING_ATTRIBUTE;

    /// @brief Request attribute: captured template variables (`condition::UriVariables`).
    static const char* const URI_VARIABLES_ATTRIBUTE;

    virtual ~HandlerMapping() = default;

    /**
     * @return The chain for `request`, or null if this mapping has no handler.
     * @throws web::AmbiguousMappingError if two candidates tie.
     */
    virtual std::shared_ptr<web::ExecutionChain> resolve(http::Request& request) = 0;

    /// @brief Lower values are queried first.
    virtual int order() const
    {
        return LOWEST_PRECEDENCE;
    }
};

} // namespace conduit::mapping
