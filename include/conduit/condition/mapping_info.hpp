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
 * @file mapping_info.hpp
 * @brief Composite condition describing one request mapping.
 *
 * @details
 * A `RequestMappingInfo` bundles the six conditions a handler declares:
 * URL patterns, methods, params, headers, consumes and produces. It is
 * what the request-mapping handler mapping stores per handler, reduces per
 * request, and sorts to pick the best candidate.
 */

#pragma once

#include "conduit/condition/headers_condition.hpp"
#include "conduit/condition/media_type_conditions.hpp"
#include "conduit/condition/methods_condition.hpp"
#include "conduit/condition/params_condition.hpp"
#include "conduit/condition/patterns_condition.hpp"
#include "conduit/condition/request_condition.hpp"

#include <string>
#include <vector>

namespace conduit::condition {

/**
 * @class RequestMappingInfo
 * @brief The conjunction of all mapping conditions for one handler.
 */
class RequestMappingInfo final : public RequestCondition<RequestMappingInfo> {
  public:
    class Builder;

    RequestMappingInfo(PatternsCondition patterns, MethodsCondition methods,
                       ParamsCondition params, HeadersCondition headers,
                       ConsumesCondition consumes, ProducesCondition produces);

    /**
     * @brief Starts a fluent declaration.
     *
     * @code
     * auto info = RequestMappingInfo::paths({"/accounts/{id}"})
     *                 .methods({http::Method::GET})
     *                 .params({"view=full"})
     *                 .build();
     * @endcode
     */
    static Builder paths(const std::vector<std::string>& patterns);

    const PatternsCondition& patterns() const;
    const MethodsCondition& methods() const;
    const ParamsCondition& params() const;
    const HeadersCondition& headers() const;
    const ConsumesCondition& consumes() const;
    const ProducesCondition& produces() const;

    /**
     * @brief Merges a type-level declaration (this) with a method-level one.
     *
     * Patterns are joined with `PatternsCondition::concat`; every other
     * condition is the union of both sides.
     */
    RequestMappingInfo combine(const RequestMappingInfo& other) const override;

    /**
     * @brief Reduces every condition; fails if any of them does not apply.
     *
     * Cheap conditions are checked first and the patterns condition last.
     */
    std::optional<RequestMappingInfo> matching(const http::Request& request) const override;

    /**
     * @brief Ranks two reduced infos.
     *
     * The info with more discrete expressions across methods, params,
     * headers, consumes and produces ranks first; on a tie the URL pattern
     * comparator decides.
     */
    int compare_to(const RequestMappingInfo& other, const http::Request& request) const override;

    bool is_empty() const override;

    std::string to_string() const override;

    bool operator==(const RequestMappingInfo& other) const;

  private:
    int expression_count() const;

    PatternsCondition patterns_;
    MethodsCondition methods_;
    ParamsCondition params_;
    HeadersCondition headers_;
    ConsumesCondition consumes_;
    ProducesCondition produces_;
};

/**
 * @class RequestMappingInfo::Builder
 * @brief Fluent assembly of a `RequestMappingInfo`.
 */
class RequestMappingInfo::Builder {
  public:
    explicit Builder(const std::vector<std::string>& patterns);

    Builder& methods(const std::vector<http::Method>& methods);
    Builder& params(const std::vector<std::string>& params);
    Builder& headers(const std::vector<std::string>& headers);
    Builder& consumes(const std::vector<std::string>& consumes);
    Builder& produces(const std::vector<std::string>& produces);

    RequestMappingInfo build() const;

  private:
    std::vector<std::string> patterns_;
    std::vector<http::Method> methods_;
    std::vector<std::string> params_;
    std::vector<std::string> headers_;
    std::vector<std::string> consumes_;
    std::vector<std::string> produces_;
};

} // namespace conduit::condition
