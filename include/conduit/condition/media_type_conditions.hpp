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
 * @file media_type_conditions.hpp
 * @brief Consumes (`Content-Type`) and produces (`Accept`) conditions.
 *
 * @details
 * Both are disjunctions over media type expressions: a handler declaring
 * `consumes = {"application/json", "text/plain"}` accepts either body type.
 * `matching` keeps only the expressions that held; when none did the
 * condition does not apply.
 */

#pragma once

#include "conduit/condition/name_value_expression.hpp"
#include "conduit/condition/request_condition.hpp"

#include <string>
#include <vector>

namespace conduit::condition {

/**
 * @class MediaTypeCondition
 * @brief Shared set algebra of the consumes and produces conditions.
 */
template <typename Derived> class MediaTypeCondition : public RequestCondition<Derived> {
  public:
    const std::vector<MediaTypeExpression>& expressions() const
    {
        return expressions_;
    }

    Derived combine(const Derived& other) const override
    {
        std::vector<MediaTypeExpression> merged = expressions_;
        for (const MediaTypeExpression& e : other.expressions()) {
            add_unique(merged, e);
        }
        return Derived(std::move(merged));
    }

    int compare_to(const Derived& other, const http::Request&) const override
    {
        return static_cast<int>(other.expressions().size()) -
               static_cast<int>(expressions_.size());
    }

    bool is_empty() const override
    {
        return expressions_.empty();
    }

    std::string to_string() const override
    {
        std::string out = "[";
        for (size_t i = 0; i < expressions_.size(); ++i) {
            if (i > 0) {
                out += " || ";
            }
            out += expressions_[i].to_string();
        }
        return out + "]";
    }

    bool operator==(const Derived& other) const
    {
        if (expressions_.size() != other.expressions().size()) {
            return false;
        }
        for (const MediaTypeExpression& e : expressions_) {
            bool found = false;
            for (const MediaTypeExpression& o : other.expressions()) {
                found = found || (o == e);
            }
            if (!found) {
                return false;
            }
        }
        return true;
    }

  protected:
    explicit MediaTypeCondition(std::vector<MediaTypeExpression> expressions)
    {
        for (MediaTypeExpression& e : expressions) {
            add_unique(expressions_, std::move(e));
        }
    }

    /// @brief Expressions that accept at least one of `candidates`.
    std::vector<MediaTypeExpression> filter(const std::vector<MediaType>& candidates) const
    {
        std::vector<MediaTypeExpression> kept;
        for (const MediaTypeExpression& e : expressions_) {
            bool compatible = false;
            for (const MediaType& candidate : candidates) {
                compatible = compatible || e.media_type().is_compatible_with(candidate);
            }
            if (compatible != e.is_negated()) {
                kept.push_back(e);
            }
        }
        return kept;
    }

    static void add_unique(std::vector<MediaTypeExpression>& set, MediaTypeExpression e)
    {
        for (const MediaTypeExpression& existing : set) {
            if (existing == e) {
                return;
            }
        }
        set.push_back(std::move(e));
    }

    std::vector<MediaTypeExpression> expressions_;
};

/**
 * @class ConsumesCondition
 * @brief Matches the request `Content-Type`; a missing header is read as
 * `application/octet-stream`, an unparsable one never matches.
 */
class ConsumesCondition final : public MediaTypeCondition<ConsumesCondition> {
  public:
    ConsumesCondition();

    explicit ConsumesCondition(const std::vector<std::string>& expressions);

    explicit ConsumesCondition(std::vector<MediaTypeExpression> expressions);

    std::optional<ConsumesCondition> matching(const http::Request& request) const override;
};

/**
 * @class ProducesCondition
 * @brief Matches the request `Accept` list; a missing header accepts anything.
 */
class ProducesCondition final : public MediaTypeCondition<ProducesCondition> {
  public:
    ProducesCondition();

    explicit ProducesCondition(const std::vector<std::string>& expressions);

    explicit ProducesCondition(std::vector<MediaTypeExpression> expressions);

    std::optional<ProducesCondition> matching(const http::Request& request) const override;
};

} // namespace conduit::condition
