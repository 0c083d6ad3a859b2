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
 * @file media_type_conditions.cpp
 * @brief Consumes and produces condition matching.
 */

#include "conduit/condition/media_type_conditions.hpp"

#include <stdexcept>

namespace conduit::condition {

namespace {

std::vector<MediaTypeExpression> parse(const std::vector<std::string>& expressions)
{
    std::vector<MediaTypeExpression> out;
    out.reserve(expressions.size());
    for (const std::string& e : expressions) {
        out.emplace_back(e);
    }
    return out;
}

} // namespace

// ----------------------------------------------------------------------------
// ConsumesCondition
// ----------------------------------------------------------------------------

ConsumesCondition::ConsumesCondition()
    : MediaTypeCondition(std::vector<MediaTypeExpression>{})
{
}

ConsumesCondition::ConsumesCondition(const std::vector<std::string>& expressions)
    : MediaTypeCondition(parse(expressions))
{
}

ConsumesCondition::ConsumesCondition(std::vector<MediaTypeExpression> expressions)
    : MediaTypeCondition(std::move(expressions))
{
}

std::optional<ConsumesCondition> ConsumesCondition::matching(const http::Request& request) const
{
    if (expressions_.empty()) {
        return *this;
    }

    MediaType content_type("application", "octet-stream");
    if (std::optional<std::string> header = request.header("Content-Type")) {
        try {
            content_type = MediaType::parse(*header);
        } catch (const std::invalid_argument&) {
            return std::nullopt;
        }
    }

    std::vector<MediaTypeExpression> kept = filter({content_type});
    if (kept.empty()) {
        return std::nullopt;
    }
    return ConsumesCondition(std::move(kept));
}

// ----------------------------------------------------------------------------
// ProducesCondition
// ----------------------------------------------------------------------------

ProducesCondition::ProducesCondition()
    : MediaTypeCondition(std::vector<MediaTypeExpression>{})
{
}

ProducesCondition::ProducesCondition(const std::vector<std::string>& expressions)
    : MediaTypeCondition(parse(expressions))
{
}

ProducesCondition::ProducesCondition(std::vector<MediaTypeExpression> expressions)
    : MediaTypeCondition(std::move(expressions))
{
}

std::optional<ProducesCondition> ProducesCondition::matching(const http::Request& request) const
{
    if (expressions_.empty()) {
        return *this;
    }

    std::vector<MediaType> accepted{MediaType::all()};
    if (std::optional<std::string> header = request.header("Accept")) {
        try {
            accepted = MediaType::parse_list(*header);
        } catch (const std::invalid_argument&) {
            return std::nullopt;
        }
        if (accepted.empty()) {
            accepted.push_back(MediaType::all());
        }
    }

    std::vector<MediaTypeExpression> kept = filter(accepted);
    if (kept.empty()) {
        return std::nullopt;
    }
    return ProducesCondition(std::move(kept));
}

} // namespace conduit::condition
