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
 * @file id_generator.hpp
 * @brief Random identifiers for sessions and request correlation.
 */

#pragma once

#include <string>

namespace conduit::infra {

/**
 * @class IdGenerator
 * @brief Static source of unguessable identifiers.
 *
 * @details
 * The transport mints a session token for every client that arrives
 * without one; the flash store is keyed by that token. The dispatcher tags
 * each request with a short correlation id used in log lines.
 */
class IdGenerator {
  public:
    /**
     * @brief Generates a 128-bit random token as 32 lower-case hex digits.
     *
     * @code
     * std::string sid = conduit::infra::IdGenerator::session_token();
     * @endcode
     */
    static std::string session_token();

    /// @brief Generates an 8 hex digit id for log correlation.
    static std::string short_id();
};

} // namespace conduit::infra
