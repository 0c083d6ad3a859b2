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
 * @file id_generator.cpp
 * @brief Implementation of the random identifier utility.
 */

#include "conduit/infra/id_generator.hpp"

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace conduit::infra {

namespace {

/// One engine per worker thread; no lock contention between requests.
uint64_t next_random()
{
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;
    return dis(gen);
}

} // namespace

std::string IdGenerator::session_token()
{
    std::ostringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(16) << next_random() << std::setw(16)
       << next_random();
    return ss.str();
}

std::string IdGenerator::short_id()
{
    std::ostringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(8)
       << static_cast<uint32_t>(next_random() >> 32);
    return ss.str();
}

} // namespace conduit::infra
