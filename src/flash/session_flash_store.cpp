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
 * @file session_flash_store.cpp
 * @brief In-memory flash store implementation.
 */

#include "conduit/flash/session_flash_store.hpp"

#include "conduit/infra/logger.hpp"

#include <stdexcept>

namespace conduit::flash {

using infra::Logger;
using infra::LogLevel;

SessionFlashStore::SessionFlashStore(infra::MillisClock clock) : clock_(std::move(clock)) {}

std::shared_ptr<SessionFlashStore::Bucket>
SessionFlashStore::bucket(const std::string& session_key, bool create) const
{
    std::lock_guard<std::mutex> lock(table_mutex_);
    auto it = buckets_.find(session_key);
    if (it != buckets_.end()) {
        return it->second;
    }
    if (!create) {
        return nullptr;
    }
    auto fresh = std::make_shared<Bucket>();
    buckets_[session_key] = fresh;
    return fresh;
}

void SessionFlashStore::save(const FlashState& state, const std::string& session_key)
{
    std::shared_ptr<Bucket> target = bucket(session_key, true);
    std::lock_guard<std::mutex> lock(target->mutex);
    target->entries.push_back(state.to_json());
}

size_t SessionFlashStore::purge_expired(Bucket& bucket, int64_t now) const
{
    size_t removed = 0;
    for (auto it = bucket.entries.begin(); it != bucket.entries.end();) {
        bool expired = false;
        try {
            expired = FlashState::from_json(*it).is_expired(now);
        } catch (const std::invalid_argument& e) {
            Logger::log(LogLevel::WARN, std::string("Dropping unreadable flash entry: ") + e.what());
            expired = true;
        }
        if (expired) {
            it = bucket.entries.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::optional<FlashState>
SessionFlashStore::retrieve_and_remove_best_match(const std::string& session_key,
                                                  const http::Request& request)
{
    std::shared_ptr<Bucket> target = bucket(session_key, false);
    if (!target) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(target->mutex);
    purge_expired(*target, clock_());

    std::optional<FlashState> best;
    size_t best_index = 0;
    for (size_t i = 0; i < target->entries.size(); ++i) {
        FlashState candidate = FlashState::from_json(target->entries[i]);
        if (!candidate.matches(request)) {
            continue;
        }
        if (!best || candidate.compare_to(*best) < 0) {
            best = std::move(candidate);
            best_index = i;
        }
    }

    if (best) {
        target->entries.erase(target->entries.begin() + static_cast<long>(best_index));
    }
    return best;
}

size_t SessionFlashStore::sweep_expired()
{
    std::vector<std::shared_ptr<Bucket>> snapshot;
    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        for (const auto& entry : buckets_) {
            snapshot.push_back(entry.second);
        }
    }

    int64_t now = clock_();
    size_t removed = 0;
    for (const auto& b : snapshot) {
        std::lock_guard<std::mutex> lock(b->mutex);
        removed += purge_expired(*b, now);
    }
    return removed;
}

size_t SessionFlashStore::size(const std::string& session_key) const
{
    std::shared_ptr<Bucket> target = bucket(session_key, false);
    if (!target) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(target->mutex);
    return target->entries.size();
}

} // namespace conduit::flash
