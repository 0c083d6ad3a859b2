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
 * @file session_flash_store.hpp
 * @brief In-memory flash store partitioned by session.
 *
 * @details
 * Each session owns a bucket with its own mutex; the bucket table is guarded
 * by a separate lock that is only held long enough to find or create a
 * bucket. Entries are kept in their JSON wire form, the same layout an
 * external store would persist.
 */

#pragma once

#include "conduit/flash/flash_store.hpp"
#include "conduit/infra/time.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace conduit::flash {

class SessionFlashStore : public FlashStore {
  public:
    /// @param clock Source of "now"; defaults to the wall clock.
    explicit SessionFlashStore(infra::MillisClock clock = infra::Time::now_millis);

    void save(const FlashState& state, const std::string& session_key) override;

    std::optional<FlashState> retrieve_and_remove_best_match(const std::string& session_key,
                                                             const http::Request& request) override;

    size_t sweep_expired() override;

    /// @brief Entries currently held for `session_key`, expired ones included.
    size_t size(const std::string& session_key) const;

  private:
    struct Bucket {
        std::mutex mutex;
        std::vector<std::string> entries;
    };

    std::shared_ptr<Bucket> bucket(const std::string& session_key, bool create) const;

    /// @brief Removes expired entries; caller holds the bucket lock.
    size_t purge_expired(Bucket& bucket, int64_t now) const;

    infra::MillisClock clock_;
    mutable std::mutex table_mutex_;
    mutable std::map<std::string, std::shared_ptr<Bucket>> buckets_;
};

} // namespace conduit::flash
