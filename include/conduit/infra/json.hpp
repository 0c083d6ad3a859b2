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
 * @file json.hpp
 * @brief RAII ownership helpers for cJSON trees.
 *
 * @details
 * cJSON hands out raw pointers that must be released with `cJSON_Delete`
 * (trees) or `cJSON_free` (printed buffers). These guards make that release
 * automatic on every exit path, including exceptions thrown while a
 * document is half built.
 */

#pragma once

#include <cJSON.h>
#include <string>

namespace conduit::infra {

/**
 * @class ScopedJson
 * @brief Unique owner of a root `cJSON` node.
 */
class ScopedJson {
  public:
    /// Takes ownership of a tree returned by cJSON (may be null).
    explicit ScopedJson(cJSON* root) : root_(root) {}

    ScopedJson(const ScopedJson&) = delete;
    ScopedJson& operator=(const ScopedJson&) = delete;

    ~ScopedJson()
    {
        if (root_) {
            cJSON_Delete(root_);
        }
    }

    cJSON* get() const
    {
        return root_;
    }

    /// Gives up ownership, e.g. when the node is attached to a parent.
    cJSON* release()
    {
        cJSON* out = root_;
        root_ = nullptr;
        return out;
    }

    explicit operator bool() const
    {
        return root_ != nullptr;
    }

    /**
     * @brief Serializes the owned tree without whitespace.
     *
     * @return The compact text, or an empty string for a null tree.
     */
    std::string print() const
    {
        if (!root_) {
            return "";
        }
        char* raw = cJSON_PrintUnformatted(root_);
        if (!raw) {
            return "";
        }
        std::string out(raw);
        cJSON_free(raw);
        return out;
    }

  private:
    cJSON* root_;
};

} // namespace conduit::infra
