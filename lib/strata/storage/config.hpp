#pragma once
/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <string>
#include <vector>
#include <strata/codec/json.hpp>

namespace strata::storage {
    struct config_t {
        static constexpr size_t default_cache_size = 1000;

        size_t cache_size = default_cache_size;
        std::string database_type { "memory" };
        std::vector<std::string> database_args {};

        // missing files and missing keys take the defaults; STRATA_CACHE_SIZE overrides the cache size
        static config_t load(const std::string &path);
        static config_t from_json(const codec::json::value &j);

        void save(const std::string &path) const;
        [[nodiscard]] codec::json::value to_json() const;
        bool operator==(const config_t &o) const = default;
    };
}
