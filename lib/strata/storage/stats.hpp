#pragma once
/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <strata/common/format.hpp>

namespace strata::storage {
    /*
     * Cache and backend access counters of a database.
     * A successful fetch from the backend counts as a cache miss; a fetch that finds nothing counts only as a fetch failure.
     */
    struct stats_t {
        void add_cache_hit();
        void add_cache_miss();
        void add_fetch_success(double elapsed_ms);
        void add_fetch_failure(double elapsed_ms);
        void reset();

        uint64_t cache_hits() const;
        uint64_t cache_misses() const;
        uint64_t fetch_successes() const;
        uint64_t fetch_failures() const;
        // -1 when there are no samples
        double average_fetch_success_ms() const;
        double average_fetch_failure_ms() const;
    private:
        std::atomic<uint64_t> _cache_hits { 0 };
        std::atomic<uint64_t> _cache_misses { 0 };
        mutable std::mutex _fetch_mutex {};
        uint64_t _fetch_successes = 0;
        double _fetch_success_ms = 0;
        uint64_t _fetch_failures = 0;
        double _fetch_failure_ms = 0;
    };
    using stats_ptr_t = std::shared_ptr<stats_t>;
}

namespace fmt {
    template<>
    struct formatter<strata::storage::stats_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const strata::storage::stats_t &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "cache hits: {} misses: {} fetch successes: {} (avg {:.3f} ms) failures: {} (avg {:.3f} ms)",
                v.cache_hits(), v.cache_misses(), v.fetch_successes(), v.average_fetch_success_ms(),
                v.fetch_failures(), v.average_fetch_failure_ms());
        }
    };
}
