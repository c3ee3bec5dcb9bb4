/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include "stats.hpp"

namespace strata::storage {
    void stats_t::add_cache_hit()
    {
        _cache_hits.fetch_add(1, std::memory_order_relaxed);
    }

    void stats_t::add_cache_miss()
    {
        _cache_misses.fetch_add(1, std::memory_order_relaxed);
    }

    void stats_t::add_fetch_success(const double elapsed_ms)
    {
        std::scoped_lock lk { _fetch_mutex };
        ++_fetch_successes;
        _fetch_success_ms += elapsed_ms;
    }

    void stats_t::add_fetch_failure(const double elapsed_ms)
    {
        std::scoped_lock lk { _fetch_mutex };
        ++_fetch_failures;
        _fetch_failure_ms += elapsed_ms;
    }

    void stats_t::reset()
    {
        _cache_hits = 0;
        _cache_misses = 0;
        std::scoped_lock lk { _fetch_mutex };
        _fetch_successes = 0;
        _fetch_success_ms = 0;
        _fetch_failures = 0;
        _fetch_failure_ms = 0;
    }

    uint64_t stats_t::cache_hits() const
    {
        return _cache_hits.load(std::memory_order_relaxed);
    }

    uint64_t stats_t::cache_misses() const
    {
        return _cache_misses.load(std::memory_order_relaxed);
    }

    uint64_t stats_t::fetch_successes() const
    {
        std::scoped_lock lk { _fetch_mutex };
        return _fetch_successes;
    }

    uint64_t stats_t::fetch_failures() const
    {
        std::scoped_lock lk { _fetch_mutex };
        return _fetch_failures;
    }

    double stats_t::average_fetch_success_ms() const
    {
        std::scoped_lock lk { _fetch_mutex };
        if (_fetch_successes == 0)
            return -1;
        return _fetch_success_ms / static_cast<double>(_fetch_successes);
    }

    double stats_t::average_fetch_failure_ms() const
    {
        std::scoped_lock lk { _fetch_mutex };
        if (_fetch_failures == 0)
            return -1;
        return _fetch_failure_ms / static_cast<double>(_fetch_failures);
    }
}
