/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <strata/common/test.hpp>
#include "stats.hpp"

namespace {
    using namespace strata;
    using namespace strata::storage;
}

suite strata_storage_stats_suite = [] {
    "storage::stats"_test = [] {
        "no samples"_test = [] {
            const stats_t st {};
            expect_equal(uint64_t { 0 }, st.cache_hits());
            expect_equal(uint64_t { 0 }, st.cache_misses());
            expect_equal(-1.0, st.average_fetch_success_ms());
            expect_equal(-1.0, st.average_fetch_failure_ms());
        };
        "averages"_test = [] {
            stats_t st {};
            st.add_cache_hit();
            st.add_cache_miss();
            st.add_cache_miss();
            st.add_fetch_success(1.0);
            st.add_fetch_success(3.0);
            st.add_fetch_failure(0.5);
            expect_equal(uint64_t { 1 }, st.cache_hits());
            expect_equal(uint64_t { 2 }, st.cache_misses());
            expect_equal(uint64_t { 2 }, st.fetch_successes());
            expect_equal(uint64_t { 1 }, st.fetch_failures());
            expect_equal(2.0, st.average_fetch_success_ms());
            expect_equal(0.5, st.average_fetch_failure_ms());
            expect(fmt::format("{}", st).starts_with("cache hits: 1 misses: 2"));
            st.reset();
            expect_equal(uint64_t { 0 }, st.cache_misses());
            expect_equal(-1.0, st.average_fetch_success_ms());
        };
    };
};
