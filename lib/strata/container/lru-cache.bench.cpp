/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <strata/common/benchmark.hpp>
#include "lru-cache.hpp"

namespace {
    using namespace strata;
    using namespace strata::container;
}

suite strata_container_lru_cache_bench_suite = [] {
    "container::lru_cache"_test = [] {
        static constexpr size_t capacity = 1000;
        ankerl::nanobench::Bench b {};
        b.title("container::lru_cache")
            .output(&std::cerr)
            .unit("op")
            .performanceCounters(true)
            .relative(true);
        cache_t<uint64_t, uint64_t> c { capacity };
        uint64_t k = 0;
        b.run("put with eviction", [&] {
            c.put(k, k);
            ++k;
        });
        b.run("get hit", [&] {
            ankerl::nanobench::doNotOptimizeAway(c.get(k - 1 - (k % capacity)));
        });
        b.run("get miss", [&] {
            ankerl::nanobench::doNotOptimizeAway(c.get(k + 1));
        });
    };
};
