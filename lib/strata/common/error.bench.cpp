/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include "benchmark.hpp"
#include "errors.hpp"

namespace {
    using namespace strata;
}

suite strata_common_error_bench_suite = [] {
    "common::error"_test = [] {
        ankerl::nanobench::Bench b {};
        b.title("common::error")
            .output(&std::cerr)
            .unit("exception")
            .performanceCounters(true)
            .relative(true);
        {
            b.run("construct one-param", [&] {
                ankerl::nanobench::doNotOptimizeAway(error(fmt::format("Hello {}!", "world")));
            });
            b.run("construct wrapping", [&] {
                const err_translation_t cause { "bad number" };
                ankerl::nanobench::doNotOptimizeAway(err_storage_t("get failed", cause));
            });
            b.run("construct, throw, and catch", [&] {
                try {
                    throw err_storage_t(fmt::format("Hello {}!", "world"));
                } catch (const error &err) {
                    ankerl::nanobench::doNotOptimizeAway(err);
                }
            });
        }
    };
};
