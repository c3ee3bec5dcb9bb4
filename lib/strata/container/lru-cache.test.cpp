/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <thread>
#include <strata/common/test.hpp>
#include "lru-cache.hpp"

namespace {
    using namespace strata;
    using namespace strata::container;
    using value_t = std::optional<std::string>;
}

suite strata_container_lru_cache_suite = [] {
    "container::lru_cache"_test = [] {
        "capacity must be positive"_test = [] {
            expect(throws<err_argument_t>([] { cache_t<std::string, std::string> c { 0 }; }));
        };
        "evicts the first inserted key"_test = [] {
            cache_t<std::string, std::string> c { 3 };
            for (const auto &k: { "a", "b", "c", "d" })
                c.put(k, fmt::format("val-{}", k));
            expect_equal(3ULL, c.size());
            expect(!c.contains("a"));
            expect_equal(value_t {}, c.get("a"));
            expect_equal(value_t { "val-b" }, c.get("b"));
            expect_equal(value_t { "val-c" }, c.get("c"));
            expect_equal(value_t { "val-d" }, c.get("d"));
        };
        "get promotes"_test = [] {
            cache_t<std::string, int> c { 2 };
            c.put("A", 1);
            c.put("B", 2);
            expect_equal(std::optional<int> { 1 }, c.get("A"));
            c.put("C", 3);
            expect(c.contains("A"));
            expect(!c.contains("B"));
            expect(c.contains("C"));
        };
        "update preserves the recency order"_test = [] {
            cache_t<std::string, int> c { 2 };
            c.put("A", 1);
            c.put("B", 2);
            expect_equal(std::optional<int> { 1 }, c.update("A", 10));
            c.put("C", 3);
            expect(!c.contains("A"));
            expect_equal(std::optional<int> { 2 }, c.get("B"));
            expect_equal(std::optional<int> { 3 }, c.get("C"));
        };
        "update of a missing key"_test = [] {
            cache_t<std::string, int> c { 2 };
            expect_equal(std::optional<int> {}, c.update("A", 1));
            expect(!c.contains("A"));
            expect_equal(0ULL, c.size());
        };
        "put replaces and promotes"_test = [] {
            cache_t<std::string, int> c { 2 };
            c.put("A", 1);
            c.put("B", 2);
            expect_equal(std::optional<int> { 1 }, c.put("A", 11));
            c.put("C", 3);
            expect_equal(std::optional<int> { 11 }, c.get("A"));
            expect(!c.contains("B"));
        };
        "remove and clear"_test = [] {
            cache_t<int, int> c { 4 };
            for (int i = 0; i < 4; ++i)
                c.put(i, i * 10);
            expect_equal(std::optional<int> { 20 }, c.remove(2));
            expect_equal(std::optional<int> {}, c.remove(2));
            expect_equal(3ULL, c.size());
            // the freed slot is reused
            c.put(5, 50);
            c.put(6, 60);
            expect(!c.contains(0));
            expect_equal(4ULL, c.size());
            c.clear();
            expect_equal(0ULL, c.size());
            expect_equal(std::optional<int> {}, c.get(5));
            c.put(7, 70);
            expect_equal(std::optional<int> { 70 }, c.get(7));
        };
        "null shared pointers are rejected"_test = [] {
            cache_t<int, std::shared_ptr<int>> c { 2 };
            expect(throws<err_argument_t>([&] { c.put(1, nullptr); }));
            c.put(1, std::make_shared<int>(1));
            expect(throws<err_argument_t>([&] { c.update(1, nullptr); }));
            expect_equal(1, **c.get(1));
        };
        "concurrent access"_test = [] {
            static constexpr size_t num_threads = 4;
            static constexpr int num_ops = 10000;
            cache_t<int, int> c { 64 };
            std::vector<std::thread> threads {};
            for (size_t t = 0; t < num_threads; ++t) {
                threads.emplace_back([&c, t] {
                    for (int i = 0; i < num_ops; ++i) {
                        const int k = static_cast<int>(t) * num_ops + i % 100;
                        c.put(k, i);
                        c.get(k - 1);
                        if (i % 7 == 0)
                            c.remove(k);
                    }
                });
            }
            for (auto &th: threads)
                th.join();
            expect(c.size() <= c.capacity());
        };
    };
};
