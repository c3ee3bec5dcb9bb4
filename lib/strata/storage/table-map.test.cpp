/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <strata/common/test.hpp>
#include "memory.hpp"
#include "table-map.hpp"

namespace {
    using namespace strata;
    using namespace strata::codec;
    using namespace strata::storage;
    using namespace std::string_view_literals;

    struct failing_db_t: memory::db_t {
        value_t get(std::string_view) const override
        {
            throw error("connection lost");
        }
    };
}

suite strata_storage_table_map_suite = [] {
    "storage::table_map"_test = [] {
        "values are stored as json"_test = [] {
            const auto db = std::make_shared<memory::db_t>();
            table_map_t map { "users", db };
            const auto val = map_data({ { "name", string_data("ann") }, { "age", number_data(42) } });
            expect_equal(std::optional<data_t> {}, map.put("u1", val));
            expect_equal(value_t { R"({"age":42,"name":"ann"})" }, db->get("u1"sv));
            expect_equal(std::optional<data_t> { val }, map.get("u1"));
            expect(map.contains("u1"));
            expect_equal(std::optional<data_t> { val }, map.put("u1", number_data("1.50")));
            expect_equal(std::optional<data_t> { number_data("1.50") }, map.get("u1"));
            expect_equal(size_t { 1 }, map.size());
            expect_equal(std::optional<data_t> { number_data("1.50") }, map.remove("u1"));
            expect_equal(std::optional<data_t> {}, map.remove("u1"));
            expect(map.empty());
        };
        "foreach and bulk removal"_test = [] {
            table_map_t map { "flags", std::make_shared<memory::db_t>() };
            map.put("a", boolean_data(true));
            map.put("b", boolean_data(false));
            map.put("c", boolean_data(true));
            size_t num_items = 0;
            map.foreach([&](const auto &, const auto &v) {
                expect(v.is_boolean());
                ++num_items;
            });
            expect_equal(size_t { 3 }, num_items);
            expect_equal(size_t { 2 }, map.remove_if([](const auto &, const auto &v) { return v.as_bool(); }));
            expect_equal(std::vector<std::string> { "b" }, [&] {
                std::vector<std::string> keys {};
                map.foreach([&](const auto &k, const auto &) { keys.emplace_back(k); });
                return keys;
            }());
            map.clear();
            expect(map.empty());
        };
        "invalid stored values"_test = [] {
            const auto db = std::make_shared<memory::db_t>();
            db->set("bad"sv, "{not json"sv);
            table_map_t map { "t", db };
            expect(throws<err_storage_t>([&] { map.get("bad"); }));
            expect(throws<err_storage_t>([&] { map.foreach([](const auto &, const auto &) {}); }));
            expect_equal(table_map_t::value_t {}, map.put("bad", string_data("fixed")));
            expect_equal(table_map_t::value_t { string_data("fixed") }, map.get("bad"));
            db->set("worse"sv, "[1,"sv);
            expect_equal(table_map_t::value_t {}, map.remove("worse"));
            expect(!map.contains("worse"));
            expect(!db->get("worse"sv));
            expect_equal(size_t { 1 }, map.size());
        };
        "backend failures"_test = [] {
            table_map_t map { "t", std::make_shared<failing_db_t>() };
            expect(throws<err_storage_t>([&] { map.get("k"); }));
            expect(throws<err_storage_t>([&] { map.contains("k"); }));
            expect(throws<err_argument_t>([] { table_map_t { "t", nullptr }; }));
        };
    };
};
