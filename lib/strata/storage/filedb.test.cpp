/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <map>
#include <strata/common/test.hpp>
#include "filedb.hpp"

namespace {
    using namespace strata;
    using namespace strata::storage;
    using namespace std::string_view_literals;
}

suite strata_storage_filedb_suite = [] {
    "storage::filedb"_test = [] {
        const file::tmp_directory tmp_dir { "test-strata-filedb" };
        "hex"_test = [] {
            expect_equal(std::string { "00FF41" }, filedb::to_hex(std::string_view { "\x00\xFF" "A", 3 }));
            expect_equal(std::string { "\x00\xFF" "A", 3 }, filedb::from_hex("00ff41"));
            expect(throws([] { filedb::from_hex("0"); }));
            expect(throws([] { filedb::from_hex("0G"); }));
        };
        "get, set, and erase"_test = [&] {
            filedb::db_t db { tmp_dir.path() };
            expect_equal(value_t {}, db.get("AB"sv));
            db.set("AB"sv, "CD"sv);
            expect_equal(value_t { "CD" }, db.get("AB"sv));
            db.set("AB"sv, "EF"sv);
            expect_equal(value_t { "EF" }, db.get("AB"sv));
            db.erase("AB"sv);
            expect_equal(value_t {}, db.get("AB"sv));
        };
        "empty and binary keys"_test = [&] {
            filedb::db_t db { tmp_dir.path() };
            db.clear();
            db.set(""sv, "root"sv);
            db.set("a/b\\c"sv, "x"sv);
            expect_equal(value_t { "root" }, db.get(""sv));
            expect_equal(value_t { "x" }, db.get("a/b\\c"sv));
            expect_equal(2ULL, db.size());
        };
        "long keys"_test = [&] {
            filedb::db_t db { tmp_dir.path() };
            db.clear();
            const std::string long_a(1024, 'a');
            const auto long_b = long_a + "b";
            db.set(long_a, "1"sv);
            db.set(long_b, "2"sv);
            db.set(long_a, "3"sv);
            expect_equal(value_t { "3" }, db.get(long_a));
            expect_equal(value_t { "2" }, db.get(long_b));
            expect_equal(value_t {}, db.get(std::string(1024, 'c')));
            expect_equal(2ULL, db.size());
            std::map<std::string, std::string> act {};
            db.foreach([&](auto &&k, auto &&v) {
                act.try_emplace(std::move(k), std::move(v));
            });
            expect_equal(std::map<std::string, std::string> { { long_a, "3" }, { long_b, "2" } }, act);
            db.erase(long_a);
            expect_equal(value_t {}, db.get(long_a));
            expect_equal(1ULL, db.size());
        };
        "foreach and persistence"_test = [&] {
            const std::map<std::string, std::string> exp {
                { "AABB", "0011" },
                { "CCDD", "2233" },
                { "", "" }
            };
            {
                filedb::db_t db { tmp_dir.path() };
                db.clear();
                for (const auto &[k, v]: exp)
                    db.set(k, v);
            }
            filedb::db_t db { tmp_dir.path() };
            std::map<std::string, std::string> act {};
            db.foreach([&](auto &&k, auto &&v) {
                act.try_emplace(std::move(k), std::move(v));
            });
            expect_equal(exp, act);
            expect_equal(3ULL, db.size());
            db.clear();
            expect(db.empty());
        };
    };
};
