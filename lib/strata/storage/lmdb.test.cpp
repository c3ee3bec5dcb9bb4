/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <map>
#include <strata/common/test.hpp>
#include "lmdb.hpp"

namespace {
    using namespace strata;
    using namespace strata::storage;
    using namespace std::string_view_literals;
}

suite strata_storage_lmdb_suite = [] {
    "storage::lmdb"_test = [] {
        const file::tmp_directory tmp_dir { "test-strata-lmdb" };
        "get, set, and erase"_test = [&] {
            const auto env = std::make_shared<lmdb::env_t>(tmp_dir.path());
            lmdb::db_t db { env, "basic" };
            expect_equal(value_t {}, db.get("AB"sv));
            db.set("AB"sv, "CD"sv);
            expect_equal(value_t { "CD" }, db.get("AB"sv));
            db.set("AB"sv, "EF"sv);
            expect_equal(value_t { "EF" }, db.get("AB"sv));
            db.erase("AB"sv);
            expect_equal(value_t {}, db.get("AB"sv));
            db.erase("AB"sv);
            db.set(""sv, "root"sv);
            expect_equal(value_t { "root" }, db.get(""sv));
        };
        "tables are independent and persistent"_test = [&] {
            {
                const auto env = std::make_shared<lmdb::env_t>(tmp_dir.path());
                lmdb::db_t users { env, "users" };
                lmdb::db_t groups { env, "groups" };
                users.set("u1"sv, "alice"sv);
                users.set("u2"sv, "bob"sv);
                groups.set("g1"sv, "admins"sv);
                expect_equal(2ULL, users.size());
                expect_equal(1ULL, groups.size());
                expect_equal(value_t {}, groups.get("u1"sv));
            }
            const auto env = std::make_shared<lmdb::env_t>(tmp_dir.path());
            lmdb::db_t users { env, "users" };
            std::map<std::string, std::string> act {};
            users.foreach([&](auto &&k, auto &&v) {
                act.try_emplace(std::move(k), std::move(v));
            });
            expect_equal(std::map<std::string, std::string> { { "u1", "alice" }, { "u2", "bob" } }, act);
            users.clear();
            expect(users.empty());
            lmdb::db_t groups { env, "groups" };
            expect_equal(1ULL, groups.size());
        };
        "long keys"_test = [&] {
            const auto env = std::make_shared<lmdb::env_t>(tmp_dir.path());
            lmdb::db_t db { env, "long-keys" };
            db.clear();
            const std::string long_key(1024, 'x');
            const std::string short_key(16, 'x');
            db.set(long_key, "long"sv);
            db.set(short_key, "short"sv);
            expect_equal(value_t { "long" }, db.get(long_key));
            expect_equal(value_t { "short" }, db.get(short_key));
            expect_equal(2ULL, db.size());
            std::map<std::string, std::string> act {};
            db.foreach([&](auto &&k, auto &&v) {
                act.try_emplace(std::move(k), std::move(v));
            });
            expect_equal(std::map<std::string, std::string> { { long_key, "long" }, { short_key, "short" } }, act);
            db.erase(long_key);
            expect_equal(value_t {}, db.get(long_key));
            expect_equal(1ULL, db.size());
        };
        "null environment"_test = [] {
            expect(throws<err_argument_t>([] { lmdb::db_t db { nullptr, "x" }; }));
        };
    };
};
