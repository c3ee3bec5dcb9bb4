/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <cstdlib>
#include <strata/common/test.hpp>
#include "config.hpp"

namespace {
    using namespace strata;
    using namespace strata::storage;
}

suite strata_storage_config_suite = [] {
    "storage::config"_test = [] {
        "a missing file gives the defaults"_test = [] {
            file::tmp tmp_cfg { "strata-config-missing.json" };
            const auto cfg = config_t::load(tmp_cfg.path());
            expect_equal(size_t { 1000 }, cfg.cache_size);
            expect_equal(std::string { "memory" }, cfg.database_type);
            expect(cfg.database_args.empty());
        };
        "missing keys take the defaults"_test = [] {
            const auto cfg = config_t::from_json(codec::json::parse(R"({"database_type":"file"})"));
            expect_equal(size_t { 1000 }, cfg.cache_size);
            expect_equal(std::string { "file" }, cfg.database_type);
        };
        "save and load"_test = [] {
            file::tmp tmp_cfg { "strata-config-save.json" };
            config_t cfg {};
            cfg.cache_size = 17;
            cfg.database_type = "lmdb";
            cfg.database_args = { "/tmp/strata-db", "64" };
            cfg.save(tmp_cfg.path());
            expect(cfg == config_t::load(tmp_cfg.path()));
        };
        "invalid configurations"_test = [] {
            expect(throws<err_argument_t>([] { config_t::from_json(codec::json::parse(R"({"cache_size":0})")); }));
            expect(throws<err_argument_t>([] { config_t::from_json(codec::json::parse(R"({"cache_size":"big"})")); }));
            expect(throws<err_argument_t>([] { config_t::from_json(codec::json::parse(R"([1, 2])")); }));
            expect(throws<err_argument_t>([] { config_t::from_json(codec::json::parse(R"({"database_args":[1]})")); }));
        };
        "the cache size can be overridden by the environment"_test = [] {
            file::tmp tmp_cfg { "strata-config-env.json" };
            ::setenv("STRATA_CACHE_SIZE", "5", 1);
            const auto cfg = config_t::load(tmp_cfg.path());
            ::unsetenv("STRATA_CACHE_SIZE");
            expect_equal(size_t { 5 }, cfg.cache_size);
        };
    };
};
