/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <strata/common/test.hpp>
#include "long-key.hpp"

namespace {
    using namespace strata;
    using namespace strata::storage;
}

suite strata_storage_long_key_suite = [] {
    "storage::long_key"_test = [] {
        "wrap and unwrap"_test = [] {
            const std::string key(300, 'k');
            const auto data = long_key::wrap(key, "12:value");
            expect(data.starts_with("300:"));
            const auto e = long_key::unwrap(data);
            expect_equal(key, e.key);
            expect_equal(std::string { "12:value" }, e.value);
            expect_equal(std::string { "12:value" }, long_key::unwrap_value(key, data));
            expect_equal(std::string {}, long_key::unwrap(long_key::wrap("", "")).value);
        };
        "digest"_test = [] {
            expect_equal(32ULL, long_key::digest(std::string(300, 'k')).size());
            expect(long_key::digest("a") != long_key::digest("b"));
        };
        "malformed records"_test = [] {
            expect(throws<err_storage_t>([] { long_key::unwrap("no size"); }));
            expect(throws<err_storage_t>([] { long_key::unwrap("x1:a"); }));
            expect(throws<err_storage_t>([] { long_key::unwrap("10:short"); }));
            expect(throws<err_storage_t>([] { long_key::unwrap_value("other", long_key::wrap("key", "v")); }));
        };
    };
};
