/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <cmath>
#include <limits>
#include <unordered_set>
#include <strata/common/test.hpp>
#include "data.hpp"

namespace {
    using namespace strata;
    using namespace strata::codec;
}

suite strata_codec_data_suite = [] {
    "codec::data"_test = [] {
        "exactly one variant"_test = [] {
            expect(throws<err_argument_t>([] { data_t { data_fields_t {} }; }));
            expect(throws<err_argument_t>([] { data_t { data_fields_t { .string="a", .boolean=true } }; }));
            expect(throws<err_argument_t>([] { data_t { data_fields_t { .null=true, .list=data_list_t {} } }; }));
            expect(string_data("a").is_string());
            expect(number_data(1).is_number());
            expect(boolean_data(false).is_boolean());
            expect(null_data().is_null());
            expect(list_data({}).is_list());
            expect(map_data({}).is_map());
            expect_equal(data_type_t::map, map_data({}).type());
        };
        "number identity"_test = [] {
            expect(number_data("42") == number_data(42));
            expect(number_data("42") != number_data(42.0));
            expect(number_data("42.0") == number_data(42.0));
            expect(!number_data(42).is_float());
            expect(number_data(42.0).is_float());
            expect_equal(std::string { "42.0" }, number_data(42.0).number());
            expect_equal(std::string { "1.0e+20" }, number_data(1e20).number());
            expect_equal(std::string { "0.5" }, number_data(0.5).number());
        };
        "number validation"_test = [] {
            for (const auto *ok: { "0", "-0", "12", "-12.5", "1e5", "1.5E-3", "NaN", "Infinity", "-Infinity" })
                expect(valid_number(ok)) << ok;
            for (const auto *bad: { "", "-", "abc", "1.", ".5", "01", "1e", "+1", "nan", "inf", "1 ", "0x10" })
                expect(!valid_number(bad)) << bad;
            expect(throws<err_argument_t>([] { number_data("12a"); }));
        };
        "non-finite numbers"_test = [] {
            expect_equal(std::string { "NaN" }, number_data(std::numeric_limits<double>::quiet_NaN()).number());
            expect_equal(std::string { "Infinity" }, number_data(std::numeric_limits<double>::infinity()).number());
            expect_equal(std::string { "-Infinity" }, number_data(-std::numeric_limits<double>::infinity()).number());
            expect(number_data("NaN").is_float());
            expect(std::isnan(number_data("NaN").number_float()));
            expect_equal(int64_t { 0 }, number_data("NaN").number_integer());
            expect_equal(std::numeric_limits<int64_t>::max(), number_data("Infinity").number_integer());
        };
        "number conversions"_test = [] {
            expect_equal(int64_t { -12 }, number_data("-12.9").number_integer());
            expect_equal(int64_t { 100000 }, number_data("1e5").number_integer());
            expect_equal(std::numeric_limits<int64_t>::max(), number_data("99999999999999999999").number_integer());
            expect_equal(std::numeric_limits<int64_t>::min(), number_data("-99999999999999999999").number_integer());
            expect_equal(2.5, number_data("2.5").number_float());
            expect_equal(7.0, number_data(7).number_float());
        };
        "wrong accessors"_test = [] {
            const auto d = string_data("x");
            expect(throws<err_argument_t>([&] { d.number(); }));
            expect(throws<err_argument_t>([&] { d.as_bool(); }));
            expect(throws<err_argument_t>([&] { d.list(); }));
            expect(throws<err_argument_t>([&] { d.map(); }));
            expect(throws<err_argument_t>([&] { number_data(1).as_string(); }));
        };
        "structural equality and hashing"_test = [] {
            const auto make = [] {
                return map_data({
                    { "a", list_data({ number_data(1), string_data("x"), null_data() }) },
                    { "b", map_data({ { "c", boolean_data(true) } }) }
                });
            };
            const auto d1 = make();
            const auto d2 = make();
            expect(d1 == d2);
            expect_equal(d1.hash(), d2.hash());
            expect(d1 != map_data({ { "a", null_data() } }));
            expect(string_data("1") != number_data(1));
            std::unordered_set<data_t> set {};
            set.emplace(d1);
            set.emplace(d2);
            set.emplace(string_data("1"));
            set.emplace(number_data("1"));
            expect_equal(3ULL, set.size());
        };
        "copies share storage"_test = [] {
            const auto d1 = list_data({ string_data("a"), string_data("b") });
            const auto d2 = d1;
            expect(&d1.list() == &d2.list());
        };
        "format"_test = [] {
            expect_equal(std::string { R"({"a":[1,2.5,"x"],"b":null})" },
                fmt::format("{}", map_data({ { "a", list_data({ number_data(1), number_data(2.5), string_data("x") }) }, { "b", null_data() } })));
        };
    };
};
