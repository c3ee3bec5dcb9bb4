/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <strata/common/test.hpp>
#include "translator.hpp"

namespace {
    using namespace strata;
    using namespace strata::codec;

    struct point_t {
        int64_t x = 0;
        int64_t y = 0;

        static point_t from_data(const data_t &d)
        {
            return { d.map().at("x").number_integer(), d.map().at("y").number_integer() };
        }

        data_t to_data() const
        {
            return map_data({ { "x", number_data(x) }, { "y", number_data(y) } });
        }

        bool operator==(const point_t &) const = default;
    };

    const auto str_tr = std::make_shared<string_translator_t>();
    const auto int_tr = std::make_shared<int64_translator_t>();
}

suite strata_codec_translator_suite = [] {
    "codec::translator"_test = [] {
        "scalars"_test = [] {
            expect_equal(std::string { "a;b" }, str_tr->encode("a;b"));
            expect_equal(std::string { "a;b" }, str_tr->decode("a;b"));
            expect_equal(std::string { "-17" }, int_tr->encode(-17));
            expect_equal(int64_t { -17 }, int_tr->decode("-17"));
            expect(throws<err_translation_t>([] { int_tr->decode("seventeen"); }));
            expect(throws<err_translation_t>([] { int_tr->from_data(string_data("17")); }));
            double_translator_t dbl_tr {};
            expect_equal(std::string { "3.0" }, dbl_tr.encode(3.0));
            expect_equal(0.25, dbl_tr.decode("0.25"));
            bool_translator_t bool_tr {};
            expect_equal(std::string { "true" }, bool_tr.encode(true));
            expect_equal(false, bool_tr.decode("false"));
            expect(throws<err_translation_t>([&] { bool_tr.decode("1"); }));
        };
        "int16 clamps"_test = [] {
            int16_translator_t tr {};
            expect_equal(int16_t { 32767 }, tr.decode("100000"));
            expect_equal(int16_t { -32768 }, tr.decode("-100000"));
            expect_equal(int16_t { 12 }, tr.decode("12.7"));
        };
        "data translator is the identity"_test = [] {
            data_translator_t tr {};
            const auto d = map_data({ { "k", list_data({ number_data("1.50") }) } });
            expect_equal(d, tr.to_data(d));
            expect_equal(d, tr.decode(tr.encode(d)));
            expect_equal(std::string { R"({"k":[1.50]})" }, tr.encode(d));
        };
        "list encoding"_test = [] {
            list_translator_t<std::string> tr { str_tr };
            expect_equal(std::string {}, tr.encode({}));
            expect_equal(std::vector<std::string> {}, tr.decode(""));
            expect_equal(std::string { "&empty" }, tr.encode({ "" }));
            expect_equal(std::vector<std::string> { "" }, tr.decode("&empty"));
            expect_equal(std::string { "a&sclnb;c&ampd;&empty" }, tr.encode({ "a;b", "c&d", "" }));
            const std::vector<std::vector<std::string>> samples {
                { "plain" },
                { "a;b", "c&d" },
                { "", "", "" },
                { "&scln", "&amp", "&empty", "&null", ";;", "&&" }
            };
            for (const auto &s: samples)
                expect_equal(s, tr.decode(tr.encode(s)));
            expect(throws<err_translation_t>([&] { tr.decode("a;&null"); }));
            expect(throws<err_translation_t>([&] { tr.decode("a&b"); }));
            expect_equal(std::string { "list<string>" }, tr.type_tag());
        };
        "list element failures"_test = [] {
            list_translator_t<int64_t> tr { int_tr };
            expect_equal(std::string { "1;-2;3" }, tr.encode({ 1, -2, 3 }));
            expect_equal(std::vector<int64_t> { 1, -2, 3 }, tr.decode("1;-2;3"));
            expect(throws<err_translation_t>([&] { tr.decode("1;x;3"); }));
            expect(throws<err_translation_t>([&] { tr.from_data(list_data({ number_data(1), string_data("x") })); }));
            expect_equal(list_data({ number_data(1), number_data(2) }), tr.to_data({ 1, 2 }));
        };
        "nested lists"_test = [] {
            list_translator_t<std::vector<std::string>> tr { std::make_shared<list_translator_t<std::string>>(str_tr) };
            const std::vector<std::vector<std::string>> val { { "a", "b" }, {}, { "c;d" } };
            expect_equal(val, tr.decode(tr.encode(val)));
            expect_equal(std::string { "list<list<string>>" }, tr.type_tag());
        };
        "sets and maps"_test = [] {
            set_translator_t<int64_t> set_tr { int_tr };
            const std::set<int64_t> s { 3, 1, 2 };
            expect_equal(std::string { "[1,2,3]" }, set_tr.encode(s));
            expect_equal(s, set_tr.decode("[3,2,1,1]"));
            map_translator_t<int64_t, std::string> map_tr { int_tr, str_tr };
            const std::map<int64_t, std::string> m { { 1, "one" }, { 20, "twenty" } };
            expect_equal(std::string { R"({"1":"one","20":"twenty"})" }, map_tr.encode(m));
            expect_equal(m, map_tr.decode(map_tr.encode(m)));
            expect_equal(std::string { "map<int64,string>" }, map_tr.type_tag());
            expect(throws<err_translation_t>([&] { map_tr.decode("[]"); }));
        };
        "storable"_test = [] {
            storable_translator_t<point_t> tr {};
            const point_t p { 3, -4 };
            expect_equal(std::string { R"({"x":3,"y":-4})" }, tr.encode(p));
            expect(tr.decode(tr.encode(p)) == p);
            expect(throws<err_translation_t>([&] { tr.decode("[]"); }));
        };
        "null element translators"_test = [] {
            expect(throws<err_argument_t>([] { list_translator_t<std::string> tr { nullptr }; }));
        };
    };
};
