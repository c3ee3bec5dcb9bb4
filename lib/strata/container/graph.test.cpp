/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <strata/common/test.hpp>
#include "graph.hpp"

namespace {
    using namespace strata;
    using namespace strata::container;
    using path_t = std::vector<std::string>;

    tree_ptr_t<std::string, int64_t> make_tree(const map_ptr_t<std::string, int64_t> &flat)
    {
        auto path_tr = std::make_shared<codec::list_translator_t<std::string>>(std::make_shared<codec::string_translator_t>());
        auto paths = std::make_shared<key_translated_map_t<path_t, int64_t>>(flat, std::move(path_tr));
        return std::make_shared<mapped_tree_t<std::string, int64_t>>(std::move(paths));
    }
}

suite strata_container_graph_suite = [] {
    "container::graph"_test = [] {
        "set, get, and remove"_test = [] {
            const auto flat = std::make_shared<std_map_t<std::string, int64_t>>();
            const auto tree = make_tree(flat);
            expect(tree->empty());
            expect_equal(std::optional<int64_t> {}, tree->set(1, { "a", "b" }));
            expect_equal(std::optional<int64_t> { 1 }, tree->set(2, { "a", "b" }));
            expect_equal(std::optional<int64_t> { 2 }, tree->get({ "a", "b" }));
            expect_equal(std::optional<int64_t> {}, tree->get({ "a" }));
            expect(tree->contains_path({ "a", "b" }));
            expect(tree->contains_value(2));
            expect(!tree->contains_value(1));
            // paths are flattened with the list encoding
            expect_equal(std::optional<int64_t> { 2 }, flat->get("a;b"));
            expect_equal(std::optional<int64_t> { 2 }, tree->remove({ "a", "b" }));
            expect_equal(std::optional<int64_t> {}, tree->remove({ "a", "b" }));
            expect(tree->empty());
        };
        "root and separator-like keys"_test = [] {
            const auto flat = std::make_shared<std_map_t<std::string, int64_t>>();
            const auto tree = make_tree(flat);
            tree->set(0, {});
            tree->set(1, { "a;b" });
            tree->set(2, { "a", "b" });
            tree->set(3, { "" });
            expect_equal(4ULL, tree->size());
            expect_equal(std::optional<int64_t> { 0 }, tree->get({}));
            expect_equal(std::optional<int64_t> { 1 }, tree->get({ "a;b" }));
            expect_equal(std::optional<int64_t> { 2 }, tree->get({ "a", "b" }));
            expect_equal(std::optional<int64_t> { 3 }, tree->get({ "" }));
        };
        "get_all"_test = [] {
            const auto tree = make_tree(std::make_shared<std_map_t<std::string, int64_t>>());
            tree->set(10, {});
            tree->set(30, { "x", "y" });
            tree->set(40, { "x", "y", "z" });
            expect_equal(std::vector<int64_t> { 10, 30, 40 }, tree->get_all({ "x", "y", "z" }));
            expect_equal(std::vector<int64_t> { 10, 30 }, tree->get_all({ "x", "y" }));
            expect_equal(std::vector<int64_t> { 10 }, tree->get_all({ "q" }));
        };
        "add is insert-only"_test = [] {
            const auto tree = make_tree(std::make_shared<std_map_t<std::string, int64_t>>());
            expect(tree->add(1, { "k" }));
            expect(!tree->add(2, { "k" }));
            expect_equal(std::optional<int64_t> { 1 }, tree->get({ "k" }));
        };
        "foreach and remove_if"_test = [] {
            const auto tree = make_tree(std::make_shared<std_map_t<std::string, int64_t>>());
            for (int64_t i = 0; i < 10; ++i)
                tree->set(i, { "n", fmt::format("{}", i) });
            std::map<path_t, int64_t> seen {};
            tree->foreach([&](const auto &p, const auto &v) {
                seen.try_emplace(p, v);
            });
            expect_equal(10ULL, seen.size());
            expect_equal(int64_t { 7 }, seen.at({ "n", "7" }));
            expect_equal(5ULL, tree->remove_if([](const auto &, const auto &v) { return v % 2 == 0; }));
            expect_equal(5ULL, tree->size());
            tree->clear();
            expect(tree->empty());
        };
    };
};
