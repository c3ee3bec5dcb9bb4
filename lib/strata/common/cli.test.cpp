/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include "cli.hpp"
#include "test.hpp"

namespace {
    using namespace strata;
    using namespace strata::cli;
}

suite strata_common_cli_suite = [] {
    "common::cli"_test = [] {
        "argument_config"_test = [] {
            argument_config args {};
            args.expect({ "<config>", "<map>", "<key>", "[<key> ...]" });
            expect_equal(size_t { 3 }, args.min);
            expect_equal(std::numeric_limits<size_t>::max(), args.max);
            args.expect({ "<type>", "[<param>]" });
            expect_equal(size_t { 1 }, args.min);
            expect_equal(size_t { 2 }, args.max);
            args.expect({});
            expect_equal(size_t { 0 }, args.max);
        };
        "from_str"_test = [] {
            expect_equal(size_t { 1000 }, from_str<size_t>("1000"));
            expect_equal(-5, from_str<int>("-5"));
            expect(throws([] { from_str<size_t>("10MiB"); }));
            expect(throws([] { from_str<size_t>(""); }));
        };
        "registry"_test = [] {
            struct echo_cmd: command {
                void configure(config &cmd) const override
                {
                    cmd.name = "test-echo";
                    cmd.args.expect({ "<text>" });
                }
            };
            const auto cmd = std::make_shared<echo_cmd>();
            command::reg(cmd);
            expect(command::registry().contains("test-echo"));
            expect(throws([&] { command::reg(cmd); }));
            expect(throws([&] { cmd->run({ "x" }); }));
        };
    };
};
