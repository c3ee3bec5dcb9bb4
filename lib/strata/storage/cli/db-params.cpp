/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <strata/common/cli.hpp>
#include <strata/storage/manager.hpp>

namespace strata::cli::db_params {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "db-params";
            cmd.desc = "List the load parameters of the database <type> or of all types when not given";
            cmd.args.expect({"[<type>]"});
        }

        void run(const arguments &args) const override
        {
            using namespace strata::storage;
            // fails on unknown types
            if (!args.empty())
                database_type(args.at(0));
            for (const auto &type: database_types()) {
                if (!args.empty() && type.id != args.at(0))
                    continue;
                logger::info("{} ({}):", type.id, type.name);
                for (const auto &param: type.load_params()) {
                    if (param.choices.empty())
                        logger::info("    {}", param.name);
                    else
                        logger::info("    {} one of {}", param.name, param.choices);
                }
            }
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
