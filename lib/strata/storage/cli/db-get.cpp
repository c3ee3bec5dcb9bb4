/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <ranges>
#include <strata/common/cli.hpp>
#include <strata/storage/manager.hpp>

namespace strata::cli::db_get {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "db-get";
            cmd.desc = "Print the values of <key> in the map <map> of the database configured by <config>";
            cmd.args.expect({"<config>", "<map>", "<key>", "[<key> ...]"});
        }

        void run(const arguments &args) const override
        {
            storage::database_manager_t mgr { args.at(0) };
            if (!mgr.startup())
                throw error(fmt::format("could not start the database configured by {}", args.at(0)));
            logger::run_log_errors_rethrow([&] {
                const auto map = mgr.database().data_map(args.at(1));
                for (const auto &key: args | std::views::drop(2))
                    logger::info("{}: {}", key, map->get(key));
            }, [&] {
                mgr.shutdown();
            });
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
