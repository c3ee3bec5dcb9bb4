/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <ranges>
#include <strata/common/cli.hpp>
#include <strata/storage/manager.hpp>

namespace strata::cli::db_stats {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "db-stats";
            cmd.desc = "Look up <key> in the map <map> <repeat> times and report the cache and fetch statistics";
            cmd.args.expect({"<config>", "<map>", "<key>", "[<key> ...]"});
            cmd.opts.try_emplace("repeat", "the number of lookups of each key", "2");
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto repeat = from_str<size_t>(opts.at("repeat").value());
            storage::database_manager_t mgr { args.at(0) };
            if (!mgr.startup())
                throw error(fmt::format("could not start the database configured by {}", args.at(0)));
            logger::run_log_errors_rethrow([&] {
                auto &db = mgr.database();
                const auto map = db.data_map(args.at(1));
                for (size_t i = 0; i < repeat; ++i) {
                    for (const auto &key: args | std::views::drop(2))
                        (void)map->get(key);
                }
                logger::info("{}", db.stats());
            }, [&] {
                mgr.shutdown();
            });
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
