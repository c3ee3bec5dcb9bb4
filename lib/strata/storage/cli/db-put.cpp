/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <strata/common/cli.hpp>
#include <strata/storage/manager.hpp>

namespace strata::cli::db_put {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "db-put";
            cmd.desc = "Store the JSON <value> under <key> in the map <map> of the database configured by <config>";
            cmd.args.expect({"<config>", "<map>", "<key>", "<value>"});
        }

        void run(const arguments &args) const override
        {
            const auto val = codec::json::decode(args.at(3));
            storage::database_manager_t mgr { args.at(0) };
            if (!mgr.startup())
                throw error(fmt::format("could not start the database configured by {}", args.at(0)));
            logger::run_log_errors_rethrow([&] {
                const auto prev = mgr.database().data_map(args.at(1))->put(args.at(2), val);
                logger::info("{}: {} -> {}", args.at(2), prev, val);
            }, [&] {
                mgr.shutdown();
            });
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
