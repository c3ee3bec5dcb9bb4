/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <ranges>
#include <strata/common/cli.hpp>
#include <strata/storage/manager.hpp>

namespace strata::cli::db_migrate {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "db-migrate";
            cmd.desc = "Copy the maps and trees of the database configured by <config> into a new database of <type> and make it the configured one";
            cmd.args.expect({"<config>", "<type>", "[<param> ...]"});
            cmd.opts.try_emplace("maps", "a comma-separated list of the maps to copy", "");
            cmd.opts.try_emplace("trees", "a comma-separated list of the trees to copy", "");
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto maps = _names(opts.at("maps").value());
            const auto trees = _names(opts.at("trees").value());
            if (maps.empty() && trees.empty())
                throw error("at least one map or tree to copy must be given");
            storage::database_manager_t mgr { args.at(0) };
            const std::vector<std::string> params(args.begin() + 2, args.end());
            if (!mgr.startup())
                throw error(fmt::format("could not start the database configured by {}", args.at(0)));
            bool changed = false;
            logger::run_log_errors_rethrow([&] {
                if (!mgr.request_change(args.at(1), params))
                    throw error(fmt::format("could not open a {} database with {}", args.at(1), params));
                auto &db = mgr.database();
                for (const auto &name: maps)
                    logger::info("map {}: {} entries", name, db.data_map(name)->size());
                for (const auto &name: trees)
                    logger::info("tree {}: {} entries", name, db.data_tree(name)->size());
            }, [&] {
                changed = mgr.shutdown();
            });
            if (!changed)
                throw error("the migration has been aborted; see the log for details");
        }
    private:
        static std::vector<std::string> _names(const std::string_view list)
        {
            std::vector<std::string> names {};
            for (const auto part: list | std::views::split(',')) {
                std::string name { part.begin(), part.end() };
                if (!name.empty())
                    names.emplace_back(std::move(name));
            }
            return names;
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
