/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <iostream>
#include "cli.hpp"
#include "timer.hpp"

namespace strata::cli {
    command_map &command::registry()
    {
        static command_map cmds {};
        return cmds;
    }

    command_ptr command::reg(command_ptr cmd)
    {
        config cfg {};
        cmd->configure(cfg);
        if (cfg.name.empty()) [[unlikely]]
            throw error("a command must have a name!");
        const auto [it, created] = registry().try_emplace(cfg.name, cmd);
        if (!created) [[unlikely]]
            throw error(fmt::format("duplicate command name: {}", cfg.name));
        return cmd;
    }

    static void print_usage(const std::string_view prog)
    {
        std::cerr << fmt::format("Usage: {} <command> [<arg> ...] [--<option>=<value> ...], where <command> is one of:\n", prog);
        for (const auto &[name, cmd]: command::registry()) {
            config cfg {};
            cmd->configure(cfg);
            std::cerr << fmt::format("    {} {}\n", name, fmt::join(cfg.args.names, " "));
            std::cerr << fmt::format("        {}\n", cfg.desc);
            for (const auto &[opt_name, opt]: cfg.opts) {
                if (opt.default_value)
                    std::cerr << fmt::format("        --{}: {} (default: {})\n", opt_name, opt.desc, *opt.default_value);
                else
                    std::cerr << fmt::format("        --{}: {}\n", opt_name, opt.desc);
            }
        }
    }

    int run(const int argc, const char **argv)
    {
        if (argc < 2) {
            print_usage(argv[0]);
            return 1;
        }
        const std::string cmd_name { argv[1] };
        const auto &cmds = command::registry();
        const auto cmd_it = cmds.find(cmd_name);
        if (cmd_it == cmds.end()) {
            std::cerr << fmt::format("unknown command: {}\n", cmd_name);
            print_usage(argv[0]);
            return 1;
        }
        config cfg {};
        cmd_it->second->configure(cfg);
        arguments args {};
        options opts {};
        for (const auto &[name, opt]: cfg.opts) {
            if (opt.default_value)
                opts.try_emplace(name, opt.default_value);
        }
        for (int i = 2; i < argc; ++i) {
            const std::string_view arg { argv[i] };
            if (arg.starts_with("--")) {
                const auto opt = arg.substr(2);
                const auto eq_pos = opt.find('=');
                const std::string opt_name { opt.substr(0, eq_pos) };
                if (!cfg.opts.contains(opt_name)) {
                    std::cerr << fmt::format("unsupported option: --{}\n", opt_name);
                    print_usage(argv[0]);
                    return 1;
                }
                if (eq_pos != std::string_view::npos)
                    opts[opt_name] = std::string { opt.substr(eq_pos + 1) };
                else
                    opts[opt_name] = std::string {};
            } else {
                args.emplace_back(arg);
            }
        }
        if (args.size() < cfg.args.min || args.size() > cfg.args.max) {
            std::cerr << fmt::format("command {} expects {} arguments but got {}\n", cmd_name, fmt::join(cfg.args.names, " "), args.size());
            print_usage(argv[0]);
            return 1;
        }
        const auto ex = logger::run_log_errors([&] {
            const timer t { fmt::format("{}", cmd_name), logger::level::debug };
            cmd_it->second->run(args, opts);
        });
        return ex ? 1 : 0;
    }
}
