#pragma once
/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <cerrno>
#include <charconv>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <typeinfo>
#include <vector>
#include "error.hpp"
#include "logger.hpp"

namespace strata::cli {
    using arguments = std::vector<std::string>;
    using options = std::map<std::string, std::optional<std::string>>;

    struct argument_config {
        size_t min = 0;
        size_t max = 0;
        std::vector<std::string> names {};

        // optional arguments are given in square brackets, "..." allows an unlimited number of them
        void expect(const std::initializer_list<std::string> &exp_names)
        {
            names = exp_names;
            min = 0;
            max = 0;
            for (const auto &name: names) {
                if (name.find("...") != std::string::npos) {
                    max = std::numeric_limits<size_t>::max();
                } else {
                    if (!name.starts_with('['))
                        ++min;
                    if (max != std::numeric_limits<size_t>::max())
                        ++max;
                }
            }
        }
    };

    struct option_config {
        std::string desc;
        std::optional<std::string> default_value {};

        option_config(const std::string_view desc_):
            desc { desc_ }
        {
        }

        option_config(const std::string_view desc_, const std::string_view def):
            desc { desc_ }, default_value { std::string { def } }
        {
        }
    };

    struct config {
        std::string name {};
        std::string desc {};
        argument_config args {};
        std::map<std::string, option_config> opts {};
    };

    struct command;
    using command_ptr = std::shared_ptr<command>;
    using command_map = std::map<std::string, command_ptr>;

    struct command {
        static command_map &registry();
        static command_ptr reg(command_ptr cmd);

        virtual ~command() = default;
        virtual void configure(config &cmd) const = 0;

        virtual void run(const arguments &) const
        {
            throw error("this command requires options to be passed");
        }

        virtual void run(const arguments &args, const options &) const
        {
            run(args);
        }
    };

    extern int run(int argc, const char **argv);

    template<typename T>
    T from_str(const std::string_view str)
    {
        T val {};
        const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), val);
        if (ec != std::errc {} || ptr != str.data() + str.size()) [[unlikely]]
            throw error(fmt::format("failed to parse {} from '{}'", typeid(T).name(), str));
        return val;
    }
}
