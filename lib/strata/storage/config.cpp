/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <cstdlib>
#include <filesystem>
#include <strata/common/cli.hpp>
#include <strata/common/logger.hpp>
#include "config.hpp"

namespace strata::storage {
    static void _apply_env(config_t &cfg)
    {
        if (const char *env_cache_size = std::getenv("STRATA_CACHE_SIZE"); env_cache_size) {
            const auto cache_size = cli::from_str<size_t>(env_cache_size);
            if (cache_size == 0) [[unlikely]]
                throw err_argument_t("STRATA_CACHE_SIZE must be positive");
            cfg.cache_size = cache_size;
        }
    }

    config_t config_t::load(const std::string &path)
    {
        config_t cfg {};
        if (std::filesystem::exists(path)) {
            cfg = from_json(codec::json::load(path));
        } else {
            logger::info("config file {} does not exist; using the defaults", path);
        }
        _apply_env(cfg);
        return cfg;
    }

    config_t config_t::from_json(const codec::json::value &j)
    {
        try {
            config_t cfg {};
            const auto &jo = j.as_object();
            if (const auto *jv = jo.if_contains("cache_size"); jv) {
                cfg.cache_size = jv->to_number<size_t>();
                if (cfg.cache_size == 0) [[unlikely]]
                    throw err_argument_t("cache_size must be positive");
            }
            if (const auto *jv = jo.if_contains("database_type"); jv)
                cfg.database_type = jv->as_string();
            if (const auto *jv = jo.if_contains("database_args"); jv) {
                for (const auto &arg: jv->as_array())
                    cfg.database_args.emplace_back(arg.as_string());
            }
            return cfg;
        } catch (const err_argument_t &) {
            throw;
        } catch (const std::exception &ex) {
            throw err_argument_t("invalid configuration", ex);
        }
    }

    void config_t::save(const std::string &path) const
    {
        if (const auto parent = std::filesystem::path { path }.parent_path(); !parent.empty())
            std::filesystem::create_directories(parent);
        codec::json::save_pretty(path, to_json());
    }

    codec::json::value config_t::to_json() const
    {
        codec::json::array args {};
        for (const auto &arg: database_args)
            args.emplace_back(arg);
        return codec::json::object {
            { "cache_size", cache_size },
            { "database_type", database_type },
            { "database_args", std::move(args) }
        };
    }
}
