/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <filesystem>
#include <limits>
#include <strata/common/cli.hpp>
#include "filedb.hpp"
#include "memory.hpp"
#include "table-database.hpp"
#include "table-map.hpp"

namespace strata::storage {
    data_map_ptr_t table_database_t::_new_map(const std::string &name)
    {
        return std::make_shared<table_map_t>(name, _open_table(name));
    }

    data_tree_ptr_t table_database_t::_new_tree(const std::string &name)
    {
        using path_t = std::vector<std::string>;
        auto path_tr = std::make_shared<codec::list_translator_t<std::string>>(std::make_shared<codec::string_translator_t>());
        auto paths = std::make_shared<container::key_translated_map_t<path_t, codec::data_t>>(_new_map(name), std::move(path_tr));
        return std::make_shared<container::mapped_tree_t<std::string, codec::data_t>>(std::move(paths));
    }

    params_t memory_database_t::_load_params() const
    {
        return {};
    }

    void memory_database_t::_load(const std::vector<std::string> &)
    {
    }

    void memory_database_t::_release()
    {
        _tables.clear();
    }

    db_ptr_t memory_database_t::_open_table(const std::string &name)
    {
        auto [it, created] = _tables.try_emplace(name);
        if (created)
            it->second = std::make_shared<memory::db_t>();
        return it->second;
    }

    std::string file_database_t::table_dir(const std::string_view name)
    {
        // the prefix keeps the empty name valid
        return fmt::format("t{}", filedb::to_hex(name));
    }

    params_t file_database_t::_load_params() const
    {
        return { param_t { "Directory path" } };
    }

    void file_database_t::_load(const std::vector<std::string> &args)
    {
        if (args.at(0).empty()) [[unlikely]]
            throw err_argument_t("the directory path must not be empty");
        std::filesystem::create_directories(args.at(0));
        _dir = args.at(0);
    }

    void file_database_t::_release()
    {
        _dir.clear();
    }

    db_ptr_t file_database_t::_open_table(const std::string &name)
    {
        return std::make_shared<filedb::db_t>((std::filesystem::path { _dir } / table_dir(name)).string());
    }

    params_t lmdb_database_t::_load_params() const
    {
        return { param_t { "Directory path" }, param_t { "Map size (MiB)" } };
    }

    void lmdb_database_t::_load(const std::vector<std::string> &args)
    {
        if (args.at(0).empty()) [[unlikely]]
            throw err_argument_t("the directory path must not be empty");
        size_t map_size_mib = 0;
        try {
            map_size_mib = cli::from_str<size_t>(args.at(1));
        } catch (const error &ex) {
            throw err_argument_t("the map size must be a number of MiB", ex);
        }
        if (map_size_mib == 0) [[unlikely]]
            throw err_argument_t("the map size must be positive");
        if (map_size_mib > (std::numeric_limits<size_t>::max() >> 20U)) [[unlikely]]
            throw err_argument_t(fmt::format("the map size of {} MiB is too large", map_size_mib));
        _env = std::make_shared<lmdb::env_t>(args.at(0), map_size_mib << 20U);
    }

    void lmdb_database_t::_release()
    {
        _env.reset();
    }

    db_ptr_t lmdb_database_t::_open_table(const std::string &name)
    {
        // LMDB does not accept empty database names
        return std::make_shared<lmdb::db_t>(_env, fmt::format("t{}", name));
    }
}
