#pragma once
/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include "database.hpp"
#include "lmdb.hpp"

namespace strata::storage {
    /*
     * A database over flat tables, one table per view name.
     * Trees are stored in a table keyed by the list encoding of their paths.
     */
    struct table_database_t: database_t {
        using database_t::database_t;
    protected:
        // tables are created on first use
        virtual db_ptr_t _open_table(const std::string &name) = 0;
        data_map_ptr_t _new_map(const std::string &name) override;
        data_tree_ptr_t _new_tree(const std::string &name) override;
    };

    struct memory_database_t: table_database_t {
        using table_database_t::table_database_t;
    protected:
        params_t _load_params() const override;
        void _load(const std::vector<std::string> &args) override;
        void _release() override;
        db_ptr_t _open_table(const std::string &name) override;
    private:
        std::map<std::string, db_ptr_t> _tables {};
    };

    // A directory per table with a file per key
    struct file_database_t: table_database_t {
        using table_database_t::table_database_t;
        // the name of the subdirectory holding a table
        static std::string table_dir(std::string_view name);
    protected:
        params_t _load_params() const override;
        void _load(const std::vector<std::string> &args) override;
        void _release() override;
        db_ptr_t _open_table(const std::string &name) override;
    private:
        std::string _dir {};
    };

    // A named LMDB database per table inside one environment
    struct lmdb_database_t: table_database_t {
        using table_database_t::table_database_t;
    protected:
        params_t _load_params() const override;
        void _load(const std::vector<std::string> &args) override;
        void _release() override;
        db_ptr_t _open_table(const std::string &name) override;
    private:
        lmdb::env_ptr_t _env {};
    };
}
