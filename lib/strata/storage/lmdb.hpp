#pragma once
/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include "common.hpp"

struct MDB_env;

namespace strata::storage::lmdb {
    // An LMDB environment shared by all tables of a database
    struct env_t {
        static constexpr size_t default_map_size = 1ULL << 30U;
        static constexpr unsigned max_tables = 256;

        explicit env_t(std::string_view dir_path, size_t map_size=default_map_size);
        ~env_t();
        env_t(const env_t &) = delete;
        env_t &operator=(const env_t &) = delete;
        const std::string &path() const;
        MDB_env *native() const;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
    using env_ptr_t = std::shared_ptr<env_t>;

    // A named LMDB database created on first use; each operation runs in its own transaction
    struct db_t: storage::db_t {
        db_t(env_ptr_t env, std::string_view name);
        ~db_t() override;
        void clear() override;
        void erase(std::string_view key) override;
        void foreach(const observer_t &) const override;
        value_t get(std::string_view key) const override;
        void set(std::string_view key, std::string_view val) override;
        [[nodiscard]] size_t size() const override;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
}
