/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

extern "C" {
    #include <lmdb.h>
}

#include <filesystem>
#include <vector>
#include <strata/common/logger.hpp>
#include "lmdb.hpp"
#include "long-key.hpp"

namespace strata::storage::lmdb {
    namespace {
        // LMDB does not support empty keys so every stored key has a one-byte prefix
        constexpr char key_prefix = 'k';
        // keys above the environment's limit are stored under their digest
        constexpr char long_key_prefix = 'h';

        void throw_lmdb(const int rc, const std::string_view what)
        {
            if (rc == MDB_SUCCESS) [[likely]]
                return;
            throw err_storage_t(fmt::format("lmdb: {}: {}", what, mdb_strerror(rc)));
        }

        MDB_val to_mdb_val(const std::string_view b)
        {
            MDB_val v {};
            v.mv_size = b.size();
            v.mv_data = const_cast<void*>(static_cast<const void*>(b.data()));
            return v;
        }

        std::string_view from_mdb_val(const MDB_val &v)
        {
            return { static_cast<const char *>(v.mv_data), v.mv_size };
        }

        bool is_long(MDB_env *env, const std::string_view key)
        {
            return key.size() + 1 > static_cast<size_t>(mdb_env_get_maxkeysize(env));
        }

        std::string stored_key(MDB_env *env, const std::string_view key)
        {
            if (is_long(env, key))
                return long_key_prefix + long_key::digest(key);
            std::string res {};
            res.reserve(key.size() + 1);
            res += key_prefix;
            res += key;
            return res;
        }

        // Aborts the transaction unless it has been committed
        struct txn_t {
            txn_t(MDB_env *env, const bool read_only)
            {
                throw_lmdb(mdb_txn_begin(env, nullptr, read_only ? MDB_RDONLY : 0, &_txn), "txn_begin");
            }

            ~txn_t()
            {
                if (_txn)
                    mdb_txn_abort(_txn);
            }

            txn_t(const txn_t &) = delete;
            txn_t &operator=(const txn_t &) = delete;

            MDB_txn *get() const
            {
                return _txn;
            }

            void commit()
            {
                const auto rc = mdb_txn_commit(_txn);
                _txn = nullptr;
                throw_lmdb(rc, "txn_commit");
            }
        private:
            MDB_txn *_txn = nullptr;
        };
    }

    struct env_t::impl {
        explicit impl(const std::string_view dir_path, const size_t map_size):
            _dir_path { dir_path }
        {
            std::filesystem::create_directories(_dir_path);
            throw_lmdb(mdb_env_create(&_env), "env_create");
            try {
                throw_lmdb(mdb_env_set_maxdbs(_env, max_tables), "env_set_maxdbs");
                throw_lmdb(mdb_env_set_mapsize(_env, map_size), "env_set_mapsize");
                throw_lmdb(mdb_env_open(_env, _dir_path.c_str(), 0, 0664), "env_open");
            } catch (const std::exception &) {
                mdb_env_close(_env);
                _env = nullptr;
                throw;
            }
            logger::debug("lmdb: opened an environment at {} with the map size of {} MiB", _dir_path, map_size >> 20U);
        }

        ~impl()
        {
            if (_env) {
                mdb_env_close(_env);
                _env = nullptr;
            }
        }

        impl(const impl &) = delete;
        impl &operator=(const impl &) = delete;

        MDB_env *env() const
        {
            return _env;
        }

        const std::string &path() const
        {
            return _dir_path;
        }
    private:
        std::string _dir_path;
        MDB_env *_env = nullptr;
    };

    env_t::env_t(const std::string_view dir_path, const size_t map_size):
        _impl { std::make_unique<impl>(dir_path, map_size) }
    {
    }

    env_t::~env_t() = default;

    const std::string &env_t::path() const
    {
        return _impl->path();
    }

    MDB_env *env_t::native() const
    {
        return _impl->env();
    }

    struct db_t::impl {
        impl(env_ptr_t env, const std::string_view name):
            _env { std::move(env) }, _name { name }
        {
            if (!_env) [[unlikely]]
                throw err_argument_t("lmdb: the environment must not be null");
            txn_t txn { _mdb_env(), false };
            throw_lmdb(mdb_dbi_open(txn.get(), _name.c_str(), MDB_CREATE, &_dbi), fmt::format("dbi_open({})", _name));
            txn.commit();
        }

        void clear()
        {
            txn_t txn { _mdb_env(), false };
            throw_lmdb(mdb_drop(txn.get(), _dbi, 0), "drop");
            txn.commit();
        }

        void erase(const std::string_view key)
        {
            const auto sk = stored_key(_mdb_env(), key);
            auto k = to_mdb_val(sk);
            txn_t txn { _mdb_env(), false };
            if (is_long(_mdb_env(), key)) {
                MDB_val v {};
                if (const auto rc = mdb_get(txn.get(), _dbi, &k, &v); rc == MDB_SUCCESS)
                    long_key::unwrap_value(key, from_mdb_val(v));
                else if (rc != MDB_NOTFOUND)
                    throw_lmdb(rc, "get");
            }
            if (const auto rc = mdb_del(txn.get(), _dbi, &k, nullptr); rc != MDB_NOTFOUND)
                throw_lmdb(rc, "del");
            txn.commit();
        }

        void foreach(const observer_t &obs) const
        {
            std::vector<std::pair<std::string, std::string>> items {};
            {
                txn_t txn { _mdb_env(), true };
                MDB_cursor *cur = nullptr;
                throw_lmdb(mdb_cursor_open(txn.get(), _dbi, &cur), "cursor_open");
                MDB_val k {}, v {};
                auto rc = mdb_cursor_get(cur, &k, &v, MDB_FIRST);
                while (rc == MDB_SUCCESS) {
                    const auto key = from_mdb_val(k);
                    if (!key.empty() && key.front() == key_prefix) {
                        items.emplace_back(key.substr(1), from_mdb_val(v));
                    } else if (!key.empty() && key.front() == long_key_prefix) {
                        try {
                            auto entry = long_key::unwrap(from_mdb_val(v));
                            items.emplace_back(std::move(entry.key), std::move(entry.value));
                        } catch (const std::exception &) {
                            mdb_cursor_close(cur);
                            throw;
                        }
                    } else [[unlikely]] {
                        mdb_cursor_close(cur);
                        throw err_storage_t(fmt::format("lmdb: {}: an unexpected key format", _name));
                    }
                    rc = mdb_cursor_get(cur, &k, &v, MDB_NEXT);
                }
                mdb_cursor_close(cur);
                if (rc != MDB_NOTFOUND)
                    throw_lmdb(rc, "cursor_get");
            }
            for (auto &&[k, v]: items)
                obs(std::move(k), std::move(v));
        }

        value_t get(const std::string_view key) const
        {
            const auto sk = stored_key(_mdb_env(), key);
            auto k = to_mdb_val(sk);
            MDB_val v {};
            txn_t txn { _mdb_env(), true };
            const auto rc = mdb_get(txn.get(), _dbi, &k, &v);
            if (rc == MDB_NOTFOUND)
                return {};
            throw_lmdb(rc, "get");
            if (is_long(_mdb_env(), key))
                return long_key::unwrap_value(key, from_mdb_val(v));
            return std::string { from_mdb_val(v) };
        }

        void set(const std::string_view key, const std::string_view val)
        {
            const auto sk = stored_key(_mdb_env(), key);
            auto k = to_mdb_val(sk);
            txn_t txn { _mdb_env(), false };
            std::string wrapped {};
            if (is_long(_mdb_env(), key)) {
                MDB_val prev {};
                if (const auto rc = mdb_get(txn.get(), _dbi, &k, &prev); rc == MDB_SUCCESS)
                    long_key::unwrap_value(key, from_mdb_val(prev));
                else if (rc != MDB_NOTFOUND)
                    throw_lmdb(rc, "get");
                wrapped = long_key::wrap(key, val);
            }
            auto v = to_mdb_val(wrapped.empty() ? val : std::string_view { wrapped });
            throw_lmdb(mdb_put(txn.get(), _dbi, &k, &v, 0), "put");
            txn.commit();
        }

        size_t size() const
        {
            MDB_stat st {};
            txn_t txn { _mdb_env(), true };
            throw_lmdb(mdb_stat(txn.get(), _dbi, &st), "stat");
            return static_cast<size_t>(st.ms_entries);
        }
    private:
        env_ptr_t _env;
        std::string _name;
        MDB_dbi _dbi { 0 };

        MDB_env *_mdb_env() const
        {
            return _env->native();
        }
    };

    db_t::db_t(env_ptr_t env, const std::string_view name):
        _impl { std::make_unique<impl>(std::move(env), name) }
    {
    }

    db_t::~db_t() = default;

    void db_t::clear()
    {
        _impl->clear();
    }

    void db_t::erase(const std::string_view key)
    {
        _impl->erase(key);
    }

    void db_t::foreach(const observer_t &obs) const
    {
        _impl->foreach(obs);
    }

    value_t db_t::get(const std::string_view key) const
    {
        return _impl->get(key);
    }

    void db_t::set(const std::string_view key, const std::string_view val)
    {
        _impl->set(key, val);
    }

    size_t db_t::size() const
    {
        return _impl->size();
    }
}
