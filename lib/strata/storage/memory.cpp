/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <map>
#include <mutex>
#include <vector>
#include "memory.hpp"

namespace strata::storage::memory {
    struct db_t::impl {
        void clear()
        {
            std::scoped_lock lk { _mutex };
            _db.clear();
        }

        void erase(const std::string_view key)
        {
            std::scoped_lock lk { _mutex };
            if (const auto it = _db.find(key); it != _db.end())
                _db.erase(it);
        }

        void foreach(const observer_t &obs) const
        {
            // the observer may access the table so it is called on a snapshot without holding the lock
            std::vector<std::pair<std::string, std::string>> items {};
            {
                std::scoped_lock lk { _mutex };
                items.reserve(_db.size());
                for (const auto &[k, v]: _db)
                    items.emplace_back(k, v);
            }
            for (auto &&[k, v]: items)
                obs(std::move(k), std::move(v));
        }

        value_t get(const std::string_view key) const
        {
            std::scoped_lock lk { _mutex };
            if (const auto it = _db.find(key); it != _db.end())
                return it->second;
            return {};
        }

        void set(const std::string_view key, const std::string_view val)
        {
            std::scoped_lock lk { _mutex };
            auto [it, created] = _db.try_emplace(std::string { key }, val);
            if (!created)
                it->second = val;
        }

        [[nodiscard]] size_t size() const
        {
            std::scoped_lock lk { _mutex };
            return _db.size();
        }
    private:
        mutable std::mutex _mutex {};
        std::map<std::string, std::string, std::less<>> _db {};
    };

    db_t::db_t():
        _impl { std::make_unique<impl>() }
    {
    }

    db_t::~db_t() = default;

    void db_t::clear()
    {
        _impl->clear();
    }

    size_t db_t::size() const
    {
        return _impl->size();
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
}
