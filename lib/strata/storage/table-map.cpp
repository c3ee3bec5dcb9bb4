/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <strata/common/logger.hpp>
#include "table-map.hpp"

namespace strata::storage {
    table_map_t::table_map_t(std::string name, db_ptr_t db):
        _name { std::move(name) },
        _db { std::move(db) }
    {
        if (!_db) [[unlikely]]
            throw err_argument_t(fmt::format("table {} requires a backing store", _name));
    }

    template<typename F>
    auto table_map_t::_call(const std::string_view op, const F &f) const
    {
        try {
            return f();
        } catch (const err_storage_t &) {
            throw;
        } catch (const std::exception &ex) {
            throw err_storage_t(fmt::format("table {}: {} failed", _name, op), ex);
        }
    }

    codec::data_t table_map_t::_decode(const std::string &key, const std::string &text) const
    {
        try {
            return codec::json::decode(text);
        } catch (const err_translation_t &ex) {
            throw err_storage_t(fmt::format("table {}: the value of '{}' is not valid JSON", _name, key), ex);
        }
    }

    table_map_t::value_t table_map_t::get(const std::string &key) const
    {
        const auto text = _call("get", [&] { return _db->get(key); });
        if (!text)
            return {};
        return _decode(key, *text);
    }

    table_map_t::value_t table_map_t::_previous(const std::string &key, const storage::value_t &text) const
    {
        if (!text)
            return {};
        try {
            return _decode(key, *text);
        } catch (const err_storage_t &ex) {
            logger::warn("table {}: replaced an undecodable value of '{}': {}", _name, key, ex.what());
            return {};
        }
    }

    table_map_t::value_t table_map_t::put(const std::string &key, const codec::data_t &val)
    {
        const auto text = codec::json::encode(val);
        const auto prev = _call("get", [&] { return _db->get(key); });
        _call("set", [&] { _db->set(key, text); });
        return _previous(key, prev);
    }

    table_map_t::value_t table_map_t::remove(const std::string &key)
    {
        const auto prev = _call("get", [&] { return _db->get(key); });
        if (!prev)
            return {};
        _call("erase", [&] { _db->erase(key); });
        return _previous(key, prev);
    }

    bool table_map_t::contains(const std::string &key) const
    {
        return _call("get", [&] { return _db->get(key).has_value(); });
    }

    void table_map_t::foreach(const observer_t &obs) const
    {
        std::vector<std::pair<std::string, std::string>> items {};
        _call("foreach", [&] {
            _db->foreach([&](auto k, auto v) {
                items.emplace_back(std::move(k), std::move(v));
            });
        });
        for (const auto &[k, v]: items)
            obs(k, _decode(k, v));
    }

    size_t table_map_t::size() const
    {
        return _call("size", [&] { return _db->size(); });
    }

    void table_map_t::clear()
    {
        _call("clear", [&] { _db->clear(); });
    }
}
