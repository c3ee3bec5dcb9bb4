#pragma once
/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <strata/codec/json.hpp>
#include <strata/container/map.hpp>
#include "common.hpp"

namespace strata::storage {
    // A data-level map over a flat table with values stored as their JSON text
    struct table_map_t: container::map_t<std::string, codec::data_t> {
        table_map_t(std::string name, db_ptr_t db);
        value_t get(const std::string &key) const override;
        value_t put(const std::string &key, const codec::data_t &val) override;
        value_t remove(const std::string &key) override;
        bool contains(const std::string &key) const override;
        void foreach(const observer_t &obs) const override;
        size_t size() const override;
        void clear() override;
    private:
        std::string _name;
        db_ptr_t _db;

        codec::data_t _decode(const std::string &key, const std::string &text) const;
        // undecodable previous values are logged and reported as absent
        value_t _previous(const std::string &key, const storage::value_t &text) const;
        template<typename F>
        auto _call(std::string_view op, const F &f) const;
    };
}
