#pragma once
/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <functional>
#include <memory>
#include <optional>
#include <vector>
#include "map.hpp"

namespace strata::container {
    /*
     * Maps paths, sequences of keys, to values.
     * The value at the empty path is the root value.
     */
    template<typename K, typename V>
    struct graph_t {
        using key_type = K;
        using mapped_type = V;
        using path_t = std::vector<K>;
        using value_t = std::optional<V>;
        using observer_t = std::function<void(const path_t &, const V &)>;
        using predicate_t = std::function<bool(const path_t &, const V &)>;

        virtual ~graph_t() = default;
        [[nodiscard]] virtual value_t get(const path_t &path) const = 0;
        // values at every prefix of the path in the root-to-leaf order skipping prefixes without a value
        [[nodiscard]] virtual std::vector<V> get_all(const path_t &path) const = 0;
        virtual value_t set(const V &val, const path_t &path) = 0;
        // inserts only when there is no value at the path
        virtual bool add(const V &val, const path_t &path) = 0;
        virtual value_t remove(const path_t &path) = 0;
        virtual void foreach(const observer_t &obs) const = 0;
        [[nodiscard]] virtual size_t size() const = 0;
        virtual void clear() = 0;
        virtual size_t remove_if(const predicate_t &pred) = 0;

        [[nodiscard]] virtual bool contains_path(const path_t &path) const
        {
            return get(path).has_value();
        }

        [[nodiscard]] virtual bool contains_value(const V &val) const
        {
            bool found = false;
            foreach([&](const auto &, const auto &v) {
                if (!found && v == val)
                    found = true;
            });
            return found;
        }

        [[nodiscard]] bool empty() const
        {
            return size() == 0;
        }
    };

    template<typename K, typename V>
    struct tree_t: graph_t<K, V> {
    };
    template<typename K, typename V>
    using tree_ptr_t = std::shared_ptr<tree_t<K, V>>;

    // A tree stored in a flat map keyed by whole paths
    template<typename K, typename V>
    struct mapped_tree_t: tree_t<K, V> {
        using typename graph_t<K, V>::path_t;
        using typename graph_t<K, V>::value_t;
        using typename graph_t<K, V>::observer_t;
        using typename graph_t<K, V>::predicate_t;

        explicit mapped_tree_t(map_ptr_t<path_t, V> base):
            _base { std::move(base) }
        {
            if (!_base) [[unlikely]]
                throw err_argument_t("the base map must not be null");
        }

        value_t get(const path_t &path) const override
        {
            return _base->get(path);
        }

        std::vector<V> get_all(const path_t &path) const override
        {
            std::vector<V> res {};
            path_t prefix {};
            prefix.reserve(path.size());
            for (size_t i = 0; ; ++i) {
                if (auto val = _base->get(prefix); val)
                    res.emplace_back(std::move(*val));
                if (i == path.size())
                    break;
                prefix.emplace_back(path[i]);
            }
            return res;
        }

        value_t set(const V &val, const path_t &path) override
        {
            return _base->put(path, val);
        }

        bool add(const V &val, const path_t &path) override
        {
            if (_base->contains(path))
                return false;
            _base->put(path, val);
            return true;
        }

        value_t remove(const path_t &path) override
        {
            return _base->remove(path);
        }

        bool contains_path(const path_t &path) const override
        {
            return _base->contains(path);
        }

        void foreach(const observer_t &obs) const override
        {
            _base->foreach(obs);
        }

        size_t size() const override
        {
            return _base->size();
        }

        void clear() override
        {
            _base->clear();
        }

        size_t remove_if(const predicate_t &pred) override
        {
            return _base->remove_if(pred);
        }
    private:
        map_ptr_t<path_t, V> _base;
    };
}
