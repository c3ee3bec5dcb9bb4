#pragma once
/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <algorithm>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <strata/codec/translator.hpp>

namespace strata::container {
    template<typename K, typename V>
    struct map_t {
        using key_type = K;
        using mapped_type = V;
        using value_t = std::optional<V>;
        using observer_t = std::function<void(const K &, const V &)>;
        using predicate_t = std::function<bool(const K &, const V &)>;

        virtual ~map_t() = default;
        [[nodiscard]] virtual value_t get(const K &key) const = 0;
        // returns the previous value if any
        virtual value_t put(const K &key, const V &val) = 0;
        virtual value_t remove(const K &key) = 0;
        virtual void foreach(const observer_t &obs) const = 0;
        [[nodiscard]] virtual size_t size() const = 0;

        [[nodiscard]] virtual bool contains(const K &key) const
        {
            return get(key).has_value();
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

        // returns the number of removed entries
        virtual size_t remove_if(const predicate_t &pred)
        {
            std::vector<K> keys {};
            foreach([&](const auto &k, const auto &v) {
                if (pred(k, v))
                    keys.emplace_back(k);
            });
            size_t num_removed = 0;
            for (const auto &k: keys) {
                if (remove(k))
                    ++num_removed;
            }
            return num_removed;
        }

        virtual void clear()
        {
            remove_if([](const auto &, const auto &) { return true; });
        }

        [[nodiscard]] bool empty() const
        {
            return size() == 0;
        }

        void put_all(const map_t &src)
        {
            src.foreach([&](const auto &k, const auto &v) {
                put(k, v);
            });
        }

        size_t remove_all(const std::vector<K> &keys)
        {
            return remove_if([&](const auto &k, const auto &) {
                return std::find(keys.begin(), keys.end(), k) != keys.end();
            });
        }

        size_t retain_all(const std::vector<K> &keys)
        {
            return remove_if([&](const auto &k, const auto &) {
                return std::find(keys.begin(), keys.end(), k) == keys.end();
            });
        }
    };
    template<typename K, typename V>
    using map_ptr_t = std::shared_ptr<map_t<K, V>>;

    // An unsynchronized in-process map
    template<typename K, typename V>
    struct std_map_t: map_t<K, V> {
        using typename map_t<K, V>::value_t;
        using typename map_t<K, V>::observer_t;

        value_t get(const K &key) const override
        {
            if (const auto it = _map.find(key); it != _map.end())
                return it->second;
            return {};
        }

        value_t put(const K &key, const V &val) override
        {
            auto [it, created] = _map.try_emplace(key, val);
            if (created)
                return {};
            value_t prev { std::move(it->second) };
            it->second = val;
            return prev;
        }

        value_t remove(const K &key) override
        {
            const auto it = _map.find(key);
            if (it == _map.end())
                return {};
            value_t prev { std::move(it->second) };
            _map.erase(it);
            return prev;
        }

        void foreach(const observer_t &obs) const override
        {
            for (const auto &[k, v]: _map)
                obs(k, v);
        }

        size_t size() const override
        {
            return _map.size();
        }

        void clear() override
        {
            _map.clear();
        }
    private:
        std::map<K, V> _map {};
    };

    // Exposes a string-keyed map as a map keyed by K using the string encoding of a translator
    template<typename K, typename V>
    struct key_translated_map_t: map_t<K, V> {
        using typename map_t<K, V>::value_t;
        using typename map_t<K, V>::observer_t;
        using typename map_t<K, V>::predicate_t;

        key_translated_map_t(map_ptr_t<std::string, V> base, codec::translator_ptr_t<K> key_tr):
            _base { std::move(base) },
            _key_tr { codec::require_translator(std::move(key_tr), "key") }
        {
            if (!_base) [[unlikely]]
                throw err_argument_t("the base map must not be null");
        }

        value_t get(const K &key) const override
        {
            return _base->get(_key_tr->encode(key));
        }

        value_t put(const K &key, const V &val) override
        {
            return _base->put(_key_tr->encode(key), val);
        }

        value_t remove(const K &key) override
        {
            return _base->remove(_key_tr->encode(key));
        }

        bool contains(const K &key) const override
        {
            return _base->contains(_key_tr->encode(key));
        }

        void foreach(const observer_t &obs) const override
        {
            _base->foreach([&](const auto &k, const auto &v) {
                obs(_decode_key(k), v);
            });
        }

        size_t size() const override
        {
            return _base->size();
        }

        size_t remove_if(const predicate_t &pred) override
        {
            return _base->remove_if([&](const auto &k, const auto &v) {
                return pred(_decode_key(k), v);
            });
        }

        void clear() override
        {
            _base->clear();
        }
    private:
        map_ptr_t<std::string, V> _base;
        codec::translator_ptr_t<K> _key_tr;

        K _decode_key(const std::string &k) const
        {
            try {
                return _key_tr->decode(k);
            } catch (const err_translation_t &ex) {
                throw err_storage_t(fmt::format("a stored key cannot be decoded as {}: '{}'", _key_tr->type_tag(), k), ex);
            }
        }
    };
}
