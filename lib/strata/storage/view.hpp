#pragma once
/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <atomic>
#include <mutex>
#include <strata/codec/translator.hpp>
#include <strata/common/timer.hpp>
#include <strata/container/graph.hpp>
#include <strata/container/lru-cache.hpp>
#include "stats.hpp"

namespace strata::storage {
    using data_map_ptr_t = container::map_ptr_t<std::string, codec::data_t>;
    using data_tree_ptr_t = container::tree_ptr_t<std::string, codec::data_t>;

    // The closed flag shared by a database and all its views
    struct database_guard_t {
        void check() const
        {
            if (_closed.load(std::memory_order_acquire)) [[unlikely]]
                throw err_state_t("the database has been closed");
        }

        void close()
        {
            _closed.store(true, std::memory_order_release);
        }

        [[nodiscard]] bool closed() const
        {
            return _closed.load(std::memory_order_acquire);
        }
    private:
        std::atomic<bool> _closed { false };
    };
    using guard_ptr_t = std::shared_ptr<database_guard_t>;

    struct view_base_t {
        virtual ~view_base_t() = default;
        virtual void flush_cache() = 0;
    };
    using view_ptr_t = std::shared_ptr<view_base_t>;

    template<typename V>
    V decode_stored(const codec::translator_t<V> &tr, const codec::data_t &data)
    {
        try {
            return tr.from_data(data);
        } catch (const err_translation_t &ex) {
            throw err_storage_t(fmt::format("a stored value cannot be decoded as {}: {}", tr.type_tag(), data), ex);
        }
    }

    template<typename K>
    K decode_stored_key(const codec::translator_t<K> &tr, const std::string &key)
    {
        try {
            return tr.decode(key);
        } catch (const err_translation_t &ex) {
            throw err_storage_t(fmt::format("a stored key cannot be decoded as {}: '{}'", tr.type_tag(), key), ex);
        }
    }

    // A typed map over a data-level map with keys in their string form
    template<typename K, typename V>
    struct translated_map_t: container::map_t<K, V> {
        using typename container::map_t<K, V>::value_t;
        using typename container::map_t<K, V>::observer_t;
        using typename container::map_t<K, V>::predicate_t;

        translated_map_t(data_map_ptr_t base, codec::translator_ptr_t<K> key_tr, codec::translator_ptr_t<V> value_tr):
            _base { std::move(base) },
            _key_tr { codec::require_translator(std::move(key_tr), "key") },
            _value_tr { codec::require_translator(std::move(value_tr), "value") }
        {
            if (!_base) [[unlikely]]
                throw err_argument_t("the base map must not be null");
        }

        const codec::translator_ptr_t<K> &key_translator() const
        {
            return _key_tr;
        }

        value_t get(const K &key) const override
        {
            return _value(_base->get(_key_tr->encode(key)));
        }

        value_t put(const K &key, const V &val) override
        {
            return _value(_base->put(_key_tr->encode(key), _value_tr->to_data(val)));
        }

        value_t remove(const K &key) override
        {
            return _value(_base->remove(_key_tr->encode(key)));
        }

        bool contains(const K &key) const override
        {
            return _base->contains(_key_tr->encode(key));
        }

        void foreach(const observer_t &obs) const override
        {
            _base->foreach([&](const auto &k, const auto &v) {
                obs(decode_stored_key(*_key_tr, k), decode_stored(*_value_tr, v));
            });
        }

        size_t size() const override
        {
            return _base->size();
        }

        size_t remove_if(const predicate_t &pred) override
        {
            return _base->remove_if([&](const auto &k, const auto &v) {
                return pred(decode_stored_key(*_key_tr, k), decode_stored(*_value_tr, v));
            });
        }

        void clear() override
        {
            _base->clear();
        }
    private:
        data_map_ptr_t _base;
        codec::translator_ptr_t<K> _key_tr;
        codec::translator_ptr_t<V> _value_tr;

        value_t _value(const std::optional<codec::data_t> &data) const
        {
            if (!data)
                return {};
            return decode_stored(*_value_tr, *data);
        }
    };

    // A typed tree over a data-level tree with each path element in its string form
    template<typename K, typename V>
    struct translated_tree_t: container::tree_t<K, V> {
        using typename container::graph_t<K, V>::path_t;
        using typename container::graph_t<K, V>::value_t;
        using typename container::graph_t<K, V>::observer_t;
        using typename container::graph_t<K, V>::predicate_t;

        translated_tree_t(data_tree_ptr_t base, codec::translator_ptr_t<K> key_tr, codec::translator_ptr_t<V> value_tr):
            _base { std::move(base) },
            _key_tr { codec::require_translator(std::move(key_tr), "key") },
            _value_tr { codec::require_translator(std::move(value_tr), "value") }
        {
            if (!_base) [[unlikely]]
                throw err_argument_t("the base tree must not be null");
        }

        const codec::translator_ptr_t<K> &key_translator() const
        {
            return _key_tr;
        }

        value_t get(const path_t &path) const override
        {
            return _value(_base->get(_encode(path)));
        }

        std::vector<V> get_all(const path_t &path) const override
        {
            std::vector<V> res {};
            for (const auto &data: _base->get_all(_encode(path)))
                res.emplace_back(decode_stored(*_value_tr, data));
            return res;
        }

        value_t set(const V &val, const path_t &path) override
        {
            return _value(_base->set(_value_tr->to_data(val), _encode(path)));
        }

        bool add(const V &val, const path_t &path) override
        {
            return _base->add(_value_tr->to_data(val), _encode(path));
        }

        value_t remove(const path_t &path) override
        {
            return _value(_base->remove(_encode(path)));
        }

        bool contains_path(const path_t &path) const override
        {
            return _base->contains_path(_encode(path));
        }

        void foreach(const observer_t &obs) const override
        {
            _base->foreach([&](const auto &p, const auto &v) {
                obs(_decode(p), decode_stored(*_value_tr, v));
            });
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
            return _base->remove_if([&](const auto &p, const auto &v) {
                return pred(_decode(p), decode_stored(*_value_tr, v));
            });
        }
    private:
        data_tree_ptr_t _base;
        codec::translator_ptr_t<K> _key_tr;
        codec::translator_ptr_t<V> _value_tr;

        std::vector<std::string> _encode(const path_t &path) const
        {
            std::vector<std::string> res {};
            res.reserve(path.size());
            for (const auto &k: path)
                res.emplace_back(_key_tr->encode(k));
            return res;
        }

        path_t _decode(const std::vector<std::string> &path) const
        {
            path_t res {};
            res.reserve(path.size());
            for (const auto &k: path)
                res.emplace_back(decode_stored_key(*_key_tr, k));
            return res;
        }

        value_t _value(const std::optional<codec::data_t> &data) const
        {
            if (!data)
                return {};
            return decode_stored(*_value_tr, *data);
        }
    };

    /*
     * Common part of the views handed out by a database.
     * Cache entries are keyed by the string encoding of the key or the path.
     * Lookups are counted in the database statistics; failed lookups are never cached.
     */
    template<typename V>
    struct cached_view_t: view_base_t {
        cached_view_t(guard_ptr_t guard, stats_ptr_t stats, const size_t cache_size):
            _guard { std::move(guard) },
            _stats { std::move(stats) },
            _cache { cache_size }
        {
            if (!_guard || !_stats) [[unlikely]]
                throw err_argument_t("a view requires a guard and statistics");
        }

        void flush_cache() override
        {
            _cache.clear();
        }
    protected:
        guard_ptr_t _guard;
        stats_ptr_t _stats;
        mutable container::cache_t<std::string, V> _cache;
        mutable std::mutex _mutex {};

        template<typename F>
        std::optional<V> _cached_get(const std::string &cache_key, const F &fetch) const
        {
            std::scoped_lock lk { _mutex };
            if (auto val = _cache.get(cache_key); val) {
                _stats->add_cache_hit();
                return val;
            }
            timer t { "storage fetch", logger::level::trace };
            auto val = fetch();
            const auto elapsed_ms = t.stop(false) * 1000;
            if (val) {
                _stats->add_fetch_success(elapsed_ms);
                _stats->add_cache_miss();
                _cache.put(cache_key, *val);
            } else {
                _stats->add_fetch_failure(elapsed_ms);
            }
            return val;
        }

        // updates a cached entry without changing its recency and evicts it if the write fails
        template<typename F>
        auto _write(const std::string &cache_key, const V &val, const F &write)
        {
            std::scoped_lock lk { _mutex };
            _cache.update(cache_key, val);
            try {
                return write();
            } catch (const std::exception &) {
                _cache.remove(cache_key);
                throw;
            }
        }

        template<typename F>
        auto _remove(const std::string &cache_key, const F &remove)
        {
            std::scoped_lock lk { _mutex };
            _cache.remove(cache_key);
            return remove();
        }

        // predicates run under the view lock and must not access the same view
        template<typename F>
        auto _bulk(const F &op)
        {
            std::scoped_lock lk { _mutex };
            _cache.clear();
            return op();
        }
    };

    template<typename K, typename V>
    struct database_map_t: container::map_t<K, V>, cached_view_t<V> {
        using typename container::map_t<K, V>::value_t;
        using typename container::map_t<K, V>::observer_t;
        using typename container::map_t<K, V>::predicate_t;
        using base_map_ptr_t = std::shared_ptr<translated_map_t<K, V>>;

        database_map_t(base_map_ptr_t view, guard_ptr_t guard, stats_ptr_t stats, const size_t cache_size):
            cached_view_t<V> { std::move(guard), std::move(stats), cache_size },
            _view { std::move(view) }
        {
            if (!_view) [[unlikely]]
                throw err_argument_t("the base map must not be null");
        }

        value_t get(const K &key) const override
        {
            this->_guard->check();
            return this->_cached_get(_cache_key(key), [&] { return _view->get(key); });
        }

        value_t put(const K &key, const V &val) override
        {
            this->_guard->check();
            return this->_write(_cache_key(key), val, [&] { return _view->put(key, val); });
        }

        value_t remove(const K &key) override
        {
            this->_guard->check();
            return this->_remove(_cache_key(key), [&] { return _view->remove(key); });
        }

        void foreach(const observer_t &obs) const override
        {
            this->_guard->check();
            _view->foreach(obs);
        }

        size_t size() const override
        {
            this->_guard->check();
            return _view->size();
        }

        size_t remove_if(const predicate_t &pred) override
        {
            this->_guard->check();
            return this->_bulk([&] { return _view->remove_if(pred); });
        }

        void clear() override
        {
            this->_guard->check();
            this->_bulk([&] { _view->clear(); });
        }
    private:
        base_map_ptr_t _view;

        std::string _cache_key(const K &key) const
        {
            return _view->key_translator()->encode(key);
        }
    };

    template<typename K, typename V>
    struct database_tree_t: container::tree_t<K, V>, cached_view_t<V> {
        using typename container::graph_t<K, V>::path_t;
        using typename container::graph_t<K, V>::value_t;
        using typename container::graph_t<K, V>::observer_t;
        using typename container::graph_t<K, V>::predicate_t;
        using base_tree_ptr_t = std::shared_ptr<translated_tree_t<K, V>>;

        database_tree_t(base_tree_ptr_t view, guard_ptr_t guard, stats_ptr_t stats, const size_t cache_size):
            cached_view_t<V> { std::move(guard), std::move(stats), cache_size },
            _view { std::move(view) }
        {
            if (!_view) [[unlikely]]
                throw err_argument_t("the base tree must not be null");
            _path_tr = std::make_shared<codec::list_translator_t<K>>(_view->key_translator());
        }

        value_t get(const path_t &path) const override
        {
            this->_guard->check();
            return this->_cached_get(_cache_key(path), [&] { return _view->get(path); });
        }

        std::vector<V> get_all(const path_t &path) const override
        {
            std::vector<V> res {};
            path_t prefix {};
            prefix.reserve(path.size());
            for (size_t i = 0; ; ++i) {
                if (auto val = get(prefix); val)
                    res.emplace_back(std::move(*val));
                if (i == path.size())
                    break;
                prefix.emplace_back(path[i]);
            }
            return res;
        }

        value_t set(const V &val, const path_t &path) override
        {
            this->_guard->check();
            return this->_write(_cache_key(path), val, [&] { return _view->set(val, path); });
        }

        bool add(const V &val, const path_t &path) override
        {
            this->_guard->check();
            return _view->add(val, path);
        }

        value_t remove(const path_t &path) override
        {
            this->_guard->check();
            return this->_remove(_cache_key(path), [&] { return _view->remove(path); });
        }

        void foreach(const observer_t &obs) const override
        {
            this->_guard->check();
            _view->foreach(obs);
        }

        size_t size() const override
        {
            this->_guard->check();
            return _view->size();
        }

        void clear() override
        {
            this->_guard->check();
            this->_bulk([&] { _view->clear(); });
        }

        size_t remove_if(const predicate_t &pred) override
        {
            this->_guard->check();
            return this->_bulk([&] { return _view->remove_if(pred); });
        }
    private:
        base_tree_ptr_t _view;
        std::shared_ptr<codec::list_translator_t<K>> _path_tr {};

        std::string _cache_key(const path_t &path) const
        {
            return _path_tr->encode(path);
        }
    };
}
