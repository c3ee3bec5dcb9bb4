#pragma once
/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <vector>
#include <strata/common/errors.hpp>
#include <strata/common/format.hpp>

namespace strata::container {
    template <typename T>
    struct is_shared_ptr: std::false_type {};

    template <typename U>
    struct is_shared_ptr<std::shared_ptr<U>>: std::true_type {};

    template<typename T>
    concept shared_ptr_c = is_shared_ptr<T>::value;

    /*
     * A fixed-capacity least-recently-used cache.
     * Nodes live in an arena addressed by index; slots 0 and 1 are the sentinels of the recency list
     * with the most recently used entry right after the head and the least recently used one right before the tail.
     * All operations are O(1) and are serialized by a single mutex.
     */
    template<typename K, typename V, typename Hash=std::hash<K>, typename KeyEqual=std::equal_to<K>>
    struct cache_t {
        using key_type = K;
        using mapped_type = V;
        using value_t = std::optional<V>;

        explicit cache_t(const size_t capacity):
            _capacity { capacity }
        {
            if (_capacity == 0) [[unlikely]]
                throw err_argument_t("cache capacity must be positive");
            _nodes.reserve(std::min(_capacity, max_reserve) + num_sentinels);
            _nodes.emplace_back();
            _nodes.emplace_back();
            _nodes[head].next = tail;
            _nodes[tail].prev = head;
            _index.reserve(std::min(_capacity, max_reserve));
        }

        cache_t(const cache_t &) = delete;
        cache_t &operator=(const cache_t &) = delete;

        // Returns the cached value and makes it the most recently used one
        value_t get(const K &key)
        {
            std::scoped_lock lk { _mutex };
            const auto it = _index.find(key);
            if (it == _index.end())
                return {};
            _unlink(it->second);
            _link_front(it->second);
            return _nodes[it->second].value;
        }

        // Inserts or replaces the value making it the most recently used one, evicts the least recently used entry when full
        value_t put(const K &key, V val)
        {
            _check_value(val);
            std::scoped_lock lk { _mutex };
            if (const auto it = _index.find(key); it != _index.end()) {
                auto &node = _nodes[it->second];
                value_t prev { std::move(node.value) };
                node.value = std::move(val);
                _unlink(it->second);
                _link_front(it->second);
                return prev;
            }
            if (_index.size() >= _capacity)
                _evict(_nodes[tail].prev);
            const auto idx = _alloc(key, std::move(val));
            _index.try_emplace(key, idx);
            _link_front(idx);
            return {};
        }

        // Replaces the value of a cached key leaving its recency untouched; does nothing when the key is not cached
        value_t update(const K &key, V val)
        {
            _check_value(val);
            std::scoped_lock lk { _mutex };
            const auto it = _index.find(key);
            if (it == _index.end())
                return {};
            auto &node = _nodes[it->second];
            value_t prev { std::move(node.value) };
            node.value = std::move(val);
            return prev;
        }

        value_t remove(const K &key)
        {
            std::scoped_lock lk { _mutex };
            const auto it = _index.find(key);
            if (it == _index.end())
                return {};
            const auto idx = it->second;
            value_t prev { std::move(_nodes[idx].value) };
            _evict(idx);
            return prev;
        }

        void clear()
        {
            std::scoped_lock lk { _mutex };
            _index.clear();
            _nodes.resize(num_sentinels);
            _free.clear();
            _nodes[head].next = tail;
            _nodes[tail].prev = head;
        }

        bool contains(const K &key) const
        {
            std::scoped_lock lk { _mutex };
            return _index.contains(key);
        }

        size_t size() const
        {
            std::scoped_lock lk { _mutex };
            return _index.size();
        }

        size_t capacity() const
        {
            return _capacity;
        }
    private:
        static constexpr size_t head = 0;
        static constexpr size_t tail = 1;
        static constexpr size_t num_sentinels = 2;
        static constexpr size_t max_reserve = 0x10000;

        struct node_t {
            std::optional<K> key {};
            std::optional<V> value {};
            size_t prev = head;
            size_t next = tail;
        };

        const size_t _capacity;
        mutable std::mutex _mutex {};
        std::vector<node_t> _nodes {};
        std::vector<size_t> _free {};
        std::unordered_map<K, size_t, Hash, KeyEqual> _index {};

        static void _check_value(const V &val)
        {
            if constexpr (shared_ptr_c<V>) {
                if (!val) [[unlikely]]
                    throw err_argument_t("cache values must not be null");
            }
        }

        size_t _alloc(const K &key, V &&val)
        {
            if (!_free.empty()) {
                const auto idx = _free.back();
                _free.pop_back();
                _nodes[idx].key.emplace(key);
                _nodes[idx].value.emplace(std::move(val));
                return idx;
            }
            const auto idx = _nodes.size();
            _nodes.emplace_back(node_t { key, std::move(val) });
            return idx;
        }

        void _evict(const size_t idx)
        {
            _unlink(idx);
            auto &node = _nodes[idx];
            _index.erase(*node.key);
            node.key.reset();
            node.value.reset();
            _free.emplace_back(idx);
        }

        void _unlink(const size_t idx)
        {
            auto &node = _nodes[idx];
            _nodes[node.prev].next = node.next;
            _nodes[node.next].prev = node.prev;
        }

        void _link_front(const size_t idx)
        {
            auto &node = _nodes[idx];
            node.prev = head;
            node.next = _nodes[head].next;
            _nodes[node.next].prev = idx;
            _nodes[head].next = idx;
        }
    };
}
