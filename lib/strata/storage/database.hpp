#pragma once
/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "config.hpp"
#include "view.hpp"

namespace strata::storage {
    struct param_t {
        std::string name;
        // any value is accepted when empty
        std::vector<std::string> choices {};
    };
    using params_t = std::vector<param_t>;

    enum class view_kind_t {
        tree, map
    };
}

namespace fmt {
    template<>
    struct formatter<strata::storage::view_kind_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const strata::storage::view_kind_t &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            using namespace strata::storage;
            switch (v) {
                case view_kind_t::tree: return fmt::format_to(ctx.out(), "tree");
                case view_kind_t::map: return fmt::format_to(ctx.out(), "map");
                default: throw strata::error(fmt::format("unsupported view_kind_t value: {}", static_cast<int>(v)));
            }
        }
    };
}

namespace strata::storage {
    /*
     * Issues named trees and maps backed by persistent storage.
     * A name refers to exactly one tree or map during the lifetime of a database.
     * Repeated requests for a name must use translators with the same type tags as the first request.
     * State: unloaded -> loaded -> closed; a closed database cannot be reused.
     */
    struct database_t {
        explicit database_t(size_t cache_size=config_t::default_cache_size);
        virtual ~database_t();
        database_t(const database_t &) = delete;
        database_t &operator=(const database_t &) = delete;

        // available before load; throws err_state_t after close like cache_size()
        [[nodiscard]] params_t load_params() const;
        // returns false when the backing store cannot be opened
        bool load(const std::vector<std::string> &args);
        void close();
        [[nodiscard]] bool loaded() const;
        [[nodiscard]] bool closed() const;
        [[nodiscard]] size_t cache_size() const;

        // the number of checked-out views
        [[nodiscard]] size_t size() const;
        [[nodiscard]] std::vector<std::string> tree_names() const;
        [[nodiscard]] std::vector<std::string> map_names() const;
        // copies every entry of every view of other that is not present here yet; requires no views to be checked out here
        void copy_data(const database_t &other);
        [[nodiscard]] stats_t &stats();

        template<typename K, typename V>
        container::tree_ptr_t<K, V> translated_tree(const std::string &name, codec::translator_ptr_t<K> key_tr, codec::translator_ptr_t<V> value_tr)
        {
            return _bind<database_tree_t<K, V>>(name, view_kind_t::tree, key_tr, value_tr, [&](view_entry_t &entry) {
                entry.raw_tree = _new_tree(name);
                auto base = std::make_shared<translated_tree_t<K, V>>(entry.raw_tree, key_tr, value_tr);
                return std::make_shared<database_tree_t<K, V>>(std::move(base), _guard, _stats, _cache_size);
            });
        }

        template<typename K, typename V>
        container::map_ptr_t<K, V> translated_map(const std::string &name, codec::translator_ptr_t<K> key_tr, codec::translator_ptr_t<V> value_tr)
        {
            return _bind<database_map_t<K, V>>(name, view_kind_t::map, key_tr, value_tr, [&](view_entry_t &entry) {
                entry.raw_map = _new_map(name);
                auto base = std::make_shared<translated_map_t<K, V>>(entry.raw_map, key_tr, value_tr);
                return std::make_shared<database_map_t<K, V>>(std::move(base), _guard, _stats, _cache_size);
            });
        }

        container::tree_ptr_t<std::string, codec::data_t> data_tree(const std::string &name)
        {
            return translated_tree<std::string, codec::data_t>(name, std::make_shared<codec::string_translator_t>(),
                std::make_shared<codec::data_translator_t>());
        }

        container::map_ptr_t<std::string, codec::data_t> data_map(const std::string &name)
        {
            return translated_map<std::string, codec::data_t>(name, std::make_shared<codec::string_translator_t>(),
                std::make_shared<codec::data_translator_t>());
        }

        template<typename K>
        container::tree_ptr_t<K, codec::data_t> key_translated_tree(const std::string &name, codec::translator_ptr_t<K> key_tr)
        {
            return translated_tree<K, codec::data_t>(name, std::move(key_tr), std::make_shared<codec::data_translator_t>());
        }

        template<typename K>
        container::map_ptr_t<K, codec::data_t> key_translated_map(const std::string &name, codec::translator_ptr_t<K> key_tr)
        {
            return translated_map<K, codec::data_t>(name, std::move(key_tr), std::make_shared<codec::data_translator_t>());
        }

        template<typename V>
        container::tree_ptr_t<std::string, V> value_translated_tree(const std::string &name, codec::translator_ptr_t<V> value_tr)
        {
            return translated_tree<std::string, V>(name, std::make_shared<codec::string_translator_t>(), std::move(value_tr));
        }

        template<typename V>
        container::map_ptr_t<std::string, V> value_translated_map(const std::string &name, codec::translator_ptr_t<V> value_tr)
        {
            return translated_map<std::string, V>(name, std::make_shared<codec::string_translator_t>(), std::move(value_tr));
        }
    protected:
        virtual params_t _load_params() const = 0;
        // throws when the backing store cannot be opened
        virtual void _load(const std::vector<std::string> &args) = 0;
        virtual void _release() = 0;
        virtual data_map_ptr_t _new_map(const std::string &name) = 0;
        virtual data_tree_ptr_t _new_tree(const std::string &name) = 0;
    private:
        enum class state_t {
            unloaded, loaded, closed
        };

        struct view_entry_t {
            view_kind_t kind;
            std::string key_tag;
            std::string value_tag;
            view_ptr_t view {};
            data_map_ptr_t raw_map {};
            data_tree_ptr_t raw_tree {};
        };

        mutable std::mutex _mutex {};
        std::map<std::string, view_entry_t> _views {};
        state_t _state = state_t::unloaded;
        guard_ptr_t _guard = std::make_shared<database_guard_t>();
        stats_ptr_t _stats = std::make_shared<stats_t>();
        size_t _cache_size;

        // must be called with the mutex held
        void _check_loaded() const;
        void _check_open() const;
        std::vector<std::string> _names(view_kind_t kind) const;

        template<typename View, typename K, typename V, typename F>
        std::shared_ptr<View> _bind(const std::string &name, const view_kind_t kind,
            const codec::translator_ptr_t<K> &key_tr, const codec::translator_ptr_t<V> &value_tr, const F &make)
        {
            codec::require_translator(key_tr, "key");
            codec::require_translator(value_tr, "value");
            std::scoped_lock lk { _mutex };
            _check_loaded();
            if (const auto it = _views.find(name); it != _views.end()) {
                const auto &entry = it->second;
                if (entry.kind != kind) [[unlikely]]
                    throw err_argument_t(fmt::format("'{}' is already used as a {}", name, entry.kind));
                if (entry.key_tag != key_tr->type_tag()) [[unlikely]]
                    throw err_argument_t(fmt::format("{} '{}' uses {} keys but {} were requested", kind, name, entry.key_tag, key_tr->type_tag()));
                if (entry.value_tag != value_tr->type_tag()) [[unlikely]]
                    throw err_argument_t(fmt::format("{} '{}' uses {} values but {} were requested", kind, name, entry.value_tag, value_tr->type_tag()));
                auto view = std::dynamic_pointer_cast<View>(entry.view);
                if (!view) [[unlikely]]
                    throw err_argument_t(fmt::format("{} '{}' was created for different C++ types", kind, name));
                return view;
            }
            view_entry_t entry { kind, key_tr->type_tag(), value_tr->type_tag() };
            auto view = make(entry);
            entry.view = view;
            _views.emplace(name, std::move(entry));
            logger::debug("created {} '{}' with {} keys and {} values", kind, name, key_tr->type_tag(), value_tr->type_tag());
            return view;
        }
    };
    using database_ptr_t = std::shared_ptr<database_t>;
}
