#pragma once
/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <concepts>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <typeinfo>
#include <vector>
#include "data.hpp"
#include "json.hpp"

namespace strata::codec {
    /*
     * A stateless bidirectional conversion between values of T and their string and data_t forms.
     * Translators are compatible when their type tags are equal regardless of their instances.
     */
    template<typename T>
    struct translator_t {
        using value_type = T;

        virtual ~translator_t() = default;
        virtual std::string type_tag() const = 0;
        virtual data_t to_data(const T &val) const = 0;
        virtual T from_data(const data_t &data) const = 0;

        virtual std::string encode(const T &val) const
        {
            return json::encode(to_data(val));
        }

        virtual T decode(const std::string_view text) const
        {
            return from_data(json::decode(text));
        }
    };
    template<typename T>
    using translator_ptr_t = std::shared_ptr<const translator_t<T>>;

    template<typename T>
    translator_ptr_t<T> require_translator(translator_ptr_t<T> tr, const std::string_view what)
    {
        if (!tr) [[unlikely]]
            throw err_argument_t(fmt::format("{} translator must not be null", what));
        return tr;
    }

    struct string_translator_t: translator_t<std::string> {
        std::string type_tag() const override;
        data_t to_data(const std::string &val) const override;
        std::string from_data(const data_t &data) const override;
        std::string encode(const std::string &val) const override;
        std::string decode(std::string_view text) const override;
    };

    struct int64_translator_t: translator_t<int64_t> {
        std::string type_tag() const override;
        data_t to_data(const int64_t &val) const override;
        int64_t from_data(const data_t &data) const override;
    };

    // Out-of-range numbers are clamped to the range of int16_t
    struct int16_translator_t: translator_t<int16_t> {
        std::string type_tag() const override;
        data_t to_data(const int16_t &val) const override;
        int16_t from_data(const data_t &data) const override;
    };

    struct double_translator_t: translator_t<double> {
        std::string type_tag() const override;
        data_t to_data(const double &val) const override;
        double from_data(const data_t &data) const override;
    };

    struct bool_translator_t: translator_t<bool> {
        std::string type_tag() const override;
        data_t to_data(const bool &val) const override;
        bool from_data(const data_t &data) const override;
    };

    struct data_translator_t: translator_t<data_t> {
        std::string type_tag() const override;
        data_t to_data(const data_t &val) const override;
        data_t from_data(const data_t &data) const override;
    };

    /*
     * Joins a list of strings with ';' escaping '&' as "&amp" and ';' as "&scln".
     * Empty strings are written as "&empty" so that an empty list can encode to an empty string.
     */
    extern std::string encode_list(const std::vector<std::string> &items);
    extern std::vector<std::string> decode_list(std::string_view text);

    template<typename T>
    struct list_translator_t: translator_t<std::vector<T>> {
        explicit list_translator_t(translator_ptr_t<T> elem_tr):
            _elem_tr { require_translator(std::move(elem_tr), "element") }
        {
        }

        std::string type_tag() const override
        {
            return fmt::format("list<{}>", _elem_tr->type_tag());
        }

        data_t to_data(const std::vector<T> &val) const override
        {
            data_list_t items {};
            items.reserve(val.size());
            for (const auto &item: val)
                items.emplace_back(_element(item, [&](const auto &v) { return _elem_tr->to_data(v); }));
            return list_data(std::move(items));
        }

        std::vector<T> from_data(const data_t &data) const override
        {
            if (!data.is_list()) [[unlikely]]
                throw err_translation_t(fmt::format("expected a list but got {}", data.type()));
            std::vector<T> res {};
            res.reserve(data.list().size());
            for (const auto &item: data.list())
                res.emplace_back(_element(item, [&](const auto &v) { return _elem_tr->from_data(v); }));
            return res;
        }

        std::string encode(const std::vector<T> &val) const override
        {
            std::vector<std::string> items {};
            items.reserve(val.size());
            for (const auto &item: val)
                items.emplace_back(_element(item, [&](const auto &v) { return _elem_tr->encode(v); }));
            return encode_list(items);
        }

        std::vector<T> decode(const std::string_view text) const override
        {
            std::vector<T> res {};
            for (const auto &item: decode_list(text))
                res.emplace_back(_element(item, [&](const auto &v) { return _elem_tr->decode(v); }));
            return res;
        }
    private:
        translator_ptr_t<T> _elem_tr;

        template<typename X, typename F>
        static auto _element(const X &item, const F &conv)
        {
            try {
                return conv(item);
            } catch (const std::exception &ex) {
                throw err_translation_t("could not translate a list element", ex);
            }
        }
    };

    template<typename T>
    struct set_translator_t: translator_t<std::set<T>> {
        explicit set_translator_t(translator_ptr_t<T> elem_tr):
            _elem_tr { require_translator(std::move(elem_tr), "element") }
        {
        }

        std::string type_tag() const override
        {
            return fmt::format("set<{}>", _elem_tr->type_tag());
        }

        data_t to_data(const std::set<T> &val) const override
        {
            data_list_t items {};
            items.reserve(val.size());
            for (const auto &item: val)
                items.emplace_back(_elem_tr->to_data(item));
            return list_data(std::move(items));
        }

        std::set<T> from_data(const data_t &data) const override
        {
            if (!data.is_list()) [[unlikely]]
                throw err_translation_t(fmt::format("expected a list but got {}", data.type()));
            std::set<T> res {};
            for (const auto &item: data.list())
                res.emplace(_elem_tr->from_data(item));
            return res;
        }
    private:
        translator_ptr_t<T> _elem_tr;
    };

    // Keys are stored through their string encoding, values through their data_t form
    template<typename K, typename V>
    struct map_translator_t: translator_t<std::map<K, V>> {
        map_translator_t(translator_ptr_t<K> key_tr, translator_ptr_t<V> val_tr):
            _key_tr { require_translator(std::move(key_tr), "key") },
            _val_tr { require_translator(std::move(val_tr), "value") }
        {
        }

        std::string type_tag() const override
        {
            return fmt::format("map<{},{}>", _key_tr->type_tag(), _val_tr->type_tag());
        }

        data_t to_data(const std::map<K, V> &val) const override
        {
            data_map_t items {};
            for (const auto &[k, v]: val)
                items.insert_or_assign(_key_tr->encode(k), _val_tr->to_data(v));
            return map_data(std::move(items));
        }

        std::map<K, V> from_data(const data_t &data) const override
        {
            if (!data.is_map()) [[unlikely]]
                throw err_translation_t(fmt::format("expected a map but got {}", data.type()));
            std::map<K, V> res {};
            for (const auto &[k, v]: data.map())
                res.insert_or_assign(_key_tr->decode(k), _val_tr->from_data(v));
            return res;
        }
    private:
        translator_ptr_t<K> _key_tr;
        translator_ptr_t<V> _val_tr;
    };

    template<typename T>
    concept storable_c = requires(const T &t, const data_t &d)
    {
        { t.to_data() } -> std::convertible_to<data_t>;
        { T::from_data(d) } -> std::convertible_to<T>;
    };

    template<storable_c T>
    struct storable_translator_t: translator_t<T> {
        std::string type_tag() const override
        {
            return fmt::format("storable<{}>", typeid(T).name());
        }

        data_t to_data(const T &val) const override
        {
            return val.to_data();
        }

        T from_data(const data_t &data) const override
        {
            try {
                return T::from_data(data);
            } catch (const err_translation_t &) {
                throw;
            } catch (const std::exception &ex) {
                throw err_translation_t(fmt::format("could not restore {} from {}", typeid(T).name(), data), ex);
            }
        }
    };
}
