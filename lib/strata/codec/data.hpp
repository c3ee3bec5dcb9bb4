#pragma once
/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <concepts>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <strata/common/errors.hpp>
#include <strata/common/format.hpp>

namespace strata::codec {
    enum class data_type_t: uint8_t {
        string, number, boolean, null, list, map
    };

    struct data_fields_t;

    /*
     * An immutable value with exactly one populated variant.
     * Lists and maps are shared between copies, numbers keep their original decimal text,
     * so a float-ness of a number is a part of its identity: 42 != 42.0
     */
    struct data_t {
        using list_t = std::vector<data_t>;
        using map_t = std::map<std::string, data_t>;

        struct null_t {
            bool operator==(const null_t &) const = default;
        };

        struct number_t {
            std::string text;
            bool operator==(const number_t &) const = default;
        };

        using value_t = std::variant<std::string, number_t, bool, null_t, std::shared_ptr<const list_t>, std::shared_ptr<const map_t>>;

        // throws err_argument_t unless exactly one field is populated
        explicit data_t(data_fields_t fields);

        data_type_t type() const noexcept
        {
            return static_cast<data_type_t>(_val.index());
        }

        bool is_string() const noexcept
        {
            return type() == data_type_t::string;
        }

        bool is_number() const noexcept
        {
            return type() == data_type_t::number;
        }

        bool is_boolean() const noexcept
        {
            return type() == data_type_t::boolean;
        }

        bool is_null() const noexcept
        {
            return type() == data_type_t::null;
        }

        bool is_list() const noexcept
        {
            return type() == data_type_t::list;
        }

        bool is_map() const noexcept
        {
            return type() == data_type_t::map;
        }

        bool is_float() const noexcept;

        const std::string &as_string() const;
        const std::string &number() const;
        double number_float() const;
        // floats are truncated towards zero, out-of-range values saturate, NaN gives 0
        int64_t number_integer() const;
        bool as_bool() const;
        const list_t &list() const;
        const map_t &map() const;

        bool operator==(const data_t &o) const;
        size_t hash() const noexcept;
        std::string to_json() const;
    private:
        value_t _val;
    };
    using data_list_t = data_t::list_t;
    using data_map_t = data_t::map_t;

    struct data_fields_t {
        std::optional<std::string> string {};
        std::optional<std::string> number {};
        std::optional<bool> boolean {};
        bool null = false;
        std::optional<data_list_t> list {};
        std::optional<data_map_t> map {};
    };

    extern std::string_view data_type_name(data_type_t type);
    extern bool valid_number(std::string_view text);
    // Renders a double with at least one fractional digit: 42.0, 1.0e+20, NaN, Infinity, -Infinity
    extern std::string format_float(double val);

    extern data_t string_data(std::string val);
    extern data_t number_data(std::string_view text);
    extern data_t boolean_data(bool val);
    extern data_t null_data();
    extern data_t list_data(data_list_t val);
    extern data_t map_data(data_map_t val);

    template<std::integral T>
    requires (!std::same_as<T, bool>)
    data_t number_data(const T val)
    {
        return data_t { data_fields_t { .number=fmt::format("{}", val) } };
    }

    template<std::floating_point T>
    data_t number_data(const T val)
    {
        return data_t { data_fields_t { .number=format_float(static_cast<double>(val)) } };
    }

    // disambiguates string literals from the integral overload
    inline data_t number_data(const char *text)
    {
        return number_data(std::string_view { text });
    }
}

namespace std {
    template<>
    struct hash<strata::codec::data_t> {
        size_t operator()(const strata::codec::data_t &d) const noexcept
        {
            return d.hash();
        }
    };
}

namespace fmt {
    template<>
    struct formatter<strata::codec::data_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const strata::codec::data_t &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}", v.to_json());
        }
    };

    template<>
    struct formatter<strata::codec::data_type_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const strata::codec::data_type_t &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}", strata::codec::data_type_name(v));
        }
    };
}
