/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <charconv>
#include <cmath>
#include <limits>
#include "data.hpp"
#include "json.hpp"

namespace strata::codec {
    namespace {
        constexpr std::string_view nan_token { "NaN" };
        constexpr std::string_view inf_token { "Infinity" };
        constexpr std::string_view neg_inf_token { "-Infinity" };

        bool is_digit(const char c)
        {
            return c >= '0' && c <= '9';
        }

        size_t skip_digits(const std::string_view text, size_t pos)
        {
            while (pos < text.size() && is_digit(text[pos]))
                ++pos;
            return pos;
        }

        void hash_combine(size_t &seed, const size_t h)
        {
            seed ^= h + 0x9e3779b9U + (seed << 6U) + (seed >> 2U);
        }

        [[noreturn]] void throw_wrong_type(const data_type_t act, const data_type_t req)
        {
            throw err_argument_t(fmt::format("data of type {} was accessed as {}", act, req));
        }
    }

    std::string_view data_type_name(const data_type_t type)
    {
        switch (type) {
            case data_type_t::string: return "string";
            case data_type_t::number: return "number";
            case data_type_t::boolean: return "boolean";
            case data_type_t::null: return "null";
            case data_type_t::list: return "list";
            case data_type_t::map: return "map";
            default: throw error(fmt::format("unsupported data type: {}", static_cast<int>(type)));
        }
    }

    bool valid_number(const std::string_view text)
    {
        if (text == nan_token || text == inf_token || text == neg_inf_token)
            return true;
        size_t pos = 0;
        if (pos < text.size() && text[pos] == '-')
            ++pos;
        if (pos >= text.size() || !is_digit(text[pos]))
            return false;
        if (text[pos] == '0')
            ++pos;
        else
            pos = skip_digits(text, pos);
        if (pos < text.size() && text[pos] == '.') {
            const auto frac_start = ++pos;
            pos = skip_digits(text, pos);
            if (pos == frac_start)
                return false;
        }
        if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
            ++pos;
            if (pos < text.size() && (text[pos] == '+' || text[pos] == '-'))
                ++pos;
            const auto exp_start = pos;
            pos = skip_digits(text, pos);
            if (pos == exp_start)
                return false;
        }
        return pos == text.size();
    }

    std::string format_float(const double val)
    {
        if (std::isnan(val))
            return std::string { nan_token };
        if (std::isinf(val))
            return std::string { val > 0 ? inf_token : neg_inf_token };
        auto text = fmt::format("{}", val);
        const auto mantissa_end = std::min(text.find_first_of("eE"), text.size());
        if (text.find('.') >= mantissa_end)
            text.insert(mantissa_end, ".0");
        return text;
    }

    data_t::data_t(data_fields_t fields):
        _val { null_t {} }
    {
        const size_t num_fields = static_cast<size_t>(fields.string.has_value())
            + static_cast<size_t>(fields.number.has_value())
            + static_cast<size_t>(fields.boolean.has_value())
            + static_cast<size_t>(fields.null)
            + static_cast<size_t>(fields.list.has_value())
            + static_cast<size_t>(fields.map.has_value());
        if (num_fields == 0) [[unlikely]]
            throw err_argument_t("missing data value");
        if (num_fields > 1) [[unlikely]]
            throw err_argument_t("multiple data values");
        if (fields.string) {
            _val.emplace<std::string>(std::move(*fields.string));
        } else if (fields.number) {
            if (!valid_number(*fields.number)) [[unlikely]]
                throw err_argument_t(fmt::format("not a valid number: '{}'", *fields.number));
            _val.emplace<number_t>(number_t { std::move(*fields.number) });
        } else if (fields.boolean) {
            _val.emplace<bool>(*fields.boolean);
        } else if (fields.list) {
            _val.emplace<std::shared_ptr<const list_t>>(std::make_shared<const list_t>(std::move(*fields.list)));
        } else if (fields.map) {
            _val.emplace<std::shared_ptr<const map_t>>(std::make_shared<const map_t>(std::move(*fields.map)));
        }
    }

    bool data_t::is_float() const noexcept
    {
        if (!is_number())
            return false;
        const auto &text = std::get<number_t>(_val).text;
        return text.find('.') != std::string::npos || text == nan_token || text == inf_token || text == neg_inf_token;
    }

    const std::string &data_t::as_string() const
    {
        if (!is_string()) [[unlikely]]
            throw_wrong_type(type(), data_type_t::string);
        return std::get<std::string>(_val);
    }

    const std::string &data_t::number() const
    {
        if (!is_number()) [[unlikely]]
            throw_wrong_type(type(), data_type_t::number);
        return std::get<number_t>(_val).text;
    }

    double data_t::number_float() const
    {
        const auto &text = number();
        if (text == nan_token)
            return std::numeric_limits<double>::quiet_NaN();
        if (text == inf_token)
            return std::numeric_limits<double>::infinity();
        if (text == neg_inf_token)
            return -std::numeric_limits<double>::infinity();
        double val = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), val);
        if (ec == std::errc::result_out_of_range) {
            const bool neg = text.starts_with('-');
            const auto e_pos = text.find_first_of("eE");
            if (e_pos != std::string::npos && text[e_pos + 1] == '-')
                return neg ? -0.0 : 0.0;
            return neg ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity();
        }
        if (ec != std::errc {} || ptr != text.data() + text.size()) [[unlikely]]
            throw error(fmt::format("internal error: failed to parse a validated number: '{}'", text));
        return val;
    }

    int64_t data_t::number_integer() const
    {
        static constexpr auto max_val = std::numeric_limits<int64_t>::max();
        static constexpr auto min_val = std::numeric_limits<int64_t>::min();
        const auto &text = number();
        if (!is_float()) {
            int64_t val = 0;
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), val);
            if (ec == std::errc::result_out_of_range)
                return text.starts_with('-') ? min_val : max_val;
            // numbers with an exponent but without a fraction take the floating-point path
            if (ec == std::errc {} && ptr == text.data() + text.size())
                return val;
        }
        const auto d = number_float();
        if (std::isnan(d))
            return 0;
        if (d >= static_cast<double>(max_val))
            return max_val;
        if (d <= static_cast<double>(min_val))
            return min_val;
        return static_cast<int64_t>(d);
    }

    bool data_t::as_bool() const
    {
        if (!is_boolean()) [[unlikely]]
            throw_wrong_type(type(), data_type_t::boolean);
        return std::get<bool>(_val);
    }

    const data_t::list_t &data_t::list() const
    {
        if (!is_list()) [[unlikely]]
            throw_wrong_type(type(), data_type_t::list);
        return *std::get<std::shared_ptr<const list_t>>(_val);
    }

    const data_t::map_t &data_t::map() const
    {
        if (!is_map()) [[unlikely]]
            throw_wrong_type(type(), data_type_t::map);
        return *std::get<std::shared_ptr<const map_t>>(_val);
    }

    bool data_t::operator==(const data_t &o) const
    {
        if (_val.index() != o._val.index())
            return false;
        return std::visit([&](const auto &v) {
            using T = std::decay_t<decltype(v)>;
            const auto &ov = std::get<T>(o._val);
            if constexpr (std::is_same_v<T, std::shared_ptr<const list_t>> || std::is_same_v<T, std::shared_ptr<const map_t>>) {
                return v == ov || *v == *ov;
            } else {
                return v == ov;
            }
        }, _val);
    }

    size_t data_t::hash() const noexcept
    {
        size_t seed = _val.index();
        std::visit([&](const auto &v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                hash_combine(seed, std::hash<std::string> {}(v));
            } else if constexpr (std::is_same_v<T, number_t>) {
                hash_combine(seed, std::hash<std::string> {}(v.text));
            } else if constexpr (std::is_same_v<T, bool>) {
                hash_combine(seed, std::hash<bool> {}(v));
            } else if constexpr (std::is_same_v<T, std::shared_ptr<const list_t>>) {
                for (const auto &item: *v)
                    hash_combine(seed, item.hash());
            } else if constexpr (std::is_same_v<T, std::shared_ptr<const map_t>>) {
                for (const auto &[k, item]: *v) {
                    hash_combine(seed, std::hash<std::string> {}(k));
                    hash_combine(seed, item.hash());
                }
            }
        }, _val);
        return seed;
    }

    std::string data_t::to_json() const
    {
        return json::encode(*this);
    }

    data_t string_data(std::string val)
    {
        return data_t { data_fields_t { .string=std::move(val) } };
    }

    data_t number_data(const std::string_view text)
    {
        return data_t { data_fields_t { .number=std::string { text } } };
    }

    data_t boolean_data(const bool val)
    {
        return data_t { data_fields_t { .boolean=val } };
    }

    data_t null_data()
    {
        return data_t { data_fields_t { .null=true } };
    }

    data_t list_data(data_list_t val)
    {
        return data_t { data_fields_t { .list=std::move(val) } };
    }

    data_t map_data(data_map_t val)
    {
        return data_t { data_fields_t { .map=std::move(val) } };
    }
}
