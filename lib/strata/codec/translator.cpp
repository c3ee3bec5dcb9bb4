/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <algorithm>
#include <limits>
#include "translator.hpp"

namespace strata::codec {
    namespace {
        constexpr std::string_view separator { ";" };
        constexpr std::string_view amp_marker { "&amp" };
        constexpr std::string_view separator_marker { "&scln" };
        constexpr std::string_view empty_marker { "&empty" };
        constexpr std::string_view null_marker { "&null" };

        void require_number(const data_t &data)
        {
            if (!data.is_number()) [[unlikely]]
                throw err_translation_t(fmt::format("expected a number but got {}", data.type()));
        }

        std::string unescape(const std::string_view item)
        {
            std::string res {};
            res.reserve(item.size());
            for (size_t pos = 0; pos < item.size();) {
                if (item[pos] != '&') {
                    res += item[pos++];
                } else if (item.substr(pos).starts_with(amp_marker)) {
                    res += '&';
                    pos += amp_marker.size();
                } else if (item.substr(pos).starts_with(separator_marker)) {
                    res += separator;
                    pos += separator_marker.size();
                } else {
                    throw err_translation_t(fmt::format("unknown escape sequence at position {} in a list element: '{}'", pos, item));
                }
            }
            return res;
        }
    }

    std::string encode_list(const std::vector<std::string> &items)
    {
        std::string res {};
        for (const auto &item: items) {
            if (&item != &items.front())
                res += separator;
            if (item.empty()) {
                res += empty_marker;
                continue;
            }
            for (const auto c: item) {
                switch (c) {
                    case '&': res += amp_marker; break;
                    case ';': res += separator_marker; break;
                    default: res += c; break;
                }
            }
        }
        return res;
    }

    std::vector<std::string> decode_list(const std::string_view text)
    {
        std::vector<std::string> res {};
        if (text.empty())
            return res;
        for (size_t start = 0;;) {
            const auto end = std::min(text.find(separator, start), text.size());
            const auto item = text.substr(start, end - start);
            if (item == null_marker) [[unlikely]]
                throw err_translation_t(fmt::format("null list elements are not supported: '{}'", text));
            if (item == empty_marker)
                res.emplace_back();
            else
                res.emplace_back(unescape(item));
            if (end == text.size())
                break;
            start = end + separator.size();
        }
        return res;
    }

    std::string string_translator_t::type_tag() const
    {
        return "string";
    }

    data_t string_translator_t::to_data(const std::string &val) const
    {
        return string_data(val);
    }

    std::string string_translator_t::from_data(const data_t &data) const
    {
        if (!data.is_string()) [[unlikely]]
            throw err_translation_t(fmt::format("expected a string but got {}", data.type()));
        return data.as_string();
    }

    std::string string_translator_t::encode(const std::string &val) const
    {
        return val;
    }

    std::string string_translator_t::decode(const std::string_view text) const
    {
        return std::string { text };
    }

    std::string int64_translator_t::type_tag() const
    {
        return "int64";
    }

    data_t int64_translator_t::to_data(const int64_t &val) const
    {
        return number_data(val);
    }

    int64_t int64_translator_t::from_data(const data_t &data) const
    {
        require_number(data);
        return data.number_integer();
    }

    std::string int16_translator_t::type_tag() const
    {
        return "int16";
    }

    data_t int16_translator_t::to_data(const int16_t &val) const
    {
        return number_data(val);
    }

    int16_t int16_translator_t::from_data(const data_t &data) const
    {
        require_number(data);
        const auto val = std::clamp<int64_t>(data.number_integer(), std::numeric_limits<int16_t>::min(), std::numeric_limits<int16_t>::max());
        return static_cast<int16_t>(val);
    }

    std::string double_translator_t::type_tag() const
    {
        return "double";
    }

    data_t double_translator_t::to_data(const double &val) const
    {
        return number_data(val);
    }

    double double_translator_t::from_data(const data_t &data) const
    {
        require_number(data);
        return data.number_float();
    }

    std::string bool_translator_t::type_tag() const
    {
        return "boolean";
    }

    data_t bool_translator_t::to_data(const bool &val) const
    {
        return boolean_data(val);
    }

    bool bool_translator_t::from_data(const data_t &data) const
    {
        if (!data.is_boolean()) [[unlikely]]
            throw err_translation_t(fmt::format("expected a boolean but got {}", data.type()));
        return data.as_bool();
    }

    std::string data_translator_t::type_tag() const
    {
        return "data";
    }

    data_t data_translator_t::to_data(const data_t &val) const
    {
        return val;
    }

    data_t data_translator_t::from_data(const data_t &data) const
    {
        return data;
    }
}
