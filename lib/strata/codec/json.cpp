/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <cmath>
#include <exception>
#include <limits>
#include <sstream>
#include <boost/json/basic_parser_impl.hpp>
#include <strata/common/file.hpp>
#include "json.hpp"

namespace strata::codec::json {
    namespace {
        void encode_to(std::string &out, const data_t &val)
        {
            switch (val.type()) {
                case data_type_t::string:
                    out += serialize(string_view { val.as_string() });
                    break;
                case data_type_t::number:
                    out += val.number();
                    break;
                case data_type_t::boolean:
                    out += val.as_bool() ? "true" : "false";
                    break;
                case data_type_t::null:
                    out += "null";
                    break;
                case data_type_t::list: {
                    out += '[';
                    bool first = true;
                    for (const auto &item: val.list()) {
                        if (!first)
                            out += ',';
                        first = false;
                        encode_to(out, item);
                    }
                    out += ']';
                    break;
                }
                case data_type_t::map: {
                    out += '{';
                    bool first = true;
                    for (const auto &[k, item]: val.map()) {
                        if (!first)
                            out += ',';
                        first = false;
                        out += serialize(string_view { k });
                        out += ':';
                        encode_to(out, item);
                    }
                    out += '}';
                    break;
                }
                default:
                    throw err_translation_t(fmt::format("unsupported data type: {}", static_cast<int>(val.type())));
            }
        }

        // Rebuilds data_t from the parser's event stream keeping the original text of numbers
        struct data_handler {
            static constexpr size_t max_object_size = std::numeric_limits<size_t>::max();
            static constexpr size_t max_array_size = std::numeric_limits<size_t>::max();
            static constexpr size_t max_key_size = std::numeric_limits<size_t>::max();
            static constexpr size_t max_string_size = std::numeric_limits<size_t>::max();

            std::optional<data_t> result {};
            std::exception_ptr exception {};

            bool on_document_begin(error_code &)
            {
                return true;
            }

            bool on_document_end(error_code &)
            {
                return true;
            }

            bool on_array_begin(error_code &)
            {
                _frames.emplace_back(false);
                return true;
            }

            bool on_array_end(std::size_t, error_code &ec)
            {
                return _guard(ec, [&] {
                    auto list = std::move(_frames.back().list);
                    _frames.pop_back();
                    _emit(list_data(std::move(list)));
                });
            }

            bool on_object_begin(error_code &)
            {
                _frames.emplace_back(true);
                return true;
            }

            bool on_object_end(std::size_t, error_code &ec)
            {
                return _guard(ec, [&] {
                    auto map = std::move(_frames.back().map);
                    _frames.pop_back();
                    _emit(map_data(std::move(map)));
                });
            }

            bool on_string_part(const string_view s, std::size_t, error_code &)
            {
                _text.append(s.data(), s.size());
                return true;
            }

            bool on_string(const string_view s, std::size_t, error_code &ec)
            {
                return _guard(ec, [&] {
                    _text.append(s.data(), s.size());
                    auto str = std::move(_text);
                    _text.clear();
                    _emit(string_data(std::move(str)));
                });
            }

            bool on_key_part(const string_view s, std::size_t, error_code &)
            {
                _text.append(s.data(), s.size());
                return true;
            }

            bool on_key(const string_view s, std::size_t, error_code &)
            {
                _text.append(s.data(), s.size());
                _frames.back().key = std::move(_text);
                _text.clear();
                return true;
            }

            bool on_number_part(const string_view s, error_code &)
            {
                _text.append(s.data(), s.size());
                return true;
            }

            bool on_int64(int64_t, const string_view s, error_code &ec)
            {
                return _on_number(s, ec);
            }

            bool on_uint64(uint64_t, const string_view s, error_code &ec)
            {
                return _on_number(s, ec);
            }

            bool on_double(const double d, const string_view s, error_code &ec)
            {
                return _guard(ec, [&] {
                    _text.append(s.data(), s.size());
                    auto num = std::move(_text);
                    _text.clear();
                    // literals out of the double range keep their text
                    if (valid_number(num))
                        _emit(number_data(std::string_view { num }));
                    else
                        _emit(number_data(d));
                });
            }

            bool on_bool(const bool b, error_code &ec)
            {
                return _guard(ec, [&] { _emit(boolean_data(b)); });
            }

            bool on_null(error_code &ec)
            {
                return _guard(ec, [&] { _emit(null_data()); });
            }

            bool on_comment_part(string_view, error_code &)
            {
                return true;
            }

            bool on_comment(string_view, error_code &)
            {
                return true;
            }
        private:
            struct frame_t {
                bool is_map;
                data_list_t list {};
                data_map_t map {};
                std::string key {};

                explicit frame_t(const bool is_map_):
                    is_map { is_map_ }
                {
                }
            };

            std::vector<frame_t> _frames {};
            std::string _text {};

            template<typename F>
            bool _guard(error_code &ec, const F &action)
            {
                try {
                    action();
                    return true;
                } catch (const std::exception &) {
                    exception = std::current_exception();
                    ec = make_error_code(boost::json::error::exception);
                    return false;
                }
            }

            bool _on_number(const string_view s, error_code &ec)
            {
                return _guard(ec, [&] {
                    _text.append(s.data(), s.size());
                    auto num = std::move(_text);
                    _text.clear();
                    _emit(number_data(std::string_view { num }));
                });
            }

            void _emit(data_t &&val)
            {
                if (_frames.empty()) {
                    result.emplace(std::move(val));
                    return;
                }
                auto &f = _frames.back();
                if (f.is_map) {
                    // duplicate keys: the last one wins
                    f.map.insert_or_assign(std::move(f.key), std::move(val));
                    f.key.clear();
                } else {
                    f.list.emplace_back(std::move(val));
                }
            }
        };

        bool is_space(const char c)
        {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r';
        }
    }

    std::string encode(const data_t &val)
    {
        std::string out {};
        encode_to(out, val);
        return out;
    }

    data_t decode(const std::string_view text)
    {
        parse_options opts {};
        opts.allow_infinity_and_nan = true;
        // encode accepts any nesting and any string bytes
        opts.max_depth = std::numeric_limits<size_t>::max();
        opts.allow_invalid_utf8 = true;
        basic_parser<data_handler> p { opts };
        error_code ec {};
        const auto consumed = p.write_some(false, text.data(), text.size(), ec);
        if (p.handler().exception) {
            try {
                std::rethrow_exception(p.handler().exception);
            } catch (const std::exception &ex) {
                throw err_translation_t(fmt::format("invalid JSON data: '{}'", text), ex);
            }
        }
        if (ec) [[unlikely]]
            throw err_translation_t(fmt::format("invalid JSON data: '{}': {}", text, ec.message()));
        if (!p.done() || !p.handler().result) [[unlikely]]
            throw err_translation_t(fmt::format("incomplete JSON data: '{}'", text));
        for (size_t i = consumed; i < text.size(); ++i) {
            if (!is_space(text[i])) [[unlikely]]
                throw err_translation_t(fmt::format("unexpected trailing data at position {}: '{}'", i, text));
        }
        return std::move(*p.handler().result);
    }

    value parse(const std::string_view text)
    {
        return boost::json::parse(text);
    }

    value load(const std::string &path)
    {
        return parse(file::read(path));
    }

    void save_pretty(std::ostream& os, value const &jv, std::string *indent)
    {
        static constexpr size_t indent_step = 2;
        std::string indent_ {};
        if(!indent)
            indent = &indent_;
        switch (jv.kind()) {
            case kind::object: {
                const auto &obj = jv.get_object();
                if (obj.empty()) {
                    os << "{}";
                    break;
                }
                os << "{\n";
                indent->append(indent_step, ' ');
                for (auto it = obj.begin(), last = std::prev(obj.end()); it != obj.end(); ++it) {
                    os << *indent << json::serialize(it->key()) << ": ";
                    save_pretty(os, it->value(), indent);
                    if (it != last)
                        os << ',';
                    os << '\n';
                }
                indent->resize(indent->size() - indent_step);
                os << *indent << "}";
                break;
            }
            case kind::array: {
                const auto &arr = jv.get_array();
                if (arr.empty()) {
                    os << "[]";
                    break;
                }
                os << "[\n";
                indent->append(indent_step, ' ');
                for (auto it = arr.begin(), last = std::prev(arr.end()); it != arr.end(); ++it) {
                    os << *indent;
                    save_pretty(os, *it, indent);
                    if (it != last)
                        os << ',';
                    os << '\n';
                }
                indent->resize(indent->size() - indent_step);
                os << *indent << "]";
                break;
            }
            case kind::string:
                os << serialize(jv.get_string());
                break;
            case kind::uint64:
                os << jv.get_uint64();
                break;
            case kind::int64:
                os << jv.get_int64();
                break;
            case kind::double_:
                os << serialize(jv);
                break;
            case kind::bool_:
                if(jv.get_bool())
                    os << "true";
                else
                    os << "false";
                break;
            case kind::null:
                os << "null";
                break;
        }
    }

    std::string serialize_pretty(const value &jv)
    {
        std::ostringstream ss {};
        save_pretty(ss, jv);
        return ss.str();
    }

    void save_pretty(const std::string &path, const value &jv)
    {
        file::write(path, serialize_pretty(jv));
    }
}
