/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <filesystem>
#include <mutex>
#include <vector>
#include <strata/common/file.hpp>
#include <strata/common/logger.hpp>
#include "filedb.hpp"
#include "long-key.hpp"

namespace strata::storage::filedb {
    std::string to_hex(const std::string_view bytes)
    {
        static constexpr std::string_view digits { "0123456789ABCDEF" };
        std::string res {};
        res.reserve(bytes.size() * 2);
        for (const auto c: bytes) {
            const auto b = static_cast<uint8_t>(c);
            res += digits[b >> 4U];
            res += digits[b & 0xFU];
        }
        return res;
    }

    static uint8_t hex_nibble(const char c)
    {
        if (c >= '0' && c <= '9')
            return static_cast<uint8_t>(c - '0');
        if (c >= 'A' && c <= 'F')
            return static_cast<uint8_t>(c - 'A' + 10);
        if (c >= 'a' && c <= 'f')
            return static_cast<uint8_t>(c - 'a' + 10);
        throw error(fmt::format("not a hex digit: '{}'", c));
    }

    std::string from_hex(const std::string_view hex)
    {
        if (hex.size() % 2 != 0) [[unlikely]]
            throw error(fmt::format("a hex string must have an even number of digits: '{}'", hex));
        std::string res {};
        res.reserve(hex.size() / 2);
        for (size_t i = 0; i < hex.size(); i += 2)
            res += static_cast<char>((hex_nibble(hex[i]) << 4U) | hex_nibble(hex[i + 1]));
        return res;
    }

    /*
     * Files are spread over 256 subdirectories named by the first byte of the key.
     * Directories are created on first use.
     * A file name is the letter 'k' followed by the hex-encoded key so that the empty key is supported too.
     * Keys too long for a file name are stored in files named 'h' followed by the hex-encoded key digest.
     */
    struct db_t::impl {
        explicit impl(const std::string_view dir_path):
            _dir_path { dir_path }
        {
            std::filesystem::create_directories(_dir_path);
        }

        void clear()
        {
            std::scoped_lock lk { _mutex };
            for (const auto &e: std::filesystem::directory_iterator(_dir_path))
                std::filesystem::remove_all(e.path());
        }

        void erase(const std::string_view key)
        {
            std::scoped_lock lk { _mutex };
            const auto key_path = _key_path(key);
            if (_is_long(key) && std::filesystem::exists(key_path))
                long_key::unwrap_value(key, file::read(key_path.string()));
            std::filesystem::remove(key_path);
        }

        void foreach(const observer_t &obs) const
        {
            std::vector<std::pair<std::string, std::string>> items {};
            {
                std::scoped_lock lk { _mutex };
                for (const auto &e: std::filesystem::recursive_directory_iterator(_dir_path)) {
                    if (!e.is_regular_file())
                        continue;
                    const auto p = e.path();
                    if (p.extension() != "")
                        continue;
                    const auto name = p.filename().string();
                    if (name.starts_with(key_prefix)) {
                        items.emplace_back(from_hex(std::string_view { name }.substr(key_prefix.size())), file::read(p.string()));
                    } else if (name.starts_with(long_key_prefix)) {
                        auto entry = long_key::unwrap(file::read(p.string()));
                        items.emplace_back(std::move(entry.key), std::move(entry.value));
                    } else [[unlikely]] {
                        logger::warn("filedb: ignoring an unexpected file: {}", p.string());
                    }
                }
            }
            for (auto &&[k, v]: items)
                obs(std::move(k), std::move(v));
        }

        value_t get(const std::string_view key) const
        {
            std::scoped_lock lk { _mutex };
            const auto key_path = _key_path(key);
            if (!std::filesystem::exists(key_path))
                return {};
            auto data = file::read(key_path.string());
            if (_is_long(key))
                return long_key::unwrap_value(key, data);
            return data;
        }

        void set(const std::string_view key, const std::string_view val)
        {
            std::scoped_lock lk { _mutex };
            const auto final_path = _key_path(key);
            const auto tmp_path = final_path.string() + ".tmp";
            // write into a temporary file + rename ensures partial values are never kept/returned.
            if (_is_long(key)) {
                if (std::filesystem::exists(final_path))
                    long_key::unwrap_value(key, file::read(final_path.string()));
                file::write(tmp_path, long_key::wrap(key, val));
            } else {
                file::write(tmp_path, val);
            }
            std::filesystem::rename(tmp_path, final_path);
        }

        size_t size() const
        {
            std::scoped_lock lk { _mutex };
            size_t num_keys = 0;
            for (const auto &e: std::filesystem::recursive_directory_iterator(_dir_path)) {
                if (e.is_regular_file() && e.path().extension() == "")
                    ++num_keys;
            }
            return num_keys;
        }
    private:
        static constexpr std::string_view key_prefix { "k" };
        static constexpr std::string_view long_key_prefix { "h" };
        // keeps file names well below the common limit of 255 bytes
        static constexpr size_t max_short_key_size = 100;
        std::filesystem::path _dir_path;
        mutable std::mutex _mutex {};

        static bool _is_long(const std::string_view key)
        {
            return key.size() > max_short_key_size;
        }

        std::filesystem::path _key_path(const std::string_view key) const
        {
            const uint8_t byte0 = key.empty() ? 0 : static_cast<uint8_t>(key.front());
            const auto dir = _dir_path / fmt::format("{:02X}", byte0);
            if (_is_long(key))
                return dir / fmt::format("{}{}", long_key_prefix, to_hex(long_key::digest(key)));
            return dir / fmt::format("{}{}", key_prefix, to_hex(key));
        }
    };

    db_t::db_t(const std::string_view dir_path):
        _impl { std::make_unique<impl>(dir_path) }
    {
    }

    db_t::~db_t() = default;

    void db_t::clear()
    {
        _impl->clear();
    }

    void db_t::erase(const std::string_view key)
    {
        _impl->erase(key);
    }

    void db_t::foreach(const observer_t &obs) const
    {
        _impl->foreach(obs);
    }

    value_t db_t::get(const std::string_view key) const
    {
        return _impl->get(key);
    }

    void db_t::set(const std::string_view key, const std::string_view val)
    {
        _impl->set(key, val);
    }

    size_t db_t::size() const
    {
        return _impl->size();
    }
}
