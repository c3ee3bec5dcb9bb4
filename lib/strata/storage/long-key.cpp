/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <charconv>
#include <strata/common/errors.hpp>
#include <strata/common/format.hpp>
#include <strata/crypto/blake2b.hpp>
#include "long-key.hpp"

namespace strata::storage::long_key {
    std::string digest(const std::string_view key)
    {
        const auto h = crypto::blake2b::digest(key);
        return { reinterpret_cast<const char *>(h.data()), h.size() };
    }

    std::string wrap(const std::string_view key, const std::string_view val)
    {
        std::string res = fmt::format("{}:", key.size());
        res.reserve(res.size() + key.size() + val.size());
        res += key;
        res += val;
        return res;
    }

    entry_t unwrap(const std::string_view data)
    {
        const auto sep = data.find(':');
        if (sep == std::string_view::npos) [[unlikely]]
            throw err_storage_t("long key record: no key size");
        size_t key_size = 0;
        const auto [ptr, ec] = std::from_chars(data.data(), data.data() + sep, key_size);
        if (ec != std::errc {} || ptr != data.data() + sep || data.size() - sep - 1 < key_size) [[unlikely]]
            throw err_storage_t(fmt::format("long key record: invalid key size: '{}'", data.substr(0, sep)));
        const auto rest = data.substr(sep + 1);
        return { std::string { rest.substr(0, key_size) }, std::string { rest.substr(key_size) } };
    }

    std::string unwrap_value(const std::string_view key, const std::string_view data)
    {
        auto e = unwrap(data);
        if (e.key != key) [[unlikely]]
            throw err_storage_t(fmt::format("long key record: a digest collision between keys of {} and {} bytes", key.size(), e.key.size()));
        return std::move(e.value);
    }
}
