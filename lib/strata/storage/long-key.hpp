#pragma once
/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <string>
#include <string_view>

/*
 * Keys too long for a backend are stored under their blake2b digest.
 * The stored value then carries the full key: the decimal key size, a colon, the key and the value.
 */
namespace strata::storage::long_key {
    struct entry_t {
        std::string key;
        std::string value;
    };

    // the raw 32-byte digest
    extern std::string digest(std::string_view key);
    extern std::string wrap(std::string_view key, std::string_view val);
    // throws err_storage_t on a malformed record
    extern entry_t unwrap(std::string_view data);
    // throws err_storage_t when the record belongs to a different key
    extern std::string unwrap_value(std::string_view key, std::string_view data);
}
