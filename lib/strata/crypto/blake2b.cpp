/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include "blake2b.hpp"
#include "sodium.hpp"

namespace strata::crypto::blake2b {
    hash_t digest(const std::string_view in)
    {
        sodium::ensure_initialized();
        hash_t out;
        if (sodium::crypto_generichash(out.data(), out.size(), reinterpret_cast<const unsigned char *>(in.data()), in.size(), nullptr, 0) != 0) [[unlikely]]
            throw error("libsodium: blake2b digest failed");
        return out;
    }
}
