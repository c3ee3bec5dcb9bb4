/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include "sodium.hpp"

namespace strata::crypto::sodium {
    void ensure_initialized()
    {
        struct initializer_t {
            initializer_t()
            {
                if (sodium_init() == -1) [[unlikely]]
                    throw error("libsodium: initialization failed");
            }
        };
        static initializer_t init {};
    }
}
