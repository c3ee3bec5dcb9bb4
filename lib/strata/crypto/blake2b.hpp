#pragma once
/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <array>
#include <cstdint>
#include <string_view>

namespace strata::crypto::blake2b {
    using hash_t = std::array<uint8_t, 32>;

    extern hash_t digest(std::string_view in);
}
