#pragma once
/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <strata/common/error.hpp>

namespace strata::crypto::sodium {
    extern "C" {
#       include <sodium.h>
    }

    // safe to call any number of times, libsodium is initialized only on the first call
    extern void ensure_initialized();
}
