#pragma once
/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include "error.hpp"

namespace strata {
    // A caller violated a documented precondition: bad argument, incompatible translator, name reuse
    struct err_argument_t final: error {
        using error::error;
    };

    // An operation is not allowed in the current lifecycle state of a database or its views
    struct err_state_t final: error {
        using error::error;
    };

    // A value cannot be represented in the target encoding
    struct err_translation_t final: error {
        using error::error;
    };

    // The backing store rejected or failed an operation or returned undecodable data
    struct err_storage_t final: error {
        using error::error;
    };
}
