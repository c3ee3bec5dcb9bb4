#pragma once
/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <stdexcept>
#include <string>
#include <string_view>

namespace strata {
    /*
     * The root of the exceptions thrown by Strata.
     * A wrapping error appends the type and the message of its cause to its own message.
     */
    struct error: std::exception {
        explicit error(std::string_view msg);
        explicit error(std::string_view msg, const std::exception &cause);
        const char *what() const noexcept override;
        // the message of the wrapped exception, empty when there is none
        const std::string &cause() const noexcept;
    private:
        std::string _msg;
        std::string _cause {};
    };

    // Appends errno and its description
    struct error_sys: error {
        explicit error_sys(std::string_view msg);
    };
}
