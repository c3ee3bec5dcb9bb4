/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <cerrno>
#include <cstring>
#include <typeinfo>
#include "error.hpp"
#include "format.hpp"

namespace strata {
    error::error(const std::string_view msg):
        _msg { msg }
    {
    }

    error::error(const std::string_view msg, const std::exception &cause):
        _msg { fmt::format("{} caused by {}: {}", msg, typeid(cause).name(), cause.what()) },
        _cause { cause.what() }
    {
    }

    const char *error::what() const noexcept
    {
        return _msg.c_str();
    }

    const std::string &error::cause() const noexcept
    {
        return _cause;
    }

    error_sys::error_sys(const std::string_view msg):
        error { fmt::format("{} errno: {} strerror: {}", msg, errno, std::strerror(errno)) }
    {
    }
}
