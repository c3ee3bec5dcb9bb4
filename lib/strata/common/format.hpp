#pragma once
/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <optional>
#include <string_view>
#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace strata {
    using fmt::format;
}

namespace fmt {
    template<typename T>
    struct formatter<std::optional<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const std::optional<T> &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            if (v)
                return fmt::format_to(ctx.out(), "{}", *v);
            return fmt::format_to(ctx.out(), "std::nullopt");
        }
    };
}
