#pragma once
/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <exception>
#include <functional>
#include <source_location>

#if defined(__GNUC__) && !defined(__clang__)
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Warray-bounds"
#   pragma GCC diagnostic ignored "-Wstringop-overflow"
#endif
#ifndef SPDLOG_FMT_EXTERNAL
#   define SPDLOG_FMT_EXTERNAL 1
#endif
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#if defined(__GNUC__) && !defined(__clang__)
#   pragma GCC diagnostic pop
#endif
#include "format.hpp"

/*
 * A process-wide logger writing to the file given by STRATA_LOG and, unless STRATA_LOG_NO_CONSOLE is set, to stderr.
 * STRATA_DEBUG enables the trace level.
 */
namespace strata::logger {
    using level = spdlog::level::level_enum;
    using action = std::function<void()>;

    extern std::string log_path();
    extern bool tracing_enabled();
    extern spdlog::logger create(const std::string &path);

    inline spdlog::logger &get()
    {
        static spdlog::logger logger = create(log_path());
        return logger;
    }

    template<typename... Args>
    void log(const level lev, const std::string_view &fmt, Args&&... a)
    {
        // messages below the logger's level are not formatted
        auto &l = get();
        if (l.should_log(lev))
            l.log(lev, format(fmt::runtime(fmt), std::forward<Args>(a)...));
    }

    template<typename... Args>
    void trace(const std::string_view &fmt, Args&&... a)
    {
        log(level::trace, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void debug(const std::string_view &fmt, Args&&... a)
    {
        log(level::debug, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void info(const std::string_view &fmt, Args&&... a)
    {
        log(level::info, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void warn(const std::string_view &fmt, Args&&... a)
    {
        log(level::warn, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void error(const std::string_view &fmt, Args&&... a)
    {
        log(level::err, fmt, std::forward<Args>(a)...);
    }

    // logs and returns the exception thrown by main; cleanup, when given, runs in both cases
    extern std::exception_ptr run_log_errors(const action &main, const action &cleanup={},
        const std::source_location &loc=std::source_location::current());
    extern void run_log_errors_rethrow(const action &main, const action &cleanup={},
        const std::source_location &loc=std::source_location::current());
}
