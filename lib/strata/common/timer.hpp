#pragma once
/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <chrono>
#include <string>
#include "logger.hpp"

namespace strata {
    struct timer {
        explicit timer(const std::string_view title, const logger::level lev=logger::level::debug):
            _title { title }, _level { lev }
        {
        }

        ~timer()
        {
            if (!_stopped)
                stop();
        }

        timer(const timer &) = delete;
        timer &operator=(const timer &) = delete;

        // seconds since the construction
        [[nodiscard]] double duration() const
        {
            return std::chrono::duration<double> { std::chrono::steady_clock::now() - _start }.count();
        }

        double stop(const bool report=true)
        {
            const auto secs = duration();
            if (!_stopped) {
                _stopped = true;
                if (report)
                    logger::log(_level, "timer '{}' took {:0.3f} secs", _title, secs);
            }
            return secs;
        }
    private:
        std::string _title;
        logger::level _level;
        std::chrono::time_point<std::chrono::steady_clock> _start = std::chrono::steady_clock::now();
        bool _stopped = false;
    };
}
