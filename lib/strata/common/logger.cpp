/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include "error.hpp"
#include "file.hpp"
#include "logger.hpp"

namespace strata::logger {
    bool tracing_enabled()
    {
        static const bool enabled = std::getenv("STRATA_DEBUG") != nullptr;
        return enabled;
    }

    std::string log_path()
    {
        if (const char *env_log_path = std::getenv("STRATA_LOG"); env_log_path)
            return env_log_path;
        return file::install_path("log/strata.log");
    }

    static bool console_enabled()
    {
        return !std::getenv("STRATA_LOG_NO_CONSOLE");
    }

    spdlog::logger create(const std::string &path)
    {
        std::cerr << fmt::format("INIT: log path: {}\n", path);
        {
            if (const auto parent = std::filesystem::path { path }.parent_path(); !parent.empty())
                std::filesystem::create_directories(parent);
            std::ofstream os { path, std::ios_base::app };
            if (!os) {
                std::cerr << fmt::format("INIT: Unable to write to the log file: {}; terminating.\n", path);
                std::terminate();
            }
        }

        std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink {};
        if (console_enabled()) {
            console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(spdlog::level::info);
            console_sink->set_pattern("[%^%l%$] %v");
        }
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path);
        file_sink->set_level(spdlog::level::trace);
        file_sink->set_pattern("[%Y-%m-%d %T %z] [%P:%t] [%n] [%l] %v");
        auto logger = console_sink
            ? spdlog::logger("strata", { file_sink, console_sink })
            : spdlog::logger("strata", { file_sink });
        if (tracing_enabled()) {
            logger.set_level(spdlog::level::trace);
        } else {
            logger.set_level(spdlog::level::debug);
        }
        logger.flush_on(spdlog::level::debug);
        logger.log(spdlog::level::debug, fmt::format("Installation directory: {}", file::install_path("")));
        return logger;
    }

    std::exception_ptr run_log_errors(const action &main, const action &cleanup, const std::source_location &loc)
    {
        std::exception_ptr cur_ex {};
        try {
            main();
        } catch (const std::exception &ex) {
            cur_ex = std::current_exception();
            error("{}:{}: {}", loc.file_name(), loc.line(), ex.what());
        } catch (...) {
            cur_ex = std::current_exception();
            error("{}:{}: an unknown exception", loc.file_name(), loc.line());
        }
        if (cleanup) {
            try {
                cleanup();
            } catch (const std::exception &ex) {
                error("{}:{}: cleanup failed: {}", loc.file_name(), loc.line(), ex.what());
                if (!cur_ex)
                    cur_ex = std::current_exception();
            }
        }
        return cur_ex;
    }

    void run_log_errors_rethrow(const action &main, const action &cleanup, const std::source_location &loc)
    {
        if (const auto cur_ex = run_log_errors(main, cleanup, loc))
            std::rethrow_exception(cur_ex);
    }
}
