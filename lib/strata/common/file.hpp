#pragma once
/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <filesystem>
#include <string>
#include <string_view>
#include "error.hpp"
#include "format.hpp"

namespace strata::file {
    extern std::string read(const std::string &path);
    extern void write(const std::string &path, std::string_view data);
    extern std::string install_path(std::string_view rel_path);

    inline std::filesystem::path tmp_path(const std::string_view name)
    {
        return std::filesystem::temp_directory_path() / name;
    }

    // Removes the file on destruction
    struct tmp {
        explicit tmp(const std::string_view name):
            _path { tmp_path(name).string() }
        {
            std::filesystem::remove(_path);
        }

        ~tmp()
        {
            std::error_code ec {};
            std::filesystem::remove(_path, ec);
        }

        tmp(const tmp &) = delete;
        tmp &operator=(const tmp &) = delete;

        const std::string &path() const
        {
            return _path;
        }
    private:
        std::string _path;
    };

    // Creates an empty directory and removes it with all its contents on destruction
    struct tmp_directory {
        explicit tmp_directory(const std::string_view name):
            _path { tmp_path(name).string() }
        {
            std::filesystem::remove_all(_path);
            std::filesystem::create_directories(_path);
        }

        ~tmp_directory()
        {
            std::error_code ec {};
            std::filesystem::remove_all(_path, ec);
        }

        tmp_directory(const tmp_directory &) = delete;
        tmp_directory &operator=(const tmp_directory &) = delete;

        const std::string &path() const
        {
            return _path;
        }
    private:
        std::string _path;
    };
}
