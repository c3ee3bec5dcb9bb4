/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <cstdio>
#include <memory>
#include "file.hpp"

namespace strata::file {
    namespace {
        struct file_closer {
            void operator()(std::FILE *f) const
            {
                std::fclose(f);
            }
        };
        using file_ptr = std::unique_ptr<std::FILE, file_closer>;
    }

    std::string read(const std::string &path)
    {
        file_ptr f { std::fopen(path.c_str(), "rb") };
        if (!f) [[unlikely]]
            throw error_sys(fmt::format("failed to open {} for reading", path));
        const auto size = std::filesystem::file_size(path);
        std::string res(size, '\0');
        if (size > 0 && std::fread(res.data(), 1, res.size(), f.get()) != res.size()) [[unlikely]]
            throw error_sys(fmt::format("failed to read {} bytes from {}", size, path));
        return res;
    }

    void write(const std::string &path, const std::string_view data)
    {
        if (const auto parent = std::filesystem::path { path }.parent_path(); !parent.empty())
            std::filesystem::create_directories(parent);
        file_ptr f { std::fopen(path.c_str(), "wb") };
        if (!f) [[unlikely]]
            throw error_sys(fmt::format("failed to open {} for writing", path));
        if (!data.empty() && std::fwrite(data.data(), 1, data.size(), f.get()) != data.size()) [[unlikely]]
            throw error_sys(fmt::format("failed to write {} bytes to {}", data.size(), path));
        if (std::fflush(f.get()) != 0) [[unlikely]]
            throw error_sys(fmt::format("failed to flush {}", path));
    }

    std::string install_path(const std::string_view rel_path)
    {
        // relative to the working directory until packaging defines an installation prefix
        return fmt::format("./{}", rel_path);
    }
}
