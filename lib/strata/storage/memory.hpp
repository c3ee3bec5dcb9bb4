#pragma once
/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include "common.hpp"

namespace strata::storage::memory {
    struct db_t: storage::db_t {
        explicit db_t();
        ~db_t() override;
        void clear() override;
        void erase(std::string_view key) override;
        void foreach(const observer_t &) const override;
        value_t get(std::string_view key) const override;
        void set(std::string_view key, std::string_view val) override;
        [[nodiscard]] size_t size() const override;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
}
