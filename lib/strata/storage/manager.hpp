#pragma once
/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <functional>
#include <mutex>
#include <optional>
#include "config.hpp"
#include "database.hpp"

namespace strata::storage {
    struct database_type_t {
        using factory_t = std::function<database_ptr_t(size_t cache_size)>;

        std::string id;
        std::string name;
        factory_t factory;

        [[nodiscard]] params_t load_params() const;
    };

    extern const std::vector<database_type_t> &database_types();
    extern const database_type_t &database_type(std::string_view id);

    enum class manager_event_t {
        started, stopping
    };

    struct pending_change_t {
        std::string type;
        std::vector<std::string> args;
    };

    /*
     * Owns the configuration and the running database.
     * A requested change of the database type is performed at shutdown by copying all data into the new database.
     */
    struct database_manager_t {
        // listeners are called with the manager locked and must not call back into it
        using listener_t = std::function<void(manager_event_t, database_t &)>;

        explicit database_manager_t(std::string config_path);
        ~database_manager_t();
        database_manager_t(const database_manager_t &) = delete;
        database_manager_t &operator=(const database_manager_t &) = delete;

        [[nodiscard]] config_t config() const;
        void add_listener(listener_t listener);
        // returns false when the configured database cannot be loaded
        bool startup();
        [[nodiscard]] bool running() const;
        [[nodiscard]] database_t &database() const;
        // test-loads the new database and records the change when it succeeds
        bool request_change(std::string_view type, const std::vector<std::string> &args);
        [[nodiscard]] std::optional<pending_change_t> pending_change() const;
        // returns false when there was no pending change
        bool cancel_change();
        // returns true when a pending change has been applied
        bool shutdown();
    private:
        mutable std::mutex _mutex {};
        std::string _config_path;
        config_t _config;
        database_ptr_t _db {};
        std::optional<pending_change_t> _change {};
        std::vector<listener_t> _listeners {};

        void _notify(manager_event_t event);
        bool _apply_change(const pending_change_t &change);
    };
}

namespace fmt {
    template<>
    struct formatter<strata::storage::manager_event_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const strata::storage::manager_event_t &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            using namespace strata::storage;
            switch (v) {
                case manager_event_t::started: return fmt::format_to(ctx.out(), "started");
                case manager_event_t::stopping: return fmt::format_to(ctx.out(), "stopping");
                default: throw strata::error(fmt::format("unsupported manager_event_t value: {}", static_cast<int>(v)));
            }
        }
    };
}
