/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <strata/common/logger.hpp>
#include "manager.hpp"
#include "table-database.hpp"

namespace strata::storage {
    params_t database_type_t::load_params() const
    {
        return factory(1)->load_params();
    }

    const std::vector<database_type_t> &database_types()
    {
        static std::vector<database_type_t> types {
            { "memory", "In-process memory", [](const size_t cache_size) { return std::make_shared<memory_database_t>(cache_size); } },
            { "file", "Local files", [](const size_t cache_size) { return std::make_shared<file_database_t>(cache_size); } },
            { "lmdb", "LMDB", [](const size_t cache_size) { return std::make_shared<lmdb_database_t>(cache_size); } }
        };
        return types;
    }

    const database_type_t &database_type(const std::string_view id)
    {
        for (const auto &type: database_types()) {
            if (type.id == id)
                return type;
        }
        throw err_argument_t(fmt::format("unknown database type: '{}'", id));
    }

    database_manager_t::database_manager_t(std::string config_path):
        _config_path { std::move(config_path) },
        _config { config_t::load(_config_path) }
    {
    }

    database_manager_t::~database_manager_t()
    {
        if (_db) {
            logger::run_log_errors([&] {
                logger::warn("the database manager is destroyed while the database is running");
                _db->close();
            });
        }
    }

    config_t database_manager_t::config() const
    {
        std::scoped_lock lk { _mutex };
        return _config;
    }

    void database_manager_t::add_listener(listener_t listener)
    {
        if (!listener) [[unlikely]]
            throw err_argument_t("a listener must not be empty");
        std::scoped_lock lk { _mutex };
        _listeners.emplace_back(std::move(listener));
    }

    bool database_manager_t::startup()
    {
        std::scoped_lock lk { _mutex };
        if (_db) [[unlikely]]
            throw err_state_t("the database is already running");
        logger::info("starting a {} database with {}", _config.database_type, _config.database_args);
        auto db = database_type(_config.database_type).factory(_config.cache_size);
        if (!db->load(_config.database_args)) {
            logger::error("could not start the {} database", _config.database_type);
            return false;
        }
        _db = std::move(db);
        _notify(manager_event_t::started);
        return true;
    }

    bool database_manager_t::running() const
    {
        std::scoped_lock lk { _mutex };
        return static_cast<bool>(_db);
    }

    database_t &database_manager_t::database() const
    {
        std::scoped_lock lk { _mutex };
        if (!_db) [[unlikely]]
            throw err_state_t("the database is not running");
        return *_db;
    }

    bool database_manager_t::request_change(const std::string_view type, const std::vector<std::string> &args)
    {
        std::scoped_lock lk { _mutex };
        logger::debug("received a request to change the database to {} with {}", type, args);
        const auto &db_type = database_type(type);
        const auto db = db_type.factory(_config.cache_size);
        if (!db->load(args))
            return false;
        db->close();
        _change = pending_change_t { db_type.id, args };
        logger::info("the database will change to {} at shutdown", db_type.id);
        return true;
    }

    std::optional<pending_change_t> database_manager_t::pending_change() const
    {
        std::scoped_lock lk { _mutex };
        return _change;
    }

    bool database_manager_t::cancel_change()
    {
        std::scoped_lock lk { _mutex };
        if (!_change)
            return false;
        _change.reset();
        logger::info("the database change has been cancelled");
        return true;
    }

    bool database_manager_t::shutdown()
    {
        std::scoped_lock lk { _mutex };
        if (!_db) [[unlikely]]
            throw err_state_t("the database is not running");
        _notify(manager_event_t::stopping);
        bool changed = false;
        if (_change) {
            const auto change = std::move(*_change);
            _change.reset();
            changed = _apply_change(change);
        }
        auto db = std::move(_db);
        db->close();
        logger::info("the database has been shut down");
        return changed;
    }

    void database_manager_t::_notify(const manager_event_t event)
    {
        for (const auto &listener: _listeners) {
            logger::run_log_errors([&] {
                listener(event, *_db);
            });
        }
    }

    bool database_manager_t::_apply_change(const pending_change_t &change)
    {
        logger::info("changing the database to {} with {}", change.type, change.args);
        const auto new_db = database_type(change.type).factory(_config.cache_size);
        if (!new_db->load(change.args)) {
            logger::error("could not load the new {} database; the change is aborted", change.type);
            return false;
        }
        try {
            new_db->copy_data(*_db);
        } catch (const error &ex) {
            logger::error("could not copy the data into the new {} database; the change is aborted: {}", change.type, ex.what());
            new_db->close();
            return false;
        }
        new_db->close();
        _config.database_type = change.type;
        _config.database_args = change.args;
        _config.save(_config_path);
        logger::info("the database has been changed to {}", change.type);
        return true;
    }
}
