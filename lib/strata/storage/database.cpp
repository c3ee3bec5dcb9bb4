/* This file is part of Strata project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <algorithm>
#include <strata/common/logger.hpp>
#include "database.hpp"

namespace strata::storage {
    database_t::database_t(const size_t cache_size):
        _cache_size { cache_size }
    {
        if (_cache_size == 0) [[unlikely]]
            throw err_argument_t("cache size must be positive");
    }

    database_t::~database_t() = default;

    params_t database_t::load_params() const
    {
        std::scoped_lock lk { _mutex };
        _check_open();
        return _load_params();
    }

    bool database_t::load(const std::vector<std::string> &args)
    {
        std::scoped_lock lk { _mutex };
        switch (_state) {
            case state_t::loaded: throw err_state_t("the database has already been loaded");
            case state_t::closed: throw err_state_t("a closed database cannot be reused");
            default: break;
        }
        const auto params = _load_params();
        if (args.size() != params.size()) [[unlikely]]
            throw err_argument_t(fmt::format("expected {} load parameters but got {}", params.size(), args.size()));
        for (size_t i = 0; i < params.size(); ++i) {
            const auto &choices = params[i].choices;
            if (!choices.empty() && std::find(choices.begin(), choices.end(), args[i]) == choices.end()) [[unlikely]]
                throw err_argument_t(fmt::format("'{}' is not a valid value of {}; the choices are: {}", args[i], params[i].name, choices));
        }
        try {
            _load(args);
        } catch (const err_argument_t &) {
            throw;
        } catch (const std::exception &ex) {
            logger::error("failed to open the backing store with {}: {}", args, ex.what());
            return false;
        }
        _state = state_t::loaded;
        logger::debug("loaded a database with {}", args);
        return true;
    }

    void database_t::close()
    {
        std::scoped_lock lk { _mutex };
        switch (_state) {
            case state_t::unloaded: throw err_state_t("the database has not been loaded");
            case state_t::closed:
                logger::warn("the database has already been closed");
                return;
            default: break;
        }
        _state = state_t::closed;
        _guard->close();
        for (const auto &[name, entry]: _views)
            entry.view->flush_cache();
        logger::debug("closing a database with {} views; {}", _views.size(), *_stats);
        _views.clear();
        _release();
    }

    bool database_t::loaded() const
    {
        std::scoped_lock lk { _mutex };
        return _state == state_t::loaded;
    }

    bool database_t::closed() const
    {
        std::scoped_lock lk { _mutex };
        return _state == state_t::closed;
    }

    size_t database_t::cache_size() const
    {
        std::scoped_lock lk { _mutex };
        _check_open();
        return _cache_size;
    }

    size_t database_t::size() const
    {
        std::scoped_lock lk { _mutex };
        _check_loaded();
        return _views.size();
    }

    std::vector<std::string> database_t::tree_names() const
    {
        return _names(view_kind_t::tree);
    }

    std::vector<std::string> database_t::map_names() const
    {
        return _names(view_kind_t::map);
    }

    void database_t::copy_data(const database_t &other)
    {
        if (&other == this) [[unlikely]]
            throw err_argument_t("a database cannot copy data from itself");
        {
            std::scoped_lock lk { _mutex };
            _check_loaded();
            if (!_views.empty()) [[unlikely]]
                throw err_state_t(fmt::format("copying requires no checked-out views but there are {}", _views.size()));
        }
        std::vector<std::pair<std::string, view_entry_t>> src_views {};
        {
            std::scoped_lock lk { other._mutex };
            other._check_loaded();
            src_views.assign(other._views.begin(), other._views.end());
        }
        timer t { "storage copy_data", logger::level::info };
        for (const auto &[name, entry]: src_views) {
            size_t num_copied = 0;
            switch (entry.kind) {
                case view_kind_t::map: {
                    const auto dst = data_map(name);
                    entry.raw_map->foreach([&](const auto &k, const auto &v) {
                        if (!dst->contains(k)) {
                            dst->put(k, v);
                            ++num_copied;
                        }
                    });
                    break;
                }
                case view_kind_t::tree: {
                    const auto dst = data_tree(name);
                    entry.raw_tree->foreach([&](const auto &p, const auto &v) {
                        if (dst->add(v, p))
                            ++num_copied;
                    });
                    break;
                }
                default: throw error(fmt::format("unsupported view kind: {}", static_cast<int>(entry.kind)));
            }
            logger::info("copied {} entries of {} '{}'", num_copied, entry.kind, name);
        }
    }

    stats_t &database_t::stats()
    {
        std::scoped_lock lk { _mutex };
        _check_loaded();
        return *_stats;
    }

    void database_t::_check_loaded() const
    {
        switch (_state) {
            case state_t::unloaded: throw err_state_t("the database has not been loaded");
            case state_t::closed: throw err_state_t("the database has been closed");
            default: break;
        }
    }

    void database_t::_check_open() const
    {
        if (_state == state_t::closed) [[unlikely]]
            throw err_state_t("the database has been closed");
    }

    std::vector<std::string> database_t::_names(const view_kind_t kind) const
    {
        std::scoped_lock lk { _mutex };
        _check_loaded();
        std::vector<std::string> names {};
        for (const auto &[name, entry]: _views) {
            if (entry.kind == kind)
                names.emplace_back(name);
        }
        return names;
    }
}
