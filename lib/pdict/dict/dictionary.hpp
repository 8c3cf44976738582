#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <pdict/common/logger.hpp>
#include "config.hpp"
#include "cursor-pool.hpp"
#include "enumerator.hpp"

namespace pdict::dict {
    // A durable ordered dictionary stored in an LMDB environment inside the given directory.
    //
    // Every operation borrows a cursor from the pool and returns it on exit. Reads take no lock and wrap
    // seek and retrieve in a short read-only transaction, so a successful seek always implies a successful
    // retrieve. Mutations are serialized by a single per-dictionary mutex held for exactly one operation:
    // two mutations never run at the same time, and checking a row and then changing it is race-free.
    //
    // Views returned by keys(), values(), entries() and range() borrow the dictionary: a scan started
    // after close() throws, and a view must not outlive the dictionary object.
    // close() and the destructor must not run concurrently with any other operation or with live iterators.
    template<persistable K, persistable V>
    struct dictionary_t {
        using key_type = K;
        using mapped_type = V;
        using value_type = std::pair<K, V>;
        using cursor_type = cursor_t<K, V>;
        using converters_type = converters_t<K, V>;
        using iterator = iterator_t<K, V, value_type>;
        using entry_view_t = view_t<K, V, value_type>;
        using key_view_t = view_t<K, V, K>;
        using value_view_t = view_t<K, V, V>;

        explicit dictionary_t(const std::string_view directory, config_t cfg={}):
            _cfg { std::move(cfg) },
            _path { _database_path(directory, _cfg) },
            _env { std::make_unique<storage::lmdb::env_t>(_path, _cfg.env) },
            _schema { open_schema(*_env, _cfg, converters_type::key_coltyp, converters_type::value_coltyp) },
            _cursors { std::make_unique<cursor_pool_t<K, V>>(*_env, _schema) }
        {
        }

        dictionary_t(const dictionary_t &) =delete;
        dictionary_t &operator=(const dictionary_t &) =delete;

        ~dictionary_t()
        {
            close();
        }

        // Throws key_not_found_error when the key is absent.
        V at(const K &key) const
        {
            return _using_cursor([&](cursor_type &cur) {
                auto txn = cur.begin_transaction(txn_mode_t::read_only);
                cur.seek_with_key_not_found_exception(key);
                auto val = cur.retrieve_current_value();
                txn.commit(durability_t::lazy_flush);
                return val;
            });
        }

        V operator[](const K &key) const
        {
            return at(key);
        }

        // Inserts the entry or replaces the value of an existing key.
        void set(const K &key, const V &val)
        {
            std::scoped_lock lk { _update_mutex };
            _using_cursor([&](cursor_type &cur) {
                auto txn = cur.begin_transaction(txn_mode_t::read_write);
                if (cur.try_seek(key))
                    cur.replace_current_value(val);
                else
                    cur.insert(key, val);
                txn.commit(durability_t::lazy_flush);
            });
        }

        // Throws duplicate_key_error when the key is already present; the stored value stays unchanged.
        void add(const K &key, const V &val)
        {
            std::scoped_lock lk { _update_mutex };
            _using_cursor([&](cursor_type &cur) {
                auto txn = cur.begin_transaction(txn_mode_t::read_write);
                if (cur.try_seek(key))
                    throw duplicate_key_error(fmt::format("an item with the key {} already exists", key));
                cur.insert(key, val);
                txn.commit(durability_t::lazy_flush);
            });
        }

        void add(const value_type &item)
        {
            add(item.first, item.second);
        }

        // Returns whether a row was deleted.
        bool remove(const K &key)
        {
            std::scoped_lock lk { _update_mutex };
            return _using_cursor([&](cursor_type &cur) {
                auto txn = cur.begin_transaction(txn_mode_t::read_write);
                if (!cur.try_seek(key))
                    return false;
                cur.delete_current();
                txn.commit(durability_t::lazy_flush);
                return true;
            });
        }

        // Deletes the key only while it still maps to the given value.
        bool remove(const K &key, const V &val)
        {
            std::scoped_lock lk { _update_mutex };
            return _using_cursor([&](cursor_type &cur) {
                auto txn = cur.begin_transaction(txn_mode_t::read_write);
                if (!cur.try_seek(key) || !(cur.retrieve_current_value() == val))
                    return false;
                cur.delete_current();
                txn.commit(durability_t::lazy_flush);
                return true;
            });
        }

        bool remove(const value_type &item)
        {
            return remove(item.first, item.second);
        }

        bool contains(const K &key, const V &val) const
        {
            return _using_cursor([&](cursor_type &cur) {
                auto txn = cur.begin_transaction(txn_mode_t::read_only);
                const bool present = cur.try_seek(key) && cur.retrieve_current_value() == val;
                txn.commit(durability_t::lazy_flush);
                return present;
            });
        }

        bool contains(const value_type &item) const
        {
            return contains(item.first, item.second);
        }

        bool contains_key(const K &key) const
        {
            return _using_cursor([&](cursor_type &cur) {
                return cur.try_seek(key);
            });
        }

        // Scans all values, so it is much slower than contains_key.
        bool contains_value(const V &val) const
        {
            return values().contains(val);
        }

        std::optional<V> try_get(const K &key) const
        {
            return _using_cursor([&](cursor_type &cur) {
                std::optional<V> res {};
                auto txn = cur.begin_transaction(txn_mode_t::read_only);
                if (cur.try_seek(key))
                    res.emplace(cur.retrieve_current_value());
                txn.commit(durability_t::lazy_flush);
                return res;
            });
        }

        bool try_get_value(const K &key, V &val) const
        {
            auto res = try_get(key);
            if (!res)
                return false;
            val = std::move(*res);
            return true;
        }

        // The committed number of entries. Reads outside of the update lock.
        [[nodiscard]] size_t count() const
        {
            return _using_cursor([](cursor_type &cur) {
                return cur.retrieve_count();
            });
        }

        [[nodiscard]] size_t size() const
        {
            return count();
        }

        [[nodiscard]] bool empty() const
        {
            return count() == 0;
        }

        // Deletes the entries one by one, each in its own transaction. Not atomic as a whole:
        // concurrent readers may observe a partially cleared dictionary, and a failure midway
        // leaves the entries that were not reached yet.
        void clear()
        {
            std::scoped_lock lk { _update_mutex };
            const auto num_deleted = _using_cursor([](cursor_type &cur) {
                size_t n = 0;
                cur.move_before_first();
                for (;;) {
                    auto txn = cur.begin_transaction(txn_mode_t::read_write);
                    if (!cur.try_move_next())
                        break;
                    cur.delete_current();
                    txn.commit(durability_t::lazy_flush);
                    ++n;
                }
                return n;
            });
            logger::debug("dictionary {}: cleared {} entries", _path, num_deleted);
        }

        // Forces all changes made to this dictionary to be written to disk.
        void flush()
        {
            std::scoped_lock lk { _update_mutex };
            _using_cursor([](cursor_type &cur) {
                cur.flush();
            });
        }

        iterator begin() const
        {
            return entries().begin();
        }

        std::default_sentinel_t end() const noexcept
        {
            return std::default_sentinel;
        }

        entry_view_t entries() const
        {
            return _view<value_type>({}, [](cursor_type &cur) { return cur.retrieve_current(); }, true);
        }

        key_view_t keys() const
        {
            return _view<K>({}, [](cursor_type &cur) { return cur.retrieve_current_key(); }, true);
        }

        value_view_t values() const
        {
            return _view<V>({}, [](cursor_type &cur) { return cur.retrieve_current_value(); }, true);
        }

        // The entries with keys within the range in ascending key order.
        entry_view_t range(key_range_t<K> range) const
        {
            return _view<value_type>(std::move(range), [](cursor_type &cur) { return cur.retrieve_current(); }, false);
        }

        [[nodiscard]] const std::string &path() const noexcept
        {
            return _path;
        }

        [[nodiscard]] bool is_open() const noexcept
        {
            return static_cast<bool>(_env);
        }

        // Closes the pooled cursors and the storage environment. Idempotent.
        void close()
        {
            if (!_env)
                return;
            _cursors->dispose();
            _cursors.reset();
            _env.reset();
            logger::debug("dictionary {}: closed", _path);
        }
    private:
        config_t _cfg;
        std::string _path;
        std::unique_ptr<storage::lmdb::env_t> _env;
        schema_t _schema;
        std::unique_ptr<cursor_pool_t<K, V>> _cursors;
        mutable std::mutex _update_mutex {};

        static std::string _database_path(const std::string_view directory, const config_t &cfg)
        {
            if (directory.empty()) [[unlikely]]
                throw invalid_argument_error("the dictionary directory must not be empty");
            if (cfg.database_name.empty()) [[unlikely]]
                throw invalid_argument_error("the database name must not be empty");
            std::filesystem::create_directories(directory);
            return (std::filesystem::path { directory } / cfg.database_name).string();
        }

        void _require_open() const
        {
            if (!_env) [[unlikely]]
                throw error(fmt::format("dictionary {} has been closed", _path));
        }

        template<typename F>
        auto _using_cursor(const F &f) const
        {
            _require_open();
            // the lease returns the cursor to the pool on every exit path
            const auto cur = _cursors->lease();
            return f(*cur);
        }

        template<typename T>
        view_t<K, V, T> _view(key_range_t<K> range, typename view_t<K, V, T>::projection_t proj, const bool full) const
        {
            _require_open();
            typename view_t<K, V, T>::size_fn_t size_fn {};
            if (full)
                size_fn = [this] { return count(); };
            return view_t<K, V, T> { *_env, _schema, std::move(range), std::move(proj), [this] { _require_open(); }, std::move(size_fn) };
        }
    };
}
