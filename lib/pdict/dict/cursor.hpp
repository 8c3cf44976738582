#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <optional>
#include <utility>
#include <pdict/common/numeric-cast.hpp>
#include <pdict/storage/lmdb.hpp>
#include "errors.hpp"
#include "schema.hpp"

namespace pdict::dict {
    using storage::lmdb::durability_t;
    using storage::lmdb::txn_mode_t;

    template<typename K>
    struct key_bound_t {
        K key;
        bool inclusive = true;
    };

    // A key range for enumeration; an empty bound leaves that side of the range open.
    template<typename K>
    struct key_range_t {
        std::optional<key_bound_t<K>> lower {};
        std::optional<key_bound_t<K>> upper {};
    };

    // A transaction scope over a cursor. Rolled back on destruction unless committed.
    struct transaction_t {
        explicit transaction_t(storage::lmdb::cursor_t &cur, const txn_mode_t mode):
            _cur { &cur }
        {
            _cur->begin(mode);
        }

        transaction_t(transaction_t &&o) noexcept:
            _cur { std::exchange(o._cur, nullptr) }
        {
        }

        transaction_t(const transaction_t &) =delete;
        transaction_t &operator=(const transaction_t &) =delete;
        transaction_t &operator=(transaction_t &&) =delete;

        ~transaction_t()
        {
            if (_cur)
                _cur->rollback();
        }

        void commit(const durability_t durability)
        {
            if (!_cur) [[unlikely]]
                throw error("the transaction has already been completed");
            std::exchange(_cur, nullptr)->commit(durability);
        }

        void rollback()
        {
            if (_cur)
                std::exchange(_cur, nullptr)->rollback();
        }
    private:
        storage::lmdb::cursor_t *_cur;
    };

    // A typed cursor over the data table of a dictionary. Methods other than begin_transaction
    // run in an implicit short read-only transaction when called outside of an explicit one.
    template<persistable K, persistable V>
    struct cursor_t {
        using converters_type = converters_t<K, V>;

        explicit cursor_t(storage::lmdb::env_t &env, const schema_t &schema):
            _schema { schema },
            _cur { env, schema.data },
            _max_key_size { env.max_key_size() }
        {
        }

        cursor_t(const cursor_t &) =delete;
        cursor_t &operator=(const cursor_t &) =delete;

        [[nodiscard]] transaction_t begin_transaction(const txn_mode_t mode=txn_mode_t::read_only)
        {
            return transaction_t { _cur, mode };
        }

        bool try_seek(const K &key)
        {
            return _autocommit([&] {
                return _cur.seek(_encode_key(key));
            });
        }

        void seek_with_key_not_found_exception(const K &key)
        {
            if (!try_seek(key))
                throw key_not_found_error(fmt::format("the key is not present in the dictionary: {}", key));
        }

        K retrieve_current_key()
        {
            return _autocommit([&] {
                return converters_type::decode_key(_cur.key());
            });
        }

        V retrieve_current_value()
        {
            return _autocommit([&] {
                return converters_type::decode_value(_cur.val());
            });
        }

        std::pair<K, V> retrieve_current()
        {
            return _autocommit([&] {
                return std::pair<K, V> { converters_type::decode_key(_cur.key()), converters_type::decode_value(_cur.val()) };
            });
        }

        // The count delta is applied to the metadata record in the same transaction.
        void insert(const K &key, const V &val)
        {
            _cur.insert(_encode_key(key), converters_type::encode_value(val));
            _update_globals([](globals_t &g) { ++g.count; });
        }

        void replace_current_value(const V &val)
        {
            _cur.replace(converters_type::encode_value(val));
        }

        void delete_current()
        {
            _cur.erase();
            _update_globals([](globals_t &g) { --g.count; });
        }

        void move_before_first() noexcept
        {
            _upper.reset();
            _cur.move_before_first();
        }

        bool try_move_next()
        {
            return _autocommit([&] {
                return _cur.next() && _within_upper();
            });
        }

        // Positions the cursor on the first row of the range and restricts subsequent try_move_next calls to it.
        // Returns false when the range has no rows.
        bool set_range(const key_range_t<K> &range)
        {
            move_before_first();
            if (range.upper)
                _upper.emplace(_encode_key(range.upper->key), range.upper->inclusive);
            return _autocommit([&] {
                if (!range.lower)
                    return _cur.first() && _within_upper();
                const auto lower = _encode_key(range.lower->key);
                if (!_cur.seek_ge(lower))
                    return false;
                if (!range.lower->inclusive && _cur.key() == static_cast<buffer>(lower) && !_cur.next())
                    return false;
                return _within_upper();
            });
        }

        size_t retrieve_count()
        {
            return _autocommit([&] {
                return numeric_cast<size_t>(_read_globals().count);
            });
        }

        // Forces every lazily committed transaction to disk: bumps the flush counter and commits with flush durability.
        void flush()
        {
            auto txn = begin_transaction(txn_mode_t::read_write);
            _update_globals([](globals_t &g) { ++g.flush_count; });
            txn.commit(durability_t::flush);
        }

        int64_t retrieve_flush_count()
        {
            return _autocommit([&] {
                return _read_globals().flush_count;
            });
        }

        // drops any transaction, position and range left over from the previous user
        void reset()
        {
            _cur.rollback();
            move_before_first();
        }

        void close()
        {
            _cur.close();
        }
    private:
        const schema_t &_schema;
        storage::lmdb::cursor_t _cur;
        std::optional<std::pair<uint8_vector, bool>> _upper {};
        size_t _max_key_size;

        // keys beyond the engine's limit can never be stored, so every operation rejects them the same way
        uint8_vector _encode_key(const K &key) const
        {
            auto bytes = converters_type::encode_key(key);
            if (bytes.size() > _max_key_size) [[unlikely]]
                throw invalid_argument_error(fmt::format("a key encodes to {} bytes but the limit is {}", bytes.size(), _max_key_size));
            return bytes;
        }

        template<typename F>
        auto _autocommit(const F &f)
        {
            if (_cur.in_transaction())
                return f();
            auto txn = begin_transaction(txn_mode_t::read_only);
            auto res = f();
            txn.commit(durability_t::lazy_flush);
            return res;
        }

        bool _within_upper()
        {
            if (!_upper)
                return true;
            const auto cmp = _cur.key() <=> static_cast<buffer>(_upper->first);
            return cmp < 0 || (cmp == 0 && _upper->second);
        }

        globals_t _read_globals()
        {
            const auto rec = _cur.get(_schema.globals, schema_t::globals_key);
            if (!rec) [[unlikely]]
                throw error("the metadata record is missing");
            return globals_t::decode(*rec);
        }

        template<typename F>
        void _update_globals(const F &update)
        {
            auto g = _read_globals();
            update(g);
            _cur.put(_schema.globals, schema_t::globals_key, g.encode());
        }
    };
}
