#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include "cursor.hpp"

namespace pdict::dict {
    enum class enum_state_t: uint8_t {
        not_started,
        positioned,
        exhausted
    };

    // A lazy, forward-only, ascending scan over a key range. Owns a private cursor that is never shared
    // with the cursor pool, since a scan may stay open for an unbounded time.
    // Every step runs in its own read-only transaction: a long scan does not pin old versions of the data,
    // and a change committed by a writer between two steps may or may not be seen by later steps.
    template<persistable K, persistable V, typename T>
    struct enumerator_t {
        using cursor_type = cursor_t<K, V>;
        using projection_t = std::function<T(cursor_type &)>;

        explicit enumerator_t(storage::lmdb::env_t &env, const schema_t &schema, key_range_t<K> range, projection_t proj):
            _cursor { std::make_unique<cursor_type>(env, schema) },
            _range { std::move(range) },
            _proj { std::move(proj) }
        {
        }

        enumerator_t(const enumerator_t &) =delete;
        enumerator_t &operator=(const enumerator_t &) =delete;

        ~enumerator_t()
        {
            dispose();
        }

        // Produces the next item or an empty optional once the range is exhausted.
        // An exhausted enumerator stays exhausted: a new scan needs a new enumerator.
        std::optional<T> next()
        {
            if (_state == enum_state_t::exhausted || !_cursor)
                return {};
            auto txn = _cursor->begin_transaction(txn_mode_t::read_only);
            const bool found = _state == enum_state_t::not_started
                ? _cursor->set_range(_range)
                : _cursor->try_move_next();
            if (!found) {
                txn.commit(durability_t::lazy_flush);
                _state = enum_state_t::exhausted;
                dispose();
                return {};
            }
            _state = enum_state_t::positioned;
            auto item = _proj(*_cursor);
            // the transaction ends before the item is handed out so that the caller holds no engine resources
            txn.commit(durability_t::lazy_flush);
            return item;
        }

        [[nodiscard]] enum_state_t state() const noexcept
        {
            return _state;
        }

        // Closes the private cursor. Safe to call more than once.
        void dispose()
        {
            if (_cursor) {
                _cursor->close();
                _cursor.reset();
            }
        }
    private:
        std::unique_ptr<cursor_type> _cursor;
        key_range_t<K> _range;
        projection_t _proj;
        enum_state_t _state = enum_state_t::not_started;
    };

    // An input iterator over an enumerator. Copies share the underlying enumerator.
    template<persistable K, persistable V, typename T>
    struct iterator_t {
        using enumerator_type = enumerator_t<K, V, T>;
        using iterator_category = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T *;
        using reference = const T &;

        iterator_t() =default;

        explicit iterator_t(std::shared_ptr<enumerator_type> e):
            _enum { std::move(e) }
        {
            _advance();
        }

        reference operator*() const
        {
            return *_item;
        }

        pointer operator->() const
        {
            return &*_item;
        }

        iterator_t &operator++()
        {
            _advance();
            return *this;
        }

        void operator++(int)
        {
            _advance();
        }

        bool operator==(std::default_sentinel_t) const noexcept
        {
            return !_item;
        }
    private:
        std::shared_ptr<enumerator_type> _enum {};
        std::optional<T> _item {};

        void _advance()
        {
            if (!_enum) {
                _item.reset();
                return;
            }
            _item = _enum->next();
            // releases the private cursor as soon as the scan is over
            if (!_item)
                _enum.reset();
        }
    };

    // A lazily evaluated view over a dictionary: its keys, its values, its entries or a key range of them.
    // Each begin() starts a new scan after the open check confirms that the storage is still available.
    // A view borrows the dictionary's storage and must not outlive the dictionary itself.
    template<persistable K, persistable V, typename T>
    struct view_t {
        using enumerator_type = enumerator_t<K, V, T>;
        using iterator = iterator_t<K, V, T>;
        using projection_t = typename enumerator_type::projection_t;
        using size_fn_t = std::function<size_t()>;
        using open_check_t = std::function<void()>;

        explicit view_t(storage::lmdb::env_t &env, const schema_t &schema, key_range_t<K> range, projection_t proj,
                open_check_t open_check={}, size_fn_t size_fn={}):
            _env { env },
            _schema { schema },
            _range { std::move(range) },
            _proj { std::move(proj) },
            _open_check { std::move(open_check) },
            _size_fn { std::move(size_fn) }
        {
        }

        [[nodiscard]] std::shared_ptr<enumerator_type> enumerator() const
        {
            if (_open_check)
                _open_check();
            return std::make_shared<enumerator_type>(_env, _schema, _range, _proj);
        }

        [[nodiscard]] iterator begin() const
        {
            return iterator { enumerator() };
        }

        [[nodiscard]] std::default_sentinel_t end() const noexcept
        {
            return std::default_sentinel;
        }

        // A linear scan: the view is not indexed by its items.
        [[nodiscard]] bool contains(const T &item) const
        {
            for (auto it = begin(); it != end(); ++it) {
                if (*it == item)
                    return true;
            }
            return false;
        }

        // The dictionary's count for full views, a walk over the range otherwise.
        [[nodiscard]] size_t size() const
        {
            if (_size_fn)
                return _size_fn();
            size_t n = 0;
            for (auto it = begin(); it != end(); ++it)
                ++n;
            return n;
        }
    private:
        storage::lmdb::env_t &_env;
        const schema_t &_schema;
        key_range_t<K> _range;
        projection_t _proj;
        open_check_t _open_check;
        size_fn_t _size_fn;
    };
}
