#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <memory>
#include <mutex>
#include <vector>
#include <pdict/common/logger.hpp>
#include "cursor.hpp"

namespace pdict::dict {
    // A thread-safe cache of cursors over one dictionary. Cursors are fungible: a released cursor
    // may be handed to any later caller. The lock protects only the idle list and is never held
    // while a cursor is being created or used.
    template<persistable K, persistable V>
    struct cursor_pool_t {
        using cursor_type = cursor_t<K, V>;

        struct releaser_t {
            cursor_pool_t *_pool = nullptr;

            void operator()(cursor_type *cur) const
            {
                if (_pool)
                    _pool->release(cur);
            }
        };

        using ptr_t = std::unique_ptr<cursor_type, releaser_t>;

        explicit cursor_pool_t(storage::lmdb::env_t &env, const schema_t &schema):
            _env { env },
            _schema { schema }
        {
        }

        cursor_pool_t(const cursor_pool_t &) =delete;
        cursor_pool_t &operator=(const cursor_pool_t &) =delete;

        ~cursor_pool_t()
        {
            dispose();
        }

        // Returns an idle cursor or creates a new one when none is idle.
        cursor_type *acquire()
        {
            {
                std::scoped_lock lk { _mutex };
                if (_disposed) [[unlikely]]
                    throw error("the cursor pool has been disposed");
                ++_num_outstanding;
                if (!_idle.empty()) {
                    auto cur = std::move(_idle.back());
                    _idle.pop_back();
                    return cur.release();
                }
                ++_num_created;
            }
            try {
                auto cur = std::make_unique<cursor_type>(_env, _schema);
                logger::trace("cursor pool: created a new cursor over {}", _schema.data.name);
                return cur.release();
            } catch (const std::exception &) {
                std::scoped_lock lk { _mutex };
                --_num_outstanding;
                --_num_created;
                throw;
            }
        }

        // Returns a cursor to the idle list. A cursor released after dispose is closed right away.
        void release(cursor_type *cur)
        {
            if (!cur) [[unlikely]]
                return;
            std::unique_ptr<cursor_type> owned { cur };
            owned->reset();
            std::scoped_lock lk { _mutex };
            --_num_outstanding;
            if (!_disposed) {
                _idle.emplace_back(std::move(owned));
            } else {
                logger::warn("cursor pool: a cursor over {} was released after the pool had been disposed", _schema.data.name);
                owned->close();
            }
        }

        // Checks out a cursor that returns to the pool when the pointer goes out of scope.
        ptr_t lease()
        {
            return ptr_t { acquire(), releaser_t { this } };
        }

        // Closes every idle cursor. Cursors still checked out at this point are a caller error.
        void dispose()
        {
            std::vector<std::unique_ptr<cursor_type>> idle {};
            size_t num_outstanding = 0;
            {
                std::scoped_lock lk { _mutex };
                if (_disposed)
                    return;
                _disposed = true;
                idle.swap(_idle);
                num_outstanding = _num_outstanding;
            }
            if (num_outstanding) [[unlikely]]
                logger::warn("cursor pool: disposed with {} cursors still checked out", num_outstanding);
            for (auto &cur: idle)
                cur->close();
            logger::debug("cursor pool: closed {} cursors over {}", idle.size(), _schema.data.name);
        }

        [[nodiscard]] size_t num_idle() const
        {
            std::scoped_lock lk { _mutex };
            return _idle.size();
        }

        [[nodiscard]] size_t num_outstanding() const
        {
            std::scoped_lock lk { _mutex };
            return _num_outstanding;
        }

        [[nodiscard]] size_t num_created() const
        {
            std::scoped_lock lk { _mutex };
            return _num_created;
        }
    private:
        storage::lmdb::env_t &_env;
        const schema_t &_schema;
        mutable std::mutex _mutex {};
        std::vector<std::unique_ptr<cursor_type>> _idle {};
        size_t _num_outstanding = 0;
        size_t _num_created = 0;
        bool _disposed = false;
    };
}
