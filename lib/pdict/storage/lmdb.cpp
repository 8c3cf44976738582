/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

extern "C" {
    #include <lmdb.h>
}

#include <filesystem>
#include <utility>
#include <pdict/common/logger.hpp>
#include "lmdb.hpp"

namespace pdict::storage::lmdb {
    namespace {
        void throw_lmdb(const int rc, const char *op)
        {
            if (rc == MDB_SUCCESS) [[likely]]
                return;
            throw lmdb_error(op, rc);
        }

        MDB_val to_mdb_val(const buffer b)
        {
            MDB_val v {};
            v.mv_size = b.size();
            v.mv_data = const_cast<void*>(static_cast<const void*>(b.data()));
            return v;
        }

        buffer from_mdb_val(const MDB_val &v)
        {
            return { static_cast<const uint8_t *>(v.mv_data), v.mv_size };
        }

        value_t get_value(MDB_txn *txn, const MDB_dbi dbi, const buffer key)
        {
            MDB_val k = to_mdb_val(key);
            MDB_val v {};
            const auto rc = mdb_get(txn, dbi, &k, &v);
            if (rc == MDB_NOTFOUND)
                return {};
            throw_lmdb(rc, "mdb_get");
            return uint8_vector { from_mdb_val(v) };
        }

        void put_value(MDB_txn *txn, const MDB_dbi dbi, const buffer key, const buffer val)
        {
            MDB_val k = to_mdb_val(key);
            MDB_val v = to_mdb_val(val);
            throw_lmdb(mdb_put(txn, dbi, &k, &v, 0), "mdb_put");
        }
    }

    lmdb_error::lmdb_error(const std::string_view op, const int rc):
        error { fmt::format("lmdb: {}: {}", op, mdb_strerror(rc)) },
        _rc { rc }
    {
    }

    struct env_t::impl {
        explicit impl(const std::string_view path, const env_config_t &cfg):
            _path { path }
        {
            if (const auto parent = std::filesystem::path { _path }.parent_path(); !parent.empty())
                std::filesystem::create_directories(parent);
            throw_lmdb(mdb_env_create(&_env), "env_create");
            try {
                throw_lmdb(mdb_env_set_maxdbs(_env, cfg.max_tables), "env_set_maxdbs");
                throw_lmdb(mdb_env_set_mapsize(_env, cfg.map_size), "env_set_mapsize");
                throw_lmdb(mdb_env_set_maxreaders(_env, cfg.max_readers), "env_set_maxreaders");
                // MDB_NOTLS lets a reset read transaction be renewed from any thread
                unsigned int flags = MDB_NOSUBDIR | MDB_NOTLS;
                if (cfg.lazy_sync)
                    flags |= MDB_NOSYNC;
                throw_lmdb(mdb_env_open(_env, _path.c_str(), flags, 0664), "env_open");
            } catch (const std::exception &) {
                mdb_env_close(_env);
                _env = nullptr;
                throw;
            }
            logger::debug("lmdb: opened environment {} map size: {} lazy sync: {}", _path, cfg.map_size, cfg.lazy_sync);
        }

        ~impl()
        {
            if (_env) {
                mdb_env_close(_env);
                _env = nullptr;
                logger::debug("lmdb: closed environment {}", _path);
            }
        }

        impl(impl&&) = delete;
        impl& operator=(impl&&) = delete;
        impl(const impl&) = delete;
        impl& operator=(const impl&) = delete;

        const std::string &path() const noexcept
        {
            return _path;
        }

        MDB_env *native() const noexcept
        {
            return _env;
        }

        size_t max_key_size() const noexcept
        {
            return static_cast<size_t>(mdb_env_get_maxkeysize(_env));
        }

        void sync()
        {
            throw_lmdb(mdb_env_sync(_env, 1), "env_sync");
        }
    private:
        std::string _path;
        MDB_env *_env { nullptr };
    };

    env_t::env_t(const std::string_view path, const env_config_t &cfg):
        _impl { std::make_unique<impl>(path, cfg) }
    {
    }

    env_t::~env_t() = default;

    const std::string &env_t::path() const noexcept
    {
        return _impl->path();
    }

    void *env_t::native() const noexcept
    {
        return _impl->native();
    }

    size_t env_t::max_key_size() const noexcept
    {
        return _impl->max_key_size();
    }

    void env_t::sync()
    {
        _impl->sync();
    }

    struct txn_t::impl {
        explicit impl(env_t &env, const txn_mode_t mode):
            _env { static_cast<MDB_env *>(env.native()) },
            _mode { mode }
        {
            throw_lmdb(mdb_txn_begin(_env, nullptr, mode == txn_mode_t::read_only ? MDB_RDONLY : 0, &_txn), "txn_begin");
        }

        ~impl()
        {
            abort();
        }

        std::optional<table_t> open_table(const std::string_view name, const bool create)
        {
            _require_active();
            const std::string name_str { name };
            MDB_dbi dbi {};
            const auto rc = mdb_dbi_open(_txn, name_str.c_str(), create ? MDB_CREATE : 0, &dbi);
            if (rc == MDB_NOTFOUND && !create)
                return {};
            throw_lmdb(rc, "dbi_open");
            return table_t { name_str, dbi };
        }

        value_t get(const table_t &table, const buffer key) const
        {
            _require_active();
            return get_value(_txn, table.dbi, key);
        }

        void put(const table_t &table, const buffer key, const buffer val)
        {
            _require_active();
            put_value(_txn, table.dbi, key, val);
        }

        void commit(const durability_t durability)
        {
            _require_active();
            // the transaction handle is released by mdb_txn_commit even when it fails
            throw_lmdb(mdb_txn_commit(std::exchange(_txn, nullptr)), "txn_commit");
            if (durability == durability_t::flush && _mode == txn_mode_t::read_write)
                throw_lmdb(mdb_env_sync(_env, 1), "env_sync");
        }

        void abort()
        {
            if (_txn)
                mdb_txn_abort(std::exchange(_txn, nullptr));
        }
    private:
        MDB_env *_env;
        txn_mode_t _mode;
        MDB_txn *_txn { nullptr };

        void _require_active() const
        {
            if (!_txn) [[unlikely]]
                throw error("lmdb: the transaction has already been completed");
        }
    };

    txn_t::txn_t(env_t &env, const txn_mode_t mode):
        _impl { std::make_unique<impl>(env, mode) }
    {
    }

    txn_t::~txn_t() = default;

    std::optional<table_t> txn_t::open_table(const std::string_view name, const bool create)
    {
        return _impl->open_table(name, create);
    }

    value_t txn_t::get(const table_t &table, const buffer key) const
    {
        return _impl->get(table, key);
    }

    void txn_t::put(const table_t &table, const buffer key, const buffer val)
    {
        _impl->put(table, key, val);
    }

    void txn_t::commit(const durability_t durability)
    {
        _impl->commit(durability);
    }

    void txn_t::abort()
    {
        _impl->abort();
    }

    struct cursor_t::impl {
        explicit impl(env_t &env, const table_t &table):
            _env { static_cast<MDB_env *>(env.native()) },
            _table { table }
        {
        }

        ~impl()
        {
            close();
        }

        impl(impl&&) = delete;
        impl& operator=(impl&&) = delete;
        impl(const impl&) = delete;
        impl& operator=(const impl&) = delete;

        void begin(const txn_mode_t mode)
        {
            if (_txn) [[unlikely]]
                throw error(fmt::format("lmdb: a cursor over {} already has an active transaction", _table.name));
            if (mode == txn_mode_t::read_only) {
                _begin_read();
            } else {
                MDB_txn *txn = nullptr;
                throw_lmdb(mdb_txn_begin(_env, nullptr, 0, &txn), "txn_begin(write)");
                MDB_cursor *cur = nullptr;
                if (const auto rc = mdb_cursor_open(txn, _table.dbi, &cur); rc != MDB_SUCCESS) {
                    mdb_txn_abort(txn);
                    throw_lmdb(rc, "cursor_open(write)");
                }
                _txn = txn;
                _cur = cur;
            }
            _writable = mode == txn_mode_t::read_write;
            _native_valid = false;
        }

        void commit(const durability_t durability)
        {
            _require_txn("commit");
            _native_valid = false;
            if (_writable) {
                mdb_cursor_close(std::exchange(_cur, nullptr));
                // the transaction handle is released by mdb_txn_commit even when it fails
                throw_lmdb(mdb_txn_commit(std::exchange(_txn, nullptr)), "txn_commit");
                if (durability == durability_t::flush)
                    throw_lmdb(mdb_env_sync(_env, 1), "env_sync");
            } else {
                // a read-only transaction has nothing to make durable, resetting it keeps the handle for reuse
                _cur = nullptr;
                mdb_txn_reset(std::exchange(_txn, nullptr));
            }
        }

        void rollback()
        {
            if (!_txn)
                return;
            _native_valid = false;
            if (_writable) {
                mdb_cursor_close(std::exchange(_cur, nullptr));
                mdb_txn_abort(std::exchange(_txn, nullptr));
            } else {
                _cur = nullptr;
                mdb_txn_reset(std::exchange(_txn, nullptr));
            }
        }

        bool in_transaction() const noexcept
        {
            return _txn != nullptr;
        }

        bool writable() const noexcept
        {
            return _txn != nullptr && _writable;
        }

        bool seek(const buffer key)
        {
            _require_txn("seek");
            MDB_val k = to_mdb_val(key);
            MDB_val v {};
            if (_get(MDB_SET_KEY, k, v))
                return _land(true, k);
            // a failed exact seek leaves the cursor unpositioned, as it does the native one
            move_before_first();
            return false;
        }

        bool seek_ge(const buffer key)
        {
            _require_txn("seek_ge");
            MDB_val k = to_mdb_val(key);
            MDB_val v {};
            return _land(_get(MDB_SET_RANGE, k, v), k);
        }

        bool first()
        {
            _require_txn("first");
            MDB_val k {}, v {};
            if (_get(MDB_FIRST, k, v))
                return _land(true, k);
            move_before_first();
            return false;
        }

        bool next()
        {
            _require_txn("next");
            MDB_val k {}, v {};
            if (_native_valid)
                return _land(_get(MDB_NEXT, k, v), k);
            if (!_pos_key)
                return first();
            // the native cursor lost its position at a transaction boundary or with the deletion
            // of the current row: the next row is the first one after the last visited key
            k = to_mdb_val(*_pos_key);
            if (!_get(MDB_SET_RANGE, k, v))
                return _land(false, k);
            if (from_mdb_val(k) == static_cast<buffer>(*_pos_key))
                return _land(_get(MDB_NEXT, k, v), k);
            return _land(true, k);
        }

        void move_before_first() noexcept
        {
            _pos_key.reset();
            _native_valid = false;
        }

        buffer key()
        {
            MDB_val k {}, v {};
            _current(k, v);
            return from_mdb_val(k);
        }

        buffer val()
        {
            MDB_val k {}, v {};
            _current(k, v);
            return from_mdb_val(v);
        }

        void insert(const buffer key, const buffer val)
        {
            _require_writable("insert");
            MDB_val k = to_mdb_val(key);
            MDB_val v = to_mdb_val(val);
            throw_lmdb(mdb_cursor_put(_cur, &k, &v, MDB_NOOVERWRITE), "cursor_put(insert)");
            // mdb_cursor_put leaves the cursor on the new row
            _pos_key.emplace(key);
            _native_valid = true;
        }

        void replace(const buffer val)
        {
            _require_writable("replace");
            _restore();
            MDB_val k = to_mdb_val(*_pos_key);
            MDB_val v = to_mdb_val(val);
            throw_lmdb(mdb_cursor_put(_cur, &k, &v, MDB_CURRENT), "cursor_put(replace)");
        }

        void erase()
        {
            _require_writable("erase");
            _restore();
            throw_lmdb(mdb_cursor_del(_cur, 0), "cursor_del");
            // _pos_key keeps the deleted key so that next() continues with the following row
            _native_valid = false;
        }

        value_t get(const table_t &table, const buffer key) const
        {
            _require_txn("get");
            return get_value(_txn, table.dbi, key);
        }

        void put(const table_t &table, const buffer key, const buffer val)
        {
            _require_writable("put");
            put_value(_txn, table.dbi, key, val);
        }

        void close()
        {
            rollback();
            if (_rcur)
                mdb_cursor_close(std::exchange(_rcur, nullptr));
            if (_rtxn)
                mdb_txn_abort(std::exchange(_rtxn, nullptr));
            _pos_key.reset();
        }
    private:
        MDB_env *_env;
        table_t _table;
        // the reusable read-only transaction and its cursor
        MDB_txn *_rtxn { nullptr };
        MDB_cursor *_rcur { nullptr };
        // the active transaction and cursor: either the read-only pair above or a short-lived writable pair
        MDB_txn *_txn { nullptr };
        MDB_cursor *_cur { nullptr };
        bool _writable = false;
        bool _native_valid = false;
        std::optional<uint8_vector> _pos_key {};

        void _begin_read()
        {
            if (!_rtxn) {
                throw_lmdb(mdb_txn_begin(_env, nullptr, MDB_RDONLY, &_rtxn), "txn_begin(read)");
                if (const auto rc = mdb_cursor_open(_rtxn, _table.dbi, &_rcur); rc != MDB_SUCCESS) {
                    mdb_txn_abort(std::exchange(_rtxn, nullptr));
                    throw_lmdb(rc, "cursor_open(read)");
                }
            } else {
                throw_lmdb(mdb_txn_renew(_rtxn), "txn_renew");
                if (const auto rc = mdb_cursor_renew(_rtxn, _rcur); rc != MDB_SUCCESS) {
                    mdb_txn_reset(_rtxn);
                    throw_lmdb(rc, "cursor_renew");
                }
            }
            _txn = _rtxn;
            _cur = _rcur;
        }

        bool _get(const MDB_cursor_op op, MDB_val &k, MDB_val &v)
        {
            const auto rc = mdb_cursor_get(_cur, &k, &v, op);
            if (rc == MDB_NOTFOUND)
                return false;
            throw_lmdb(rc, "cursor_get");
            return true;
        }

        bool _land(const bool found, const MDB_val &k)
        {
            _native_valid = found;
            if (found)
                _pos_key.emplace(from_mdb_val(k));
            return found;
        }

        void _restore()
        {
            if (_native_valid)
                return;
            if (!_pos_key) [[unlikely]]
                throw error(fmt::format("lmdb: a cursor over {} is not positioned on a row", _table.name));
            MDB_val k = to_mdb_val(*_pos_key);
            MDB_val v {};
            if (!_get(MDB_SET_KEY, k, v)) [[unlikely]]
                throw error(fmt::format("lmdb: the current row of {} has been deleted", _table.name));
            _native_valid = true;
        }

        void _current(MDB_val &k, MDB_val &v)
        {
            _require_txn("get_current");
            _restore();
            throw_lmdb(mdb_cursor_get(_cur, &k, &v, MDB_GET_CURRENT), "cursor_get(current)");
        }

        void _require_txn(const char *op) const
        {
            if (!_txn) [[unlikely]]
                throw error(fmt::format("lmdb: {} on a cursor over {} requires an active transaction", op, _table.name));
        }

        void _require_writable(const char *op) const
        {
            _require_txn(op);
            if (!_writable) [[unlikely]]
                throw error(fmt::format("lmdb: {} on a cursor over {} requires a writable transaction", op, _table.name));
        }
    };

    cursor_t::cursor_t(env_t &env, const table_t &table):
        _impl { std::make_unique<impl>(env, table) }
    {
    }

    cursor_t::~cursor_t() = default;

    void cursor_t::begin(const txn_mode_t mode)
    {
        _impl->begin(mode);
    }

    void cursor_t::commit(const durability_t durability)
    {
        _impl->commit(durability);
    }

    void cursor_t::rollback()
    {
        _impl->rollback();
    }

    bool cursor_t::in_transaction() const noexcept
    {
        return _impl->in_transaction();
    }

    bool cursor_t::writable() const noexcept
    {
        return _impl->writable();
    }

    bool cursor_t::seek(const buffer key)
    {
        return _impl->seek(key);
    }

    bool cursor_t::seek_ge(const buffer key)
    {
        return _impl->seek_ge(key);
    }

    bool cursor_t::first()
    {
        return _impl->first();
    }

    bool cursor_t::next()
    {
        return _impl->next();
    }

    void cursor_t::move_before_first() noexcept
    {
        _impl->move_before_first();
    }

    buffer cursor_t::key() const
    {
        return _impl->key();
    }

    buffer cursor_t::val() const
    {
        return _impl->val();
    }

    void cursor_t::insert(const buffer key, const buffer val)
    {
        _impl->insert(key, val);
    }

    void cursor_t::replace(const buffer val)
    {
        _impl->replace(val);
    }

    void cursor_t::erase()
    {
        _impl->erase();
    }

    value_t cursor_t::get(const table_t &table, const buffer key) const
    {
        return _impl->get(table, key);
    }

    void cursor_t::put(const table_t &table, const buffer key, const buffer val)
    {
        _impl->put(table, key, val);
    }

    void cursor_t::close()
    {
        _impl->close();
    }
}
