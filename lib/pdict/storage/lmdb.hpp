#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <pdict/common/bytes.hpp>

namespace pdict::storage::lmdb {
    // The hint passed to every commit: flush forces a synchronous write of the environment,
    // lazy_flush makes the transaction visible and leaves the disk write to the next flush.
    enum class durability_t: uint8_t {
        flush,
        lazy_flush
    };

    enum class txn_mode_t: uint8_t {
        read_only,
        read_write
    };

    struct env_config_t {
        size_t map_size = 1ULL << 30U;
        unsigned max_tables = 4;
        // every cursor keeps a reader slot for its whole life, so this bounds the number of open cursors
        unsigned max_readers = 512;
        bool lazy_sync = true;
    };

    struct lmdb_error: error {
        explicit lmdb_error(std::string_view op, int rc);

        [[nodiscard]] int code() const noexcept
        {
            return _rc;
        }
    private:
        int _rc;
    };

    struct table_t {
        std::string name {};
        unsigned int dbi = 0;
    };

    struct env_t {
        explicit env_t(std::string_view path, const env_config_t &cfg={});
        ~env_t();

        env_t(const env_t &) =delete;
        env_t &operator=(const env_t &) =delete;

        [[nodiscard]] const std::string &path() const noexcept;
        [[nodiscard]] void *native() const noexcept;
        // the largest key the engine accepts, in bytes
        [[nodiscard]] size_t max_key_size() const noexcept;
        // forces a synchronous write of all committed transactions
        void sync();
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };

    // A standalone transaction used for schema work: opening and creating tables, point reads and writes.
    // Aborted on destruction unless committed.
    struct txn_t {
        explicit txn_t(env_t &env, txn_mode_t mode);
        ~txn_t();

        txn_t(const txn_t &) =delete;
        txn_t &operator=(const txn_t &) =delete;

        // returns an empty optional when the table does not exist and create is false
        std::optional<table_t> open_table(std::string_view name, bool create);
        [[nodiscard]] value_t get(const table_t &table, buffer key) const;
        void put(const table_t &table, buffer key, buffer val);
        void commit(durability_t durability);
        void abort();
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };

    // A cursor bound to a single table. The cursor owns a reusable read-only transaction that is reset
    // and renewed instead of being reopened, so keeping cursors around is cheaper than opening new ones.
    // The logical position is remembered as the last visited key and survives transaction boundaries.
    // Must be used by one thread at a time.
    struct cursor_t {
        explicit cursor_t(env_t &env, const table_t &table);
        ~cursor_t();

        cursor_t(const cursor_t &) =delete;
        cursor_t &operator=(const cursor_t &) =delete;

        void begin(txn_mode_t mode);
        void commit(durability_t durability);
        void rollback();
        [[nodiscard]] bool in_transaction() const noexcept;
        [[nodiscard]] bool writable() const noexcept;

        bool seek(buffer key);
        bool seek_ge(buffer key);
        bool first();
        bool next();
        void move_before_first() noexcept;
        [[nodiscard]] buffer key() const;
        [[nodiscard]] buffer val() const;

        void insert(buffer key, buffer val);
        void replace(buffer val);
        void erase();

        [[nodiscard]] value_t get(const table_t &table, buffer key) const;
        void put(const table_t &table, buffer key, buffer val);

        void close();
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
}
