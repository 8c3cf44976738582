/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <pdict/common/logger.hpp>
#include "errors.hpp"
#include "schema.hpp"

namespace pdict::dict {
    namespace {
        void store_i64_le(uint8_vector &out, const int64_t val)
        {
            auto x = static_cast<uint64_t>(val);
            for (size_t i = 0; i < sizeof(x); ++i, x >>= 8U)
                out << static_cast<uint8_t>(x & 0xFFU);
        }

        int64_t load_i64_le(const buffer bytes)
        {
            uint64_t x = 0;
            for (size_t i = sizeof(x); i > 0; --i)
                x = (x << 8U) | bytes[i - 1];
            return static_cast<int64_t>(x);
        }

        coltyp_t to_coltyp(const uint8_t b)
        {
            if (b < static_cast<uint8_t>(coltyp_t::binary) || b > static_cast<uint8_t>(coltyp_t::float64)) [[unlikely]]
                throw error(fmt::format("unsupported column type tag: {}", b));
            return static_cast<coltyp_t>(b);
        }
    }

    std::string_view coltyp_name(const coltyp_t typ)
    {
        switch (typ) {
            case coltyp_t::binary: return "binary";
            case coltyp_t::text: return "text";
            case coltyp_t::boolean: return "boolean";
            case coltyp_t::int8: return "int8";
            case coltyp_t::int16: return "int16";
            case coltyp_t::int32: return "int32";
            case coltyp_t::int64: return "int64";
            case coltyp_t::uint8: return "uint8";
            case coltyp_t::uint16: return "uint16";
            case coltyp_t::uint32: return "uint32";
            case coltyp_t::uint64: return "uint64";
            case coltyp_t::float32: return "float32";
            case coltyp_t::float64: return "float64";
            default: throw error(fmt::format("unsupported column type: {}", static_cast<int>(typ)));
        }
    }

    globals_t globals_t::decode(const buffer bytes)
    {
        if (bytes.size() < fixed_size) [[unlikely]]
            throw error(fmt::format("the metadata record must have at least {} bytes but has {}", fixed_size, bytes.size()));
        globals_t res {};
        res.count = load_i64_le(bytes.subbuf(0, sizeof(int64_t)));
        res.flush_count = load_i64_le(bytes.subbuf(sizeof(int64_t), sizeof(int64_t)));
        res.key_type = to_coltyp(bytes[sizeof(int64_t) * 2]);
        res.value_type = to_coltyp(bytes[sizeof(int64_t) * 2 + 1]);
        res.version = static_cast<std::string_view>(bytes.subbuf(fixed_size));
        return res;
    }

    uint8_vector globals_t::encode() const
    {
        uint8_vector out {};
        out.reserve(fixed_size + version.size());
        store_i64_le(out, count);
        store_i64_le(out, flush_count);
        out << static_cast<uint8_t>(key_type);
        out << static_cast<uint8_t>(value_type);
        out << buffer { version };
        return out;
    }

    schema_t open_schema(storage::lmdb::env_t &env, const config_t &cfg, const coltyp_t key_type, const coltyp_t value_type)
    {
        using namespace storage::lmdb;
        txn_t txn { env, txn_mode_t::read_write };
        if (const auto globals = txn.open_table(cfg.globals_table, false); globals) {
            const auto data = txn.open_table(cfg.data_table, false);
            if (!data) [[unlikely]]
                throw error(fmt::format("the database {} has no data table {}", env.path(), cfg.data_table));
            const auto rec = txn.get(*globals, schema_t::globals_key);
            if (!rec) [[unlikely]]
                throw error(fmt::format("the database {} has no metadata record", env.path()));
            const auto g = globals_t::decode(*rec);
            if (g.version != cfg.schema_version)
                throw schema_mismatch_error(fmt::format("the database {} has schema version '{}' but '{}' was expected",
                    env.path(), g.version, cfg.schema_version));
            if (g.key_type != key_type || g.value_type != value_type)
                throw schema_mismatch_error(fmt::format("the database {} stores {} keys and {} values but {} keys and {} values were requested",
                    env.path(), g.key_type, g.value_type, key_type, value_type));
            txn.commit(durability_t::lazy_flush);
            logger::info("opened the dictionary database {} with {} entries", env.path(), g.count);
            return schema_t { *data, *globals };
        }
        // both tables and the metadata record are created in one transaction, so a failure leaves nothing behind
        const auto data = txn.open_table(cfg.data_table, true);
        const auto globals = txn.open_table(cfg.globals_table, true);
        const globals_t g { .key_type=key_type, .value_type=value_type, .version=cfg.schema_version };
        txn.put(*globals, schema_t::globals_key, g.encode());
        txn.commit(durability_t::flush);
        logger::info("created the dictionary database {} for {} keys and {} values", env.path(), key_type, value_type);
        return schema_t { *data, *globals };
    }
}
