#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdint>
#include <string>
#include <pdict/storage/lmdb.hpp>
#include "config.hpp"
#include "converters.hpp"

namespace pdict::dict {
    // The single metadata record of a dictionary database.
    // Layout: count (int64 LE), flush_count (int64 LE), key_type (uint8), value_type (uint8), version (the remaining bytes).
    struct globals_t {
        static constexpr size_t fixed_size = sizeof(int64_t) * 2 + 2;

        int64_t count = 0;
        int64_t flush_count = 0;
        coltyp_t key_type = coltyp_t::binary;
        coltyp_t value_type = coltyp_t::binary;
        std::string version {};

        static globals_t decode(buffer bytes);
        [[nodiscard]] uint8_vector encode() const;
        bool operator==(const globals_t &o) const = default;
    };

    struct schema_t {
        // the key of the metadata record within the globals table
        static constexpr std::string_view globals_key = "globals";

        storage::lmdb::table_t data {};
        storage::lmdb::table_t globals {};
    };

    // Opens the tables of an existing database or creates them together with the metadata record.
    // Throws schema_mismatch_error when an existing database was created for other types.
    extern schema_t open_schema(storage::lmdb::env_t &env, const config_t &cfg, coltyp_t key_type, coltyp_t value_type);
}
