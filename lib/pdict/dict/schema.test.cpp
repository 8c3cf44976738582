/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <pdict/common/test.hpp>
#include "errors.hpp"
#include "schema.hpp"

namespace {
    using namespace pdict;
    using namespace pdict::dict;

    std::string db_path(const file::tmp_directory &dir, const std::string_view name)
    {
        return (static_cast<std::filesystem::path>(dir) / name).string();
    }
}

suite pdict_dict_schema_suite = [] {
    "pdict::dict::schema"_test = [] {
        const file::tmp_directory tmp_dir { "test-pdict-dict-schema" };
        "metadata record layout"_test = [] {
            const globals_t g { .count=3, .flush_count=258, .key_type=coltyp_t::text, .value_type=coltyp_t::int32, .version="V1" };
            const auto bytes = g.encode();
            expect_equal(uint8_vector::from_hex("0300000000000000" "0201000000000000" "0206" "5631"), bytes);
            expect(globals_t::decode(bytes) == g);
            expect(throws<error>([] { globals_t::decode(uint8_vector::from_hex("0300")); }));
            expect(throws<error>([] { globals_t::decode(uint8_vector::from_hex("0000000000000000" "0000000000000000" "FF06")); }));
        };
        "negative counts survive the encoding"_test = [] {
            const globals_t g { .count=-2 };
            expect_equal(int64_t { -2 }, globals_t::decode(g.encode()).count);
        };
        "creates and reopens"_test = [&] {
            const config_t cfg {};
            const auto path = db_path(tmp_dir, "create.edb");
            {
                storage::lmdb::env_t env { path, cfg.env };
                const auto schema = open_schema(env, cfg, coltyp_t::text, coltyp_t::int64);
                expect_equal(cfg.data_table, schema.data.name);
                expect_equal(cfg.globals_table, schema.globals.name);
                storage::lmdb::txn_t txn { env, storage::lmdb::txn_mode_t::read_only };
                const auto rec = txn.get(schema.globals, schema_t::globals_key);
                expect(rec.has_value());
                const auto g = globals_t::decode(*rec);
                expect_equal(int64_t { 0 }, g.count);
                expect_equal(cfg.schema_version, g.version);
            }
            storage::lmdb::env_t env { path, cfg.env };
            expect(nothrow([&] { open_schema(env, cfg, coltyp_t::text, coltyp_t::int64); }));
        };
        "rejects other types and versions"_test = [&] {
            const config_t cfg {};
            const auto path = db_path(tmp_dir, "mismatch.edb");
            {
                storage::lmdb::env_t env { path, cfg.env };
                open_schema(env, cfg, coltyp_t::text, coltyp_t::int64);
            }
            storage::lmdb::env_t env { path, cfg.env };
            expect(throws<schema_mismatch_error>([&] { open_schema(env, cfg, coltyp_t::int64, coltyp_t::int64); }));
            expect(throws<schema_mismatch_error>([&] { open_schema(env, cfg, coltyp_t::text, coltyp_t::text); }));
            config_t other_cfg {};
            other_cfg.schema_version = "PersistentDictionary V2";
            expect(throws<invalid_argument_error>([&] { open_schema(env, other_cfg, coltyp_t::text, coltyp_t::int64); }));
        };
    };
};
