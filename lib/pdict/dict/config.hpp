#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <string>
#include <pdict/storage/lmdb.hpp>

namespace pdict::dict {
    // Names and engine parameters of a dictionary database. The defaults are suitable for most uses.
    struct config_t {
        std::string database_name = "PersistentDictionary.edb";
        std::string data_table = "data";
        std::string globals_table = "globals";
        std::string schema_version = "PersistentDictionary V1";
        storage::lmdb::env_config_t env {};
    };
}
