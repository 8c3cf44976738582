#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <pdict/common/error.hpp>

namespace pdict::dict {
    struct key_not_found_error: error {
        using error::error;
    };

    struct duplicate_key_error: error {
        using error::error;
    };

    struct invalid_argument_error: error {
        using error::error;
    };

    // the database exists but was created for another schema version or other key or value types
    struct schema_mismatch_error: invalid_argument_error {
        using invalid_argument_error::invalid_argument_error;
    };
}
