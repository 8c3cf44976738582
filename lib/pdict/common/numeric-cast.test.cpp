/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "test.hpp"
#include "numeric-cast.hpp"

namespace {
    using namespace pdict;
}

suite pdict_common_numeric_cast_suite = [] {
    "pdict::common::numeric_cast"_test = [] {
        "same signedness"_test = [] {
            expect_equal(uint8_t { 255 }, numeric_cast<uint8_t>(uint64_t { 255 }));
            expect(throws<error>([] { numeric_cast<uint8_t>(uint64_t { 256 }); }));
            expect_equal(int8_t { -128 }, numeric_cast<int8_t>(int64_t { -128 }));
            expect(throws<error>([] { numeric_cast<int8_t>(int64_t { -129 }); }));
        };
        "signed to unsigned"_test = [] {
            expect_equal(size_t { 1234 }, numeric_cast<size_t>(int64_t { 1234 }));
            expect(throws<error>([] { numeric_cast<size_t>(int64_t { -1 }); }));
            expect(throws<error>([] { numeric_cast<uint16_t>(int32_t { 0x10000 }); }));
        };
        "unsigned to signed"_test = [] {
            expect_equal(int64_t { 77 }, numeric_cast<int64_t>(size_t { 77 }));
            expect(throws<error>([] { numeric_cast<int64_t>(std::numeric_limits<uint64_t>::max()); }));
            expect_equal(int32_t { 0x7FFFFFFF }, numeric_cast<int32_t>(uint32_t { 0x7FFFFFFF }));
        };
    };
};
