/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cmath>
#include <limits>
#include <pdict/common/test.hpp>
#include "converters.hpp"

namespace {
    using namespace pdict;
    using namespace pdict::dict;

    // the encodings of an ascending sequence must be strictly ascending as byte strings
    template<typename T>
    bool encodes_in_order(const std::vector<T> &sorted)
    {
        for (size_t i = 1; i < sorted.size(); ++i) {
            const auto prev = converter_t<T>::encode(sorted[i - 1]);
            const auto next = converter_t<T>::encode(sorted[i]);
            if (!(prev < next))
                return false;
        }
        return true;
    }

    static_assert(persistable<std::string>);
    static_assert(persistable<uint8_vector>);
    static_assert(persistable<bool>);
    static_assert(persistable<int32_t>);
    static_assert(persistable<uint64_t>);
    static_assert(persistable<double>);
    static_assert(!persistable<std::vector<int>>);
}

suite pdict_dict_converters_suite = [] {
    "pdict::dict::converters"_test = [] {
        "column tags"_test = [] {
            expect_equal(coltyp_t::text, converter_t<std::string>::coltyp);
            expect_equal(coltyp_t::binary, converter_t<uint8_vector>::coltyp);
            expect_equal(coltyp_t::int16, converter_t<int16_t>::coltyp);
            expect_equal(coltyp_t::uint32, converter_t<uint32_t>::coltyp);
            expect_equal(coltyp_t::int64, converter_t<int64_t>::coltyp);
            expect_equal(coltyp_t::float64, converter_t<double>::coltyp);
            expect_equal(std::string_view { "float32" }, coltyp_name(converter_t<float>::coltyp));
        };
        "signed integers keep their order"_test = [] {
            expect(encodes_in_order<int32_t>({ std::numeric_limits<int32_t>::min(), -1000, -1, 0, 1, 255, 256, std::numeric_limits<int32_t>::max() }));
            expect(encodes_in_order<int8_t>({ -128, -1, 0, 1, 127 }));
            expect_equal(int64_t { -42 }, converter_t<int64_t>::decode(converter_t<int64_t>::encode(-42)));
        };
        "unsigned integers keep their order"_test = [] {
            expect(encodes_in_order<uint64_t>({ 0, 1, 0xFF, 0x100, 0xFFFFFFFFULL, std::numeric_limits<uint64_t>::max() }));
            expect_equal(uint8_vector::from_hex("00000102"), converter_t<uint32_t>::encode(0x0102U));
        };
        "floating point values keep their order"_test = [] {
            expect(encodes_in_order<double>({ -std::numeric_limits<double>::infinity(), -1e10, -1.5, -1e-300, 0.0, 1e-300, 1.5, 1e10, std::numeric_limits<double>::infinity() }));
            expect(encodes_in_order<float>({ -2.5F, -0.5F, 0.0F, 0.5F, 2.5F }));
            expect_equal(-1.5, converter_t<double>::decode(converter_t<double>::encode(-1.5)));
            expect_equal(0.25F, converter_t<float>::decode(converter_t<float>::encode(0.25F)));
        };
        "strings order as bytes"_test = [] {
            expect(encodes_in_order<std::string>({ "", "a", "ab", "b", "ba", "\xFF" }));
            expect_equal(std::string { "hello" }, converter_t<std::string>::decode(converter_t<std::string>::encode("hello")));
        };
        "booleans"_test = [] {
            expect(encodes_in_order<bool>({ false, true }));
            expect(converter_t<bool>::decode(converter_t<bool>::encode(true)));
        };
        "mismatched widths are rejected"_test = [] {
            const auto bytes = converter_t<int16_t>::encode(7);
            expect(throws<error>([&] { converter_t<int32_t>::decode(bytes); }));
            expect(throws<error>([&] { converter_t<double>::decode(bytes); }));
        };
        "floating-point keys are canonical"_test = [] {
            using conv = converters_t<double, int32_t>;
            expect_equal(conv::encode_key(0.0), conv::encode_key(-0.0));
            expect(!std::signbit(conv::decode_key(conv::encode_key(-0.0))));
            expect(conv::encode_key(-1e-300) < conv::encode_key(-0.0));
            expect(throws<invalid_argument_error>([] { conv::encode_key(std::numeric_limits<double>::quiet_NaN()); }));
            expect(throws<invalid_argument_error>([] { converters_t<float, int32_t>::encode_key(-std::numeric_limits<float>::quiet_NaN()); }));
            // values keep their exact bits
            expect(std::signbit(converters_t<int32_t, double>::decode_value(converters_t<int32_t, double>::encode_value(-0.0))));
        };
        "keys carry their column tag"_test = [] {
            using conv = converters_t<std::string, int64_t>;
            const auto empty_key = conv::encode_key("");
            expect_equal(size_t { 1 }, empty_key.size());
            expect_equal(std::string {}, conv::decode_key(empty_key));
            expect(conv::encode_key("a") < conv::encode_key("b"));
            expect(throws<error>([] { conv::decode_key(converters_t<int32_t, int64_t>::encode_key(1)); }));
            expect(throws<error>([] { conv::decode_key(buffer {}); }));
            expect_equal(int64_t { 99 }, conv::decode_value(conv::encode_value(99)));
        };
    };
};
