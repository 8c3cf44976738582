#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <bit>
#include <cmath>
#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <pdict/common/bytes.hpp>
#include "errors.hpp"

namespace pdict::dict {
    // Column type tags. Stored in the metadata record to detect a database opened with other key or value types.
    enum class coltyp_t: uint8_t {
        binary = 1,
        text = 2,
        boolean = 3,
        int8 = 4,
        int16 = 5,
        int32 = 6,
        int64 = 7,
        uint8 = 8,
        uint16 = 9,
        uint32 = 10,
        uint64 = 11,
        float32 = 12,
        float64 = 13
    };

    extern std::string_view coltyp_name(coltyp_t typ);

    // Encodings are order-preserving: memcmp over the encoded bytes orders them exactly as operator<
    // orders the decoded values. The storage engine relies on its native byte order for the key index.
    template<typename T>
    struct converter_t;

    template<>
    struct converter_t<std::string> {
        static constexpr coltyp_t coltyp = coltyp_t::text;

        static uint8_vector encode(const std::string &val)
        {
            return uint8_vector(buffer { val });
        }

        static std::string decode(const buffer bytes)
        {
            return std::string { static_cast<std::string_view>(bytes) };
        }
    };

    template<>
    struct converter_t<uint8_vector> {
        static constexpr coltyp_t coltyp = coltyp_t::binary;

        static uint8_vector encode(const uint8_vector &val)
        {
            return val;
        }

        static uint8_vector decode(const buffer bytes)
        {
            return uint8_vector(bytes);
        }
    };

    template<>
    struct converter_t<bool> {
        static constexpr coltyp_t coltyp = coltyp_t::boolean;

        static uint8_vector encode(const bool val)
        {
            uint8_vector out {};
            out << uint8_t { val ? uint8_t { 1 } : uint8_t { 0 } };
            return out;
        }

        static bool decode(const buffer bytes)
        {
            return bytes.to<uint8_t>() != 0;
        }
    };

    template<typename T>
    constexpr coltyp_t integral_coltyp()
    {
        if constexpr (std::is_signed_v<T>) {
            switch (sizeof(T)) {
                case 1: return coltyp_t::int8;
                case 2: return coltyp_t::int16;
                case 4: return coltyp_t::int32;
                default: return coltyp_t::int64;
            }
        } else {
            switch (sizeof(T)) {
                case 1: return coltyp_t::uint8;
                case 2: return coltyp_t::uint16;
                case 4: return coltyp_t::uint32;
                default: return coltyp_t::uint64;
            }
        }
    }

    // Big-endian, with the sign bit flipped for signed types so that negative values sort first.
    template<std::integral T>
        requires (!std::same_as<T, bool> && sizeof(T) <= 8)
    struct converter_t<T> {
        using unsigned_type = std::make_unsigned_t<T>;
        static constexpr coltyp_t coltyp = integral_coltyp<T>();
        static constexpr unsigned_type sign_mask = std::is_signed_v<T>
            ? static_cast<unsigned_type>(unsigned_type { 1 } << (sizeof(T) * 8 - 1)) : unsigned_type { 0 };

        static uint8_vector encode(const T val)
        {
            const auto net = host_to_net(static_cast<unsigned_type>(static_cast<unsigned_type>(val) ^ sign_mask));
            return uint8_vector(buffer::from(net));
        }

        static T decode(const buffer bytes)
        {
            return static_cast<T>(static_cast<unsigned_type>(bytes.to_host<unsigned_type>() ^ sign_mask));
        }
    };

    // IEEE 754 values order as sign-magnitude integers: positives get the sign bit set, negatives are inverted.
    template<std::floating_point T>
        requires (sizeof(T) == 4 || sizeof(T) == 8)
    struct converter_t<T> {
        using bits_type = std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>;
        static constexpr coltyp_t coltyp = sizeof(T) == 4 ? coltyp_t::float32 : coltyp_t::float64;
        static constexpr bits_type sign_mask = bits_type { 1 } << (sizeof(T) * 8 - 1);

        static uint8_vector encode(const T val)
        {
            auto bits = std::bit_cast<bits_type>(val);
            bits = (bits & sign_mask) ? ~bits : (bits | sign_mask);
            const auto net = host_to_net(bits);
            return uint8_vector(buffer::from(net));
        }

        static T decode(const buffer bytes)
        {
            auto bits = bytes.to_host<bits_type>();
            bits = (bits & sign_mask) ? (bits & ~sign_mask) : ~bits;
            return std::bit_cast<T>(bits);
        }
    };

    template<typename T>
    concept persistable = requires(const T &val, const buffer bytes) {
        { converter_t<T>::coltyp } -> std::convertible_to<coltyp_t>;
        { converter_t<T>::encode(val) } -> std::same_as<uint8_vector>;
        { converter_t<T>::decode(bytes) } -> std::same_as<T>;
    };

    // Key and value converters of a dictionary. Encoded keys carry their column tag as a one-byte prefix:
    // the engine rejects zero-length keys and an empty string must remain a valid key.
    template<persistable K, persistable V>
    struct converters_t {
        static constexpr coltyp_t key_coltyp = converter_t<K>::coltyp;
        static constexpr coltyp_t value_coltyp = converter_t<V>::coltyp;

        // Floating-point keys are canonical: -0.0 is stored as +0.0 and NaN, which equals no key, is rejected.
        static uint8_vector encode_key(const K &key)
        {
            uint8_vector out {};
            out << static_cast<uint8_t>(key_coltyp);
            if constexpr (std::is_floating_point_v<K>) {
                if (std::isnan(key)) [[unlikely]]
                    throw invalid_argument_error("NaN cannot be used as a dictionary key");
                out << static_cast<buffer>(converter_t<K>::encode(key == K { 0 } ? K { 0 } : key));
            } else {
                out << static_cast<buffer>(converter_t<K>::encode(key));
            }
            return out;
        }

        static K decode_key(const buffer bytes)
        {
            if (bytes.empty() || bytes[0] != static_cast<uint8_t>(key_coltyp)) [[unlikely]]
                throw error(fmt::format("an encoded key has an unexpected column tag: {}", bytes));
            return converter_t<K>::decode(bytes.subbuf(1));
        }

        static uint8_vector encode_value(const V &val)
        {
            return converter_t<V>::encode(val);
        }

        static V decode_value(const buffer bytes)
        {
            return converter_t<V>::decode(bytes);
        }
    };
}

namespace fmt {
    template<>
    struct formatter<pdict::dict::coltyp_t>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const pdict::dict::coltyp_t &typ, FormatContext &ctx) const -> decltype(ctx.out()) {
            return formatter<std::string_view>::format(pdict::dict::coltyp_name(typ), ctx);
        }
    };
}
