/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <vector>
#include <pdict/common/test.hpp>
#include "dictionary.hpp"

namespace {
    using namespace pdict;
    using namespace pdict::dict;

    using dict_t = dictionary_t<int32_t, std::string>;

    std::string dict_dir(const file::tmp_directory &dir, const std::string_view name)
    {
        return (static_cast<std::filesystem::path>(dir) / name).string();
    }

    std::vector<int32_t> range_keys(const dict_t &d, key_range_t<int32_t> range)
    {
        std::vector<int32_t> res {};
        for (const auto &[k, v]: d.range(std::move(range)))
            res.emplace_back(k);
        return res;
    }
}

suite pdict_dict_enumerator_suite = [] {
    "pdict::dict::enumerator"_test = [] {
        const file::tmp_directory tmp_dir { "test-pdict-dict-enumerator" };
        "an empty dictionary is exhausted at once"_test = [&] {
            dict_t d { dict_dir(tmp_dir, "empty") };
            auto e = d.entries().enumerator();
            expect(e->state() == enum_state_t::not_started);
            expect(!e->next().has_value());
            expect(e->state() == enum_state_t::exhausted);
            expect(!e->next().has_value());
            expect(d.entries().begin() == d.entries().end());
        };
        "items come in ascending key order"_test = [&] {
            dict_t d { dict_dir(tmp_dir, "order") };
            for (const int32_t k: { 5, -3, 100, 0, -1000, 42 })
                d.set(k, fmt::format("v{}", k));
            auto e = d.keys().enumerator();
            std::vector<int32_t> keys {};
            while (const auto k = e->next()) {
                expect(e->state() == enum_state_t::positioned);
                keys.emplace_back(*k);
            }
            expect(e->state() == enum_state_t::exhausted);
            expect_equal(std::vector<int32_t> { -1000, -3, 0, 5, 42, 100 }, keys);
        };
        "key ranges"_test = [&] {
            dict_t d { dict_dir(tmp_dir, "ranges") };
            for (int32_t k = 1; k <= 9; ++k)
                d.set(k, "x");
            expect_equal(std::vector<int32_t> { 3, 4, 5, 6 }, range_keys(d, { key_bound_t<int32_t> { 3, true }, key_bound_t<int32_t> { 6, true } }));
            expect_equal(std::vector<int32_t> { 4, 5 }, range_keys(d, { key_bound_t<int32_t> { 3, false }, key_bound_t<int32_t> { 6, false } }));
            expect_equal(std::vector<int32_t> { 1, 2 }, range_keys(d, { {}, key_bound_t<int32_t> { 3, false } }));
            expect_equal(std::vector<int32_t> { 8, 9 }, range_keys(d, { key_bound_t<int32_t> { 8, true }, {} }));
            expect_equal(std::vector<int32_t> { 1, 2, 3, 4, 5, 6, 7, 8, 9 }, range_keys(d, {}));
            // bounds that do not match a stored key
            expect_equal(std::vector<int32_t> { 1, 2, 3 }, range_keys(d, { key_bound_t<int32_t> { -5, false }, key_bound_t<int32_t> { 3, true } }));
            expect_equal(std::vector<int32_t> {}, range_keys(d, { key_bound_t<int32_t> { 10, true }, {} }));
            expect_equal(std::vector<int32_t> {}, range_keys(d, { key_bound_t<int32_t> { 6, true }, key_bound_t<int32_t> { 3, true } }));
            expect_equal(std::vector<int32_t> {}, range_keys(d, { key_bound_t<int32_t> { 5, false }, key_bound_t<int32_t> { 5, true } }));
            expect_equal(size_t { 3 }, d.range({ key_bound_t<int32_t> { 7, true }, {} }).size());
        };
        "changes between steps"_test = [&] {
            dict_t d { dict_dir(tmp_dir, "changes") };
            for (const int32_t k: { 10, 20, 30, 40 })
                d.set(k, "x");
            auto e = d.keys().enumerator();
            expect_equal(int32_t { 10 }, e->next().value_or(-1));
            // a key deleted ahead of the position is never produced, a key inserted ahead of it is
            expect(d.remove(30));
            d.set(25, "y");
            // a key inserted behind the position is not produced
            d.set(5, "z");
            std::vector<int32_t> rest {};
            while (const auto k = e->next())
                rest.emplace_back(*k);
            expect_equal(std::vector<int32_t> { 20, 25, 40 }, rest);
        };
        "the current row deleted between steps"_test = [&] {
            dict_t d { dict_dir(tmp_dir, "current") };
            for (const int32_t k: { 1, 2, 3 })
                d.set(k, "x");
            auto e = d.keys().enumerator();
            expect_equal(int32_t { 1 }, e->next().value_or(-1));
            expect_equal(int32_t { 2 }, e->next().value_or(-1));
            expect(d.remove(2));
            expect_equal(int32_t { 3 }, e->next().value_or(-1));
            expect(!e->next().has_value());
        };
        "dispose ends the scan"_test = [&] {
            dict_t d { dict_dir(tmp_dir, "dispose") };
            d.set(1, "x");
            d.set(2, "y");
            auto e = d.entries().enumerator();
            const auto first = e->next();
            expect(first.has_value());
            expect_equal(std::string { "x" }, first->second);
            e->dispose();
            expect(!e->next().has_value());
            expect(nothrow([&] { e->dispose(); }));
        };
        "views are lazy and restartable"_test = [&] {
            dict_t d { dict_dir(tmp_dir, "views") };
            const auto vals = d.values();
            expect_equal(size_t { 0 }, vals.size());
            d.set(2, "b");
            d.set(1, "a");
            std::vector<std::string> seen {};
            for (const auto &v: vals)
                seen.emplace_back(v);
            expect_equal(std::vector<std::string> { "a", "b" }, seen);
            seen.clear();
            for (const auto &v: vals)
                seen.emplace_back(v);
            expect_equal(size_t { 2 }, seen.size());
            expect(vals.contains("b"));
            expect(!vals.contains("c"));
            expect_equal(size_t { 2 }, vals.size());
        };
    };
};
