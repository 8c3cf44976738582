/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <pdict/common/test.hpp>
#include "logger.hpp"

using namespace pdict;

suite common_logger_suite = [] {
    "pdict::common::logger"_test = [] {
        "api"_test = [] {
            // checks that the code compiles and does not fail
            logger::trace("OK - trace");
            logger::trace("OK - {}", "trace");
            logger::debug("OK - debug");
            logger::debug("OK - {}", "debug");
            logger::info("OK - info");
            logger::info("OK - {}", "info");
            logger::warn("OK - warn");
            logger::warn("OK - {}", "warn");
            logger::error("OK - error");
            logger::error("OK - {}", "error");
            expect(true);
        };
        "log path"_test = [] {
            expect(logger::log_path().ends_with(".log"));
        };
        "run_and_log_errors"_test = [] {
            const auto ex1 = logger::run_log_errors([] { return true; });
            expect(!ex1);
            size_t cleanups = 0;
            const auto ex2 = logger::run_log_errors([] { throw error("Something bad!"); }, [&] { ++cleanups; });
            expect(static_cast<bool>(ex2));
            expect_equal(size_t { 1 }, cleanups);
        };
        "run_log_errors_and_rethrow"_test = [] {
            expect(nothrow([] { logger::run_log_errors_rethrow([] { return true; }); }));
            expect(throws<error>([] { logger::run_log_errors_rethrow([] { throw error("Something bad!"); }); }));
        };
    };
};
