/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <iostream>
#include <pdict/common/logger.hpp>
#include <pdict/common/test.hpp>

int main(const int argc, const char **argv)
{
    using namespace pdict;
    if (argc >= 2) {
        std::cerr << fmt::format("using test-filter mask: {}\n", argv[1]);
        boost::ut::cfg<boost::ut::override> = { .filter = argv[1] };
    }
    logger::info("run-test: logging to {}", logger::log_path());
    // run() reports whether any test has failed
    const bool failed = boost::ut::cfg<boost::ut::override>.run();
    return failed ? 1 : 0;
}
