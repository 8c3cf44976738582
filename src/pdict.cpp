/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <iostream>
#include <pdict/common/logger.hpp>
#include <pdict/dict/dictionary.hpp>

namespace {
    using namespace pdict;
    using namespace pdict::dict;

    using str_dict_t = dictionary_t<std::string, std::string>;

    void require_args(const int argc, const size_t num_args, const std::string_view cmd)
    {
        if (static_cast<size_t>(argc) < 3 + num_args) [[unlikely]]
            throw error(fmt::format("the command '{}' needs {} argument(s)", cmd, num_args));
    }

    void list_entries(const str_dict_t &d, const int argc, char **argv)
    {
        key_range_t<std::string> range {};
        if (argc >= 4)
            range.lower = key_bound_t<std::string> { argv[3], true };
        if (argc >= 5)
            range.upper = key_bound_t<std::string> { argv[4], true };
        size_t n = 0;
        for (const auto &[k, v]: d.range(std::move(range))) {
            std::cout << fmt::format("{}\t{}\n", k, v);
            ++n;
        }
        logger::info("listed {} entries", n);
    }
}

int main(int argc, char **argv)
{
    try {
        if (argc < 3) {
            logger::info("Usage: pdict <dir> <get|set|add|remove|contains|count|list|clear|flush> [<key>] [<value>]");
            throw error("a directory and a command must be named!");
        }
        const std::string cmd = argv[2];
        str_dict_t d { argv[1] };
        if (cmd == "get") {
            require_args(argc, 1, cmd);
            std::cout << d.at(argv[3]) << '\n';
        } else if (cmd == "set") {
            require_args(argc, 2, cmd);
            d.set(argv[3], argv[4]);
        } else if (cmd == "add") {
            require_args(argc, 2, cmd);
            d.add(argv[3], argv[4]);
        } else if (cmd == "remove") {
            require_args(argc, 1, cmd);
            const bool removed = argc >= 5 ? d.remove(argv[3], argv[4]) : d.remove(argv[3]);
            std::cout << (removed ? "removed" : "not removed") << '\n';
        } else if (cmd == "contains") {
            require_args(argc, 1, cmd);
            std::cout << (d.contains_key(argv[3]) ? "true" : "false") << '\n';
        } else if (cmd == "count") {
            std::cout << d.count() << '\n';
        } else if (cmd == "list") {
            list_entries(d, argc, argv);
        } else if (cmd == "clear") {
            d.clear();
        } else if (cmd == "flush") {
            d.flush();
        } else {
            throw error(fmt::format("Unsupported command: '{}'", cmd));
        }
        d.close();
        return 0;
    } catch (const std::exception &ex) {
        logger::error("Terminating due to an exception: {}", ex.what());
        return 1;
    } catch (...) {
        logger::error("Terminating due to an unknown exception");
        return 2;
    }
}
