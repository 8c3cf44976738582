#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <filesystem>
#include <string>
#include <string_view>
#include "error.hpp"
#include "format.hpp"

namespace pdict::file {
    extern std::string install_path(std::string_view rel_path);

    // A scratch directory below the system temp directory. Starts empty and is removed with its contents on destruction.
    struct tmp_directory {
        explicit tmp_directory(std::string_view name);
        ~tmp_directory();

        tmp_directory(const tmp_directory &) =delete;
        tmp_directory &operator=(const tmp_directory &) =delete;

        const std::string &path() const noexcept
        {
            return _path;
        }

        operator std::filesystem::path() const
        {
            return _path;
        }
    private:
        std::string _path;
    };
}
