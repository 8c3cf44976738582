/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <system_error>
#include "file.hpp"

namespace pdict::file {
    std::string install_path(const std::string_view rel_path)
    {
        if (std::filesystem::path { rel_path }.is_absolute())
            return std::string { rel_path };
        return fmt::format("./{}", rel_path);
    }

    tmp_directory::tmp_directory(const std::string_view name):
        _path { (std::filesystem::temp_directory_path() / name).string() }
    {
        std::filesystem::remove_all(_path);
        if (!std::filesystem::create_directories(_path))
            throw error(fmt::format("failed to create a temporary directory: {}", _path));
    }

    tmp_directory::~tmp_directory()
    {
        // destructors must not throw, hence the error_code overload
        std::error_code ec {};
        std::filesystem::remove_all(_path, ec);
    }
}
