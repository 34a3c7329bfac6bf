// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "layout_file.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace kale {

bool read_layout_file(const std::string& path, std::string& contents, std::string& error) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        error = fmt::format("Error reading file {}: {}", path, strerror(errno));
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        error = fmt::format("Error reading file {}: read failed", path);
        return false;
    }

    contents = buffer.str();
    spdlog::debug("[LayoutFile] Read {} bytes from {}", contents.size(), path);
    return true;
}

bool write_layout_file(const std::string& path, const std::string& contents, std::string& error) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        error = fmt::format("Error writing file {}: {}", path, strerror(errno));
        return false;
    }

    file << contents;
    file.flush();
    if (!file.good()) {
        error = fmt::format("Error writing file {}: write failed", path);
        return false;
    }

    spdlog::debug("[LayoutFile] Wrote {} bytes to {}", contents.size(), path);
    return true;
}

std::string derive_output_path(const std::string& input_path, const std::string& suffix) {
    static const std::string extension = ".json";

    size_t slash = input_path.rfind('/');
    size_t name_start = (slash == std::string::npos) ? 0 : slash + 1;

    // ".json" alone is a hidden file name, not an extension
    if (input_path.size() > name_start + extension.size() &&
        input_path.compare(input_path.size() - extension.size(), extension.size(), extension) ==
            0) {
        return input_path.substr(0, input_path.size() - extension.size()) + suffix + extension;
    }
    return input_path + suffix + extension;
}

} // namespace kale
