// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "environment_config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>

namespace kale::config {

bool EnvironmentConfig::get_bool(const char* name) {
    const char* value = std::getenv(name);
    return value != nullptr && strcmp(value, "1") == 0;
}

std::optional<std::string> EnvironmentConfig::get_string(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

// ============================================================================
// Application-specific helpers
// ============================================================================

std::optional<std::string> EnvironmentConfig::get_log_level() {
    auto value = get_string("KALE_LOG_LEVEL");
    if (!value || value->empty()) {
        return std::nullopt;
    }

    std::string level = *value;
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (level == "warning") {
        level = "warn";
    } else if (level == "error") {
        level = "err";
    }

    static const char* const valid_levels[] = {"trace", "debug",    "info", "warn",
                                               "err",   "critical", "off"};
    for (const char* valid : valid_levels) {
        if (level == valid) {
            return level;
        }
    }
    return std::nullopt;
}

bool EnvironmentConfig::get_verbose() {
    return get_bool("KALE_VERBOSE");
}

std::string EnvironmentConfig::get_output_suffix() {
    // KALE_OUTPUT_SUFFIX: empty means default
    auto value = get_string("KALE_OUTPUT_SUFFIX");
    if (!value || value->empty()) {
        return "_output";
    }
    return *value;
}

} // namespace kale::config
