// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file environment_config.h
 * @brief Type-safe environment variable parsing with validation
 *
 * Settings for the command line front end that have no flag, or whose flag
 * is optional. The layout core itself reads no environment.
 */

#pragma once

#include <optional>
#include <string>

namespace kale::config {

/**
 * @brief Type-safe environment variable configuration reader
 *
 * All methods are static and thread-safe (no shared state).
 * Invalid/missing values return nullopt or a default rather than throwing.
 */
class EnvironmentConfig {
  public:
    // ========================================================================
    // Generic type-safe parsers
    // ========================================================================

    /**
     * @brief Check if environment variable equals "1"
     *
     * @param name Environment variable name
     * @return true if value is exactly "1", false otherwise
     */
    static bool get_bool(const char* name);

    /**
     * @brief Get string value of environment variable
     *
     * @param name Environment variable name
     * @return String value if exists, nullopt otherwise
     */
    static std::optional<std::string> get_string(const char* name);

    // ========================================================================
    // Application-specific helpers (KALE_* environment variables)
    // ========================================================================

    /**
     * @brief Get log level name from KALE_LOG_LEVEL
     *
     * Accepts spdlog level names (trace, debug, info, warn, err, critical,
     * off), case-insensitive, plus "warning" and "error" as aliases.
     *
     * @return Normalized spdlog level name, or nullopt if not set/invalid
     */
    static std::optional<std::string> get_log_level();

    /**
     * @brief Check if verbose logging is forced via KALE_VERBOSE=1
     */
    static bool get_verbose();

    /**
     * @brief Get output filename suffix from KALE_OUTPUT_SUFFIX
     *
     * Inserted before the ".json" extension of the derived output file.
     *
     * @return Suffix, or "_output" if not set/empty
     */
    static std::string get_output_suffix();
};

} // namespace kale::config
