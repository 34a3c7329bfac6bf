// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file layout_types.h
 * @brief Data model for raw keyboard layouts
 *
 * A layout is a list of rows. Each row mixes property patches (objects) and
 * legends (strings). Interpreting the rows yields a Keyboard: optional
 * metadata plus a flat list of placed keys.
 *
 * @pattern POD structs with small helper methods
 * @threading Value types, no shared state
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kale {

/// Marker splitting a legend string into its visual positions
constexpr char LEGEND_SEPARATOR = '\n';

/**
 * @brief Keyboard background image reference
 */
struct Background {
    std::string name;
    std::string style;
};

/**
 * @brief Descriptive record for the keyboard as a whole
 *
 * All fields optional. Absent fields are omitted on re-encoding.
 */
struct KeyboardMetadata {
    std::optional<std::string> author;
    std::optional<std::string> backcolor; // Background color, e.g. "#eeeeee"
    std::optional<Background> background;
    std::optional<std::string> name;
    std::optional<std::string> notes;
    std::optional<std::string> radii; // Corner radius, e.g. "6px"
    std::optional<std::string> switch_brand;
    std::optional<std::string> switch_mount;
    std::optional<std::string> switch_type;
};

/**
 * @brief Every recognized property key
 *
 * Transient fields apply to the next legend only and are cleared once it is
 * placed. Persistent fields stay in effect until a later patch sets them.
 */
struct KeyProperties {
    // Next key only
    std::optional<double> x;
    std::optional<double> y;
    std::optional<double> w;
    std::optional<double> h;
    std::optional<double> x2;
    std::optional<double> y2;
    std::optional<double> w2;
    std::optional<double> h2;
    std::optional<bool> l; // Stepped
    std::optional<bool> n; // Homing
    std::optional<bool> d; // Decal

    // Rotation (also next key only)
    std::optional<double> r;  // Angle in degrees
    std::optional<double> rx; // Rotation center x
    std::optional<double> ry; // Rotation center y

    // All subsequent keys
    std::optional<std::string> c; // Keycap color
    std::optional<std::string> t; // Text color
    std::optional<bool> g;        // Ghosted
    std::optional<uint8_t> a;     // Text alignment
    std::optional<uint8_t> f;     // Primary font size
    std::optional<uint8_t> f2;    // Secondary font size
    std::optional<std::string> p; // Profile and row

    /** @brief True if any of r, rx, ry is set */
    bool has_rotation() const {
        return r.has_value() || rx.has_value() || ry.has_value();
    }

    /**
     * @brief Merge a patch into this accumulator
     *
     * Persistent fields are copied only where the patch sets them. Transient
     * fields are overwritten unconditionally, so a transient field missing
     * from the patch becomes unset.
     */
    void apply_patch(const KeyProperties& patch);

    /** @brief Reset every transient field to unset */
    void clear_transient();
};

/**
 * @brief One placed key
 */
struct Key {
    std::vector<std::string> legends; ///< Never empty
    KeyProperties properties;         ///< Snapshot at placement time
    double x = 0.0;                   ///< Resolved absolute x
    double y = 0.0;                   ///< Resolved absolute y
    int row = 0;                      ///< Zero-based source row index
};

/**
 * @brief Top-level layout aggregate
 *
 * Keys are stored in encounter order (row, then column).
 */
struct Keyboard {
    std::optional<KeyboardMetadata> metadata;
    std::vector<Key> keys;
};

/**
 * @brief Split a legend string on LEGEND_SEPARATOR
 *
 * An empty string yields a one-element list holding the empty string.
 */
std::vector<std::string> split_legends(const std::string& legend);

/**
 * @brief Join legends with LEGEND_SEPARATOR (inverse of split_legends)
 */
std::string join_legends(const std::vector<std::string>& legends);

} // namespace kale
