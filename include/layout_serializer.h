// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file layout_serializer.h
 * @brief Re-encodes a Keyboard into the raw layout format
 *
 * Output is canonical, not a byte copy of the source text. Only positional
 * and rotation fields take part in deltas. Persistent style fields
 * (c, t, g, a, f, f2, p) are kept in the model but not re-emitted.
 */

#pragma once

#include "layout_types.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kale {

/**
 * @brief Shortest round-trip decimal form of a number ("1", "0.25", "-1.5")
 */
std::string format_number(double value);

/**
 * @brief Build the property delta object emitted before a key
 *
 * Rotated keys emit r, rx, ry (each only if changed) then y, x (whenever
 * present). Other keys emit y, x, each only if changed. A negative y on a
 * non-rotated key is always emitted since it marks a row start, and a
 * rotated key whose rotation fields are all unchanged still emits the first
 * one present.
 *
 * @param props Properties of the key being emitted
 * @param last Properties of the previously emitted key
 * @return "{...}" or nullopt when no field qualifies
 */
std::optional<std::string> format_property_delta(const KeyProperties& props,
                                                 const KeyProperties& last);

/**
 * @brief Regroup keys into rows
 *
 * The row counter advances before any key whose y offset is negative.
 * Rows are keyed by counter value; empty rows do not appear.
 */
std::map<int, std::vector<const Key*>> group_rows(const std::vector<Key>& keys);

/**
 * @brief Render a key's legends as a quoted, escaped JSON string
 */
std::string format_legend(const Key& key);

/**
 * @brief Serialize a keyboard to raw layout text
 *
 * Metadata (if any) comes first followed by ",\n", then rows joined by ",\n".
 */
std::string to_raw_format(const Keyboard& keyboard);

} // namespace kale
