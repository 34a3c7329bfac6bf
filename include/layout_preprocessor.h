// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file layout_preprocessor.h
 * @brief Repairs relaxed raw layout text into strict JSON
 *
 * Raw layout text is near-JSON: rows are separated by line breaks with
 * optional trailing commas, property names may be unquoted, and the row
 * sequence is not wrapped in an enclosing array. These functions only
 * rewrite text. They never validate; malformed input surfaces as a syntax
 * error from the decoder.
 *
 * Object nesting is tracked with a depth counter, so a nested object's
 * closing brace does not end property-name quoting for the enclosing object.
 */

#pragma once

#include <string>
#include <vector>

namespace kale {

/**
 * @brief Convert CRLF and lone CR line endings to LF
 */
std::string normalize_line_endings(const std::string& text);

/**
 * @brief Split into trimmed, non-blank lines with one trailing comma removed
 *
 * @param text Text with LF line endings
 * @return Cleaned lines in input order
 */
std::vector<std::string> split_layout_lines(const std::string& text);

/**
 * @brief Join lines with commas and wrap the result in [ ]
 */
std::string wrap_layout_rows(const std::vector<std::string>& lines);

/**
 * @brief Quote unquoted property names inside objects
 *
 * `{x:1, y : 2}` becomes `{"x":1, "y" : 2}`. Already quoted names and
 * anything inside string literals are left alone.
 */
std::string quote_property_names(const std::string& text);

/**
 * @brief Full repair pass: line cleanup, wrapping, property-name quoting
 *
 * @param raw Raw layout text
 * @return Text that parses as a JSON array for well-formed input
 */
std::string repair_raw_layout(const std::string& raw);

} // namespace kale
