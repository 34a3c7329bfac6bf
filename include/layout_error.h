// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

namespace kale {

/**
 * @brief Layout decode result codes
 */
enum class DecodeResult {
    SUCCESS = 0,     ///< Decoded without error
    SYNTAX_ERROR,    ///< Repaired text is not valid JSON
    METADATA_SCHEMA, ///< Leading object does not match the metadata schema
    PROPERTY_SCHEMA, ///< Property patch has a field of the wrong type
    ROW_SHAPE        ///< Top-level entry after metadata is not a row array
};

/**
 * @brief Detailed error information for a failed decode
 *
 * Row and item indices are zero-based and -1 when not applicable.
 */
struct DecodeError {
    DecodeResult result; ///< Primary error code
    std::string message; ///< Technical details for logging/debugging
    int row;             ///< Row the failure occurred in
    int item;            ///< Item within the row

    DecodeError(DecodeResult r = DecodeResult::SUCCESS, const std::string& msg = "", int row_index = -1,
                int item_index = -1)
        : result(r), message(msg), row(row_index), item(item_index) {}

    bool success() const {
        return result == DecodeResult::SUCCESS;
    }
    operator bool() const {
        return success();
    }

    /**
     * @brief Human readable one-line description including location
     * @return e.g. "property schema mismatch at row 2, item 1: field 'x' must be a number"
     */
    std::string describe() const;
};

/**
 * @brief Short lowercase name for a result code
 */
const char* decode_result_name(DecodeResult result);

} // namespace kale
