// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file layout_decoder.h
 * @brief JSON decoding of repaired layout text, metadata and property patches
 *
 * Decoding is tolerant: unknown keys are ignored, every field is optional and
 * null counts as absent. A field present with the wrong type fails the decode.
 */

#pragma once

#include "layout_error.h"
#include "layout_types.h"

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace kale {

using json = nlohmann::json;

/**
 * @brief Decode repaired text into metadata and the row sequence
 *
 * If the first element is an object it is removed and decoded as metadata.
 * A fully wrapped document (`[{meta},[row],...]` inside the outer array)
 * is unwrapped first.
 *
 * @param repaired Output of repair_raw_layout()
 * @param[out] metadata Decoded metadata, or nullopt if there is none
 * @param[out] rows Remaining row entries (JSON array)
 * @return DecodeError with SYNTAX_ERROR or METADATA_SCHEMA on failure
 */
DecodeError decode_layout_document(const std::string& repaired,
                                   std::optional<KeyboardMetadata>& metadata, json& rows);

/**
 * @brief Decode a metadata object
 *
 * Accepts snake_case names and the camelCase switch aliases
 * (switchBrand, switchMount, switchType).
 */
DecodeError decode_metadata(const json& object, KeyboardMetadata& metadata);

/**
 * @brief Decode a property patch object
 *
 * Numbers accept integer and fractional forms. a/f/f2 must be integral
 * and within 0..255.
 */
DecodeError decode_key_properties(const json& object, KeyProperties& properties);

/**
 * @brief Encode metadata as a JSON object, omitting absent fields
 */
json encode_metadata(const KeyboardMetadata& metadata);

} // namespace kale
