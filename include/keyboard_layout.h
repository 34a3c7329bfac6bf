// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file keyboard_layout.h
 * @brief Entry points for parsing and serializing raw keyboard layouts
 *
 * Pipeline: raw text -> repair_raw_layout() -> decode_layout_document()
 * -> LayoutInterpreter -> Keyboard. to_raw_format() goes the other way.
 *
 * @threading No global state; concurrent calls on different inputs are safe
 */

#pragma once

#include "layout_error.h"
#include "layout_serializer.h"
#include "layout_types.h"

#include <string>

namespace kale {

/**
 * @brief Parse raw layout text into a Keyboard
 *
 * @param raw Raw layout text (relaxed JSON rows, optional metadata first)
 * @param[out] keyboard Replaced on success, untouched on failure
 * @return DecodeError describing the first failure, or success
 */
DecodeError parse_layout(const std::string& raw, Keyboard& keyboard);

} // namespace kale
