// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "keyboard_layout.h"

#include "layout_decoder.h"
#include "layout_interpreter.h"
#include "layout_preprocessor.h"

#include <spdlog/spdlog.h>

namespace kale {

DecodeError parse_layout(const std::string& raw, Keyboard& keyboard) {
    std::string repaired = repair_raw_layout(raw);

    std::optional<KeyboardMetadata> metadata;
    json rows;
    DecodeError err = decode_layout_document(repaired, metadata, rows);
    if (!err.success()) {
        spdlog::error("[kale] Layout decode failed: {}", err.describe());
        return err;
    }

    LayoutInterpreter interpreter;
    err = interpreter.run(rows);
    if (!err.success()) {
        spdlog::error("[kale] Layout decode failed: {}", err.describe());
        return err;
    }

    keyboard.metadata = std::move(metadata);
    keyboard.keys = interpreter.take_keys();

    spdlog::debug("[kale] Parsed layout: {} keys, {} rows", keyboard.keys.size(),
                  interpreter.rows_completed());
    return {};
}

} // namespace kale
