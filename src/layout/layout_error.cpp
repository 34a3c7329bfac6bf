// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "layout_error.h"

#include <spdlog/spdlog.h>

namespace kale {

const char* decode_result_name(DecodeResult result) {
    switch (result) {
    case DecodeResult::SUCCESS:
        return "success";
    case DecodeResult::SYNTAX_ERROR:
        return "syntax error";
    case DecodeResult::METADATA_SCHEMA:
        return "metadata schema mismatch";
    case DecodeResult::PROPERTY_SCHEMA:
        return "property schema mismatch";
    case DecodeResult::ROW_SHAPE:
        return "malformed row";
    }
    return "unknown";
}

std::string DecodeError::describe() const {
    if (row >= 0 && item >= 0) {
        return fmt::format("{} at row {}, item {}: {}", decode_result_name(result), row, item,
                           message);
    }
    if (row >= 0) {
        return fmt::format("{} at row {}: {}", decode_result_name(result), row, message);
    }
    if (message.empty()) {
        return decode_result_name(result);
    }
    return fmt::format("{}: {}", decode_result_name(result), message);
}

} // namespace kale
