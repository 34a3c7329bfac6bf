// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "layout_interpreter.h"

#include "layout_decoder.h"

#include <spdlog/spdlog.h>

namespace kale {

LayoutInterpreter::LayoutInterpreter() {
    reset();
}

void LayoutInterpreter::reset() {
    current_x_ = 0.0;
    current_y_ = 0.0;
    row_ = 0;
    properties_ = KeyProperties();
    keys_.clear();
}

DecodeError LayoutInterpreter::run(const nlohmann::json& rows) {
    if (!rows.is_array()) {
        return DecodeError(DecodeResult::ROW_SHAPE,
                           fmt::format("expected an array of rows, got {}", rows.type_name()));
    }

    for (size_t row_index = 0; row_index < rows.size(); ++row_index) {
        const auto& row = rows[row_index];
        if (!row.is_array()) {
            spdlog::debug("[LayoutInterpreter] Row {} is a {}, not an array", row_index,
                          row.type_name());
            return DecodeError(DecodeResult::ROW_SHAPE,
                               fmt::format("expected an array, got {}", row.type_name()),
                               static_cast<int>(row_index));
        }

        begin_row();
        for (size_t item_index = 0; item_index < row.size(); ++item_index) {
            DecodeError err = feed(row[item_index]);
            if (!err.success()) {
                err.row = static_cast<int>(row_index);
                err.item = static_cast<int>(item_index);
                spdlog::debug("[LayoutInterpreter] Stopped: {}", err.describe());
                return err;
            }
        }
        end_row();
    }

    spdlog::debug("[LayoutInterpreter] Placed {} keys in {} rows", keys_.size(), row_);
    return {};
}

void LayoutInterpreter::begin_row() {
    current_x_ = 0.0;
}

void LayoutInterpreter::end_row() {
    current_y_ += 1.0;
    row_++;
}

DecodeError LayoutInterpreter::feed(const nlohmann::json& item) {
    if (item.is_object()) {
        KeyProperties patch;
        DecodeError err = decode_key_properties(item, patch);
        if (!err.success()) {
            return err;
        }
        apply_patch(patch);
    } else if (item.is_string()) {
        place_legend(item.get<std::string>());
    }
    // Numbers, arrays, booleans and null carry no layout meaning
    return {};
}

void LayoutInterpreter::apply_patch(const KeyProperties& patch) {
    properties_.apply_patch(patch);
}

const Key& LayoutInterpreter::place_legend(const std::string& legend) {
    double x = current_x_ + properties_.x.value_or(0.0);
    double y = current_y_ + properties_.y.value_or(0.0);

    // Rotated keys are positioned in absolute space, not relative to row flow
    if (properties_.has_rotation()) {
        x = properties_.x.value_or(0.0);
        y = properties_.y.value_or(0.0);
    }

    Key key;
    key.legends = split_legends(legend);
    key.properties = properties_;
    key.x = x;
    key.y = y;
    key.row = row_;
    keys_.push_back(std::move(key));

    current_x_ = x + properties_.w.value_or(1.0);
    properties_.clear_transient();

    return keys_.back();
}

std::vector<Key> LayoutInterpreter::take_keys() {
    std::vector<Key> keys = std::move(keys_);
    keys_.clear();
    return keys;
}

} // namespace kale
