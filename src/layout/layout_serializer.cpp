// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "layout_serializer.h"

#include "layout_decoder.h"

#include <spdlog/spdlog.h>

namespace kale {

namespace {

void push_field(std::vector<std::string>& parts, const char* name, double value) {
    parts.push_back(fmt::format("{}:{}", name, format_number(value)));
}

std::string join(const std::vector<std::string>& parts, const char* separator) {
    std::string joined;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            joined += separator;
        }
        joined += parts[i];
    }
    return joined;
}

} // namespace

std::string format_number(double value) {
    return fmt::format("{}", value);
}

std::optional<std::string> format_property_delta(const KeyProperties& props,
                                                 const KeyProperties& last) {
    std::vector<std::string> parts;

    if (props.has_rotation()) {
        // Fixed order: r, rx, ry, y, x
        if (props.r && props.r != last.r) {
            push_field(parts, "r", *props.r);
        }
        if (props.rx && props.rx != last.rx) {
            push_field(parts, "rx", *props.rx);
        }
        if (props.ry && props.ry != last.ry) {
            push_field(parts, "ry", *props.ry);
        }
        // Unchanged rotation must still mark the key as rotated on reparse
        if (parts.empty()) {
            if (props.r) {
                push_field(parts, "r", *props.r);
            } else if (props.rx) {
                push_field(parts, "rx", *props.rx);
            } else {
                push_field(parts, "ry", *props.ry);
            }
        }
        if (props.y) {
            push_field(parts, "y", *props.y);
        }
        if (props.x) {
            push_field(parts, "x", *props.x);
        }
    } else {
        // Negative y starts a row on reparse, so it is never elided
        if (props.y && (*props.y < 0.0 || props.y != last.y)) {
            push_field(parts, "y", *props.y);
        }
        if (props.x && props.x != last.x) {
            push_field(parts, "x", *props.x);
        }
    }

    if (parts.empty()) {
        return std::nullopt;
    }
    return "{" + join(parts, ",") + "}";
}

std::map<int, std::vector<const Key*>> group_rows(const std::vector<Key>& keys) {
    std::map<int, std::vector<const Key*>> rows;
    int current_row = 0;
    for (const auto& key : keys) {
        if (key.properties.y && *key.properties.y < 0.0) {
            current_row++;
        }
        rows[current_row].push_back(&key);
    }
    return rows;
}

std::string format_legend(const Key& key) {
    return json(join_legends(key.legends)).dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string to_raw_format(const Keyboard& keyboard) {
    std::string output;

    if (keyboard.metadata) {
        output += encode_metadata(*keyboard.metadata)
                      .dump(-1, ' ', false, json::error_handler_t::replace);
        output += ",\n";
    }

    auto rows = group_rows(keyboard.keys);

    KeyProperties last_props;
    bool first_row = true;
    for (const auto& row : rows) {
        if (!first_row) {
            output += ",\n";
        }
        first_row = false;

        output += '[';
        bool first_in_row = true;
        for (const Key* key : row.second) {
            if (!first_in_row) {
                output += ',';
            }
            first_in_row = false;

            if (auto delta = format_property_delta(key->properties, last_props)) {
                output += *delta;
                output += ',';
            }
            output += format_legend(*key);

            last_props = key->properties;
        }
        output += ']';
    }

    spdlog::debug("[LayoutSerializer] Wrote {} keys in {} rows ({} bytes)", keyboard.keys.size(),
                  rows.size(), output.size());
    return output;
}

} // namespace kale
