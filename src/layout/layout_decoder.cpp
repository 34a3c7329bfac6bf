// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "layout_decoder.h"

#include <spdlog/spdlog.h>

#include <cmath>

namespace kale {

namespace {

/// Returns the field value, or nullptr when missing or null
const json* find_field(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return nullptr;
    }
    return &(*it);
}

bool read_number(const json& object, const char* key, std::optional<double>& out,
                 std::string& error) {
    const json* value = find_field(object, key);
    if (value == nullptr) {
        out.reset();
        return true;
    }
    if (!value->is_number()) {
        error = fmt::format("field '{}' must be a number, got {}", key, value->type_name());
        return false;
    }
    out = value->get<double>();
    return true;
}

bool read_byte(const json& object, const char* key, std::optional<uint8_t>& out,
               std::string& error) {
    const json* value = find_field(object, key);
    if (value == nullptr) {
        out.reset();
        return true;
    }
    if (!value->is_number()) {
        error = fmt::format("field '{}' must be an integer, got {}", key, value->type_name());
        return false;
    }
    double number = value->get<double>();
    if (number < 0.0 || number > 255.0 || std::floor(number) != number) {
        error = fmt::format("field '{}' must be an integer in 0..255, got {}", key, value->dump());
        return false;
    }
    out = static_cast<uint8_t>(number);
    return true;
}

bool read_bool(const json& object, const char* key, std::optional<bool>& out, std::string& error) {
    const json* value = find_field(object, key);
    if (value == nullptr) {
        out.reset();
        return true;
    }
    if (!value->is_boolean()) {
        error = fmt::format("field '{}' must be a boolean, got {}", key, value->type_name());
        return false;
    }
    out = value->get<bool>();
    return true;
}

bool read_string(const json& object, const char* key, std::optional<std::string>& out,
                 std::string& error) {
    const json* value = find_field(object, key);
    if (value == nullptr) {
        out.reset();
        return true;
    }
    if (!value->is_string()) {
        error = fmt::format("field '{}' must be a string, got {}", key, value->type_name());
        return false;
    }
    out = value->get<std::string>();
    return true;
}

/// snake_case name wins; camelCase is what the layout editor writes
bool read_string_alias(const json& object, const char* key, const char* alias,
                       std::optional<std::string>& out, std::string& error) {
    if (!read_string(object, key, out, error)) {
        return false;
    }
    if (out) {
        return true;
    }
    return read_string(object, alias, out, error);
}

bool read_background(const json& object, std::optional<Background>& out, std::string& error) {
    const json* value = find_field(object, "background");
    if (value == nullptr) {
        out.reset();
        return true;
    }
    if (!value->is_object()) {
        error = fmt::format("field 'background' must be an object, got {}", value->type_name());
        return false;
    }

    Background background;
    for (const char* key : {"name", "style"}) {
        const json* field = find_field(*value, key);
        if (field == nullptr || !field->is_string()) {
            error = fmt::format("field 'background.{}' must be a string", key);
            return false;
        }
    }
    background.name = (*value)["name"].get<std::string>();
    background.style = (*value)["style"].get<std::string>();
    out = background;
    return true;
}

/// Editor downloads wrap the whole layout in one more array
bool is_wrapped_document(const json& doc) {
    if (doc.size() != 1 || !doc[0].is_array()) {
        return false;
    }
    const json& inner = doc[0];
    bool has_row = false;
    for (size_t i = 0; i < inner.size(); ++i) {
        if (inner[i].is_array()) {
            has_row = true;
        } else if (!(i == 0 && inner[i].is_object())) {
            return false;
        }
    }
    return has_row;
}

} // namespace

DecodeError decode_metadata(const json& object, KeyboardMetadata& metadata) {
    if (!object.is_object()) {
        return DecodeError(DecodeResult::METADATA_SCHEMA,
                           fmt::format("expected an object, got {}", object.type_name()));
    }

    KeyboardMetadata decoded;
    std::string error;
    bool ok = read_string(object, "author", decoded.author, error) &&
              read_string(object, "backcolor", decoded.backcolor, error) &&
              read_background(object, decoded.background, error) &&
              read_string(object, "name", decoded.name, error) &&
              read_string(object, "notes", decoded.notes, error) &&
              read_string(object, "radii", decoded.radii, error) &&
              read_string_alias(object, "switch_brand", "switchBrand", decoded.switch_brand,
                                error) &&
              read_string_alias(object, "switch_mount", "switchMount", decoded.switch_mount,
                                error) &&
              read_string_alias(object, "switch_type", "switchType", decoded.switch_type, error);
    if (!ok) {
        return DecodeError(DecodeResult::METADATA_SCHEMA, error);
    }

    metadata = std::move(decoded);
    return {};
}

DecodeError decode_key_properties(const json& object, KeyProperties& properties) {
    if (!object.is_object()) {
        return DecodeError(DecodeResult::PROPERTY_SCHEMA,
                           fmt::format("expected an object, got {}", object.type_name()));
    }

    KeyProperties decoded;
    std::string error;
    bool ok = read_number(object, "x", decoded.x, error) &&
              read_number(object, "y", decoded.y, error) &&
              read_number(object, "w", decoded.w, error) &&
              read_number(object, "h", decoded.h, error) &&
              read_number(object, "x2", decoded.x2, error) &&
              read_number(object, "y2", decoded.y2, error) &&
              read_number(object, "w2", decoded.w2, error) &&
              read_number(object, "h2", decoded.h2, error) &&
              read_bool(object, "l", decoded.l, error) && read_bool(object, "n", decoded.n, error) &&
              read_bool(object, "d", decoded.d, error) &&
              read_number(object, "r", decoded.r, error) &&
              read_number(object, "rx", decoded.rx, error) &&
              read_number(object, "ry", decoded.ry, error) &&
              read_string(object, "c", decoded.c, error) &&
              read_string(object, "t", decoded.t, error) &&
              read_bool(object, "g", decoded.g, error) && read_byte(object, "a", decoded.a, error) &&
              read_byte(object, "f", decoded.f, error) &&
              read_byte(object, "f2", decoded.f2, error) &&
              read_string(object, "p", decoded.p, error);
    if (!ok) {
        return DecodeError(DecodeResult::PROPERTY_SCHEMA, error);
    }

    properties = std::move(decoded);
    return {};
}

DecodeError decode_layout_document(const std::string& repaired,
                                   std::optional<KeyboardMetadata>& metadata, json& rows) {
    json doc;
    try {
        doc = json::parse(repaired);
    } catch (const json::parse_error& e) {
        spdlog::debug("[LayoutDecoder] Repaired text is not valid JSON: {}", e.what());
        return DecodeError(DecodeResult::SYNTAX_ERROR, e.what());
    }

    if (!doc.is_array()) {
        return DecodeError(DecodeResult::SYNTAX_ERROR,
                           fmt::format("expected an array of rows, got {}", doc.type_name()));
    }

    if (is_wrapped_document(doc)) {
        spdlog::debug("[LayoutDecoder] Unwrapping fully wrapped layout document");
        json inner = std::move(doc[0]);
        doc = std::move(inner);
    }

    metadata.reset();
    if (!doc.empty() && doc[0].is_object()) {
        KeyboardMetadata decoded;
        DecodeError err = decode_metadata(doc[0], decoded);
        if (!err.success()) {
            spdlog::debug("[LayoutDecoder] Invalid metadata: {}", err.message);
            return err;
        }
        metadata = std::move(decoded);
        doc.erase(doc.begin());
    }

    spdlog::debug("[LayoutDecoder] Decoded {} rows ({} metadata)", doc.size(),
                  metadata ? "with" : "without");
    rows = std::move(doc);
    return {};
}

json encode_metadata(const KeyboardMetadata& metadata) {
    json object = json::object();

    auto put = [&object](const char* key, const std::optional<std::string>& value) {
        if (value) {
            object[key] = *value;
        }
    };

    put("author", metadata.author);
    put("backcolor", metadata.backcolor);
    if (metadata.background) {
        object["background"] = {{"name", metadata.background->name},
                                {"style", metadata.background->style}};
    }
    put("name", metadata.name);
    put("notes", metadata.notes);
    put("radii", metadata.radii);
    put("switch_brand", metadata.switch_brand);
    put("switch_mount", metadata.switch_mount);
    put("switch_type", metadata.switch_type);

    return object;
}

} // namespace kale
