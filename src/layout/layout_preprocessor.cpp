// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "layout_preprocessor.h"

#include <spdlog/spdlog.h>

namespace kale {

namespace {

constexpr const char* WHITESPACE = " \t\n\r\f\v";

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(WHITESPACE);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(WHITESPACE);
    return s.substr(start, end - start + 1);
}

} // namespace

std::string normalize_line_endings(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            out += '\n';
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
        } else {
            out += text[i];
        }
    }
    return out;
}

std::vector<std::string> split_layout_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= text.size()) {
        size_t pos = text.find('\n', start);
        if (pos == std::string::npos) {
            pos = text.size();
        }

        std::string line = trim(text.substr(start, pos - start));
        if (!line.empty()) {
            // Exactly one trailing comma; rows are re-joined with commas later
            if (line.back() == ',') {
                line.pop_back();
            }
            lines.push_back(line);
        }
        start = pos + 1;
    }
    return lines;
}

std::string wrap_layout_rows(const std::vector<std::string>& lines) {
    std::string joined = "[";
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            joined += ',';
        }
        joined += lines[i];
    }
    joined += ']';
    return joined;
}

std::string quote_property_names(const std::string& text) {
    std::string result;
    result.reserve(text.size() + text.size() / 4);

    bool in_string = false;
    bool escaped = false;
    int object_depth = 0;

    // Raw characters emitted since the last '{' or ',' inside an object
    std::string candidate;
    bool candidate_quoted = false;

    auto reset_candidate = [&]() {
        candidate.clear();
        candidate_quoted = false;
    };

    for (char c : text) {
        if (in_string) {
            result += c;
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }

        switch (c) {
        case '"':
            in_string = true;
            if (object_depth > 0) {
                candidate_quoted = true;
            }
            result += c;
            break;
        case '{':
            ++object_depth;
            reset_candidate();
            result += c;
            break;
        case '}':
            if (object_depth > 0) {
                --object_depth;
            }
            reset_candidate();
            result += c;
            break;
        case ',':
            if (object_depth > 0) {
                reset_candidate();
            }
            result += c;
            break;
        case ':':
            if (object_depth > 0) {
                std::string name = trim(candidate);
                if (!name.empty() && !candidate_quoted) {
                    size_t lead = candidate.find_first_not_of(WHITESPACE);
                    size_t tail = candidate.find_last_not_of(WHITESPACE);
                    result.resize(result.size() - candidate.size());
                    result += candidate.substr(0, lead);
                    result += '"';
                    result += name;
                    result += '"';
                    result += candidate.substr(tail + 1);
                }
                reset_candidate();
            }
            result += c;
            break;
        default:
            if (object_depth > 0) {
                candidate += c;
            }
            result += c;
            break;
        }
    }

    return result;
}

std::string repair_raw_layout(const std::string& raw) {
    std::vector<std::string> lines = split_layout_lines(normalize_line_endings(raw));
    std::string repaired = quote_property_names(wrap_layout_rows(lines));
    spdlog::debug("[Preprocessor] Repaired {} non-blank lines into {} bytes", lines.size(),
                  repaired.size());
    return repaired;
}

} // namespace kale
