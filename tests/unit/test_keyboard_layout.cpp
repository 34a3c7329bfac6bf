// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_keyboard_layout.cpp
 * @brief End-to-end tests for parse_layout() and to_raw_format()
 */

#include "keyboard_layout.h"

#include <catch2/catch_test_macros.hpp>

using namespace kale;

namespace {

// Raw text as pasted from the layout editor: unquoted keys, trailing commas
const char* SAMPLE_LAYOUT = R"(
{name:"Sample", author:"kale"},
[{a:7},"Esc",{x:1},"F1","F2"],
[{y:0.5},"~\n`","!\n1",{w:1.5},"Tab"],

[{r:15,rx:4,ry:1,y:-1,x:0.5},"R1",{r:15,rx:4,ry:1,y:-1,x:1.5},"R2"],
[{y:-0.5,x:3},"A",{y:-0.5},"B"]
)";

const char* SAMPLE_CANONICAL = "{\"author\":\"kale\",\"name\":\"Sample\"},\n"
                               "[\"Esc\",{x:1},\"F1\",\"F2\",{y:0.5},\"~\\n`\",\"!\\n1\",\"Tab\"],\n"
                               "[{r:15,rx:4,ry:1,y:-1,x:0.5},\"R1\"],\n"
                               "[{r:15,y:-1,x:1.5},\"R2\"],\n"
                               "[{y:-0.5,x:3},\"A\"],\n"
                               "[{y:-0.5},\"B\"]";

Keyboard parse_ok(const std::string& raw) {
    Keyboard keyboard;
    DecodeError err = parse_layout(raw, keyboard);
    INFO(err.describe());
    REQUIRE(err.success());
    return keyboard;
}

} // namespace

// ============================================================================
// parse_layout()
// ============================================================================

TEST_CASE("parse_layout: single key with offset", "[layout][parse]") {
    auto keyboard = parse_ok(R"([{"x":1},"A"])");

    REQUIRE_FALSE(keyboard.metadata.has_value());
    REQUIRE(keyboard.keys.size() == 1);
    REQUIRE(keyboard.keys[0].legends == std::vector<std::string>{"A"});
    REQUIRE(keyboard.keys[0].x == 1.0);
    REQUIRE(keyboard.keys[0].y == 0.0);
}

TEST_CASE("parse_layout: two rows", "[layout][parse]") {
    SECTION("one row per line") {
        auto keyboard = parse_ok("[\"Q\",\"W\"],\n[\"A\",\"S\"]\n");
        REQUIRE(keyboard.keys.size() == 4);
        REQUIRE(keyboard.keys[2].y == 1.0);
        REQUIRE(keyboard.keys[3].x == 1.0);
    }

    SECTION("fully bracketed on one line") {
        auto keyboard = parse_ok(R"([["Q","W"],["A","S"]])");
        REQUIRE(keyboard.keys.size() == 4);
        REQUIRE(keyboard.keys[0].x == 0.0);
        REQUIRE(keyboard.keys[1].x == 1.0);
        REQUIRE(keyboard.keys[1].y == 0.0);
        REQUIRE(keyboard.keys[2].x == 0.0);
        REQUIRE(keyboard.keys[2].y == 1.0);
        REQUIRE(keyboard.keys[3].x == 1.0);
        REQUIRE(keyboard.keys[3].y == 1.0);
    }
}

TEST_CASE("parse_layout: unquoted keys are repaired", "[layout][parse]") {
    auto keyboard = parse_ok("[{x:1,y:2},\n\"K\"]");

    REQUIRE(keyboard.keys.size() == 1);
    REQUIRE(keyboard.keys[0].x == 1.0);
    REQUIRE(keyboard.keys[0].y == 2.0);
}

TEST_CASE("parse_layout: multi-line legend survives a round trip", "[layout][parse][serialize]") {
    auto keyboard = parse_ok(R"(["Top\nBottom"])");

    REQUIRE(keyboard.keys[0].legends == std::vector<std::string>{"Top", "Bottom"});
    REQUIRE(to_raw_format(keyboard) == R"(["Top\nBottom"])");
}

TEST_CASE("parse_layout: metadata with nested background", "[layout][parse][metadata]") {
    auto keyboard = parse_ok("{name:\"B\", background:{name:\"Oak\",style:\"x\"}, notes:\"n\"},\n"
                             "[\"A\"]");

    REQUIRE(keyboard.metadata.has_value());
    REQUIRE(keyboard.metadata->name == "B");
    REQUIRE(keyboard.metadata->background.has_value());
    REQUIRE(keyboard.metadata->background->style == "x");
    REQUIRE(keyboard.metadata->notes == "n");
}

TEST_CASE("parse_layout: CRLF input", "[layout][parse]") {
    auto keyboard = parse_ok("[\"A\"],\r\n[\"B\"]\r\n");
    REQUIRE(keyboard.keys.size() == 2);
    REQUIRE(keyboard.keys[1].y == 1.0);
}

TEST_CASE("parse_layout is deterministic", "[layout][parse]") {
    auto first = parse_ok(SAMPLE_LAYOUT);
    auto second = parse_ok(SAMPLE_LAYOUT);

    REQUIRE(first.keys.size() == second.keys.size());
    for (size_t i = 0; i < first.keys.size(); ++i) {
        REQUIRE(first.keys[i].legends == second.keys[i].legends);
        REQUIRE(first.keys[i].x == second.keys[i].x);
        REQUIRE(first.keys[i].y == second.keys[i].y);
    }
}

TEST_CASE("parse_layout: sample layout placement", "[layout][parse]") {
    auto keyboard = parse_ok(SAMPLE_LAYOUT);

    REQUIRE(keyboard.keys.size() == 10);
    REQUIRE(keyboard.metadata->author == "kale");

    // Alignment is persistent
    REQUIRE(keyboard.keys[5].properties.a == 7);

    // F1 after a 1u gap
    REQUIRE(keyboard.keys[1].x == 2.0);

    // Second row shifted down by half a unit
    REQUIRE(keyboard.keys[3].y == 1.5);
    REQUIRE(keyboard.keys[3].legends == std::vector<std::string>{"~", "`"});

    // Rotated keys are absolute
    REQUIRE(keyboard.keys[6].x == 0.5);
    REQUIRE(keyboard.keys[6].y == -1.0);
    REQUIRE(keyboard.keys[7].x == 1.5);

    // Fourth row (index 3) has offsets relative to its base
    REQUIRE(keyboard.keys[8].x == 3.0);
    REQUIRE(keyboard.keys[8].y == 2.5);
    REQUIRE(keyboard.keys[9].x == 4.0);
    REQUIRE(keyboard.keys[9].y == 2.5);
}

// ============================================================================
// Failures
// ============================================================================

TEST_CASE("parse_layout failures leave the keyboard untouched", "[layout][parse][errors]") {
    Keyboard keyboard;
    keyboard.keys.push_back(Key{{"keep"}, KeyProperties(), 0.0, 0.0, 0});

    SECTION("unbalanced brackets") {
        DecodeError err = parse_layout("[\"A\",", keyboard);
        REQUIRE(err.result == DecodeResult::SYNTAX_ERROR);
    }

    SECTION("bad metadata") {
        DecodeError err = parse_layout("{name:1},\n[\"A\"]", keyboard);
        REQUIRE(err.result == DecodeResult::METADATA_SCHEMA);
    }

    SECTION("bad property patch in a later row") {
        DecodeError err = parse_layout("[\"A\"],\n[{w:\"big\"},\"B\"]", keyboard);
        REQUIRE(err.result == DecodeResult::PROPERTY_SCHEMA);
        REQUIRE(err.row == 1);
        REQUIRE(err.item == 0);
    }

    REQUIRE(keyboard.keys.size() == 1);
    REQUIRE(keyboard.keys[0].legends[0] == "keep");
}

TEST_CASE("parse_layout: empty input is an empty keyboard", "[layout][parse]") {
    auto keyboard = parse_ok("   \n");
    REQUIRE_FALSE(keyboard.metadata.has_value());
    REQUIRE(keyboard.keys.empty());
}

// ============================================================================
// Canonical re-encoding
// ============================================================================

TEST_CASE("to_raw_format produces the canonical form", "[layout][serialize]") {
    REQUIRE(to_raw_format(parse_ok(SAMPLE_LAYOUT)) == SAMPLE_CANONICAL);
}

TEST_CASE("Canonical output is a fixed point", "[layout][serialize][roundtrip]") {
    std::string canonical = to_raw_format(parse_ok(SAMPLE_LAYOUT));
    std::string again = to_raw_format(parse_ok(canonical));
    REQUIRE(again == canonical);

    SECTION("consecutive row markers with equal offsets") {
        std::string raw = "[\"A\"],\n[{y:-0.5},\"B\"],\n[{y:-0.5},\"C\"]";
        std::string first = to_raw_format(parse_ok(raw));
        REQUIRE(to_raw_format(parse_ok(first)) == first);
    }

    SECTION("rotation cluster sharing one center") {
        std::string raw = "[{r:10,rx:2,ry:2,y:0,x:0},\"A\",{r:10,rx:2,ry:2,y:0,x:0},\"B\"]";
        std::string first = to_raw_format(parse_ok(raw));
        REQUIRE(first == "[{r:10,rx:2,ry:2,y:0,x:0},\"A\",{r:10,y:0,x:0},\"B\"]");
        REQUIRE(to_raw_format(parse_ok(first)) == first);
    }

    SECTION("metadata only") {
        std::string first = to_raw_format(parse_ok("{author:\"x\"}"));
        REQUIRE(first == "{\"author\":\"x\"},\n");
        REQUIRE(to_raw_format(parse_ok(first)) == first);
    }
}
