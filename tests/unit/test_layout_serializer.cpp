// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "layout_serializer.h"

#include <catch2/catch_test_macros.hpp>

using namespace kale;

namespace {

Key make_key(const std::string& legend, const KeyProperties& props = KeyProperties()) {
    Key key;
    key.legends = split_legends(legend);
    key.properties = props;
    return key;
}

KeyProperties offsets(std::optional<double> x, std::optional<double> y) {
    KeyProperties props;
    props.x = x;
    props.y = y;
    return props;
}

KeyProperties rotation(double r, double rx, double ry, std::optional<double> x,
                       std::optional<double> y) {
    KeyProperties props = offsets(x, y);
    props.r = r;
    props.rx = rx;
    props.ry = ry;
    return props;
}

} // namespace

// ============================================================================
// format_number()
// ============================================================================

TEST_CASE("format_number uses the shortest form", "[serializer][numbers]") {
    REQUIRE(format_number(1.0) == "1");
    REQUIRE(format_number(0.0) == "0");
    REQUIRE(format_number(0.25) == "0.25");
    REQUIRE(format_number(-1.5) == "-1.5");
    REQUIRE(format_number(15.0) == "15");
    REQUIRE(format_number(0.1) == "0.1");
}

// ============================================================================
// format_property_delta()
// ============================================================================

TEST_CASE("Delta for non-rotated keys", "[serializer][delta]") {
    KeyProperties none;

    SECTION("x only") {
        REQUIRE(format_property_delta(offsets(1.0, std::nullopt), none) == "{x:1}");
    }

    SECTION("y before x") {
        REQUIRE(format_property_delta(offsets(1.0, 0.5), none) == "{y:0.5,x:1}");
    }

    SECTION("unchanged values are omitted") {
        REQUIRE_FALSE(format_property_delta(offsets(1.0, 0.5), offsets(1.0, 0.5)).has_value());
        REQUIRE(format_property_delta(offsets(2.0, 0.5), offsets(1.0, 0.5)) == "{x:2}");
    }

    SECTION("nothing set") {
        REQUIRE_FALSE(format_property_delta(none, offsets(1.0, 1.0)).has_value());
    }

    SECTION("negative y is kept even when unchanged") {
        REQUIRE(format_property_delta(offsets(std::nullopt, -0.5), offsets(std::nullopt, -0.5)) ==
                "{y:-0.5}");
    }
}

TEST_CASE("Delta ignores style and size fields", "[serializer][delta]") {
    KeyProperties props;
    props.c = "#ffffff";
    props.t = "#000000";
    props.a = 7;
    props.w = 2.0;
    props.h = 2.0;

    REQUIRE_FALSE(format_property_delta(props, KeyProperties()).has_value());
}

TEST_CASE("Delta for rotated keys uses r, rx, ry, y, x order", "[serializer][delta][rotation]") {
    SECTION("everything new") {
        REQUIRE(format_property_delta(rotation(15, 1, 2, 0.5, -1), KeyProperties()) ==
                "{r:15,rx:1,ry:2,y:-1,x:0.5}");
    }

    SECTION("only changed rotation fields, but always y and x") {
        KeyProperties last = rotation(15, 1, 3, 0.5, -1);
        REQUIRE(format_property_delta(rotation(15, 1, 2, 0.5, -1), last) == "{ry:2,y:-1,x:0.5}");
    }

    SECTION("unchanged rotation still emits the angle") {
        KeyProperties last = rotation(15, 1, 2, 0.5, -1);
        REQUIRE(format_property_delta(rotation(15, 1, 2, 1.5, -1), last) == "{r:15,y:-1,x:1.5}");
    }

    SECTION("unchanged rotation center without angle") {
        KeyProperties props;
        props.rx = 1.0;
        REQUIRE(format_property_delta(props, props) == "{rx:1}");
    }

    SECTION("rotation without offsets") {
        KeyProperties props;
        props.r = -30.0;
        REQUIRE(format_property_delta(props, KeyProperties()) == "{r:-30}");
    }
}

// ============================================================================
// group_rows()
// ============================================================================

TEST_CASE("group_rows starts a row at each negative y", "[serializer][rows]") {
    std::vector<Key> keys = {
        make_key("A"),
        make_key("B", offsets(1.0, std::nullopt)),
        make_key("C", offsets(std::nullopt, -0.5)),
        make_key("D", offsets(std::nullopt, 0.5)),
        make_key("E", offsets(std::nullopt, -1.0)),
    };

    auto rows = group_rows(keys);

    REQUIRE(rows.size() == 3);
    REQUIRE(rows[0].size() == 2);
    REQUIRE(rows[0][1]->legends[0] == "B");
    REQUIRE(rows[1].size() == 2);
    REQUIRE(rows[1][0]->legends[0] == "C");
    REQUIRE(rows[1][1]->legends[0] == "D");
    REQUIRE(rows[2].size() == 1);
}

TEST_CASE("group_rows skips an empty first row", "[serializer][rows]") {
    std::vector<Key> keys = {make_key("A", offsets(std::nullopt, -1.0)), make_key("B")};

    auto rows = group_rows(keys);

    REQUIRE(rows.size() == 1);
    REQUIRE(rows.count(0) == 0);
    REQUIRE(rows.at(1).size() == 2);
}

// ============================================================================
// format_legend()
// ============================================================================

TEST_CASE("format_legend escapes and joins", "[serializer][legends]") {
    REQUIRE(format_legend(make_key("Top\nBottom")) == R"("Top\nBottom")");
    REQUIRE(format_legend(make_key("")) == R"("")");
    REQUIRE(format_legend(make_key("say \"hi\"")) == R"("say \"hi\"")");
    REQUIRE(format_legend(make_key("back\\slash")) == R"("back\\slash")");
}

// ============================================================================
// to_raw_format()
// ============================================================================

TEST_CASE("to_raw_format writes metadata then rows", "[serializer]") {
    Keyboard keyboard;
    keyboard.metadata = KeyboardMetadata{};
    keyboard.metadata->name = "Board";
    keyboard.keys = {
        make_key("A"),
        make_key("B", offsets(0.5, std::nullopt)),
        make_key("C", offsets(std::nullopt, -0.5)),
        make_key("D"),
    };

    REQUIRE(to_raw_format(keyboard) == "{\"name\":\"Board\"},\n"
                                       "[\"A\",{x:0.5},\"B\"],\n"
                                       "[{y:-0.5},\"C\",\"D\"]");
}

TEST_CASE("to_raw_format compares against the previous key across rows", "[serializer]") {
    Keyboard keyboard;
    keyboard.keys = {
        make_key("A", offsets(1.0, std::nullopt)),
        make_key("B", offsets(1.0, -1.0)),
    };

    REQUIRE(to_raw_format(keyboard) == "[{x:1},\"A\"],\n[{y:-1},\"B\"]");
}

TEST_CASE("to_raw_format edge cases", "[serializer]") {
    SECTION("empty keyboard") {
        REQUIRE(to_raw_format(Keyboard{}).empty());
    }

    SECTION("metadata only") {
        Keyboard keyboard;
        keyboard.metadata = KeyboardMetadata{};
        keyboard.metadata->author = "me";
        REQUIRE(to_raw_format(keyboard) == "{\"author\":\"me\"},\n");
    }

    SECTION("multi-line legend") {
        Keyboard keyboard;
        keyboard.keys = {make_key("!\n1")};
        REQUIRE(to_raw_format(keyboard) == R"(["!\n1"])");
    }
}
