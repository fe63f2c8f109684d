/// @file test_physical_layout.cpp
/// @brief Tests for physical layout extents and the ortho/raw builders

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "PhysicalLayout.hpp"

using namespace kmd;
using Catch::Approx;

// ---------- Ortho builder ----------

TEST_CASE("Split ortho layout has both halves in row-major order", "[layout][ortho]") {
    PhysicalLayout layout = build_ortho_layout(2, 3, 0, true);

    REQUIRE(layout.size() == 12);

    // Index 0 starts the left half of row 1, index 3 the right half
    CHECK(layout.key(3).pos.x - layout.key(0).pos.x == Approx(3 * KEY_W + SPLIT_GAP));
    CHECK(layout.key(3).pos.x - layout.key(0).pos.x == Approx(206.5));
    CHECK(layout.key(0).pos.y == layout.key(3).pos.y);

    // Row 2 starts at index 6 one key height lower
    CHECK(layout.key(6).pos.x == layout.key(0).pos.x);
    CHECK(layout.key(6).pos.y - layout.key(0).pos.y == Approx(KEY_H));
}

TEST_CASE("Unsplit ortho layout is a plain grid", "[layout][ortho]") {
    PhysicalLayout layout = build_ortho_layout(3, 10, 0, false);

    REQUIRE(layout.size() == 30);
    CHECK(layout.key(0).pos == Point(KEY_W / 2, KEY_H / 2));
    CHECK(layout.key(9).pos.x == Approx(9.5 * KEY_W));
    CHECK(layout.width() == Approx(10 * KEY_W));
    CHECK(layout.height() == Approx(3 * KEY_H));
}

TEST_CASE("Thumb keys hug the inner edge of each half below the grid", "[layout][ortho]") {
    PhysicalLayout layout = build_ortho_layout(3, 5, 2, true);

    REQUIRE(layout.size() == 3 * 5 * 2 + 2 * 2);

    const KeyGeometry& left_thumb = layout.key(30);
    const KeyGeometry& right_thumb = layout.key(32);

    CHECK(left_thumb.pos.x == Approx((5 - 2) * KEY_W + KEY_W / 2));
    CHECK(left_thumb.pos.y == Approx(3 * KEY_H + KEY_H / 2));
    CHECK(right_thumb.pos.x == Approx(5 * KEY_W + SPLIT_GAP + KEY_W / 2));
    CHECK(right_thumb.pos.y == left_thumb.pos.y);
    CHECK(layout.height() == Approx(4 * KEY_H));
}

TEST_CASE("Invalid thumb configurations are rejected", "[layout][ortho][errors]") {
    CHECK_THROWS_AS(build_ortho_layout(3, 5, 6, true), ConfigurationError);
    CHECK_THROWS_AS(build_ortho_layout(3, 5, 2, false), ConfigurationError);
    CHECK_THROWS_AS(build_ortho_layout(3, 5, -1, true), ConfigurationError);
    CHECK_THROWS_AS(build_ortho_layout(0, 5, 0, false), ConfigurationError);
    CHECK_THROWS_AS(build_ortho_layout(3, 0, 0, true), ConfigurationError);
}

TEST_CASE("Thumbs equal to columns is allowed", "[layout][ortho]") {
    PhysicalLayout layout = build_ortho_layout(1, 3, 3, true);
    CHECK(layout.size() == 12);
    CHECK(layout.key(6).pos.x == Approx(KEY_W / 2));
}

// ---------- Raw builder ----------

TEST_CASE("Raw layout applies default key size and rotation", "[layout][raw]") {
    std::vector<RawKeySpec> keys(2);
    keys[0].x = 30;
    keys[0].y = 27;
    keys[1].x = 100;
    keys[1].y = 40;
    keys[1].width = 80.0;
    keys[1].height = 60.0;
    keys[1].rotation = 15.0;

    PhysicalLayout layout = build_raw_layout(keys);

    REQUIRE(layout.size() == 2);
    CHECK(layout.key(0).width == KEY_W);
    CHECK(layout.key(0).height == KEY_H);
    CHECK(layout.key(0).rotation == 0.0);
    CHECK(layout.key(1).width == 80.0);
    CHECK(layout.key(1).rotation == 15.0);
}

TEST_CASE("build_layout dispatches on the layout type", "[layout]") {
    LayoutSpec ortho;
    ortho.type = LayoutType::ORTHO;
    ortho.rows = 2;
    ortho.columns = 2;
    CHECK(build_layout(ortho).size() == 4);

    LayoutSpec raw;
    raw.type = LayoutType::RAW;
    raw.keys.resize(3);
    CHECK(build_layout(raw).size() == 3);
}

TEST_CASE("Unknown layout tags are configuration errors", "[layout][errors]") {
    CHECK(parse_layout_type("ortho") == LayoutType::ORTHO);
    CHECK(parse_layout_type("raw") == LayoutType::RAW);
    CHECK_THROWS_AS(parse_layout_type("qmk"), ConfigurationError);
    CHECK_THROWS_AS(parse_layout_type(""), ConfigurationError);
}

// ---------- Extents ----------

TEST_CASE("Width and height are the far key edges and stay constant", "[layout][extents]") {
    PhysicalLayout layout({KeyGeometry(10, 20, 20, 10), KeyGeometry(50, 5, 30, 40)});

    CHECK(layout.width() == Approx(65.0));
    CHECK(layout.height() == Approx(25.0));
    CHECK(layout.min_width() == 20.0);
    CHECK(layout.min_height() == 10.0);

    const double w = layout.width();
    const double h = layout.height();
    for (int i = 0; i < 3; ++i) {
        CHECK(layout.width() == w);
        CHECK(layout.height() == h);
    }
}

TEST_CASE("Empty layouts and degenerate keys are rejected", "[layout][errors]") {
    CHECK_THROWS_AS(PhysicalLayout(std::vector<KeyGeometry>{}), ConfigurationError);
    CHECK_THROWS_AS(PhysicalLayout({KeyGeometry(0, 0, 0, 10)}), ConfigurationError);
    CHECK_THROWS_AS(PhysicalLayout({KeyGeometry(0, 0, 10, -1)}), ConfigurationError);
    CHECK_THROWS_AS(build_raw_layout({}), ConfigurationError);
}

TEST_CASE("Key access is bounds checked", "[layout]") {
    PhysicalLayout layout = build_ortho_layout(1, 2, 0, false);
    CHECK_THROWS_AS(layout.key(2), std::out_of_range);
}
