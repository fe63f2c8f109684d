/// @file test_keymap_loader.cpp
/// @brief Tests for reading keymaps and draw configurations from JSON

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "cli/KeymapLoader.hpp"

#include <filesystem>
#include <fstream>

using namespace kmd;
using Catch::Approx;
using json = KeymapLoader::json;

namespace {

const char* const SPLIT_KEYMAP = R"({
  "layout": {"ltype": "ortho", "rows": 1, "columns": 2, "thumbs": 1, "split": true},
  "layers": {
    "Base": ["Q", {"t": "W", "h": "Alt"}, "O", "P", null, {"t": "Spc", "type": "held"}],
    "Num":  [1, 2, 3, 4, "", {"s": "!", "t": "1"}]
  },
  "combos": [
    {"p": [0, 1], "k": "Esc", "l": ["Base"]},
    {"p": [2, 3], "k": {"t": "Tab", "h": "Gui"}, "align": "top", "offset": 0.5,
     "slide": -1, "dendron": false, "type": "thumb"},
    {"p": [4, 5], "k": "Ent", "dendron": true}
  ]
})";

std::filesystem::path temp_file(const std::string& name) {
    return std::filesystem::temp_directory_path() / name;
}

} // namespace

// ---------- Keymaps ----------

TEST_CASE("Keymap JSON builds layout, ordered layers and combos", "[loader]") {
    KeymapLoader loader;
    KeymapData keymap = loader.parse_keymap_string(SPLIT_KEYMAP);

    CHECK(keymap.layout().size() == 6);

    REQUIRE(keymap.layers().size() == 2);
    CHECK(keymap.layers()[0].name == "Base");
    CHECK(keymap.layers()[1].name == "Num");

    const auto& base = keymap.layers()[0].keys;
    CHECK(base[0].tap == "Q");
    CHECK(base[1].tap == "W");
    CHECK(base[1].hold == "Alt");
    CHECK(base[4].tap.empty());
    CHECK(base[5].type == "held");

    const auto& num = keymap.layers()[1].keys;
    CHECK(num[0].tap == "1");
    CHECK(num[5].shifted == "!");

    REQUIRE(keymap.combos().size() == 3);
    const ComboSpec& esc = keymap.combos()[0];
    CHECK(esc.key.tap == "Esc");
    CHECK(esc.align == ComboAlignment::MID);
    CHECK(esc.dendron == DendronMode::AUTO);
    CHECK(esc.layers == std::vector<std::string>{"Base"});

    const ComboSpec& tab = keymap.combos()[1];
    CHECK(tab.key.hold == "Gui");
    CHECK(tab.align == ComboAlignment::TOP);
    CHECK(tab.offset == Approx(0.5));
    REQUIRE(tab.slide.has_value());
    CHECK(*tab.slide == -1.0);
    CHECK(tab.dendron == DendronMode::NEVER);
    CHECK(tab.type == "thumb");
    CHECK(tab.layers.empty());

    CHECK(keymap.combos()[2].dendron == DendronMode::ALWAYS);
}

TEST_CASE("Layer order follows the file, not the alphabet", "[loader]") {
    KeymapLoader loader;
    KeymapData keymap = loader.parse_keymap_string(R"({
      "layout": {"ltype": "raw", "keys": [{"x": 30, "y": 27}]},
      "layers": {"Zeta": ["z"], "Alpha": ["a"], "Mid": ["m"]}
    })");

    REQUIRE(keymap.layers().size() == 3);
    CHECK(keymap.layers()[0].name == "Zeta");
    CHECK(keymap.layers()[1].name == "Alpha");
    CHECK(keymap.layers()[2].name == "Mid");
}

TEST_CASE("Raw layout keys read optional size and rotation", "[loader]") {
    KeymapLoader loader;
    LayoutSpec spec = loader.parse_layout(json::parse(R"({
      "ltype": "raw",
      "keys": [{"x": 10, "y": 20}, {"x": 100, "y": 20, "w": 80, "h": 40, "r": -10}]
    })"));

    CHECK(spec.type == LayoutType::RAW);
    REQUIRE(spec.keys.size() == 2);
    CHECK_FALSE(spec.keys[0].width.has_value());
    CHECK(spec.keys[1].width.value() == 80.0);
    CHECK(spec.keys[1].rotation.value() == -10.0);
}

TEST_CASE("Layout errors are reported as configuration errors", "[loader][errors]") {
    KeymapLoader loader;
    CHECK_THROWS_AS(loader.parse_layout(json::parse(R"({"ltype": "iso"})")), ConfigurationError);
    CHECK_THROWS_AS(loader.parse_layout(json::parse(R"({"rows": 3})")), ConfigurationError);
    CHECK_THROWS_AS(loader.parse_keymap_string(R"({
      "layout": {"ltype": "ortho", "rows": 1, "columns": 2, "thumbs": 1},
      "layers": {"Base": ["a", "b", "c"]}
    })"), ConfigurationError);
}

TEST_CASE("Key count mismatches are configuration errors", "[loader][errors]") {
    KeymapLoader loader;
    CHECK_THROWS_AS(loader.parse_keymap_string(R"({
      "layout": {"ltype": "ortho", "rows": 1, "columns": 2},
      "layers": {"Base": ["a"]}
    })"), ConfigurationError);
}

TEST_CASE("Malformed keymap documents are input errors", "[loader][errors]") {
    KeymapLoader loader;
    CHECK_THROWS_AS(loader.parse_keymap_string("{ not json"), InputError);
    CHECK_THROWS_AS(loader.parse_keymap_string("[]"), InputError);
    CHECK_THROWS_AS(loader.parse_keymap_string(R"({"layers": {}})"), InputError);
    CHECK_THROWS_AS(loader.parse_keymap_string(R"({"layout": {"ltype": "ortho", "rows": 1, "columns": 1}})"),
                    InputError);
    CHECK_THROWS_AS(loader.parse_keymap_string(R"({
      "layout": {"ltype": "ortho", "rows": "one", "columns": 1},
      "layers": {"Base": ["a"]}
    })"), InputError);
    CHECK_THROWS_AS(loader.parse_keymap_string(R"({
      "layout": {"ltype": "ortho", "rows": 1, "columns": 1},
      "layers": {"Base": [["nested"]]}
    })"), InputError);
}

TEST_CASE("Combo entries need key positions", "[loader][errors]") {
    KeymapLoader loader;
    CHECK_THROWS_AS(loader.parse_combo(json::parse(R"({"k": "Esc"})"), 0), InputError);
    CHECK_THROWS_AS(loader.parse_combo(json::parse(R"("Esc")"), 0), InputError);
    CHECK_THROWS_AS(loader.parse_combo(json::parse(R"({"p": [0, 1], "align": "middle"})"), 0),
                    ConfigurationError);
}

TEST_CASE("Missing keymap files are input errors", "[loader][errors]") {
    KeymapLoader loader;
    CHECK_THROWS_AS(loader.load_keymap_file(temp_file("kmd_no_such_keymap.json").string()), InputError);
}

TEST_CASE("Keymap files load from disk", "[loader]") {
    const auto path = temp_file("kmd_test_keymap.json");
    {
        std::ofstream out(path);
        out << SPLIT_KEYMAP;
    }

    KeymapLoader loader;
    KeymapData keymap = loader.load_keymap_file(path.string());
    CHECK(keymap.layers().size() == 2);

    std::filesystem::remove(path);
}

// ---------- Draw configuration ----------

TEST_CASE("Draw configuration overrides only the given fields", "[loader][config]") {
    KeymapLoader loader;
    DrawConfig config = loader.parse_draw_config(json::parse(R"({
      "key_rx": 3,
      "combo_w": 40.5,
      "append_colon_to_layer_header": false,
      "svg_style": "text { fill: red; }",
      "glyphs": {"icon": "<svg viewBox=\"0 0 1 1\"></svg>"},
      "not_a_field": 1
    })"));

    const DrawConfig defaults;
    CHECK(config.key_rx == 3.0);
    CHECK(config.key_ry == defaults.key_ry);
    CHECK(config.combo_w == 40.5);
    CHECK(config.outer_pad_h == defaults.outer_pad_h);
    CHECK_FALSE(config.append_colon_to_layer_header);
    CHECK(config.svg_style == "text { fill: red; }");
    REQUIRE(config.glyphs.count("icon") == 1);
}

TEST_CASE("Draw configuration values must have the right type", "[loader][config][errors]") {
    KeymapLoader loader;
    CHECK_THROWS_AS(loader.parse_draw_config(json::parse(R"({"key_rx": "six"})")), InputError);
    CHECK_THROWS_AS(loader.parse_draw_config(json::parse(R"({"glyphs": {"a": 1}})")), InputError);
    CHECK_THROWS_AS(loader.parse_draw_config(json::parse("[1, 2]")), InputError);
}

TEST_CASE("Default draw configuration survives a write and reload", "[loader][config]") {
    const auto path = temp_file("kmd_test_config.json");

    KeymapLoader loader;
    REQUIRE(loader.write_default_draw_config(path.string()));

    DrawConfig reloaded = loader.load_draw_config_file(path.string());
    const DrawConfig defaults;
    CHECK(reloaded.outer_pad_w == defaults.outer_pad_w);
    CHECK(reloaded.line_spacing == defaults.line_spacing);
    CHECK(reloaded.glyph_shifted_size == defaults.glyph_shifted_size);
    CHECK(reloaded.svg_style == defaults.svg_style);
    CHECK(reloaded.append_colon_to_layer_header == defaults.append_colon_to_layer_header);

    std::filesystem::remove(path);
}

TEST_CASE("Serialized configuration lists every field", "[loader][config]") {
    DrawConfig config;
    config.glyphs["x"] = "<svg/>";
    json doc = KeymapLoader::draw_config_to_json(config);

    for (const char* key : {"key_rx", "key_ry", "inner_pad_w", "inner_pad_h", "small_pad",
                            "outer_pad_w", "outer_pad_h", "line_spacing", "combo_w", "combo_h",
                            "arc_radius", "arc_scale", "glyph_tap_size", "glyph_hold_size",
                            "glyph_shifted_size", "append_colon_to_layer_header", "svg_style", "glyphs"}) {
        CHECK(doc.contains(key));
    }
    CHECK(doc["glyphs"]["x"].get<std::string>() == "<svg/>");
}
