/// @file test_keymap_data.cpp
/// @brief Tests for keymap validation, layer selection and combo activation

#include <catch2/catch_test_macros.hpp>

#include "core/InputValidator.hpp"
#include "core/KeymapData.hpp"

using namespace kmd;

namespace {

Layer make_layer(const std::string& name, size_t keys) {
    Layer layer;
    layer.name = name;
    for (size_t i = 0; i < keys; ++i) {
        layer.keys.emplace_back(name + std::to_string(i));
    }
    return layer;
}

ComboSpec make_combo(std::vector<int> positions, std::vector<std::string> layers = {}) {
    ComboSpec combo;
    combo.key_positions = std::move(positions);
    combo.layers = std::move(layers);
    combo.key = LayoutKey("C");
    return combo;
}

PhysicalLayout four_keys() {
    return build_ortho_layout(1, 4, 0, false);
}

} // namespace

// ---------- Validation ----------

TEST_CASE("Consistent keymaps validate cleanly", "[validator]") {
    InputValidator validator;
    PhysicalLayout layout = four_keys();
    std::vector<Layer> layers = {make_layer("Base", 4), make_layer("Nav", 4)};
    std::vector<ComboSpec> combos = {make_combo({0, 1}), make_combo({2, 3}, {"Nav"})};

    ValidationResult result = validator.validate(layout, layers, combos);
    CHECK(result.is_valid);
    CHECK_FALSE(result.has_errors());
    CHECK(result.format_error_message().empty());
}

TEST_CASE("Layers must match the key count and have unique names", "[validator]") {
    InputValidator validator;
    PhysicalLayout layout = four_keys();
    std::vector<Layer> layers = {make_layer("Base", 3), make_layer("Base", 4), make_layer("", 4)};

    ValidationResult result = validator.validate(layout, layers, {});
    REQUIRE(result.has_errors());
    CHECK(result.conflicts.size() == 3);

    std::string report = result.format_error_message();
    CHECK(report.find("Layer 'Base' has 3 keys but the physical layout has 4") != std::string::npos);
    CHECK(report.find("defined more than once") != std::string::npos);
    CHECK(report.find("empty name") != std::string::npos);
    CHECK(report.find("Suggested solutions:") != std::string::npos);
}

TEST_CASE("Combo problems are collected into one conflict per combo", "[validator]") {
    InputValidator validator;
    PhysicalLayout layout = four_keys();
    std::vector<Layer> layers = {make_layer("Base", 4)};

    ComboSpec out_of_range = make_combo({1, 4});
    ComboSpec empty = make_combo({});
    ComboSpec lonely_slide = make_combo({1});
    lonely_slide.slide = 0.5;
    ComboSpec wide_slide = make_combo({0, 1});
    wide_slide.slide = 1.5;
    ComboSpec unknown_layer = make_combo({0, 1}, {"Base", "Sym"});
    ComboSpec negative = make_combo({-1, 0});

    ValidationResult result = validator.validate(
        layout, layers, {out_of_range, empty, lonely_slide, wide_slide, unknown_layer, negative});

    REQUIRE(result.conflicts.size() == 6);
    CHECK(result.conflicts[0].description.find("combo #0") != std::string::npos);
    CHECK(result.conflicts[0].description.find("key position 4") != std::string::npos);
    CHECK(result.conflicts[1].description.find("no key positions") != std::string::npos);
    CHECK(result.conflicts[2].description.find("fewer than two") != std::string::npos);
    CHECK(result.conflicts[3].description.find("outside [-1, 1]") != std::string::npos);
    CHECK(result.conflicts[4].description.find("unknown layer 'Sym'") != std::string::npos);
    CHECK(result.conflicts[5].description.find("key position -1") != std::string::npos);
}

TEST_CASE("Slide at the interval ends is accepted", "[validator]") {
    InputValidator validator;
    PhysicalLayout layout = four_keys();
    ComboSpec left = make_combo({0, 3});
    left.slide = -1.0;
    ComboSpec right = make_combo({0, 3});
    right.slide = 1.0;

    CHECK(validator.validate(layout, {make_layer("Base", 4)}, {left, right}).is_valid);
}

// ---------- KeymapData ----------

TEST_CASE("KeymapData refuses inconsistent input", "[keymap]") {
    CHECK_THROWS_AS(KeymapData(four_keys(), {make_layer("Base", 5)}), ConfigurationError);
    CHECK_THROWS_AS(KeymapData(four_keys(), {make_layer("Base", 4)}, {make_combo({9})}),
                    ConfigurationError);
}

TEST_CASE("Layer selection keeps document order", "[keymap]") {
    KeymapData keymap(four_keys(),
                      {make_layer("Base", 4), make_layer("Nav", 4), make_layer("Sym", 4)});

    auto all = keymap.select_layers({});
    REQUIRE(all.size() == 3);
    CHECK(all[0]->name == "Base");
    CHECK(all[2]->name == "Sym");

    auto subset = keymap.select_layers({"Sym", "Base"});
    REQUIRE(subset.size() == 2);
    CHECK(subset[0]->name == "Base");
    CHECK(subset[1]->name == "Sym");

    CHECK(keymap.has_layer("Nav"));
    CHECK_FALSE(keymap.has_layer("Fun"));
}

TEST_CASE("Selecting an unknown layer is a configuration error", "[keymap]") {
    KeymapData keymap(four_keys(), {make_layer("Base", 4)});
    CHECK_THROWS_AS(keymap.select_layers({"Base", "Fun"}), ConfigurationError);
}

TEST_CASE("Combos without layers are active everywhere", "[keymap][combos]") {
    KeymapData keymap(four_keys(),
                      {make_layer("Base", 4), make_layer("Nav", 4)},
                      {make_combo({0, 1}), make_combo({1, 2}, {"Nav"}), make_combo({2, 3}, {"Base", "Nav"})});

    auto base = keymap.combos_for_layer("Base");
    REQUIRE(base.size() == 2);
    CHECK(base[0]->key_positions == std::vector<int>{0, 1});
    CHECK(base[1]->key_positions == std::vector<int>{2, 3});

    CHECK(keymap.combos_for_layer("Nav").size() == 3);
}
