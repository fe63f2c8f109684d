/**
 * @file KeymapLoader.cpp
 * @brief JSON keymap and draw configuration loading
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "KeymapLoader.hpp"
#include <fstream>
#include <sstream>
#include <utility>

namespace kmd {

namespace {

using json = KeymapLoader::json;

/// Numeric DrawConfig fields addressable from JSON
const std::pair<const char*, double DrawConfig::*> NUMERIC_FIELDS[] = {
    {"key_rx", &DrawConfig::key_rx},
    {"key_ry", &DrawConfig::key_ry},
    {"inner_pad_w", &DrawConfig::inner_pad_w},
    {"inner_pad_h", &DrawConfig::inner_pad_h},
    {"small_pad", &DrawConfig::small_pad},
    {"outer_pad_w", &DrawConfig::outer_pad_w},
    {"outer_pad_h", &DrawConfig::outer_pad_h},
    {"line_spacing", &DrawConfig::line_spacing},
    {"combo_w", &DrawConfig::combo_w},
    {"combo_h", &DrawConfig::combo_h},
    {"arc_radius", &DrawConfig::arc_radius},
    {"arc_scale", &DrawConfig::arc_scale},
    {"glyph_tap_size", &DrawConfig::glyph_tap_size},
    {"glyph_hold_size", &DrawConfig::glyph_hold_size},
    {"glyph_shifted_size", &DrawConfig::glyph_shifted_size},
};

/// Legend text from a JSON scalar; numbers keep their JSON spelling
std::string legend_string(const json& value, const std::string& what) {
    if (value.is_null()) return "";
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number() || value.is_boolean()) return value.dump();
    throw InputError(what + " must be a string, number or null");
}

std::string optional_string(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return "";
    return legend_string(*it, std::string("'") + key + "'");
}

} // namespace

KeymapLoader::KeymapLoader() : logger_("KeymapLoader") {
}

KeymapLoader::json KeymapLoader::read_json_file(const std::string& filename) const {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw InputError("Could not open file: " + filename);
    }

    try {
        json doc;
        file >> doc;
        logger_.debug("Parsed " + filename);
        return doc;
    } catch (const json::exception& e) {
        throw InputError("Error parsing JSON file " + filename + ": " + e.what());
    }
}

// ============================================================================
// Keymaps
// ============================================================================

KeymapData KeymapLoader::load_keymap_file(const std::string& filename) const {
    logger_.info("Loading keymap from " + filename);
    return parse_keymap(read_json_file(filename));
}

KeymapData KeymapLoader::parse_keymap_string(const std::string& text) const {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::exception& e) {
        throw InputError(std::string("Error parsing keymap JSON: ") + e.what());
    }
    return parse_keymap(doc);
}

KeymapData KeymapLoader::parse_keymap(const json& doc) const {
    if (!doc.is_object()) {
        throw InputError("Keymap document must be a JSON object");
    }
    if (!doc.contains("layout")) {
        throw InputError("Keymap document has no 'layout' section");
    }
    if (!doc.contains("layers") || !doc["layers"].is_object()) {
        throw InputError("Keymap document needs a 'layers' object mapping layer names to key lists");
    }

    try {
        PhysicalLayout layout = build_layout(parse_layout(doc["layout"]));

        std::vector<Layer> layers;
        for (const auto& [name, keys] : doc["layers"].items()) {
            if (!keys.is_array()) {
                throw InputError("Layer '" + name + "' must be a list of keys");
            }
            Layer layer;
            layer.name = name;
            layer.keys.reserve(keys.size());
            for (const auto& entry : keys) {
                layer.keys.push_back(parse_layout_key(entry));
            }
            logger_.detailed("Layer '" + name + "' with " + std::to_string(layer.keys.size()) + " keys");
            layers.push_back(std::move(layer));
        }

        std::vector<ComboSpec> combos;
        if (doc.contains("combos") && !doc["combos"].is_null()) {
            if (!doc["combos"].is_array()) {
                throw InputError("'combos' must be a list");
            }
            size_t index = 0;
            for (const auto& entry : doc["combos"]) {
                combos.push_back(parse_combo(entry, index++));
            }
        }

        logger_.info("Loaded " + std::to_string(layers.size()) + " layer(s), " +
                     std::to_string(combos.size()) + " combo(s), " +
                     std::to_string(layout.size()) + " physical keys");

        return KeymapData(std::move(layout), std::move(layers), std::move(combos));
    } catch (const json::exception& e) {
        throw InputError(std::string("Invalid keymap value: ") + e.what());
    }
}

LayoutSpec KeymapLoader::parse_layout(const json& layout) const {
    if (!layout.is_object()) {
        throw InputError("'layout' must be an object");
    }
    if (!layout.contains("ltype")) {
        throw ConfigurationError("Physical layout needs an 'ltype' of \"ortho\" or \"raw\"");
    }

    LayoutSpec spec;
    spec.type = parse_layout_type(layout.at("ltype").get<std::string>());

    switch (spec.type) {
        case LayoutType::ORTHO:
            spec.rows = layout.at("rows").get<int>();
            spec.columns = layout.at("columns").get<int>();
            spec.thumbs = layout.value("thumbs", 0);
            spec.split = layout.value("split", false);
            break;

        case LayoutType::RAW:
            for (const auto& k : layout.at("keys")) {
                RawKeySpec key;
                key.x = k.at("x").get<double>();
                key.y = k.at("y").get<double>();
                if (k.contains("w")) key.width = k["w"].get<double>();
                if (k.contains("h")) key.height = k["h"].get<double>();
                if (k.contains("r")) key.rotation = k["r"].get<double>();
                spec.keys.push_back(key);
            }
            break;
    }
    return spec;
}

LayoutKey KeymapLoader::parse_layout_key(const json& entry) const {
    if (entry.is_object()) {
        LayoutKey key;
        key.tap = optional_string(entry, "t");
        key.hold = optional_string(entry, "h");
        key.shifted = optional_string(entry, "s");
        key.type = optional_string(entry, "type");
        return key;
    }
    return LayoutKey(legend_string(entry, "Key legend"));
}

ComboSpec KeymapLoader::parse_combo(const json& entry, size_t index) const {
    const std::string name = "combo #" + std::to_string(index);
    if (!entry.is_object()) {
        throw InputError(name + " must be an object");
    }
    if (!entry.contains("p") || !entry["p"].is_array()) {
        throw InputError(name + " needs a 'p' list of key positions");
    }

    ComboSpec combo;
    combo.key_positions = entry["p"].get<std::vector<int>>();
    if (entry.contains("k")) {
        combo.key = parse_layout_key(entry["k"]);
    }
    if (entry.contains("align")) {
        combo.align = parse_combo_alignment(entry["align"].get<std::string>());
    }
    combo.offset = entry.value("offset", 0.0);
    if (entry.contains("slide") && !entry["slide"].is_null()) {
        combo.slide = entry["slide"].get<double>();
    }
    if (entry.contains("dendron") && !entry["dendron"].is_null()) {
        combo.dendron = entry["dendron"].get<bool>() ? DendronMode::ALWAYS : DendronMode::NEVER;
    }
    combo.type = optional_string(entry, "type");
    if (entry.contains("l") && !entry["l"].is_null()) {
        combo.layers = entry["l"].get<std::vector<std::string>>();
    }
    return combo;
}

// ============================================================================
// Draw configuration
// ============================================================================

DrawConfig KeymapLoader::load_draw_config_file(const std::string& filename) const {
    logger_.info("Loading draw configuration from " + filename);
    return parse_draw_config(read_json_file(filename));
}

DrawConfig KeymapLoader::parse_draw_config(const json& doc) const {
    if (!doc.is_object()) {
        throw InputError("Draw configuration must be a JSON object");
    }

    DrawConfig config;
    try {
        for (const auto& [key, value] : doc.items()) {
            bool matched = false;
            for (const auto& [field_name, field] : NUMERIC_FIELDS) {
                if (key == field_name) {
                    config.*field = value.get<double>();
                    matched = true;
                    break;
                }
            }
            if (matched) continue;

            if (key == "append_colon_to_layer_header") {
                config.append_colon_to_layer_header = value.get<bool>();
            } else if (key == "svg_style") {
                config.svg_style = value.get<std::string>();
            } else if (key == "glyphs") {
                for (const auto& [glyph_name, markup] : value.items()) {
                    config.glyphs[glyph_name] = markup.get<std::string>();
                }
                logger_.detailed("Loaded " + std::to_string(config.glyphs.size()) + " glyph(s)");
            } else {
                logger_.warning("Ignoring unknown draw configuration key '" + key + "'");
            }
        }
    } catch (const json::exception& e) {
        throw InputError(std::string("Invalid draw configuration value: ") + e.what());
    }
    return config;
}

KeymapLoader::json KeymapLoader::draw_config_to_json(const DrawConfig& config) {
    json doc = json::object();
    for (const auto& [field_name, field] : NUMERIC_FIELDS) {
        doc[field_name] = config.*field;
    }
    doc["append_colon_to_layer_header"] = config.append_colon_to_layer_header;
    doc["svg_style"] = config.svg_style;
    doc["glyphs"] = json::object();
    for (const auto& [name, markup] : config.glyphs) {
        doc["glyphs"][name] = markup;
    }
    return doc;
}

bool KeymapLoader::write_default_draw_config(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        logger_.error("Could not create configuration file: " + filename);
        return false;
    }
    file << draw_config_to_json(DrawConfig{}).dump(2) << "\n";
    logger_.info("Wrote default draw configuration to " + filename);
    return static_cast<bool>(file);
}

} // namespace kmd
