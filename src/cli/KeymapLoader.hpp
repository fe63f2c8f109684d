/**
 * @file KeymapLoader.hpp
 * @brief JSON input for keymaps and drawing configuration
 *
 * Keymap files describe the physical layout, the ordered layers and the
 * combos; draw configuration files override any subset of DrawConfig.
 * Layer order follows the order of keys in the file.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "keymap_drawer.hpp"
#include "PhysicalLayout.hpp"
#include "../core/KeymapData.hpp"
#include "../core/Logger.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace kmd {

/**
 * @brief Reads keymaps and draw configurations from JSON
 *
 * Malformed JSON or values of the wrong type raise InputError; structurally
 * valid input that describes an impossible keymap raises ConfigurationError.
 */
class KeymapLoader {
public:
    using json = nlohmann::ordered_json;

    KeymapLoader();

    /**
     * @brief Load and validate a keymap file
     * @throws InputError if the file cannot be opened or parsed
     * @throws ConfigurationError if the keymap is inconsistent
     */
    KeymapData load_keymap_file(const std::string& filename) const;

    /**
     * @brief Build a keymap from JSON text
     */
    KeymapData parse_keymap_string(const std::string& text) const;

    /**
     * @brief Build a keymap from a parsed document
     *
     * Expected shape:
     * @code
     * {
     *   "layout": {"ltype": "ortho", "rows": 3, "columns": 5, "thumbs": 2, "split": true},
     *   "layers": {"Base": ["Q", {"t": "A", "h": "Ctrl"}, null, ...]},
     *   "combos": [{"p": [0, 1], "k": "Esc", "align": "top", "l": ["Base"]}]
     * }
     * @endcode
     */
    KeymapData parse_keymap(const json& doc) const;

    /**
     * @brief Load a draw configuration file on top of the defaults
     */
    DrawConfig load_draw_config_file(const std::string& filename) const;

    /**
     * @brief Apply a JSON object of DrawConfig fields on top of the defaults
     *
     * Unknown keys are reported as warnings and ignored.
     */
    DrawConfig parse_draw_config(const json& doc) const;

    /**
     * @brief Serialize a draw configuration, including style and glyphs
     */
    static json draw_config_to_json(const DrawConfig& config);

    /**
     * @brief Write the default draw configuration to a file
     * @return true if successful, false otherwise
     */
    bool write_default_draw_config(const std::string& filename) const;

    LayoutSpec parse_layout(const json& layout) const;
    LayoutKey parse_layout_key(const json& entry) const;
    ComboSpec parse_combo(const json& entry, size_t index) const;

private:
    Logger logger_;

    json read_json_file(const std::string& filename) const;
};

} // namespace kmd
