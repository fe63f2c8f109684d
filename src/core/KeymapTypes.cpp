/**
 * @file KeymapTypes.cpp
 * @brief Enum names and the default style sheet
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "keymap_drawer.hpp"

namespace kmd {

const char* const DEFAULT_SVG_STYLE = R"css(
/* inherit to force styles through use tags */
svg path {
    fill: inherit;
}

/* font and background color specifications */
svg.keymap {
    font-family: SFMono-Regular, Consolas, Liberation Mono, Menlo, monospace;
    font-size: 14px;
    font-kerning: normal;
    text-rendering: optimizeLegibility;
    fill: #24292e;
}

/* default key styling */
rect.key {
    fill: #f6f8fa;
    stroke: #c9cccf;
    stroke-width: 1;
}

/* default combo box styling */
rect.combo {
    fill: #cdf;
}

/* color accent for held keys */
rect.held, rect.combo.held {
    fill: #fdd;
}

/* color accent for ghost (optional) keys */
rect.ghost, rect.combo.ghost {
    stroke-dasharray: 4, 4;
    stroke-width: 2;
}

text {
    text-anchor: middle;
    dominant-baseline: middle;
}

/* styling for layer labels */
text.label {
    font-weight: bold;
    text-anchor: start;
    stroke: white;
    stroke-width: 2;
    paint-order: stroke;
}

/* styling for combo tap, and key hold/shifted label text */
text.combo, text.hold, text.shifted {
    font-size: 11px;
}

text.hold {
    text-anchor: middle;
    dominant-baseline: auto;
}

text.shifted {
    text-anchor: middle;
    dominant-baseline: hanging;
}

/* styling for combo dendrons */
path.combo {
    stroke-width: 1;
    stroke: gray;
    fill: none;
}

/* lighter symbols for transparent keys */
text.trans {
    fill: #7b7e81;
}
)css";

const char* legend_slot_name(LegendSlot slot) {
    switch (slot) {
        case LegendSlot::TAP: return "tap";
        case LegendSlot::HOLD: return "hold";
        case LegendSlot::SHIFTED: return "shifted";
    }
    return "tap";
}

ComboAlignment parse_combo_alignment(const std::string& value) {
    if (value == "mid") return ComboAlignment::MID;
    if (value == "top") return ComboAlignment::TOP;
    if (value == "bottom") return ComboAlignment::BOTTOM;
    if (value == "left") return ComboAlignment::LEFT;
    if (value == "right") return ComboAlignment::RIGHT;
    throw ConfigurationError("Unknown combo alignment '" + value +
                             "' (expected mid, top, bottom, left or right)");
}

const char* combo_alignment_name(ComboAlignment align) {
    switch (align) {
        case ComboAlignment::MID: return "mid";
        case ComboAlignment::TOP: return "top";
        case ComboAlignment::BOTTOM: return "bottom";
        case ComboAlignment::LEFT: return "left";
        case ComboAlignment::RIGHT: return "right";
    }
    return "mid";
}

} // namespace kmd
