/**
 * @file KeymapData.cpp
 * @brief Keymap document validation and per-layer queries
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "KeymapData.hpp"
#include "InputValidator.hpp"
#include <algorithm>

namespace kmd {

KeymapData::KeymapData(PhysicalLayout layout, std::vector<Layer> layers, std::vector<ComboSpec> combos)
    : layout_(std::move(layout)), layers_(std::move(layers)), combos_(std::move(combos)) {
    InputValidator validator;
    ValidationResult result = validator.validate(layout_, layers_, combos_);
    if (result.has_errors()) {
        throw ConfigurationError(result.format_error_message());
    }
}

bool KeymapData::has_layer(const std::string& name) const {
    return std::any_of(layers_.begin(), layers_.end(),
                       [&name](const Layer& l) { return l.name == name; });
}

std::vector<const Layer*> KeymapData::select_layers(const std::vector<std::string>& names) const {
    std::vector<std::string> missing;
    for (const auto& name : names) {
        if (!has_layer(name)) {
            missing.push_back(name);
        }
    }
    if (!missing.empty()) {
        std::string list;
        for (size_t i = 0; i < missing.size(); ++i) {
            list += (i ? ", " : "") + missing[i];
        }
        throw ConfigurationError("Layers selected for drawing are not in the keymap: " + list);
    }

    std::vector<const Layer*> selected;
    for (const auto& layer : layers_) {
        if (names.empty() || std::find(names.begin(), names.end(), layer.name) != names.end()) {
            selected.push_back(&layer);
        }
    }
    return selected;
}

std::vector<const ComboSpec*> KeymapData::combos_for_layer(const std::string& layer_name) const {
    std::vector<const ComboSpec*> active;
    for (const auto& combo : combos_) {
        if (combo.layers.empty() ||
            std::find(combo.layers.begin(), combo.layers.end(), layer_name) != combo.layers.end()) {
            active.push_back(&combo);
        }
    }
    return active;
}

} // namespace kmd
