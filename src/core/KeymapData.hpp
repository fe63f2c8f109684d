/**
 * @file KeymapData.hpp
 * @brief Validated keymap: physical layout, ordered layers and combos
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "keymap_drawer.hpp"
#include "PhysicalLayout.hpp"
#include <string>
#include <vector>

namespace kmd {

/**
 * @brief Immutable keymap document
 *
 * Owns the physical layout together with the layers and combos that refer
 * to its keys by index. Construction validates the whole document, so any
 * KeymapData instance is consistent by construction.
 */
class KeymapData {
public:
    /**
     * @brief Construct and validate a keymap
     * @throws ConfigurationError with the formatted conflict report if any
     *         layer or combo is inconsistent with the layout
     */
    KeymapData(PhysicalLayout layout, std::vector<Layer> layers, std::vector<ComboSpec> combos = {});

    const PhysicalLayout& layout() const { return layout_; }
    const std::vector<Layer>& layers() const { return layers_; }
    const std::vector<ComboSpec>& combos() const { return combos_; }

    bool has_layer(const std::string& name) const;

    /**
     * @brief Layers to draw, in document order
     * @param names Requested subset; empty selects every layer
     * @throws ConfigurationError if a requested name is not in the keymap
     */
    std::vector<const Layer*> select_layers(const std::vector<std::string>& names) const;

    /**
     * @brief Combos active on a layer, in definition order
     *
     * A combo with no layer list is active on every layer.
     */
    std::vector<const ComboSpec*> combos_for_layer(const std::string& layer_name) const;

private:
    PhysicalLayout layout_;
    std::vector<Layer> layers_;
    std::vector<ComboSpec> combos_;
};

} // namespace kmd
