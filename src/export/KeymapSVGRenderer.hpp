/**
 * @file KeymapSVGRenderer.hpp
 * @brief SVG rendering of keymap layers, legends, glyphs and combos
 *
 * Writes one self-contained SVG document per call: glyph definitions,
 * the style sheet, then one group per layer stacked top to bottom.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "keymap_drawer.hpp"
#include "GlyphLibrary.hpp"
#include "../core/KeymapData.hpp"
#include "../core/Logger.hpp"
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace kmd {

/**
 * @brief SVG renderer for a validated keymap
 *
 * Holds references to its configuration and keymap; both must outlive the
 * renderer. The renderer keeps no state between calls, so the same
 * instance may render several documents, and separate instances may run on
 * separate threads as long as each writes to its own stream.
 */
class KeymapSVGRenderer {
public:
    /**
     * @brief Constructor
     * @param config Visual constants, style sheet and glyph markup
     * @param keymap Validated keymap, including its physical layout
     */
    KeymapSVGRenderer(const DrawConfig& config, const KeymapData& keymap);

    /**
     * @brief Write the full SVG document
     *
     * Layer selection and glyph resolution happen before the first byte is
     * written, so a ConfigurationError never leaves partial output.
     *
     * @param out Output sink
     * @param options Layer subset and keys/combos-only modes
     * @throws ConfigurationError if a selected layer is not in the keymap
     */
    void render(std::ostream& out, const RenderOptions& options = RenderOptions{}) const;

    /**
     * @brief Render into a string
     */
    std::string render_to_string(const RenderOptions& options = RenderOptions{}) const;

    /**
     * @brief Write one key: rectangle and up to three legends
     * @param origin Layer origin added to the key position
     */
    void print_key(std::ostream& out, Point origin, const KeyGeometry& geometry, const LayoutKey& legend) const;

    /**
     * @brief Write one combo: dendrons, box and legends
     * @param origin Layer origin added to key positions
     */
    void print_combo(std::ostream& out, Point origin, const ComboSpec& combo) const;

    /**
     * @brief Write every key of a layer followed by its active combos
     * @param empty_layer Draw keys without legends
     */
    void print_layer(std::ostream& out, Point origin, const Layer& layer,
                     const std::vector<const ComboSpec*>& combos, bool empty_layer = false) const;

private:
    const DrawConfig& config_;
    const KeymapData& keymap_;
    GlyphLibrary glyphs_;
    Logger logger_;

    /**
     * @brief Extra space above and below a layer reserved for edge-aligned combos
     */
    struct ComboReserve {
        double top = 0.0;
        double bottom = 0.0;
    };

    ComboReserve combo_reserve(const std::vector<const ComboSpec*>& combos) const;

    /**
     * @brief Names of resolvable glyphs referenced by the content being drawn
     */
    std::set<std::string> referenced_glyphs(const std::vector<const Layer*>& layers,
                                            const std::vector<std::vector<const ComboSpec*>>& combos,
                                            bool empty_layers) const;

    void collect_glyph(const std::vector<std::string>& words, std::set<std::string>& names) const;

    /**
     * @brief Build a class attribute, skipping empty class names
     * @return ` class="..."` or an empty string
     */
    static std::string class_attr(const std::vector<std::string>& classes);

    void draw_rect(std::ostream& out, Point p, double w, double h,
                   const std::vector<std::string>& classes) const;

    void draw_text(std::ostream& out, Point p, const std::string& word,
                   const std::vector<std::string>& classes) const;

    /**
     * @brief Write a multi-line legend centered vertically on @p p
     * @param shift -1 moves the block down, +1 moves it up
     */
    void draw_textblock(std::ostream& out, Point p, const std::vector<std::string>& words,
                        const std::vector<std::string>& classes, double shift) const;

    /**
     * @brief Write a glyph reference scaled for the legend slot
     * @return false if the glyph is unknown or its view box is unusable
     */
    bool draw_glyph(std::ostream& out, Point p, const std::string& name, LegendSlot slot,
                    const std::vector<std::string>& classes) const;

    /**
     * @brief Write a legend as a glyph, a single text line or a text block
     * @param base_classes Classes shared by every element of the legend
     */
    void draw_legend(std::ostream& out, Point p, const std::vector<std::string>& words,
                     const std::vector<std::string>& base_classes, LegendSlot slot,
                     double shift = 0.0) const;

    /**
     * @brief Tap, hold and shifted legends around a center point
     * @param edge_distance Distance from center to the hold/shifted anchors
     */
    void draw_legends(std::ostream& out, Point center, const LayoutKey& legend,
                      const std::vector<std::string>& base_classes, double edge_distance) const;

    void write_svg_header(std::ostream& out, double width, double height) const;
    void write_glyph_definitions(std::ostream& out, const std::set<std::string>& names) const;
    void write_style(std::ostream& out) const;
    void write_svg_footer(std::ostream& out) const;
};

} // namespace kmd
