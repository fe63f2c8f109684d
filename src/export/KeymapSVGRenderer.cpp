/**
 * @file KeymapSVGRenderer.cpp
 * @brief Implementation of keymap SVG rendering
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "KeymapSVGRenderer.hpp"
#include "ComboGeometry.hpp"
#include "LegendText.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace kmd {

namespace {

/// Hold and shifted legends are never wrapped
std::vector<std::string> single_word(const std::string& text) {
    if (text.empty()) {
        return {};
    }
    return {text};
}

} // namespace

KeymapSVGRenderer::KeymapSVGRenderer(const DrawConfig& config, const KeymapData& keymap)
    : config_(config), keymap_(keymap), glyphs_(config.glyphs), logger_("KeymapSVGRenderer") {
}

// ============================================================================
// Document composition
// ============================================================================

void KeymapSVGRenderer::render(std::ostream& out, const RenderOptions& options) const {
    // Everything that can fail is resolved before writing
    const std::vector<const Layer*> layers = keymap_.select_layers(options.draw_layers);
    const PhysicalLayout& layout = keymap_.layout();

    std::vector<std::vector<const ComboSpec*>> combos_per_layer;
    std::vector<ComboReserve> reserves;
    combos_per_layer.reserve(layers.size());
    reserves.reserve(layers.size());
    for (const Layer* layer : layers) {
        if (options.keys_only) {
            combos_per_layer.emplace_back();
        } else {
            combos_per_layer.push_back(keymap_.combos_for_layer(layer->name));
        }
        reserves.push_back(combo_reserve(combos_per_layer.back()));
    }

    const std::set<std::string> glyph_names =
        referenced_glyphs(layers, combos_per_layer, options.combos_only);

    const double n = static_cast<double>(layers.size());
    double board_w = layout.width() + 2.0 * config_.outer_pad_w;
    double board_h = n * layout.height() + (n + 1.0) * config_.outer_pad_h;
    for (const auto& reserve : reserves) {
        board_h += reserve.top + reserve.bottom;
    }

    logger_.info("Rendering " + std::to_string(layers.size()) + " layer(s) on a " +
                 std::to_string(layout.size()) + "-key layout");
    logger_.debug("Board size " + std::to_string(board_w) + "x" + std::to_string(board_h) +
                  ", " + std::to_string(glyph_names.size()) + " glyph(s) referenced");

    const std::streamsize saved_precision = out.precision();
    out << std::setprecision(SVG_NUMBER_PRECISION);

    write_svg_header(out, board_w, board_h);
    write_glyph_definitions(out, glyph_names);
    write_style(out);

    Point p(config_.outer_pad_w, 0.0);
    for (size_t i = 0; i < layers.size(); ++i) {
        const Layer& layer = *layers[i];
        logger_.detailed("Layer '" + layer.name + "': " + std::to_string(combos_per_layer[i].size()) +
                         " combo(s)");

        out << "<g class=\"layer-" << escape_xml(layer.name) << "\">\n";

        std::string header = layer.name;
        if (config_.append_colon_to_layer_header) {
            header += ":";
        }
        draw_text(out, p + Point(0.0, config_.outer_pad_h / 2.0), header, {"label"});

        p += Point(0.0, config_.outer_pad_h + reserves[i].top);
        print_layer(out, p, layer, combos_per_layer[i], options.combos_only);
        p += Point(0.0, layout.height() + reserves[i].bottom);

        out << "</g>\n";
    }

    write_svg_footer(out);
    out.precision(saved_precision);
}

std::string KeymapSVGRenderer::render_to_string(const RenderOptions& options) const {
    std::ostringstream oss;
    render(oss, options);
    return oss.str();
}

void KeymapSVGRenderer::print_layer(std::ostream& out, Point origin, const Layer& layer,
                                    const std::vector<const ComboSpec*>& combos, bool empty_layer) const {
    const PhysicalLayout& layout = keymap_.layout();
    const LayoutKey blank;

    for (size_t i = 0; i < layout.size(); ++i) {
        print_key(out, origin, layout.key(i), empty_layer ? blank : layer.keys[i]);
    }
    for (const ComboSpec* combo : combos) {
        print_combo(out, origin, *combo);
    }
}

KeymapSVGRenderer::ComboReserve KeymapSVGRenderer::combo_reserve(
    const std::vector<const ComboSpec*>& combos) const {
    ComboReserve reserve;
    const double min_height = keymap_.layout().min_height();
    for (const ComboSpec* combo : combos) {
        if (combo->align == ComboAlignment::TOP) {
            reserve.top = std::max(reserve.top, combo->offset * min_height);
        } else if (combo->align == ComboAlignment::BOTTOM) {
            reserve.bottom = std::max(reserve.bottom, combo->offset * min_height);
        }
    }
    return reserve;
}

std::set<std::string> KeymapSVGRenderer::referenced_glyphs(
    const std::vector<const Layer*>& layers,
    const std::vector<std::vector<const ComboSpec*>>& combos,
    bool empty_layers) const {
    std::set<std::string> names;

    for (size_t i = 0; i < layers.size(); ++i) {
        if (!empty_layers) {
            for (const auto& key : layers[i]->keys) {
                collect_glyph(split_legend_text(key.tap), names);
                collect_glyph(single_word(key.hold), names);
                collect_glyph(single_word(key.shifted), names);
            }
        }
        for (const ComboSpec* combo : combos[i]) {
            collect_glyph(split_legend_text(combo->key.tap), names);
            collect_glyph(single_word(combo->key.hold), names);
            collect_glyph(single_word(combo->key.shifted), names);
        }
    }
    return names;
}

void KeymapSVGRenderer::collect_glyph(const std::vector<std::string>& words,
                                      std::set<std::string>& names) const {
    auto name = glyph_reference(words);
    if (name && glyphs_.view_box(*name)) {
        names.insert(*name);
    }
}

// ============================================================================
// Keys and combos
// ============================================================================

void KeymapSVGRenderer::print_key(std::ostream& out, Point origin, const KeyGeometry& geometry,
                                  const LayoutKey& legend) const {
    const Point p = origin + geometry.pos;
    const double w = geometry.width;
    const double h = geometry.height;
    const double r = geometry.rotation;

    if (r != 0.0) {
        out << "<g transform=\"rotate(" << r << ", " << p.x << ", " << p.y << ")\">\n";
    }

    draw_rect(out, p, w - 2.0 * config_.inner_pad_w, h - 2.0 * config_.inner_pad_h, {legend.type, "key"});
    draw_legends(out, p, legend, {legend.type}, h / 2.0 - config_.inner_pad_h - config_.small_pad);

    if (r != 0.0) {
        out << "</g>\n";
    }
}

void KeymapSVGRenderer::print_combo(std::ostream& out, Point origin, const ComboSpec& combo) const {
    const PhysicalLayout& layout = keymap_.layout();
    const Point p = origin + combo_anchor(combo, layout, config_);

    logger_.trace("Combo '" + combo.key.tap + "' (" + combo_alignment_name(combo.align) +
                  ") anchored at " + std::to_string(p.x) + "," + std::to_string(p.y));

    for (const auto& path : combo_dendrons(combo, origin, p, layout, config_)) {
        out << "<path d=\"" << path << "\" class=\"combo\"/>\n";
    }

    draw_rect(out, p, config_.combo_w, config_.combo_h, {"combo", combo.type});
    draw_legends(out, p, combo.key, {"combo", combo.type}, config_.combo_h / 2.0 - config_.small_pad);
}

void KeymapSVGRenderer::draw_legends(std::ostream& out, Point center, const LayoutKey& legend,
                                     const std::vector<std::string>& base_classes,
                                     double edge_distance) const {
    const std::vector<std::string> tap_words = split_legend_text(legend.tap);

    // Two-line tap legends make room for a hold or shifted legend
    double shift = 0.0;
    if (tap_words.size() == 2) {
        if (!legend.shifted.empty() && legend.hold.empty()) {
            shift = -1.0;
        } else if (!legend.hold.empty() && legend.shifted.empty()) {
            shift = 1.0;
        }
    }

    draw_legend(out, center, tap_words, base_classes, LegendSlot::TAP, shift);
    draw_legend(out, center + Point(0.0, edge_distance), single_word(legend.hold),
                base_classes, LegendSlot::HOLD);
    draw_legend(out, center - Point(0.0, edge_distance), single_word(legend.shifted),
                base_classes, LegendSlot::SHIFTED);
}

// ============================================================================
// Primitives
// ============================================================================

std::string KeymapSVGRenderer::class_attr(const std::vector<std::string>& classes) {
    std::string joined;
    for (const auto& c : classes) {
        if (c.empty()) continue;
        if (!joined.empty()) joined += " ";
        joined += c;
    }
    if (joined.empty()) {
        return "";
    }
    return " class=\"" + escape_xml(joined) + "\"";
}

void KeymapSVGRenderer::draw_rect(std::ostream& out, Point p, double w, double h,
                                  const std::vector<std::string>& classes) const {
    out << "<rect rx=\"" << config_.key_rx << "\" ry=\"" << config_.key_ry << "\""
        << " x=\"" << p.x - w / 2.0 << "\" y=\"" << p.y - h / 2.0 << "\""
        << " width=\"" << w << "\" height=\"" << h << "\""
        << class_attr(classes) << "/>\n";
}

void KeymapSVGRenderer::draw_text(std::ostream& out, Point p, const std::string& word,
                                  const std::vector<std::string>& classes) const {
    if (word.empty()) {
        return;
    }
    out << "<text x=\"" << p.x << "\" y=\"" << p.y << "\"" << class_attr(classes) << ">"
        << escape_xml(word) << "</text>\n";
}

void KeymapSVGRenderer::draw_textblock(std::ostream& out, Point p, const std::vector<std::string>& words,
                                       const std::vector<std::string>& classes, double shift) const {
    const double dy_0 = static_cast<double>(words.size() - 1) *
                        (config_.line_spacing * (1.0 + shift) / 2.0);

    out << "<text x=\"" << p.x << "\" y=\"" << p.y << "\"" << class_attr(classes) << ">\n";
    out << "<tspan x=\"" << p.x << "\" dy=\"-" << dy_0 << "em\">" << escape_xml(words[0]) << "</tspan>";
    for (size_t i = 1; i < words.size(); ++i) {
        out << "<tspan x=\"" << p.x << "\" dy=\"" << config_.line_spacing << "em\">"
            << escape_xml(words[i]) << "</tspan>";
    }
    out << "</text>\n";
}

bool KeymapSVGRenderer::draw_glyph(std::ostream& out, Point p, const std::string& name, LegendSlot slot,
                                   const std::vector<std::string>& classes) const {
    auto view_box = glyphs_.view_box(name);
    if (!view_box) {
        if (glyphs_.contains(name)) {
            logger_.warning("Glyph '" + name + "' has no usable viewBox, drawing legend as text");
        } else {
            logger_.warning("Glyph '" + name + "' is not defined, drawing legend as text");
        }
        return false;
    }

    double height = 0.0;
    double d_y = 0.0;
    switch (slot) {
        case LegendSlot::TAP:
            height = config_.glyph_tap_size;
            d_y = 0.5 * height;
            break;
        case LegendSlot::HOLD:
            height = config_.glyph_hold_size;
            d_y = height;
            break;
        case LegendSlot::SHIFTED:
            height = config_.glyph_shifted_size;
            d_y = 0.0;
            break;
    }

    const double width = height * view_box->aspect_ratio();

    std::vector<std::string> glyph_classes = classes;
    glyph_classes.push_back("glyph");
    glyph_classes.push_back(name);

    out << "<use href=\"#" << escape_xml(name) << "\" x=\"" << p.x - width / 2.0 << "\" y=\"" << p.y - d_y << "\""
        << " height=\"" << height << "\" width=\"" << width << "\"" << class_attr(glyph_classes) << "/>\n";
    return true;
}

void KeymapSVGRenderer::draw_legend(std::ostream& out, Point p, const std::vector<std::string>& words,
                                    const std::vector<std::string>& base_classes, LegendSlot slot,
                                    double shift) const {
    if (words.empty()) {
        return;
    }

    std::vector<std::string> classes = base_classes;
    classes.push_back(legend_slot_name(slot));

    auto glyph = glyph_reference(words);
    if (glyph && draw_glyph(out, p, *glyph, slot, classes)) {
        return;
    }

    if (words.size() == 1) {
        draw_text(out, p, words[0], classes);
        return;
    }

    draw_textblock(out, p, words, classes, shift);
}

// ============================================================================
// Document sections
// ============================================================================

void KeymapSVGRenderer::write_svg_header(std::ostream& out, double width, double height) const {
    out << "<svg width=\"" << width << "\" height=\"" << height << "\""
        << " viewBox=\"0 0 " << width << " " << height << "\" class=\"keymap\""
        << " xmlns=\"http://www.w3.org/2000/svg\">\n";
}

void KeymapSVGRenderer::write_glyph_definitions(std::ostream& out, const std::set<std::string>& names) const {
    out << "<defs>\n";
    for (const auto& name : names) {
        out << "<svg id=\"" << escape_xml(name) << "\">\n";
        out << glyphs_.scrubbed_markup(name);
        out << "\n</svg>\n";
    }
    out << "</defs>\n";
}

void KeymapSVGRenderer::write_style(std::ostream& out) const {
    out << "<style>" << config_.svg_style << "</style>\n";
}

void KeymapSVGRenderer::write_svg_footer(std::ostream& out) const {
    out << "</svg>\n";
}

} // namespace kmd
