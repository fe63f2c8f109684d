/**
 * @file GlyphLibrary.cpp
 * @brief Glyph view box parsing and markup scrubbing
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "GlyphLibrary.hpp"
#include <regex>
#include <stdexcept>

namespace kmd {

GlyphLibrary::GlyphLibrary(std::map<std::string, std::string> glyphs)
    : glyphs_(std::move(glyphs)) {
}

std::optional<ViewBox> GlyphLibrary::view_box(const std::string& name) const {
    auto it = glyphs_.find(name);
    if (it == glyphs_.end()) {
        return std::nullopt;
    }
    return parse_view_box(it->second);
}

std::string GlyphLibrary::scrubbed_markup(const std::string& name) const {
    return scrub_dimensions(glyphs_.at(name));
}

std::optional<ViewBox> GlyphLibrary::parse_view_box(const std::string& markup) {
    // Root element must come first; the view box is read from its opening tag only
    static const std::regex svg_tag_re(R"(^\s*(<svg[^>]*>))", std::regex::icase);
    static const std::regex view_box_re(
        R"re(viewbox="(-?\d+(?:\.\d+)?)\s+(-?\d+(?:\.\d+)?)\s+(\d+(?:\.\d+)?)\s+(\d+(?:\.\d+)?)")re",
        std::regex::icase);

    std::smatch tag;
    if (!std::regex_search(markup, tag, svg_tag_re)) {
        return std::nullopt;
    }

    const std::string open_tag = tag[1].str();
    std::smatch vb;
    if (!std::regex_search(open_tag, vb, view_box_re)) {
        return std::nullopt;
    }

    ViewBox box;
    try {
        box.min_x = std::stod(vb[1].str());
        box.min_y = std::stod(vb[2].str());
        box.width = std::stod(vb[3].str());
        box.height = std::stod(vb[4].str());
    } catch (const std::exception&) {
        return std::nullopt;
    }

    if (!(box.height > 0.0)) {
        return std::nullopt;
    }
    return box;
}

std::string GlyphLibrary::scrub_dimensions(const std::string& markup) {
    static const std::regex dims_re(R"re( (width|height)=".*?")re");
    return std::regex_replace(markup, dims_re, "");
}

} // namespace kmd
