/**
 * @file GlyphLibrary.hpp
 * @brief Named SVG glyphs used in place of legend text
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include <map>
#include <optional>
#include <string>

namespace kmd {

/**
 * @brief Parsed `viewBox` of a glyph's root element
 */
struct ViewBox {
    double min_x = 0.0;
    double min_y = 0.0;
    double width = 0.0;
    double height = 0.0;

    /// Width over height of the glyph's native coordinate system
    double aspect_ratio() const { return width / height; }
};

/**
 * @brief Lookup table from glyph name to raw SVG markup
 *
 * A glyph is usable only if its markup starts with an `<svg>` element whose
 * `viewBox` parses into four numbers with a positive height.
 */
class GlyphLibrary {
public:
    GlyphLibrary() = default;
    explicit GlyphLibrary(std::map<std::string, std::string> glyphs);

    bool contains(const std::string& name) const { return glyphs_.count(name) > 0; }
    size_t size() const { return glyphs_.size(); }

    /**
     * @brief View box of a named glyph
     * @return nullopt if the name is unknown or the view box is unusable
     */
    std::optional<ViewBox> view_box(const std::string& name) const;

    /**
     * @brief Glyph markup with every width/height attribute removed so the
     *        referencing element controls the rendered size
     * @throws std::out_of_range if the name is unknown
     */
    std::string scrubbed_markup(const std::string& name) const;

    /// Parse the view box out of raw glyph markup
    static std::optional<ViewBox> parse_view_box(const std::string& markup);

    /// Remove width="..." and height="..." attributes from markup
    static std::string scrub_dimensions(const std::string& markup);

private:
    std::map<std::string, std::string> glyphs_;
};

} // namespace kmd
