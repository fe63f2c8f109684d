#pragma once

/**
 * @file keymap_drawer.hpp
 * @brief Main header for the keymap SVG drawer
 *
 * Shared geometry primitives, legend and combo descriptions, drawing
 * configuration and error types used across the layout builder, the
 * keymap data model and the SVG rendering engine.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <cmath>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace kmd {

// ============================================================================
// Errors
// ============================================================================

/**
 * @brief Raised for invalid layout parameters, invalid keymap data or
 *        unknown layer selections. Always raised before any output is written.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error("Configuration error: " + message) {}
};

/**
 * @brief Raised when an input file cannot be read or decoded
 */
class InputError : public std::runtime_error {
public:
    explicit InputError(const std::string& message)
        : std::runtime_error("Input error: " + message) {}
};

// ============================================================================
// Geometry
// ============================================================================

/// Significant digits for coordinates written to SVG
constexpr int SVG_NUMBER_PRECISION = 12;

/**
 * @brief 2D point in SVG pixel coordinates
 */
struct Point {
    double x = 0.0;
    double y = 0.0;

    Point() = default;
    Point(double x_, double y_) : x(x_), y(y_) {}

    Point operator+(const Point& other) const { return Point(x + other.x, y + other.y); }
    Point operator-(const Point& other) const { return Point(x - other.x, y - other.y); }
    Point operator*(double factor) const { return Point(x * factor, y * factor); }

    Point& operator+=(const Point& other) {
        x += other.x;
        y += other.y;
        return *this;
    }

    bool operator==(const Point& other) const {
        return x == other.x && y == other.y;
    }

    /// Euclidean length of the vector from the origin
    double magnitude() const { return std::hypot(x, y); }
};

inline Point operator*(double factor, const Point& p) { return p * factor; }

/**
 * @brief Physical key: center position, size and rotation around its center
 */
struct KeyGeometry {
    Point pos;
    double width = 0.0;
    double height = 0.0;
    double rotation = 0.0;  ///< Degrees, clockwise as in SVG

    KeyGeometry() = default;
    KeyGeometry(double x, double y, double w, double h, double r = 0.0)
        : pos(x, y), width(w), height(h), rotation(r) {}
};

// ============================================================================
// Legends and combos
// ============================================================================

/**
 * @brief Legend slots of a key, named after the behavior they show
 */
enum class LegendSlot {
    TAP,      ///< Primary legend, centered
    HOLD,     ///< Secondary legend, near the bottom edge
    SHIFTED   ///< Tertiary legend, near the top edge
};

/// CSS class name of a legend slot ("tap", "hold", "shifted")
const char* legend_slot_name(LegendSlot slot);

/**
 * @brief What a key does on one layer
 */
struct LayoutKey {
    std::string tap;
    std::string hold;
    std::string shifted;
    std::string type;  ///< Free-form styling tag, emitted as a CSS class

    LayoutKey() = default;
    explicit LayoutKey(std::string tap_, std::string hold_ = "", std::string shifted_ = "",
                       std::string type_ = "")
        : tap(std::move(tap_)), hold(std::move(hold_)),
          shifted(std::move(shifted_)), type(std::move(type_)) {}
};

/**
 * @brief Placement of a combo box relative to its participant keys
 */
enum class ComboAlignment {
    MID,
    TOP,
    BOTTOM,
    LEFT,
    RIGHT
};

/**
 * @brief Whether connectors are drawn from a combo box to its keys
 */
enum class DendronMode {
    AUTO,    ///< Arcs always; straight lines only for distant keys
    ALWAYS,
    NEVER
};

ComboAlignment parse_combo_alignment(const std::string& value);
const char* combo_alignment_name(ComboAlignment align);

/**
 * @brief Chorded key definition
 */
struct ComboSpec {
    std::vector<int> key_positions;         ///< Indices into the physical layout
    LayoutKey key;                          ///< Legends drawn in the combo box
    ComboAlignment align = ComboAlignment::MID;
    double offset = 0.0;                    ///< Multiples of the minimum key dimension
    std::optional<double> slide;            ///< [-1, 1] between the two extreme keys
    DendronMode dendron = DendronMode::AUTO;
    std::string type;
    std::vector<std::string> layers;        ///< Empty means active on every layer
};

/**
 * @brief One full assignment of legends to every physical key
 */
struct Layer {
    std::string name;
    std::vector<LayoutKey> keys;
};

// ============================================================================
// Drawing configuration
// ============================================================================

/// Style sheet embedded verbatim in every document unless overridden
extern const char* const DEFAULT_SVG_STYLE;

/**
 * @brief Visual constants consumed by the renderer
 *
 * All dimensions are in SVG pixels. Glyph markup is raw SVG keyed by the
 * name used in `$$name$$` legends.
 */
struct DrawConfig {
    // Key rectangles
    double key_rx = 6.0;               ///< Corner radius, x
    double key_ry = 6.0;               ///< Corner radius, y
    double inner_pad_w = 2.0;          ///< Horizontal inset of the key rectangle
    double inner_pad_h = 2.0;          ///< Vertical inset of the key rectangle
    double small_pad = 2.0;            ///< Inset of hold/shifted legends from the edge

    // Board
    double outer_pad_w = 30.0;         ///< Left/right board padding
    double outer_pad_h = 56.0;         ///< Padding between layers, holds the header

    // Text
    double line_spacing = 1.2;         ///< Em units between stacked lines
    bool append_colon_to_layer_header = true;

    // Combos
    double combo_w = 28.0;
    double combo_h = 26.0;
    double arc_radius = 6.0;
    double arc_scale = 1.0;            ///< Fraction of the first dendron leg before the arc

    // Glyphs
    double glyph_tap_size = 14.0;
    double glyph_hold_size = 12.0;
    double glyph_shifted_size = 10.0;
    std::map<std::string, std::string> glyphs;

    std::string svg_style = DEFAULT_SVG_STYLE;
};

/**
 * @brief Output selection for a render pass
 */
struct RenderOptions {
    std::vector<std::string> draw_layers;  ///< Empty means all layers
    bool keys_only = false;                ///< Skip combos
    bool combos_only = false;              ///< Blank key legends, draw combos
};

} // namespace kmd
