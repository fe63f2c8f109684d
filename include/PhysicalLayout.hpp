/**
 * @file PhysicalLayout.hpp
 * @brief Physical key geometry and the layout builders that produce it
 *
 * Two layout variants are supported: a literal list of keys ("raw") and a
 * generated ortholinear grid ("ortho") with optional split and thumb rows.
 * Key order is the contract used by layers and combos to reference keys.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "keymap_drawer.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace kmd {

/// Default key pitch used by the grid builder and for omitted raw sizes
constexpr double KEY_W = 59.0;
constexpr double KEY_H = 54.0;
constexpr double SPLIT_GAP = KEY_W / 2.0;

/**
 * @brief Immutable ordered collection of key geometries
 *
 * Derived extents are computed once at construction. Since keys cannot
 * change afterwards, every accessor returns the same memoized value.
 */
class PhysicalLayout {
public:
    /**
     * @brief Construct from a non-empty list of keys
     * @throws ConfigurationError if the list is empty or a key has a
     *         non-positive width or height
     */
    explicit PhysicalLayout(std::vector<KeyGeometry> keys);

    size_t size() const { return keys_.size(); }
    const KeyGeometry& key(size_t index) const { return keys_.at(index); }
    const std::vector<KeyGeometry>& keys() const { return keys_; }

    /// Maximum of x + width/2 over all keys
    double width() const { return width_; }

    /// Maximum of y + height/2 over all keys
    double height() const { return height_; }

    /// Smallest key width, used to scale left/right combo offsets
    double min_width() const { return min_width_; }

    /// Smallest key height, used to scale top/bottom combo offsets
    double min_height() const { return min_height_; }

private:
    std::vector<KeyGeometry> keys_;
    double width_ = 0.0;
    double height_ = 0.0;
    double min_width_ = 0.0;
    double min_height_ = 0.0;
};

// ============================================================================
// Layout builders
// ============================================================================

/**
 * @brief Layout variant discriminant
 */
enum class LayoutType {
    ORTHO,  ///< Generated grid
    RAW     ///< Literal key list
};

/**
 * @brief Parse a layout type tag ("ortho" or "raw")
 * @throws ConfigurationError for any other tag
 */
LayoutType parse_layout_type(const std::string& tag);

/**
 * @brief Literal key description with optional size and rotation
 */
struct RawKeySpec {
    double x = 0.0;
    double y = 0.0;
    std::optional<double> width;     ///< Defaults to KEY_W
    std::optional<double> height;    ///< Defaults to KEY_H
    std::optional<double> rotation;  ///< Defaults to 0
};

/**
 * @brief Parameters for either layout variant, selected by @ref type
 */
struct LayoutSpec {
    LayoutType type = LayoutType::ORTHO;

    // ORTHO parameters
    int rows = 0;
    int columns = 0;
    int thumbs = 0;
    bool split = false;

    // RAW parameters
    std::vector<RawKeySpec> keys;
};

/**
 * @brief Build a layout from a literal key list, applying size defaults
 */
PhysicalLayout build_raw_layout(const std::vector<RawKeySpec>& keys);

/**
 * @brief Build an ortholinear grid layout
 *
 * Keys are emitted row by row, left half before right half, and the thumb
 * row (one block per half) after all main rows.
 *
 * @throws ConfigurationError if rows or columns are not positive, thumbs is
 *         negative, thumbs exceeds columns, or thumbs are requested without split
 */
PhysicalLayout build_ortho_layout(int rows, int columns, int thumbs, bool split);

/**
 * @brief Build the layout described by @p spec, dispatching on its type
 */
PhysicalLayout build_layout(const LayoutSpec& spec);

} // namespace kmd
