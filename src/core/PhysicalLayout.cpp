/**
 * @file PhysicalLayout.cpp
 * @brief Physical layout construction and the raw/ortho builders
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "PhysicalLayout.hpp"
#include <algorithm>
#include <limits>
#include <sstream>

namespace kmd {

PhysicalLayout::PhysicalLayout(std::vector<KeyGeometry> keys) : keys_(std::move(keys)) {
    if (keys_.empty()) {
        throw ConfigurationError("Physical layout must contain at least one key");
    }

    width_ = std::numeric_limits<double>::lowest();
    height_ = std::numeric_limits<double>::lowest();
    min_width_ = std::numeric_limits<double>::max();
    min_height_ = std::numeric_limits<double>::max();

    for (size_t i = 0; i < keys_.size(); ++i) {
        const auto& k = keys_[i];
        if (!(k.width > 0.0) || !(k.height > 0.0)) {
            std::ostringstream oss;
            oss << "Key " << i << " has invalid size " << k.width << "x" << k.height
                << " (width and height must be positive)";
            throw ConfigurationError(oss.str());
        }
        width_ = std::max(width_, k.pos.x + k.width / 2.0);
        height_ = std::max(height_, k.pos.y + k.height / 2.0);
        min_width_ = std::min(min_width_, k.width);
        min_height_ = std::min(min_height_, k.height);
    }
}

LayoutType parse_layout_type(const std::string& tag) {
    if (tag == "ortho") return LayoutType::ORTHO;
    if (tag == "raw") return LayoutType::RAW;
    throw ConfigurationError("Physical layout type \"" + tag + "\" is not supported");
}

PhysicalLayout build_raw_layout(const std::vector<RawKeySpec>& keys) {
    std::vector<KeyGeometry> geometry;
    geometry.reserve(keys.size());
    for (const auto& k : keys) {
        geometry.emplace_back(k.x, k.y,
                              k.width.value_or(KEY_W),
                              k.height.value_or(KEY_H),
                              k.rotation.value_or(0.0));
    }
    return PhysicalLayout(std::move(geometry));
}

PhysicalLayout build_ortho_layout(int rows, int columns, int thumbs, bool split) {
    if (rows < 1 || columns < 1) {
        throw ConfigurationError("Ortho layout needs at least one row and one column (got rows=" +
                                 std::to_string(rows) + ", columns=" + std::to_string(columns) + ")");
    }
    if (thumbs < 0) {
        throw ConfigurationError("Number of thumbs cannot be negative");
    }
    if (thumbs > 0) {
        if (thumbs > columns) {
            throw ConfigurationError("Number of thumbs (" + std::to_string(thumbs) +
                                     ") should not be greater than columns (" +
                                     std::to_string(columns) + ")");
        }
        if (!split) {
            throw ConfigurationError("Cannot process non-split keyboard with thumb keys");
        }
    }

    std::vector<KeyGeometry> keys;
    keys.reserve(static_cast<size_t>((rows * columns + thumbs) * (split ? 2 : 1)));

    // x, y are the top-left corner of the first key in the run
    auto create_row = [&keys](double x, double y, int count) {
        for (int i = 0; i < count; ++i) {
            keys.emplace_back(x + KEY_W / 2.0, y + KEY_H / 2.0, KEY_W, KEY_H);
            x += KEY_W;
        }
    };

    const double right_half_x = columns * KEY_W + SPLIT_GAP;

    double y = 0.0;
    for (int row = 0; row < rows; ++row) {
        create_row(0.0, y, columns);
        if (split) {
            create_row(right_half_x, y, columns);
        }
        y += KEY_H;
    }

    if (thumbs > 0) {
        create_row((columns - thumbs) * KEY_W, rows * KEY_H, thumbs);
        create_row(right_half_x, rows * KEY_H, thumbs);
    }

    return PhysicalLayout(std::move(keys));
}

PhysicalLayout build_layout(const LayoutSpec& spec) {
    switch (spec.type) {
        case LayoutType::ORTHO:
            return build_ortho_layout(spec.rows, spec.columns, spec.thumbs, spec.split);
        case LayoutType::RAW:
            return build_raw_layout(spec.keys);
    }
    throw ConfigurationError("Unknown physical layout type");
}

} // namespace kmd
