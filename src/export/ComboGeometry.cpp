/**
 * @file ComboGeometry.cpp
 * @brief Combo box anchors and dendron paths
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "ComboGeometry.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace kmd {

namespace {

/// Slack for a mid connector on keys exactly one key width away
constexpr double MID_DENDRON_TOLERANCE = 1e-6;

std::vector<const KeyGeometry*> participant_keys(const ComboSpec& combo, const PhysicalLayout& layout) {
    std::vector<const KeyGeometry*> keys;
    keys.reserve(combo.key_positions.size());
    for (int pos : combo.key_positions) {
        keys.push_back(&layout.key(static_cast<size_t>(pos)));
    }
    return keys;
}

} // namespace

Point combo_center(const std::vector<const KeyGeometry*>& keys, std::optional<double> slide) {
    Point sum;
    for (const auto* k : keys) {
        sum += k->pos;
    }
    Point mid = (1.0 / static_cast<double>(keys.size())) * sum;

    if (!slide.has_value() || keys.size() < 2) {
        return mid;
    }

    std::vector<const KeyGeometry*> sorted = keys;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [&mid](const KeyGeometry* a, const KeyGeometry* b) {
                         double da = (a->pos - mid).magnitude();
                         double db = (b->pos - mid).magnitude();
                         if (da != db) return da > db;
                         if (a->pos.x != b->pos.x) return a->pos.x < b->pos.x;
                         return a->pos.y < b->pos.y;
                     });

    const Point& start = sorted[0]->pos;
    const Point& end = sorted[1]->pos;
    return (1.0 - *slide) / 2.0 * start + (1.0 + *slide) / 2.0 * end;
}

Point combo_anchor(const ComboSpec& combo, const PhysicalLayout& layout, const DrawConfig& config) {
    const auto keys = participant_keys(combo, layout);
    const Point mid = combo_center(keys, combo.slide);

    switch (combo.align) {
        case ComboAlignment::MID:
            return mid;

        case ComboAlignment::TOP: {
            double top = std::numeric_limits<double>::max();
            for (const auto* k : keys) top = std::min(top, k->pos.y - k->height / 2.0);
            return Point(mid.x, top - config.inner_pad_h / 2.0 - combo.offset * layout.min_height());
        }

        case ComboAlignment::BOTTOM: {
            double bottom = std::numeric_limits<double>::lowest();
            for (const auto* k : keys) bottom = std::max(bottom, k->pos.y + k->height / 2.0);
            return Point(mid.x, bottom + config.inner_pad_h / 2.0 + combo.offset * layout.min_height());
        }

        case ComboAlignment::LEFT: {
            double left = std::numeric_limits<double>::max();
            for (const auto* k : keys) left = std::min(left, k->pos.x - k->width / 2.0);
            return Point(left - config.inner_pad_w / 2.0 - combo.offset * layout.min_width(), mid.y);
        }

        case ComboAlignment::RIGHT: {
            double right = std::numeric_limits<double>::lowest();
            for (const auto* k : keys) right = std::max(right, k->pos.x + k->width / 2.0);
            return Point(right + config.inner_pad_w / 2.0 + combo.offset * layout.min_width(), mid.y);
        }
    }
    return mid;
}

std::string arc_dendron_path(Point p1, Point p2, bool x_first, double shorten,
                             double arc_radius, double arc_scale) {
    const double dx = p2.x - p1.x;
    const double dy = p2.y - p1.y;
    const double arc_x = std::copysign(arc_radius, dx);
    const double arc_y = std::copysign(arc_radius, dy);
    bool clockwise = (p2.x > p1.x) != (p2.y > p1.y);

    std::ostringstream line_1;
    std::ostringstream line_2;
    line_1 << std::setprecision(SVG_NUMBER_PRECISION);
    line_2 << std::setprecision(SVG_NUMBER_PRECISION);
    if (x_first) {
        line_1 << "h" << arc_scale * dx - arc_x;
        line_2 << "v" << dy - arc_y - std::copysign(shorten, dy);
        clockwise = !clockwise;
    } else {
        line_1 << "v" << arc_scale * dy - arc_y;
        line_2 << "h" << dx - arc_x - std::copysign(shorten, dx);
    }

    std::ostringstream path;
    path << std::setprecision(SVG_NUMBER_PRECISION);
    path << "M" << p1.x << "," << p1.y << " " << line_1.str()
         << " a" << arc_radius << "," << arc_radius << " 0 0 " << (clockwise ? 1 : 0)
         << " " << arc_x << "," << arc_y << " " << line_2.str();
    return path.str();
}

std::string line_dendron_path(Point p1, Point p2, double shorten) {
    Point diff = p2 - p1;
    const double magnitude = diff.magnitude();
    if (shorten > 0.0 && shorten < magnitude) {
        diff = (1.0 - shorten / magnitude) * diff;
    }

    std::ostringstream path;
    path << std::setprecision(SVG_NUMBER_PRECISION);
    path << "M" << p1.x << "," << p1.y << " l" << diff.x << "," << diff.y;
    return path.str();
}

std::vector<std::string> combo_dendrons(const ComboSpec& combo, Point origin, Point box,
                                        const PhysicalLayout& layout, const DrawConfig& config) {
    std::vector<std::string> paths;
    if (combo.dendron == DendronMode::NEVER) {
        return paths;
    }

    for (const auto* k : participant_keys(combo, layout)) {
        const Point key_pos = origin + k->pos;

        switch (combo.align) {
            case ComboAlignment::TOP:
            case ComboAlignment::BOTTOM: {
                double shorten = std::abs(key_pos.x - box.x) < config.combo_w / 2.0
                                     ? k->height / 5.0
                                     : k->height / 3.0;
                paths.push_back(arc_dendron_path(box, key_pos, true, shorten,
                                                 config.arc_radius, config.arc_scale));
                break;
            }

            case ComboAlignment::LEFT:
            case ComboAlignment::RIGHT: {
                double shorten = std::abs(key_pos.y - box.y) < config.combo_h / 2.0
                                     ? k->width / 5.0
                                     : k->width / 3.0;
                paths.push_back(arc_dendron_path(box, key_pos, false, shorten,
                                                 config.arc_radius, config.arc_scale));
                break;
            }

            case ComboAlignment::MID:
                if (combo.dendron == DendronMode::ALWAYS ||
                    (key_pos - box).magnitude() >= k->width - MID_DENDRON_TOLERANCE) {
                    paths.push_back(line_dendron_path(box, key_pos, k->width / 3.0));
                }
                break;
        }
    }
    return paths;
}

} // namespace kmd
