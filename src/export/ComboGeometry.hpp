/**
 * @file ComboGeometry.hpp
 * @brief Combo box placement and dendron path generation
 *
 * A combo box is anchored at the centroid of its keys (or slid between the
 * two keys farthest from it) and, for edge alignments, pushed past the
 * outermost key edge. Dendrons connect the box to each key: an L-shaped
 * path with a rounded corner for edge alignments, a straight line for
 * "mid" alignment.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "keymap_drawer.hpp"
#include "PhysicalLayout.hpp"
#include <optional>
#include <string>
#include <vector>

namespace kmd {

/**
 * @brief Center point of a set of keys
 *
 * Without @p slide this is the centroid of the key positions. With a slide
 * value, the two keys farthest from the centroid are selected (ties broken
 * by ascending x, then ascending y, then input order) and the result is
 * interpolated between them: -1 gives the first, +1 the second, 0 the
 * midpoint.
 *
 * @param keys Participant keys, non-empty
 * @param slide Optional interpolation value in [-1, 1]; ignored for fewer than two keys
 */
Point combo_center(const std::vector<const KeyGeometry*>& keys, std::optional<double> slide);

/**
 * @brief Anchor of a combo box in layout coordinates
 *
 * "mid" uses the center directly. "top"/"bottom" keep the center's x and sit
 * half an inner padding plus `offset * min_height` beyond the outermost key
 * edge; "left"/"right" mirror this on the x axis with `min_width`.
 */
Point combo_anchor(const ComboSpec& combo, const PhysicalLayout& layout, const DrawConfig& config);

/**
 * @brief SVG path data for an L-shaped dendron with a quarter-circle corner
 *
 * @param p1 Start point (combo box center)
 * @param p2 End point (key center)
 * @param x_first Draw the horizontal leg first
 * @param shorten Distance removed from the key-side leg
 * @param arc_radius Corner radius
 * @param arc_scale Fraction of the first-axis displacement covered by the first leg
 */
std::string arc_dendron_path(Point p1, Point p2, bool x_first, double shorten,
                             double arc_radius, double arc_scale);

/**
 * @brief SVG path data for a straight dendron
 *
 * The key-side end is pulled back by @p shorten only if that is shorter
 * than the segment itself; otherwise the full segment is drawn.
 */
std::string line_dendron_path(Point p1, Point p2, double shorten);

/**
 * @brief All dendron paths of a combo, in participant order
 *
 * @param combo Combo being drawn
 * @param origin Layer origin added to key positions
 * @param box Absolute combo box center
 * @return Path data strings; empty for DendronMode::NEVER
 */
std::vector<std::string> combo_dendrons(const ComboSpec& combo, Point origin, Point box,
                                        const PhysicalLayout& layout, const DrawConfig& config);

} // namespace kmd
