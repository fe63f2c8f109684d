/**
 * @file LegendText.hpp
 * @brief Legend tokenizing and glyph reference detection
 *
 * Legends wrap on single spaces while a literal double space keeps one
 * space inside a line, so "Caps  Lock Word" becomes the two lines
 * "Caps Lock" and "Word". A legend whose only token has the form
 * `$$name$$` refers to a named glyph instead of text.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace kmd {

/**
 * @brief Split legend text into display lines
 *
 * Whitespace separates lines. Each pair of consecutive spaces, read left to
 * right, is kept as a single literal space inside the current line instead
 * of separating it. Empty input, or input made only of separators, yields
 * no lines.
 *
 * @param text Raw legend text
 * @return Display lines in order
 */
std::vector<std::string> split_legend_text(const std::string& text);

/**
 * @brief Glyph name referenced by a tokenized legend
 *
 * Only resolves when @p words holds exactly one token and that whole token
 * is `$$name$$`.
 *
 * @return Glyph name, or nullopt if the legend is plain text
 */
std::optional<std::string> glyph_reference(const std::vector<std::string>& words);

/**
 * @brief Escape text for use in XML character data and attribute values
 */
std::string escape_xml(const std::string& text);

} // namespace kmd
