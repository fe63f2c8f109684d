/**
 * @file LegendText.cpp
 * @brief Legend tokenizer, glyph reference matching and XML escaping
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "LegendText.hpp"
#include <cctype>
#include <regex>

namespace kmd {

std::vector<std::string> split_legend_text(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;

    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];

        if (c == ' ' && i + 1 < text.size() && text[i + 1] == ' ') {
            // Double space: literal space inside the current line
            current.push_back(' ');
            in_word = true;
            i += 2;
            continue;
        }

        if (std::isspace(static_cast<unsigned char>(c))) {
            if (in_word) {
                words.push_back(current);
                current.clear();
                in_word = false;
            }
        } else {
            current.push_back(c);
            in_word = true;
        }
        ++i;
    }

    if (in_word) {
        words.push_back(current);
    }
    return words;
}

std::optional<std::string> glyph_reference(const std::vector<std::string>& words) {
    static const std::regex glyph_re(R"(\$\$(.*)\$\$)");

    if (words.size() != 1) {
        return std::nullopt;
    }

    std::smatch match;
    if (std::regex_match(words[0], match, glyph_re)) {
        return match[1].str();
    }
    return std::nullopt;
}

std::string escape_xml(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#x27;"; break;
            default: out.push_back(c); break;
        }
    }
    return out;
}

} // namespace kmd
