/**
 * @file InputValidator.cpp
 * @brief Implementation of keymap input validation
 */

#include "InputValidator.hpp"
#include <algorithm>
#include <set>
#include <sstream>

namespace kmd {

std::string ValidationResult::format_error_message() const {
    if (is_valid || conflicts.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "Inconsistent keymap data detected:\n\n";

    for (size_t i = 0; i < conflicts.size(); ++i) {
        const auto& conflict = conflicts[i];

        oss << "Conflict " << (i + 1) << ": " << conflict.description << "\n";

        if (!conflict.involved_params.empty()) {
            oss << "  Involved:\n";
            for (const auto& param : conflict.involved_params) {
                oss << "    " << param << "\n";
            }
        }

        if (!conflict.suggestions.empty()) {
            oss << "  Suggested solutions:\n";
            for (size_t j = 0; j < conflict.suggestions.size(); ++j) {
                oss << "    " << (j + 1) << ". " << conflict.suggestions[j] << "\n";
            }
        }

        if (i < conflicts.size() - 1) {
            oss << "\n";
        }
    }

    return oss.str();
}

ValidationResult InputValidator::validate(const PhysicalLayout& layout,
                                          const std::vector<Layer>& layers,
                                          const std::vector<ComboSpec>& combos) const {
    ValidationResult result;

    check_layers(layout, layers, result);

    for (size_t i = 0; i < combos.size(); ++i) {
        auto conflict = check_combo(i, combos[i], layout, layers);
        if (conflict) {
            result.add(std::move(*conflict));
        }
    }

    return result;
}

void InputValidator::check_layers(const PhysicalLayout& layout,
                                  const std::vector<Layer>& layers,
                                  ValidationResult& result) const {
    std::set<std::string> seen;

    for (const auto& layer : layers) {
        if (layer.name.empty()) {
            result.add({"A layer has an empty name", {}, {"Give every layer a unique name"}});
        } else if (!seen.insert(layer.name).second) {
            result.add({"Layer '" + layer.name + "' is defined more than once",
                        {"layer " + layer.name},
                        {"Rename or merge the duplicate layers"}});
        }

        if (layer.keys.size() != layout.size()) {
            std::ostringstream desc;
            desc << "Layer '" << layer.name << "' has " << layer.keys.size()
                 << " keys but the physical layout has " << layout.size();
            result.add({desc.str(),
                        {"layer " + layer.name, "physical layout"},
                        {"Add or remove legends so each layer has one entry per key",
                         "Check that the physical layout matches the keyboard"}});
        }
    }
}

std::optional<ParameterConflict> InputValidator::check_combo(size_t index,
                                                             const ComboSpec& combo,
                                                             const PhysicalLayout& layout,
                                                             const std::vector<Layer>& layers) const {
    const std::string name = "combo #" + std::to_string(index);
    std::vector<std::string> problems;
    std::vector<std::string> suggestions;

    if (combo.key_positions.empty()) {
        problems.push_back("has no key positions");
        suggestions.push_back("List at least one key position for every combo");
    }

    for (int pos : combo.key_positions) {
        if (pos < 0 || static_cast<size_t>(pos) >= layout.size()) {
            problems.push_back("key position " + std::to_string(pos) + " is outside [0, " +
                               std::to_string(layout.size()) + ")");
            suggestions.push_back("Key positions are zero-based indices into the physical layout");
        }
    }

    if (combo.slide.has_value()) {
        if (combo.key_positions.size() < 2) {
            problems.push_back("uses slide with fewer than two key positions");
            suggestions.push_back("Remove slide, it only applies between two or more keys");
        }
        if (*combo.slide < -1.0 || *combo.slide > 1.0) {
            problems.push_back("slide " + std::to_string(*combo.slide) + " is outside [-1, 1]");
            suggestions.push_back("Use -1 for the first extreme key, 1 for the second, 0 for the midpoint");
        }
    }

    for (const auto& layer_name : combo.layers) {
        bool found = std::any_of(layers.begin(), layers.end(),
                                 [&](const Layer& l) { return l.name == layer_name; });
        if (!found) {
            problems.push_back("refers to unknown layer '" + layer_name + "'");
            suggestions.push_back("Only list layers defined in the keymap");
        }
    }

    if (problems.empty()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = name;
    for (size_t i = 0; i < problems.size(); ++i) {
        conflict.description += (i == 0 ? " " : "; ") + problems[i];
    }
    conflict.involved_params.push_back(name);
    conflict.suggestions = std::move(suggestions);
    return conflict;
}

} // namespace kmd
