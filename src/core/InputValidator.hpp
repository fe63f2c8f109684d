/**
 * @file InputValidator.hpp
 * @brief Consistency checks between layers, combos and the physical layout
 *
 * Validates keymap inputs and collects every conflict with clear messages
 * and suggested fixes, instead of stopping at the first problem.
 */

#pragma once

#include "keymap_drawer.hpp"
#include "PhysicalLayout.hpp"
#include <optional>
#include <string>
#include <vector>

namespace kmd {

/**
 * @brief A single inconsistency found in the keymap inputs
 */
struct ParameterConflict {
    std::string description;                   // What is wrong
    std::vector<std::string> involved_params;  // Layers / combos involved
    std::vector<std::string> suggestions;      // Suggested resolutions
};

/**
 * @brief Result of input validation
 */
struct ValidationResult {
    bool is_valid;
    std::vector<ParameterConflict> conflicts;

    ValidationResult() : is_valid(true) {}

    bool has_errors() const { return !is_valid; }

    void add(ParameterConflict conflict) {
        conflicts.push_back(std::move(conflict));
        is_valid = false;
    }

    std::string format_error_message() const;
};

/**
 * @brief Validates keymap data against the physical layout it will be drawn on
 */
class InputValidator {
public:
    InputValidator() = default;

    /**
     * @brief Validate layers and combos
     * @return Validation result with every conflict found
     */
    ValidationResult validate(const PhysicalLayout& layout,
                              const std::vector<Layer>& layers,
                              const std::vector<ComboSpec>& combos) const;

private:
    /**
     * @brief Layer names must be unique and non-empty, and every layer must
     *        have exactly one entry per physical key
     */
    void check_layers(const PhysicalLayout& layout,
                      const std::vector<Layer>& layers,
                      ValidationResult& result) const;

    /**
     * @brief Combo positions must be in range, slide only with two or more
     *        keys and within [-1, 1], and every listed layer must exist
     */
    std::optional<ParameterConflict> check_combo(size_t index,
                                                 const ComboSpec& combo,
                                                 const PhysicalLayout& layout,
                                                 const std::vector<Layer>& layers) const;
};

} // namespace kmd
