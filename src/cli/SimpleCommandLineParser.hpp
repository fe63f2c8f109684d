/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight command-line parser to avoid CLI11 dependency issues
 */

#pragma once

#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kmd {

/**
 * @brief Simple command-line argument parser
 *
 * Supports `--name value`, `--name=value`, `-n value` and boolean flags.
 * Options are shown in help in the order they were added.
 */
class SimpleCommandLineParser {
public:
    struct Option {
        std::string long_name;
        std::string short_name;
        std::string description;
        bool required;
        bool has_value;
        std::string default_value;

        // Default constructor for std::map
        Option() : required(false), has_value(true) {}

        Option(const std::string& long_name, const std::string& short_name,
               const std::string& description, bool required = false,
               bool has_value = true, const std::string& default_value = "")
            : long_name(long_name), short_name(short_name), description(description),
              required(required), has_value(has_value), default_value(default_value) {}
    };

    SimpleCommandLineParser(const std::string& program_name, const std::string& description)
        : program_name_(program_name), description_(description) {}

    void add_option(const std::string& long_name, const std::string& short_name,
                    const std::string& description, bool required = false,
                    const std::string& default_value = "") {
        register_option(Option(long_name, short_name, description, required, true, default_value));
    }

    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        register_option(Option(long_name, short_name, description, false, false));
    }

    /**
     * @brief Parse command line arguments
     * @return false if help was shown or the arguments are invalid
     */
    bool parse(int argc, char* argv[]) {
        args_.clear();
        parsed_values_.clear();
        positional_args_.clear();

        for (int i = 1; i < argc; ++i) {
            args_.push_back(argv[i]);
        }

        for (const auto& arg : args_) {
            if (arg == "--help" || arg == "-h") {
                show_help();
                return false;
            }
        }

        for (size_t i = 0; i < args_.size(); ++i) {
            const std::string& arg = args_[i];

            if (arg.starts_with("--")) {
                std::string option_name = arg.substr(2);

                // --option=value
                size_t eq_pos = option_name.find('=');
                std::string value;
                bool inline_value = false;
                if (eq_pos != std::string::npos) {
                    value = option_name.substr(eq_pos + 1);
                    option_name = option_name.substr(0, eq_pos);
                    inline_value = true;
                }

                auto it = options_.find(option_name);
                if (it == options_.end()) {
                    std::cerr << "Unknown option: --" << option_name << std::endl;
                    return false;
                }

                const auto& option = it->second;
                if (option.has_value) {
                    if (!inline_value) {
                        if (i + 1 >= args_.size() || is_option_token(args_[i + 1])) {
                            std::cerr << "Option --" << option_name << " requires a value" << std::endl;
                            return false;
                        }
                        value = args_[++i];
                    }
                    parsed_values_[option_name] = value;
                } else {
                    parsed_values_[option_name] = "true";
                }

            } else if (arg.starts_with("-") && arg.size() > 1) {
                std::string short_name = arg.substr(1);

                auto it = short_to_long_.find(short_name);
                if (it == short_to_long_.end()) {
                    std::cerr << "Unknown option: -" << short_name << std::endl;
                    return false;
                }

                const std::string& option_name = it->second;
                const auto& option = options_.at(option_name);

                if (option.has_value) {
                    if (i + 1 >= args_.size() || is_option_token(args_[i + 1])) {
                        std::cerr << "Option -" << short_name << " requires a value" << std::endl;
                        return false;
                    }
                    parsed_values_[option_name] = args_[++i];
                } else {
                    parsed_values_[option_name] = "true";
                }
            } else {
                positional_args_.push_back(arg);
            }
        }

        for (const auto& [name, option] : options_) {
            if (option.required && parsed_values_.find(name) == parsed_values_.end()) {
                std::cerr << "Required option --" << name << " not provided" << std::endl;
                return false;
            }
        }

        for (const auto& [name, option] : options_) {
            if (parsed_values_.find(name) == parsed_values_.end() && !option.default_value.empty()) {
                parsed_values_[name] = option.default_value;
            }
        }

        return true;
    }

    std::optional<std::string> get(const std::string& option_name) const {
        auto it = parsed_values_.find(option_name);
        if (it != parsed_values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    bool get_flag(const std::string& option_name) const {
        auto value = get(option_name);
        return value.has_value() && value.value() == "true";
    }

    const std::vector<std::string>& get_positional() const {
        return positional_args_;
    }

    void show_help() const {
        std::cout << description_ << "\n\n";

        std::cout << "USAGE:\n";
        std::cout << "    " << program_name_ << " --keymap KEYMAP.json [OPTIONS]\n";
        std::cout << "    " << program_name_ << " --create-config FILE\n\n";

        std::cout << "OPTIONS:\n";
        for (const auto& name : order_) {
            print_help_section(options_.at(name));
        }
        std::cout << "    -h, --help                   Show this help\n\n";

        std::cout << "EXAMPLES:\n";
        std::cout << "    " << program_name_ << " -k corne.json -o corne.svg\n";
        std::cout << "    " << program_name_ << " -k corne.json -c style.json --select-layers Base,Nav\n";
        std::cout << "    " << program_name_ << " -k corne.json --combos-only --log-level 4\n\n";

        std::cout << "OUTPUT:\n";
        std::cout << "    One SVG document with the selected layers stacked vertically.\n";
        std::cout << "    Written to standard output unless --output is given; logs go to stderr.\n";
    }

private:
    void register_option(const Option& option) {
        if (options_.find(option.long_name) == options_.end()) {
            order_.push_back(option.long_name);
        }
        options_[option.long_name] = option;
        if (!option.short_name.empty()) {
            short_to_long_[option.short_name] = option.long_name;
        }
    }

    // "-" alone names standard output and is a value, not an option
    static bool is_option_token(const std::string& arg) {
        return arg.starts_with("-") && arg.size() > 1;
    }

    void print_help_section(const Option& option) const {
        std::string flags = "    ";
        flags += option.short_name.empty() ? "    " : "-" + option.short_name + ", ";
        flags += "--" + option.long_name;
        if (option.has_value) {
            flags += " VALUE";
        }
        std::cout << flags;
        for (size_t col = flags.size(); col < 33; ++col) std::cout << ' ';
        std::cout << " " << option.description;
        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        std::cout << "\n";
    }

    std::string program_name_;
    std::string description_;
    std::map<std::string, Option> options_;
    std::vector<std::string> order_;
    std::map<std::string, std::string> short_to_long_;
    std::vector<std::string> args_;
    std::map<std::string, std::string> parsed_values_;
    std::vector<std::string> positional_args_;
};

} // namespace kmd
