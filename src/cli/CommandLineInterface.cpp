/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface implementation
 */

#include "CommandLineInterface.hpp"
#include "KeymapLoader.hpp"
#include "../core/Logger.hpp"
#include "version.h"
#include <cstdlib>
#include <iostream>
#include <sstream>

namespace kmd {

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    SimpleCommandLineParser parser("kmd-draw",
        "Draw keyboard keymaps as SVG\n"
        "\n"
        "Reads a keymap (physical layout, layers and combos) from JSON and writes\n"
        "one SVG document with every layer stacked vertically. Keys carry tap,\n"
        "hold and shifted legends; combos are drawn as small boxes connected to\n"
        "their keys with dendron lines.");

    // Input and output
    parser.add_option("keymap", "k", "Keymap JSON file (layout, layers, combos)");
    parser.add_option("config", "c", "Draw configuration JSON file (sizes, style, glyphs)");
    parser.add_option("output", "o", "Output SVG file, - for standard output", false, "-");
    parser.add_option("create-config", "", "Write the default draw configuration to a file and exit");

    // Drawing options
    parser.add_option("select-layers", "s", "Draw only these layers, comma separated");
    parser.add_flag("keys-only", "", "Draw keys only, without combos");
    parser.add_flag("combos-only", "", "Draw combos only, with key legends left blank");

    // Logging and utility options
    parser.add_flag("silent", "q", "Only report errors (same as --log-level 1)");
    parser.add_flag("verbose", "v", "Enable verbose logging (same as --log-level 6)");
    parser.add_option("log-level", "", "Logging level: 1=ERROR, 2=WARNING (default), 3=INFO, 4=DETAILED, 5=DEBUG, 6=TRACE; "
                                       "facility-specific: \"3,KeymapSVGRenderer=6\"");
    parser.add_option("log-file", "", "Log to file (append if exists)");
    parser.add_flag("dry-run", "", "Load and validate inputs without writing a drawing");
    parser.add_flag("version", "", "Show version information");

    if (!parser.parse(argc, argv)) {
        // parse() prints help itself; anything else it rejects is a usage error
        bool help_requested = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") help_requested = true;
        }
        exit_status_ = help_requested ? 0 : 2;
        return false;
    }

    if (parser.get_flag("version")) {
        std::cout << "kmd-draw v" << KMD_VERSION_STRING << std::endl;
        std::cout << "Keyboard keymap SVG drawer" << std::endl;
        std::cout << "Copyright (c) 2025 Matthew Block" << std::endl;
        return false;
    }

    parse_logging_options(parser);

    if (auto config_path = parser.get("create-config")) {
        if (!create_default_config_file(config_path.value())) {
            exit_status_ = 1;
            return false;
        }
        std::cout << "Created default configuration file: " << config_path.value() << std::endl;
        return false;
    }

    if (!parse_all_options(parser)) {
        exit_status_ = 2;
        return false;
    }
    return true;
}

bool CommandLineInterface::parse_all_options(const SimpleCommandLineParser& parser) {
    auto keymap = parser.get("keymap");
    if (!keymap.has_value()) {
        // Accept the keymap as a single positional argument as well
        if (parser.get_positional().size() == 1) {
            keymap = parser.get_positional().front();
        } else {
            std::cerr << "A keymap file is required: --keymap FILE" << std::endl;
            return false;
        }
    } else if (!parser.get_positional().empty()) {
        std::cerr << "Unexpected argument: " << parser.get_positional().front() << std::endl;
        return false;
    }
    options_.keymap_file = keymap.value();

    if (auto value = parser.get("config")) options_.config_file = value.value();
    if (auto value = parser.get("output")) options_.output_file = value.value();

    if (auto value = parser.get("select-layers")) {
        options_.render.draw_layers = parse_layer_list(value.value());
        if (options_.render.draw_layers.empty()) {
            std::cerr << "--select-layers needs at least one layer name" << std::endl;
            return false;
        }
    }

    options_.render.keys_only = parser.get_flag("keys-only");
    options_.render.combos_only = parser.get_flag("combos-only");
    if (options_.render.keys_only && options_.render.combos_only) {
        std::cerr << "--keys-only and --combos-only cannot be combined" << std::endl;
        return false;
    }

    dry_run_ = parser.get_flag("dry-run");
    return true;
}

void CommandLineInterface::parse_logging_options(const SimpleCommandLineParser& parser) {
    // Priority: flags > CLI > environment > defaults
    if (const char* env_log_level = std::getenv("KMD_LOG_LEVEL")) {
        Logger::parseLogConfig(env_log_level);
    }

    if (auto value = parser.get("log-level")) {
        Logger::parseLogConfig(value.value());
    }

    if (parser.get_flag("silent")) {
        Logger::setDefaultLevel(LogLevel::ERROR);
    }
    if (parser.get_flag("verbose")) {
        Logger::setDefaultLevel(LogLevel::TRACE);
    }
    options_.log_level = static_cast<int>(Logger::getFacilityLevel("default"));

    if (const char* env_log_file = std::getenv("KMD_LOG_FILE")) {
        options_.log_file = std::string(env_log_file);
    }
    if (auto value = parser.get("log-file")) {
        options_.log_file = value.value();  // CLI overrides environment
    }
    if (options_.log_file.has_value()) {
        Logger::setSharedLogFile(options_.log_file);
    }
}

std::vector<std::string> CommandLineInterface::parse_layer_list(const std::string& list) {
    std::vector<std::string> names;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        const auto first = item.find_first_not_of(" \t");
        if (first == std::string::npos) continue;
        const auto last = item.find_last_not_of(" \t");
        names.push_back(item.substr(first, last - first + 1));
    }
    return names;
}

bool CommandLineInterface::create_default_config_file(const std::string& filename) {
    KeymapLoader loader;
    return loader.write_default_draw_config(filename);
}

void CommandLineInterface::print_options() const {
    Logger logger("CommandLineInterface");
    if (!logger.shouldOutput(LogLevel::DETAILED)) return;

    std::ostringstream summary;
    summary << "Keymap: " << options_.keymap_file
            << ", config: " << options_.config_file.value_or("(defaults)")
            << ", output: " << (options_.output_file == "-" ? "stdout" : options_.output_file)
            << ", log level: " << options_.log_level;
    logger.detailed(summary.str());

    std::string layers;
    for (const auto& name : options_.render.draw_layers) {
        if (!layers.empty()) layers += ", ";
        layers += name;
    }
    logger.detailed("Layers: " + (layers.empty() ? std::string("all") : layers) +
                    (options_.render.keys_only ? " (keys only)" : "") +
                    (options_.render.combos_only ? " (combos only)" : ""));
}

} // namespace kmd
