/**
 * @file main.cpp
 * @brief Main entry point for the keymap drawer
 *
 * Loads a keymap and an optional draw configuration, then writes the SVG
 * drawing to a file or to standard output.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "keymap_drawer.hpp"
#include "cli/CommandLineInterface.hpp"
#include "cli/KeymapLoader.hpp"
#include "core/Logger.hpp"
#include "export/KeymapSVGRenderer.hpp"
#include <chrono>
#include <fstream>
#include <iostream>

using namespace kmd;

/**
 * @brief Write the rendered document to its destination
 *
 * A file destination receives the document only after rendering has
 * succeeded, so a failed render never truncates an existing drawing.
 */
bool write_drawing(const KeymapSVGRenderer& renderer, const DrawOptions& options, const Logger& logger) {
    if (options.output_file == "-") {
        renderer.render(std::cout, options.render);
        std::cout.flush();
        return static_cast<bool>(std::cout);
    }

    const std::string svg = renderer.render_to_string(options.render);
    std::ofstream file(options.output_file);
    if (!file.is_open()) {
        logger.error("Could not open output file: " + options.output_file);
        return false;
    }
    file << svg;
    if (!file) {
        logger.error("Failed writing output file: " + options.output_file);
        return false;
    }
    logger.info("Wrote " + std::to_string(svg.size()) + " bytes to " + options.output_file);
    return true;
}

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    auto start_time = std::chrono::high_resolution_clock::now();

    try {
        CommandLineInterface cli;
        if (!cli.parse_arguments(argc, argv)) {
            return cli.exit_status();  // Help, version, create-config or usage error
        }
        cli.print_options();

        const DrawOptions& options = cli.get_options();
        Logger logger("kmd-draw");

        KeymapLoader loader;
        const DrawConfig config = options.config_file.has_value()
                                      ? loader.load_draw_config_file(options.config_file.value())
                                      : DrawConfig{};
        const KeymapData keymap = loader.load_keymap_file(options.keymap_file);

        if (cli.is_dry_run()) {
            // Layer selection is the last thing that can reject the inputs
            const auto layers = keymap.select_layers(options.render.draw_layers);
            logger.info("Dry run: keymap valid, " + std::to_string(layers.size()) +
                        " layer(s) selected");
            return 0;
        }

        KeymapSVGRenderer renderer(config, keymap);
        if (!write_drawing(renderer, options, logger)) {
            return 1;
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        auto total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
        logger.info("Drawing completed in " + std::to_string(total_duration.count()) + "ms");
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
