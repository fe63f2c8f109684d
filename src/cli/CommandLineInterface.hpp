/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for the keymap drawer
 */

#pragma once

#include "keymap_drawer.hpp"
#include "SimpleCommandLineParser.hpp"
#include <optional>
#include <string>
#include <vector>

namespace kmd {

/**
 * @brief Everything main() needs to produce one drawing
 */
struct DrawOptions {
    std::string keymap_file;
    std::optional<std::string> config_file;
    std::string output_file = "-";          ///< "-" writes to standard output
    RenderOptions render;
    std::optional<std::string> log_file;
    int log_level = 2;                      ///< Default level after flag handling
};

/**
 * @brief Command line interface for parsing arguments into DrawOptions
 */
class CommandLineInterface {
public:
    CommandLineInterface() = default;

    /**
     * @brief Parse command line arguments
     * @param argc Argument count
     * @param argv Argument vector
     * @return true if a drawing should be produced; false if help, version
     *         or --create-config was handled, or if the arguments are invalid
     */
    bool parse_arguments(int argc, char* argv[]);

    const DrawOptions& get_options() const { return options_; }

    /**
     * @brief Check if this is a dry run
     * @return true if dry run mode is enabled
     */
    bool is_dry_run() const { return dry_run_; }

    /**
     * @brief Process exit status to use when parse_arguments() returned false
     */
    int exit_status() const { return exit_status_; }

    /**
     * @brief Log the resolved options at DETAILED level
     */
    void print_options() const;

    /**
     * @brief Split a comma separated list, trimming blanks and dropping empty items
     */
    static std::vector<std::string> parse_layer_list(const std::string& list);

private:
    DrawOptions options_;
    bool dry_run_ = false;
    int exit_status_ = 0;

    bool parse_all_options(const SimpleCommandLineParser& parser);
    void parse_logging_options(const SimpleCommandLineParser& parser);
    bool create_default_config_file(const std::string& filename);
};

} // namespace kmd
