#ifndef ANIMATIC_CLI_COMMON_HPP
#define ANIMATIC_CLI_COMMON_HPP

#include <nlohmann/json.hpp>
#include <serialization/json_serialization.hpp>
#include <common/logging.hpp>
#include <string>
#include <optional>
#include <iostream>
#include <stdexcept>

namespace animatic::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> config_path;
    bool verbose = false;
    bool help = false;
};

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 < argc) {
                ctx.output_path = argv[++i];
                ++i;
            } else {
                throw std::runtime_error("-o/--output requires an argument");
            }
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                ctx.config_path = argv[++i];
                ++i;
            } else {
                throw std::runtime_error("-c/--config requires an argument");
            }
        } else if (arg == "-h" || arg == "--help") {
            ctx.help = true;
            ++i;
        } else if (arg[0] != '-') {
            // Positional argument (input file)
            if (ctx.input_path.empty()) {
                ctx.input_path = arg;
                ++i;
            } else {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    if (ctx.verbose) {
        logging::enable_verbose();
    }
    return {ctx, i};
}

// Contents of the -c file, or an empty object when none was given
inline nlohmann::json load_config(const CommandContext& ctx) {
    if (!ctx.config_path) {
        return nlohmann::json::object();
    }
    logging::get_logger()->debug("Loading config from {}", *ctx.config_path);
    return json::read_json_file(*ctx.config_path);
}

// Command function declarations
int command_flatness(int argc, char** argv);
int command_animate_flatness(int argc, char** argv);
int command_dial(int argc, char** argv);

}  // namespace animatic::cli

#endif // ANIMATIC_CLI_COMMON_HPP
