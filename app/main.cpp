#include <iostream>
#include <string>

#include <cli/cli_common.hpp>
#include <common/logging.hpp>

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Procedural 2D measurement animations.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  flatness <points.csv> [-o report.json]\n";
    std::cerr << "      Minimum-zone flatness of a 2D point set\n";
    std::cerr << "  animate-flatness <points.csv> -o <out> [-c config.json]\n";
    std::cerr << "      Animation of the support lines rolling around the points\n";
    std::cerr << "  dial <profile.csv> -o <out> [-c config.json]\n";
    std::cerr << "      Dial indicator inspection of a measured profile\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -o, --output   Output file (report, frame directory or .mp4 video)\n";
    std::cerr << "  -c, --config   JSON config with \"scene\", \"export\", \"dial\", \"flatness\" sections\n";
    std::cerr << "  -v, --verbose  Debug logging\n";
    std::cerr << "  -h, --help     Show this help message\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  ANIMATIC_LOG_LEVEL - Set log level (trace, debug, info, warn, error)\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        print_usage(argv[0]);
        return 0;
    }

    animatic::logging::get_logger()->debug("Running command: {}", command);

    if (command == "flatness") {
        return animatic::cli::command_flatness(argc, argv);
    }
    if (command == "animate-flatness") {
        return animatic::cli::command_animate_flatness(argc, argv);
    }
    if (command == "dial") {
        return animatic::cli::command_dial(argc, argv);
    }

    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage(argv[0]);
    return 1;
}
