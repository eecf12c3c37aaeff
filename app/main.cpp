#include <iostream>
#include <string>

#include <cli/cli_common.hpp>
#include <common/logging.hpp>

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options] <input.json>\n";
    std::cerr << "\n";
    std::cerr << "Draws graph edges as arcs for linear and circular layouts.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  arc     Sampled arcs from one row per edge (x, y, xend, yend, circular)\n";
    std::cerr << "  arc2    Sampled arcs from two rows per edge (x, y, group, circular),\n";
    std::cerr << "          interpolating other columns between the endpoints\n";
    std::cerr << "  arc0    Raw bezier control points, four rows per edge\n";
    std::cerr << "  svg     Render the output of arc, arc2 or arc0 as SVG\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -o, --output <path>   Output file (\"-\" for stdout)\n";
    std::cerr << "  -c, --config <path>   JSON file with curvature, fold, n, na_rm, num_threads\n";
    std::cerr << "  --curvature <x>       Bend of linear arcs (default 1)\n";
    std::cerr << "  --fold                Put all linear arcs on the same side\n";
    std::cerr << "  -n, --points <count>  Points per sampled arc (default 100)\n";
    std::cerr << "  --na-rm               Drop edges with missing coordinates\n";
    std::cerr << "  --threads <k>         OpenMP thread count (0 = default)\n";
    std::cerr << "  -v, --verbose         Debug logging\n";
    std::cerr << "  -h, --help            Show this help message\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  EDGEARC_LOG_LEVEL - Set log level (trace, debug, info, warn, error)\n";
}

int main(int argc, char* argv[]) {
    auto log = edgearc::logging::get_logger();

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h" || command == "help") {
        print_usage(argv[0]);
        return 0;
    }

    log->debug("Running command: {}", command);

    if (command == "arc") {
        return edgearc::cli::command_arc(argc, argv);
    } else if (command == "arc2") {
        return edgearc::cli::command_arc2(argc, argv);
    } else if (command == "arc0") {
        return edgearc::cli::command_arc0(argc, argv);
    } else if (command == "svg") {
        return edgearc::cli::command_svg(argc, argv);
    }

    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage(argv[0]);
    return 1;
}
