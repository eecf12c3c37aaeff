#ifndef EDGEARC_CLI_COMMON_HPP
#define EDGEARC_CLI_COMMON_HPP

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace edgearc::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> config_path;
    bool verbose = false;

    // Arc parameter overrides (win over the config file)
    std::optional<double> curvature;
    std::optional<int> n;
    std::optional<int> num_threads;
    bool fold = false;
    bool na_rm = false;

    // SVG canvas
    std::optional<double> width;
    std::optional<double> height;
};

namespace detail {

inline std::string option_value(int argc, char** argv, int& i, const std::string& arg) {
    if (i + 1 >= argc) {
        throw std::runtime_error(arg + " requires an argument");
    }
    return argv[++i];
}

inline double parse_double(const std::string& arg, const std::string& value) {
    size_t used = 0;
    double result = 0.0;
    try {
        result = std::stod(value, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used != value.size() || value.empty()) {
        throw std::runtime_error(arg + " expects a number, got '" + value + "'");
    }
    return result;
}

inline int parse_int(const std::string& arg, const std::string& value) {
    size_t used = 0;
    int result = 0;
    try {
        result = std::stoi(value, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used != value.size() || value.empty()) {
        throw std::runtime_error(arg + " expects an integer, got '" + value + "'");
    }
    return result;
}

}  // namespace detail

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
        } else if (arg == "-o" || arg == "--output") {
            ctx.output_path = detail::option_value(argc, argv, i, arg);
        } else if (arg == "-c" || arg == "--config") {
            ctx.config_path = detail::option_value(argc, argv, i, arg);
        } else if (arg == "--curvature") {
            ctx.curvature = detail::parse_double(arg, detail::option_value(argc, argv, i, arg));
        } else if (arg == "-n" || arg == "--points") {
            ctx.n = detail::parse_int(arg, detail::option_value(argc, argv, i, arg));
        } else if (arg == "--threads") {
            ctx.num_threads = detail::parse_int(arg, detail::option_value(argc, argv, i, arg));
        } else if (arg == "--fold") {
            ctx.fold = true;
        } else if (arg == "--na-rm") {
            ctx.na_rm = true;
        } else if (arg == "--width") {
            ctx.width = detail::parse_double(arg, detail::option_value(argc, argv, i, arg));
        } else if (arg == "--height") {
            ctx.height = detail::parse_double(arg, detail::option_value(argc, argv, i, arg));
        } else if (arg == "-h" || arg == "--help") {
            // Handled by caller
        } else if (arg == "-" || arg[0] != '-') {
            // Positional argument (input file, "-" for stdin)
            if (ctx.input_path.empty()) {
                ctx.input_path = arg;
            } else {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
        ++i;
    }

    return {ctx, i};
}

// Resolve output path: if empty, generate from input path with given suffix
inline std::string resolve_output_path(const std::string& input,
                                       const std::string& suffix,
                                       const std::string& provided_output) {
    if (!provided_output.empty()) {
        return provided_output;
    }
    if (input == "-") {
        return "-";
    }

    size_t dot_pos = input.find_last_of('.');
    size_t slash_pos = input.find_last_of('/');

    // Make sure dot comes after last slash (if any)
    if (dot_pos != std::string::npos &&
        (slash_pos == std::string::npos || dot_pos > slash_pos)) {
        return input.substr(0, dot_pos) + suffix;
    } else {
        return input + suffix;
    }
}

// Write string to file, "-" writes to stdout
inline void write_file(const std::string& path, const std::string& content) {
    if (path == "-") {
        std::cout << content;
        return;
    }
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << content;
}

// Command function declarations
int command_arc(int argc, char** argv);
int command_arc2(int argc, char** argv);
int command_arc0(int argc, char** argv);
int command_svg(int argc, char** argv);

}  // namespace edgearc::cli

#endif // EDGEARC_CLI_COMMON_HPP
