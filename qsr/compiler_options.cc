#include "compiler_options.hh"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>

namespace quasar::driver {

// ============================================================================
// Helper Functions
// ============================================================================

static bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

static std::string get_option_value(const char* arg, const char* prefix) {
    return arg + std::strlen(prefix);
}

static ColorMode parse_color_mode(const std::string& value) {
    if (value == "auto") {
        return ColorMode::Auto;
    }
    if (value == "always") {
        return ColorMode::Always;
    }
    if (value == "never") {
        return ColorMode::Never;
    }
    throw std::runtime_error("Invalid color mode: " + value + " (expected: auto, always, never)");
}

// ============================================================================
// Main Parser
// ============================================================================

CompilerOptions parse_command_line(int argc, char** argv) {
    CompilerOptions opts;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        // Help options
        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_help(argv[0]);
            std::exit(0);
        }

        // Version
        if (std::strcmp(arg, "--version") == 0) {
            print_version();
            std::exit(0);
        }

        // Verbosity
        if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
            opts.verbose = true;
            continue;
        }

        if (std::strcmp(arg, "-q") == 0 || std::strcmp(arg, "--quiet") == 0) {
            opts.quiet = true;
            continue;
        }

        if (std::strcmp(arg, "--debug") == 0) {
            opts.debug = true;
            continue;
        }

        if (starts_with(arg, "--color=")) {
            opts.color = parse_color_mode(get_option_value(arg, "--color="));
            continue;
        }

        // Output modes
        if (std::strcmp(arg, "--tokens") == 0) {
            opts.output_mode = OutputMode::Tokens;
            continue;
        }

        if (std::strcmp(arg, "--parse-only") == 0) {
            opts.output_mode = OutputMode::ParseOnly;
            continue;
        }

        if (std::strcmp(arg, "--dump-ast") == 0) {
            opts.dump_ast = true;
            continue;
        }

        if (std::strcmp(arg, "--dump-types") == 0) {
            opts.dump_types = true;
            continue;
        }

        // Unknown option starting with dash
        if (arg[0] == '-') {
            throw std::runtime_error(std::string("Unknown option: ") + arg);
        }

        // Input file
        opts.input_files.push_back(arg);
    }

    // Validation
    if (opts.input_files.empty()) {
        throw std::runtime_error("No input files specified");
    }

    if (opts.quiet && (opts.verbose || opts.debug)) {
        throw std::runtime_error("Cannot specify both -q/--quiet and -v/--verbose");
    }

    return opts;
}

LogLevel log_level_of(const CompilerOptions& opts) {
    if (opts.quiet) return LogLevel::Quiet;
    if (opts.debug) return LogLevel::Debug;
    if (opts.verbose) return LogLevel::Verbose;
    return LogLevel::Normal;
}

// ============================================================================
// Help and Info Functions
// ============================================================================

void print_help(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <input-files>\n\n";

    std::cout << "Options:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  --version               Show version information\n";
    std::cout << "\n";

    std::cout << "Output:\n";
    std::cout << "  --tokens                Print the token stream and exit\n";
    std::cout << "  --parse-only            Stop after parsing\n";
    std::cout << "  --dump-ast              Print the AST as s-expressions\n";
    std::cout << "  --dump-types            Print top-level bindings with their types\n";
    std::cout << "\n";

    std::cout << "Diagnostics:\n";
    std::cout << "  -v, --verbose           Verbose output\n";
    std::cout << "  -q, --quiet             Quiet mode (errors only)\n";
    std::cout << "  --debug                 Debug output\n";
    std::cout << "  --color=<when>          auto, always or never\n";
    std::cout << "\n";

    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " main.qsr\n";
    std::cout << "  " << program_name << " --dump-ast --parse-only main.qsr\n";
}

void print_version() {
    std::cout << "Quasar Compiler v0.1.0\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

}  // namespace quasar::driver
