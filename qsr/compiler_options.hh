#pragma once

#include <filesystem>
#include <vector>

#include "logger.hh"

namespace quasar::driver {

/// What the driver stops after
enum class OutputMode {
    Check,      // Parse and analyze (default)
    Tokens,     // Print the token stream and exit
    ParseOnly   // Stop after parsing
};

/// Compiler options (driver configuration only)
struct CompilerOptions {
    // ========================================================================
    // Input
    // ========================================================================

    std::vector<std::filesystem::path> input_files;

    // ========================================================================
    // Output Mode
    // ========================================================================

    OutputMode output_mode = OutputMode::Check;      // --tokens, --parse-only
    bool dump_ast = false;                           // --dump-ast
    bool dump_types = false;                         // --dump-types

    // ========================================================================
    // Diagnostic Options
    // ========================================================================

    bool verbose = false;                            // -v, --verbose
    bool quiet = false;                              // -q, --quiet
    bool debug = false;                              // --debug
    ColorMode color = ColorMode::Auto;               // --color=auto|always|never
};

/// Parse command-line arguments
/// Throws std::runtime_error on invalid arguments
CompilerOptions parse_command_line(int argc, char** argv);

/// Log level implied by -q / -v / --debug
LogLevel log_level_of(const CompilerOptions& opts);

void print_help(const char* program_name);

void print_version();

}  // namespace quasar::driver
