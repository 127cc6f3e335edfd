#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "compiler_options.hh"
#include "logger.hh"
#include <quasar/ast.hh>
#include <quasar/semantic.hh>
#include <quasar/token.hh>

namespace quasar::driver {

/// Front-end driver: scan, parse and check each input file
class Compiler {
public:
    explicit Compiler(const CompilerOptions& options, Logger& logger);

    /// Returns 0 when every input passes, 1 otherwise
    int compile();

private:
    // ========================================================================
    // Pipeline Stages
    // ========================================================================

    /// Check one file; false on the first error
    bool compile_file(const std::filesystem::path& input_file);

    /// Stage 1: Read the file and scan it
    std::vector<token> scan(const std::filesystem::path& input_file);

    /// Stage 2: Build the AST
    ast::program parse(const std::vector<token>& tokens);

    /// Stage 3: Type-check; prints diagnostics on failure
    bool run_semantic_analysis(const ast::program& program,
                               const std::filesystem::path& input_file,
                               semantic::analysis_result& out_result);

    // ========================================================================
    // Dumps
    // ========================================================================

    void print_tokens(const std::vector<token>& tokens);
    void print_types(const semantic::analyzed_program& analyzed);

    void print_diagnostics(const semantic::analysis_result& result);

    // ========================================================================
    // State
    // ========================================================================

    const CompilerOptions& options_;
    Logger& logger_;
};

}  // namespace quasar::driver
