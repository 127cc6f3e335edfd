#include "compiler.hh"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include <quasar/ast_printer.hh>
#include <quasar/lexer.hh>
#include <quasar/parser.hh>
#include <quasar/parser_error.hh>

namespace quasar::driver {

Compiler::Compiler(const CompilerOptions& options, Logger& logger)
    : options_(options)
    , logger_(logger)
{
}

int Compiler::compile() {
    logger_.verbose("Starting compilation...");
    for (const auto& input_file : options_.input_files) {
        logger_.indent(input_file.string(), 2, LogLevel::Verbose);
    }

    for (const auto& input_file : options_.input_files) {
        try {
            if (!compile_file(input_file)) {
                return 1;
            }
        } catch (const lex_error& e) {
            logger_.located_error("lexical error", e);
            return 1;
        } catch (const syntax_error& e) {
            logger_.located_error("syntax error", e);
            return 1;
        } catch (const std::exception& e) {
            logger_.error(std::string("Error: ") + e.what());
            return 1;
        }
    }

    if (options_.output_mode == OutputMode::Check) {
        logger_.success("No errors found");
    }
    return 0;
}

bool Compiler::compile_file(const std::filesystem::path& input_file) {
    logger_.info("Checking: " + input_file.string());
    if (input_file.extension() != ".qsr") {
        logger_.warning("Input file does not have a .qsr extension: " + input_file.string());
    }

    auto tokens = scan(input_file);
    if (options_.output_mode == OutputMode::Tokens) {
        print_tokens(tokens);
        return true;
    }

    auto program = parse(tokens);
    if (options_.dump_ast) {
        std::cout << ast::dump(program);
    }
    if (options_.output_mode == OutputMode::ParseOnly) {
        return true;
    }

    semantic::analysis_result result;
    if (!run_semantic_analysis(program, input_file, result)) {
        return false;
    }

    if (options_.dump_types) {
        print_types(result.analyzed.value());
    }
    return true;
}

// ============================================================================
// Pipeline Stages
// ============================================================================

std::vector<token> Compiler::scan(const std::filesystem::path& input_file) {
    logger_.verbose("Scanning: " + input_file.string());

    std::ifstream file(input_file);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + input_file.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto tokens = tokenize(buffer.str(), input_file.string());
    logger_.debug(std::to_string(tokens.size()) + " tokens");
    return tokens;
}

ast::program Compiler::parse(const std::vector<token>& tokens) {
    logger_.verbose("Parsing...");

    auto program = parse_quasar(tokens);
    logger_.debug(std::to_string(program.declarations.size()) + " top-level declarations");
    return program;
}

bool Compiler::run_semantic_analysis(const ast::program& program,
                                     const std::filesystem::path& input_file,
                                     semantic::analysis_result& out_result) {
    logger_.verbose("Running semantic analysis...");

    // Local imports resolve relative to the importing file
    semantic::analysis_options analysis_opts;
    analysis_opts.base_dir = input_file.has_parent_path() ? input_file.parent_path() : std::filesystem::path(".");

    out_result = semantic::analyze(program, analysis_opts);

    if (out_result.has_errors()) {
        print_diagnostics(out_result);
        return false;
    }

    logger_.debug(std::to_string(out_result.analyzed->expression_types.size()) + " typed expressions");
    return true;
}

// ============================================================================
// Dumps
// ============================================================================

void Compiler::print_tokens(const std::vector<token>& tokens) {
    for (const auto& tok : tokens) {
        std::cout << tok.location.start_line << ":" << tok.location.start_column << "\t"
                  << token_kind_name(tok.kind);
        if (!tok.lexeme.empty()) {
            std::cout << "\t" << tok.lexeme;
        }
        std::cout << "\n";
    }
}

void Compiler::print_types(const semantic::analyzed_program& analyzed) {
    for (const auto& [name, sym] : analyzed.globals) {
        if (sym.is_function) {
            std::string params;
            for (const auto& p : sym.params) {
                if (!params.empty()) {
                    params += ", ";
                }
                params += types::type_to_string(p);
            }
            std::cout << "fn " << name << "(" << params << ") -> " << types::type_to_string(sym.resolved) << "\n";
        } else {
            std::cout << (sym.is_const ? "const " : "let ") << name << ": "
                      << types::type_to_string(sym.resolved) << "\n";
        }
    }
}

void Compiler::print_diagnostics(const semantic::analysis_result& result) {
    for (const auto& diag : result.diagnostics) {
        logger_.diagnostic(diag);
    }

    if (result.has_errors()) {
        logger_.error("Total errors: " + std::to_string(result.error_count()));
    }
}

}  // namespace quasar::driver
