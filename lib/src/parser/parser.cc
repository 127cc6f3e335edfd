/*
 * Quasar Parser - C++ Interface
 */

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <quasar/parser.hh>
#include <quasar/lexer.hh>

#include "parser/rd_parser.h"

namespace quasar {
    /* Implementation details */
    namespace {
        std::string file_of(const std::vector<token>& tokens) {
            return tokens.empty() ? std::string("<string>") : tokens.front().location.file;
        }

        template <typename Fn>
        parse_result capture(Fn&& fn) {
            parse_result result;
            try {
                result.program = fn();
            } catch (const source_error& e) {
                result.error = e;
            }
            return result;
        }
    } // anonymous namespace

    /* Public API */
    ast::program parse_quasar(const std::vector<token>& tokens) {
        parser::rd_parser p(tokens, file_of(tokens));
        return p.parse_program();
    }

    ast::program parse_quasar(const std::string& text, const std::string& filename) {
        const auto tokens = tokenize(text, filename);
        parser::rd_parser p(tokens, filename);
        return p.parse_program();
    }

    ast::program parse_quasar_file(const std::filesystem::path& path) {
        /* Read file contents */
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open file: " + path.string());
        }

        std::stringstream buffer;
        buffer << file.rdbuf();

        /* Parse with filename for error reporting */
        return parse_quasar(buffer.str(), path.string());
    }

    parse_result try_parse_quasar(const std::vector<token>& tokens) {
        return capture([&] { return parse_quasar(tokens); });
    }

    parse_result try_parse_quasar(const std::string& text, const std::string& filename) {
        return capture([&] { return parse_quasar(text, filename); });
    }
} // namespace quasar
