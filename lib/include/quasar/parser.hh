//
// Created by igor on 20/11/2025.
//

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "ast.hh"
#include "token.hh"
#include "parser_error.hh"

namespace quasar {
    // All overloads throw syntax_error on the first malformed construct;
    // the text and path overloads may also throw lex_error.
    ast::program parse_quasar(const std::vector<token>& tokens);
    ast::program parse_quasar(const std::string& text, const std::string& filename = "<string>");
    ast::program parse_quasar_file(const std::filesystem::path& path);

    // Either the parsed program or the first lexical/syntax error
    struct parse_result {
        std::optional<ast::program> program;
        std::optional<source_error> error;

        [[nodiscard]] bool ok() const { return program.has_value(); }
    };

    parse_result try_parse_quasar(const std::vector<token>& tokens);
    parse_result try_parse_quasar(const std::string& text, const std::string& filename = "<string>");
}
