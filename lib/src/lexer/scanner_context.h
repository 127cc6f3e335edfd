//
// Created by igor on 02/12/2025.
//

#pragma once

#include <cstddef>
#include <string>

#include <quasar/token.hh>

namespace quasar::lexer {
    struct scanner_context {
        const char* input;
        const char* cursor;
        const char* limit; /* Points past padding for re2c bounds checking */
        const char* eof;   /* Points to end of actual data (where the zero padding starts) */
        const char* marker;
        const char* line_start;  /* First character of the current line */
        std::size_t line;
        std::string filename;

        /* Set by scan_token for the token just matched */
        const char* token_start;
        std::size_t token_line;
        std::size_t token_column;
    };

    /* Advance past whitespace and comments and match one token.
     * Returns token_kind::end_of_file at the end of the data. Throws lex_error. */
    token_kind scan_token(scanner_context& ctx);

    /* Span of the token matched by the last scan_token call */
    ast::span token_span(const scanner_context& ctx);
}
