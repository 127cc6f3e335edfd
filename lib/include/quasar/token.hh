//
// Created by igor on 02/12/2025.
//

#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include "span.hh"

namespace quasar {
    enum class token_kind {
        // Keywords
        kw_let, kw_const, kw_fn, kw_return, kw_if, kw_else, kw_while, kw_for, kw_in,
        kw_break, kw_continue, kw_true, kw_false, kw_print, kw_sep, kw_end,
        kw_struct, kw_enum, kw_import,
        // Type keywords
        kw_int, kw_float, kw_bool, kw_str,
        // Literals
        int_literal, float_literal, string_literal,
        identifier,
        // Operators
        plus, minus, star, slash, percent,
        equal_equal, bang_equal, less, greater, less_equal, greater_equal,
        and_and, or_or, bang,
        equal,
        // Punctuation
        lparen, rparen, lbrace, rbrace, lbracket, rbracket,
        colon, comma, arrow, dot, dot_dot,
        end_of_file
    };

    // No value for non-literal tokens
    using literal_value = std::variant<std::monostate, std::int64_t, double, bool, std::string>;

    struct token {
        token_kind kind;
        std::string lexeme;
        literal_value value;
        ast::span location;

        [[nodiscard]] bool is(token_kind k) const { return kind == k; }
    };

    /// Human-readable name used in diagnostics ("'let'", "identifier", ...)
    const char* token_kind_name(token_kind kind);
}
