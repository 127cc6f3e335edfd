//
// Created by igor on 02/12/2025.
//

#include <charconv>
#include <cstring>

#include <quasar/lexer.hh>

#include "lexer/scanner_context.h"
#include "parser/parser_constants.h"

namespace quasar {
    namespace {
        class scanner {
            public:
                scanner(const std::string& text, const std::string& filename) {
                    const size_t length = text.size();
                    char* padded_input = new char[length + parser::INPUT_BUFFER_PADDING];

                    memcpy(padded_input, text.data(), length);
                    memset(padded_input + length, 0, parser::INPUT_BUFFER_PADDING); /* Fill padding with nulls */

                    m_ctx.input = padded_input;
                    m_ctx.cursor = padded_input;
                    m_ctx.eof = padded_input + length;
                    m_ctx.limit = padded_input + length + parser::INPUT_BUFFER_PADDING;
                    m_ctx.marker = padded_input;
                    m_ctx.line_start = padded_input;
                    m_ctx.line = 1;
                    m_ctx.filename = filename;
                    m_ctx.token_start = padded_input;
                    m_ctx.token_line = 1;
                    m_ctx.token_column = 1;
                }

                ~scanner() {
                    delete [] m_ctx.input;
                }

                scanner(const scanner&) = delete;
                scanner& operator =(const scanner&) = delete;

                token_kind operator ()() {
                    return lexer::scan_token(m_ctx);
                }

                [[nodiscard]] std::string lexeme() const {
                    return {m_ctx.token_start, m_ctx.cursor};
                }

                [[nodiscard]] ast::span location() const {
                    return lexer::token_span(m_ctx);
                }

            private:
                lexer::scanner_context m_ctx{};
        };

        literal_value int_value(const std::string& text, const ast::span& where) {
            std::int64_t value = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec == std::errc::result_out_of_range) {
                throw lex_error("integer literal '" + text + "' is out of range", where);
            }
            if (ec != std::errc() || ptr != text.data() + text.size()) {
                throw lex_error("invalid integer literal '" + text + "'", where);
            }
            return value;
        }

        literal_value float_value(const std::string& text, const ast::span& where) {
            double value = 0.0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc() || ptr != text.data() + text.size()) {
                throw lex_error("invalid float literal '" + text + "'", where);
            }
            return value;
        }
    }

    std::vector<token> tokenize(const std::string& text, const std::string& filename) {
        scanner lexer(text, filename);
        std::vector<token> tokens;

        while (true) {
            token tok;
            tok.kind = lexer();
            tok.location = lexer.location();

            if (tok.kind == token_kind::end_of_file) {
                tokens.push_back(std::move(tok));
                break;
            }

            tok.lexeme = lexer.lexeme();

            switch (tok.kind) {
                case token_kind::int_literal:
                    tok.value = int_value(tok.lexeme, tok.location);
                    break;
                case token_kind::float_literal:
                    tok.value = float_value(tok.lexeme, tok.location);
                    break;
                case token_kind::string_literal:
                    if (tok.lexeme.size() - 2 > parser::MAX_STRING_LITERAL_LENGTH) {
                        throw lex_error("string literal too long", tok.location);
                    }
                    tok.value = tok.lexeme.substr(1, tok.lexeme.size() - 2);
                    break;
                case token_kind::kw_true:
                    tok.value = true;
                    break;
                case token_kind::kw_false:
                    tok.value = false;
                    break;
                case token_kind::identifier:
                    if (tok.lexeme.size() > parser::MAX_IDENTIFIER_LENGTH) {
                        throw lex_error("identifier too long", tok.location);
                    }
                    break;
                default:
                    break;
            }

            tokens.push_back(std::move(tok));
        }

        return tokens;
    }
}
