//
// Created by igor on 27/11/2025.
//

#pragma once
#include <stdexcept>
#include <string>

#include "span.hh"

namespace quasar {
    // Base for errors that point at a place in the source text.
    // what() returns the display form, message() the bare message.
    class source_error : public std::runtime_error {
        public:
            source_error(const std::string& kind, const std::string& msg, const ast::span& where)
                : std::runtime_error(where.str() + ": " + kind + ": " + msg),
                  message_(msg),
                  span_(where) {
            }

            [[nodiscard]] const std::string& message() const { return message_; }
            [[nodiscard]] const ast::span& location() const { return span_; }
            [[nodiscard]] std::size_t line() const { return span_.start_line; }
            [[nodiscard]] std::size_t column() const { return span_.start_column; }

        private:
            std::string message_;
            ast::span span_;
    };

    class lex_error : public source_error {
        public:
            lex_error(const std::string& msg, const ast::span& where)
                : source_error("lexical error", msg, where) {
            }
    };

    class syntax_error : public source_error {
        public:
            syntax_error(const std::string& msg, const ast::span& where)
                : source_error("syntax error", msg, where) {
            }
    };
}
