//
// Created by igor on 03/12/2025.
//
// Recursive-descent parser over a token vector.
//
// Grammar (lowest to highest precedence for expressions):
//   range      -> or ( ".." or )?            non-associative
//   or         -> and ( "||" and )*
//   and        -> equality ( "&&" equality )*
//   equality   -> relational ( ("==" | "!=") relational )*
//   relational -> additive ( ("<" | ">" | "<=" | ">=") additive )*
//   additive   -> multiplicative ( ("+" | "-") multiplicative )*
//   multiplicative -> unary ( ("*" | "/" | "%") unary )*
//   unary      -> ("!" | "-") unary | postfix
//   postfix    -> primary ( "(" args ")" | "[" expr "]" | "." IDENT ( "(" args ")" )? )*
//

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <quasar/ast.hh>
#include <quasar/token.hh>
#include <quasar/parser_error.hh>

namespace quasar::parser {
    class rd_parser {
        public:
            explicit rd_parser(const std::vector<token>& tokens, std::string file);

            ast::program parse_program();

        private:
            // Keeps the nesting counter balanced on every exit path
            class depth_guard {
                public:
                    explicit depth_guard(rd_parser& parser);
                    ~depth_guard();

                    depth_guard(const depth_guard&) = delete;
                    depth_guard& operator=(const depth_guard&) = delete;

                private:
                    rd_parser& parser_;
            };

            // Left-associative loops and postfix chains deepen the tree
            // without recursing; each reduction takes one level of the
            // same budget until the loop returns.
            class chain_guard {
                public:
                    explicit chain_guard(rd_parser& parser);
                    ~chain_guard();

                    chain_guard(const chain_guard&) = delete;
                    chain_guard& operator=(const chain_guard&) = delete;

                    void extend();

                private:
                    rd_parser& parser_;
                    std::size_t length_ = 0;
            };

            // Token cursor
            [[nodiscard]] const token& peek(std::size_t offset = 0) const;
            [[nodiscard]] const token& previous() const;
            [[nodiscard]] bool at_end() const;
            const token& advance();
            [[nodiscard]] bool check(token_kind kind, std::size_t offset = 0) const;
            bool match(token_kind kind);
            const token& consume(token_kind kind, const std::string& message);

            // identifier, or one of the contextual keywords `sep` / `end`
            [[nodiscard]] bool check_name(std::size_t offset = 0) const;
            const token& consume_name(const std::string& message);

            [[noreturn]] void error(const std::string& message) const;
            [[noreturn]] void error_at(const std::string& message, const ast::span& where) const;

            // Declarations
            ast::declaration parse_declaration();
            ast::var_decl parse_var_decl();
            ast::const_decl parse_const_decl();
            ast::fn_decl parse_fn_decl();
            ast::param parse_param();
            ast::struct_decl parse_struct_decl();
            ast::enum_decl parse_enum_decl();
            ast::import_decl parse_import_decl();
            ast::type_annotation parse_type();

            // Statements
            ast::statement parse_statement();
            ast::statement parse_assign_or_expression();
            ast::if_statement parse_if();
            ast::while_statement parse_while();
            ast::for_statement parse_for();
            ast::return_statement parse_return();
            ast::print_statement parse_print();
            ast::block parse_block();

            // Expressions
            ast::expr parse_expression();
            ast::expr parse_range();
            ast::expr parse_logical_or();
            ast::expr parse_logical_and();
            ast::expr parse_equality();
            ast::expr parse_relational();
            ast::expr parse_additive();
            ast::expr parse_multiplicative();
            ast::expr parse_unary();
            ast::expr parse_postfix();
            ast::expr parse_primary();
            ast::expr parse_list_literal();
            ast::expr parse_dict_literal();
            ast::expr parse_struct_init(const token& name);
            std::vector<ast::expr> parse_arguments();

            [[nodiscard]] bool at_struct_init() const;

            const std::vector<token>& tokens_;
            std::string file_;
            std::size_t pos_ = 0;
            std::size_t depth_ = 0;
    };
}
