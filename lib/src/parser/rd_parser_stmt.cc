//
// Created by igor on 03/12/2025.
//

#include "parser/rd_parser.h"

namespace quasar::parser {
    ast::statement rd_parser::parse_statement() {
        switch (peek().kind) {
            case token_kind::kw_if:
                return ast::statement{parse_if()};
            case token_kind::kw_while:
                return ast::statement{parse_while()};
            case token_kind::kw_for:
                return ast::statement{parse_for()};
            case token_kind::kw_return:
                return ast::statement{parse_return()};
            case token_kind::kw_break:
                return ast::statement{ast::break_statement{advance().location}};
            case token_kind::kw_continue:
                return ast::statement{ast::continue_statement{advance().location}};
            case token_kind::kw_print:
                return ast::statement{parse_print()};
            case token_kind::lbrace:
                return ast::statement{parse_block()};
            default:
                return parse_assign_or_expression();
        }
    }

    // The left side is parsed as a full expression; a following '=' then
    // decides which assignment form (if any) it was.
    ast::statement rd_parser::parse_assign_or_expression() {
        auto target = parse_expression();

        if (!match(token_kind::equal)) {
            ast::span pos = ast::span_of(target);
            return ast::statement{ast::expression_statement{std::move(pos), std::move(target)}};
        }

        auto value = parse_expression();
        ast::span pos = ast::merge(ast::span_of(target), ast::span_of(value));

        if (auto* id = std::get_if<ast::identifier>(&target.node)) {
            return ast::statement{ast::assign_statement{std::move(pos), id->name, id->pos, std::move(value)}};
        }
        if (auto* index = std::get_if<ast::index_expr>(&target.node)) {
            return ast::statement{ast::index_assign_statement{
                std::move(pos), std::move(*index->target), std::move(*index->index), std::move(value)
            }};
        }
        if (auto* member = std::get_if<ast::member_access_expr>(&target.node)) {
            return ast::statement{ast::member_assign_statement{
                std::move(pos), std::move(*member->object), member->member, std::move(value)
            }};
        }

        error_at("invalid assignment target", ast::span_of(target));
    }

    ast::if_statement rd_parser::parse_if() {
        const token& start = advance();  // 'if'
        auto condition = parse_expression();
        auto then_block = parse_block();

        std::optional<ast::block> else_block;
        if (match(token_kind::kw_else)) {
            if (check(token_kind::kw_if)) {
                // else if: a block holding just the nested if
                depth_guard guard(*this);
                auto nested = parse_if();
                ast::block wrapper;
                wrapper.pos = nested.pos;
                wrapper.declarations.push_back(ast::declaration{ast::statement{std::move(nested)}});
                else_block = std::move(wrapper);
            } else {
                else_block = parse_block();
            }
        }

        ast::span pos = ast::merge(start.location, else_block ? else_block->pos : then_block.pos);
        return ast::if_statement{std::move(pos), std::move(condition), std::move(then_block), std::move(else_block)};
    }

    ast::while_statement rd_parser::parse_while() {
        const token& start = advance();  // 'while'
        auto condition = parse_expression();
        auto body = parse_block();

        ast::span pos = ast::merge(start.location, body.pos);
        return ast::while_statement{std::move(pos), std::move(condition), std::move(body)};
    }

    ast::for_statement rd_parser::parse_for() {
        const token& start = advance();  // 'for'
        const token& variable = consume_name("expected variable name after 'for'");
        consume(token_kind::kw_in, "expected 'in' after variable name");
        auto iterable = parse_expression();
        auto body = parse_block();

        ast::span pos = ast::merge(start.location, body.pos);
        return ast::for_statement{
            std::move(pos), variable.lexeme, variable.location, std::move(iterable), std::move(body)
        };
    }

    ast::return_statement rd_parser::parse_return() {
        const token& start = advance();  // 'return'

        if (check(token_kind::rbrace)) {
            return ast::return_statement{start.location, std::nullopt};
        }

        auto value = parse_expression();
        ast::span pos = ast::merge(start.location, ast::span_of(value));
        return ast::return_statement{std::move(pos), std::move(value)};
    }

    ast::print_statement rd_parser::parse_print() {
        const token& start = advance();  // 'print'
        consume(token_kind::lparen, "expected '(' after 'print'");

        ast::print_statement stmt;
        stmt.arguments.push_back(parse_expression());

        while (match(token_kind::comma)) {
            const bool keyword = (check(token_kind::kw_sep) || check(token_kind::kw_end)) &&
                                 check(token_kind::equal, 1);
            if (!keyword) {
                if (stmt.sep || stmt.end) {
                    error("positional argument follows keyword argument");
                }
                stmt.arguments.push_back(parse_expression());
                continue;
            }

            const token& name = advance();
            advance();  // '='
            auto& slot = name.is(token_kind::kw_sep) ? stmt.sep : stmt.end;
            if (slot) {
                error_at("duplicate '" + name.lexeme + "' argument", name.location);
            }
            slot = parse_expression();
        }

        const token& end = consume(token_kind::rparen, "expected ')' after print arguments");
        stmt.pos = ast::merge(start.location, end.location);
        return stmt;
    }

    ast::block rd_parser::parse_block() {
        depth_guard guard(*this);

        const token& start = consume(token_kind::lbrace, "expected '{'");

        ast::block result;
        while (!check(token_kind::rbrace) && !at_end()) {
            result.declarations.push_back(parse_declaration());
        }

        const token& end = consume(token_kind::rbrace, "expected '}' after block");
        result.pos = ast::merge(start.location, end.location);
        return result;
    }
}
