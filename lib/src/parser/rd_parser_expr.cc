//
// Created by igor on 04/12/2025.
//

#include "parser/rd_parser.h"

namespace quasar::parser {
    namespace {
        ast::expr make_binary(ast::binary_op op, ast::expr left, ast::expr right) {
            ast::span pos = ast::merge(ast::span_of(left), ast::span_of(right));
            return ast::expr{ast::binary_expr{
                std::move(pos), op,
                std::make_unique<ast::expr>(std::move(left)),
                std::make_unique<ast::expr>(std::move(right))
            }};
        }
    }

    ast::expr rd_parser::parse_expression() {
        depth_guard guard(*this);
        return parse_range();
    }

    ast::expr rd_parser::parse_range() {
        auto start = parse_logical_or();

        if (!match(token_kind::dot_dot)) {
            return start;
        }

        auto end = parse_logical_or();
        if (check(token_kind::dot_dot)) {
            error("range expressions cannot be chained");
        }

        ast::span pos = ast::merge(ast::span_of(start), ast::span_of(end));
        return ast::expr{ast::range_expr{
            std::move(pos),
            std::make_unique<ast::expr>(std::move(start)),
            std::make_unique<ast::expr>(std::move(end)),
            true
        }};
    }

    ast::expr rd_parser::parse_logical_or() {
        chain_guard chain(*this);
        auto left = parse_logical_and();
        while (match(token_kind::or_or)) {
            auto right = parse_logical_and();
            chain.extend();
            left = make_binary(ast::binary_op::log_or, std::move(left), std::move(right));
        }
        return left;
    }

    ast::expr rd_parser::parse_logical_and() {
        chain_guard chain(*this);
        auto left = parse_equality();
        while (match(token_kind::and_and)) {
            auto right = parse_equality();
            chain.extend();
            left = make_binary(ast::binary_op::log_and, std::move(left), std::move(right));
        }
        return left;
    }

    ast::expr rd_parser::parse_equality() {
        chain_guard chain(*this);
        auto left = parse_relational();
        while (check(token_kind::equal_equal) || check(token_kind::bang_equal)) {
            const auto op = advance().is(token_kind::equal_equal) ? ast::binary_op::eq : ast::binary_op::ne;
            auto right = parse_relational();
            chain.extend();
            left = make_binary(op, std::move(left), std::move(right));
        }
        return left;
    }

    ast::expr rd_parser::parse_relational() {
        chain_guard chain(*this);
        auto left = parse_additive();
        while (true) {
            ast::binary_op op;
            switch (peek().kind) {
                case token_kind::less: op = ast::binary_op::lt; break;
                case token_kind::greater: op = ast::binary_op::gt; break;
                case token_kind::less_equal: op = ast::binary_op::le; break;
                case token_kind::greater_equal: op = ast::binary_op::ge; break;
                default: return left;
            }
            advance();
            auto right = parse_additive();
            chain.extend();
            left = make_binary(op, std::move(left), std::move(right));
        }
    }

    ast::expr rd_parser::parse_additive() {
        chain_guard chain(*this);
        auto left = parse_multiplicative();
        while (check(token_kind::plus) || check(token_kind::minus)) {
            const auto op = advance().is(token_kind::plus) ? ast::binary_op::add : ast::binary_op::sub;
            auto right = parse_multiplicative();
            chain.extend();
            left = make_binary(op, std::move(left), std::move(right));
        }
        return left;
    }

    ast::expr rd_parser::parse_multiplicative() {
        chain_guard chain(*this);
        auto left = parse_unary();
        while (true) {
            ast::binary_op op;
            switch (peek().kind) {
                case token_kind::star: op = ast::binary_op::mul; break;
                case token_kind::slash: op = ast::binary_op::div; break;
                case token_kind::percent: op = ast::binary_op::mod; break;
                default: return left;
            }
            advance();
            auto right = parse_unary();
            chain.extend();
            left = make_binary(op, std::move(left), std::move(right));
        }
    }

    ast::expr rd_parser::parse_unary() {
        if (!check(token_kind::bang) && !check(token_kind::minus)) {
            return parse_postfix();
        }

        depth_guard guard(*this);
        const token& op_token = advance();
        const auto op = op_token.is(token_kind::bang) ? ast::unary_op::log_not : ast::unary_op::neg;
        auto operand = parse_unary();  // right associative

        ast::span pos = ast::merge(op_token.location, ast::span_of(operand));
        return ast::expr{ast::unary_expr{std::move(pos), op, std::make_unique<ast::expr>(std::move(operand))}};
    }

    ast::expr rd_parser::parse_postfix() {
        chain_guard chain(*this);
        auto result = parse_primary();

        while (true) {
            if (check(token_kind::lparen) || check(token_kind::lbracket) || check(token_kind::dot)) {
                chain.extend();
            }

            if (match(token_kind::lparen)) {
                auto* callee = std::get_if<ast::identifier>(&result.node);
                if (!callee) {
                    error_at("can only call functions", ast::span_of(result));
                }
                auto arguments = parse_arguments();
                const token& end = consume(token_kind::rparen, "expected ')' after arguments");

                ast::span pos = ast::merge(callee->pos, end.location);
                result = ast::expr{ast::call_expr{std::move(pos), callee->name, callee->pos, std::move(arguments)}};
            } else if (match(token_kind::lbracket)) {
                auto index = parse_expression();
                const token& end = consume(token_kind::rbracket, "expected ']' after index");

                ast::span pos = ast::merge(ast::span_of(result), end.location);
                result = ast::expr{ast::index_expr{
                    std::move(pos),
                    std::make_unique<ast::expr>(std::move(result)),
                    std::make_unique<ast::expr>(std::move(index))
                }};
            } else if (match(token_kind::dot)) {
                const token& member = consume_name("expected field name after '.'");

                if (match(token_kind::lparen)) {
                    auto arguments = parse_arguments();
                    const token& end = consume(token_kind::rparen, "expected ')' after method arguments");

                    ast::span pos = ast::merge(ast::span_of(result), end.location);
                    result = ast::expr{ast::method_call_expr{
                        std::move(pos),
                        std::make_unique<ast::expr>(std::move(result)),
                        member.lexeme,
                        std::move(arguments)
                    }};
                } else {
                    ast::span pos = ast::merge(ast::span_of(result), member.location);
                    result = ast::expr{ast::member_access_expr{
                        std::move(pos),
                        std::make_unique<ast::expr>(std::move(result)),
                        member.lexeme
                    }};
                }
            } else {
                return result;
            }
        }
    }

    std::vector<ast::expr> rd_parser::parse_arguments() {
        std::vector<ast::expr> arguments;
        if (check(token_kind::rparen)) {
            return arguments;
        }

        arguments.push_back(parse_expression());
        while (match(token_kind::comma)) {
            arguments.push_back(parse_expression());
        }
        return arguments;
    }

    // Struct literal only on `IDENT { IDENT :`, so `for x in items { ... }`
    // keeps its block.
    bool rd_parser::at_struct_init() const {
        return check(token_kind::lbrace) && check_name(1) && check(token_kind::colon, 2);
    }

    ast::expr rd_parser::parse_primary() {
        const token& tok = peek();

        switch (tok.kind) {
            case token_kind::int_literal:
                advance();
                return ast::expr{ast::literal_int{tok.location, std::get<std::int64_t>(tok.value)}};

            case token_kind::float_literal:
                advance();
                return ast::expr{ast::literal_float{tok.location, std::get<double>(tok.value)}};

            case token_kind::string_literal:
                advance();
                return ast::expr{ast::literal_string{tok.location, std::get<std::string>(tok.value)}};

            case token_kind::kw_true:
            case token_kind::kw_false:
                advance();
                return ast::expr{ast::literal_bool{tok.location, tok.is(token_kind::kw_true)}};

            case token_kind::identifier:
            case token_kind::kw_sep:
            case token_kind::kw_end:
                advance();
                if (at_struct_init()) {
                    return parse_struct_init(tok);
                }
                return ast::expr{ast::identifier{tok.location, tok.lexeme}};

            // int(x), float(x), str(x), bool(x)
            case token_kind::kw_int:
            case token_kind::kw_float:
            case token_kind::kw_str:
            case token_kind::kw_bool:
                if (check(token_kind::lparen, 1)) {
                    advance();
                    return ast::expr{ast::identifier{tok.location, tok.lexeme}};
                }
                break;

            case token_kind::lparen: {
                advance();
                auto inner = parse_expression();
                consume(token_kind::rparen, "expected ')' after expression");
                return inner;
            }

            case token_kind::lbracket:
                return parse_list_literal();

            case token_kind::lbrace:
                return parse_dict_literal();

            default:
                break;
        }

        if (tok.is(token_kind::end_of_file)) {
            error("expected expression, got end of file");
        }
        error("expected expression, got '" + tok.lexeme + "'");
    }

    ast::expr rd_parser::parse_list_literal() {
        const token& start = advance();  // '['

        std::vector<ast::expr> elements;
        if (!check(token_kind::rbracket)) {
            elements.push_back(parse_expression());
            while (match(token_kind::comma)) {
                if (check(token_kind::rbracket)) {
                    break;  // trailing comma
                }
                elements.push_back(parse_expression());
            }
        }

        const token& end = consume(token_kind::rbracket, "expected ']' after list elements");
        return ast::expr{ast::list_literal{ast::merge(start.location, end.location), std::move(elements)}};
    }

    ast::expr rd_parser::parse_dict_literal() {
        const token& start = advance();  // '{'

        std::vector<ast::dict_entry> entries;
        if (!check(token_kind::rbrace)) {
            do {
                if (check(token_kind::rbrace)) {
                    break;  // trailing comma
                }
                auto key = parse_expression();
                consume(token_kind::colon, "expected ':' after dict key");
                auto value = parse_expression();

                ast::span pos = ast::merge(ast::span_of(key), ast::span_of(value));
                entries.push_back(ast::dict_entry{
                    std::move(pos),
                    std::make_unique<ast::expr>(std::move(key)),
                    std::make_unique<ast::expr>(std::move(value))
                });
            } while (match(token_kind::comma));
        }

        const token& end = consume(token_kind::rbrace, "expected '}' after dict entries");
        return ast::expr{ast::dict_literal{ast::merge(start.location, end.location), std::move(entries)}};
    }

    ast::expr rd_parser::parse_struct_init(const token& name) {
        advance();  // '{'

        std::vector<ast::field_init> fields;
        while (!check(token_kind::rbrace)) {
            const token& field = consume_name("expected field name");
            consume(token_kind::colon, "expected ':' after field name");
            auto value = parse_expression();

            ast::span pos = ast::merge(field.location, ast::span_of(value));
            fields.push_back(ast::field_init{std::move(pos), field.lexeme, std::make_unique<ast::expr>(std::move(value))});

            if (!match(token_kind::comma)) {
                break;
            }
        }

        const token& end = consume(token_kind::rbrace, "expected '}' after struct fields");
        return ast::expr{ast::struct_init{ast::merge(name.location, end.location), name.lexeme, std::move(fields)}};
    }
}
