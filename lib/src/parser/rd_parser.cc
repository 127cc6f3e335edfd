//
// Created by igor on 03/12/2025.
//

#include "parser/rd_parser.h"
#include "parser/parser_constants.h"

namespace quasar::parser {
    rd_parser::depth_guard::depth_guard(rd_parser& parser)
        : parser_(parser) {
        if (++parser_.depth_ > MAX_EXPRESSION_DEPTH) {
            --parser_.depth_;
            parser_.error("nesting too deep (limit: " + std::to_string(MAX_EXPRESSION_DEPTH) + ")");
        }
    }

    rd_parser::depth_guard::~depth_guard() {
        --parser_.depth_;
    }

    rd_parser::chain_guard::chain_guard(rd_parser& parser)
        : parser_(parser) {
    }

    rd_parser::chain_guard::~chain_guard() {
        parser_.depth_ -= length_;
    }

    void rd_parser::chain_guard::extend() {
        if (parser_.depth_ + 1 > MAX_EXPRESSION_DEPTH) {
            parser_.error("nesting too deep (limit: " + std::to_string(MAX_EXPRESSION_DEPTH) + ")");
        }
        ++parser_.depth_;
        ++length_;
    }

    rd_parser::rd_parser(const std::vector<token>& tokens, std::string file)
        : tokens_(tokens),
          file_(std::move(file)) {
        if (tokens_.empty() || !tokens_.back().is(token_kind::end_of_file)) {
            throw syntax_error("token stream is not terminated by end of file",
                               tokens_.empty() ? ast::span{} : tokens_.back().location);
        }
    }

    ast::program rd_parser::parse_program() {
        ast::program prog;
        prog.file = file_;

        while (!at_end()) {
            prog.declarations.push_back(parse_declaration());
        }

        return prog;
    }

    // ========================================================================
    // Token cursor
    // ========================================================================

    const token& rd_parser::peek(std::size_t offset) const {
        const std::size_t index = pos_ + offset;
        if (index >= tokens_.size()) {
            return tokens_.back();
        }
        return tokens_[index];
    }

    const token& rd_parser::previous() const {
        return tokens_[pos_ == 0 ? 0 : pos_ - 1];
    }

    bool rd_parser::at_end() const {
        return peek().is(token_kind::end_of_file);
    }

    const token& rd_parser::advance() {
        if (!at_end()) {
            ++pos_;
        }
        return previous();
    }

    bool rd_parser::check(token_kind kind, std::size_t offset) const {
        return peek(offset).is(kind);
    }

    bool rd_parser::match(token_kind kind) {
        if (check(kind)) {
            advance();
            return true;
        }
        return false;
    }

    const token& rd_parser::consume(token_kind kind, const std::string& message) {
        if (check(kind)) {
            return advance();
        }
        error(message);
    }

    bool rd_parser::check_name(std::size_t offset) const {
        const auto kind = peek(offset).kind;
        return kind == token_kind::identifier || kind == token_kind::kw_sep || kind == token_kind::kw_end;
    }

    const token& rd_parser::consume_name(const std::string& message) {
        if (check_name()) {
            return advance();
        }
        error(message);
    }

    void rd_parser::error(const std::string& message) const {
        throw syntax_error(message, peek().location);
    }

    void rd_parser::error_at(const std::string& message, const ast::span& where) const {
        throw syntax_error(message, where);
    }

    // ========================================================================
    // Declarations
    // ========================================================================

    ast::declaration rd_parser::parse_declaration() {
        switch (peek().kind) {
            case token_kind::kw_let:
                return ast::declaration{parse_var_decl()};
            case token_kind::kw_const:
                return ast::declaration{parse_const_decl()};
            case token_kind::kw_fn:
                return ast::declaration{parse_fn_decl()};
            case token_kind::kw_struct:
                return ast::declaration{parse_struct_decl()};
            case token_kind::kw_enum:
                return ast::declaration{parse_enum_decl()};
            case token_kind::kw_import:
                return ast::declaration{parse_import_decl()};
            default:
                return ast::declaration{parse_statement()};
        }
    }

    ast::var_decl rd_parser::parse_var_decl() {
        const token& start = advance();  // 'let'
        const token& name = consume_name("expected variable name after 'let'");
        consume(token_kind::colon, "expected ':' after variable name");
        auto annotation = parse_type();
        consume(token_kind::equal, "expected '=' in variable declaration");
        auto initializer = parse_expression();

        ast::span pos = ast::merge(start.location, ast::span_of(initializer));
        return ast::var_decl{std::move(pos), name.lexeme, std::move(annotation), std::move(initializer)};
    }

    ast::const_decl rd_parser::parse_const_decl() {
        const token& start = advance();  // 'const'
        const token& name = consume_name("expected constant name after 'const'");
        consume(token_kind::colon, "expected ':' after constant name");
        auto annotation = parse_type();
        consume(token_kind::equal, "expected '=' in constant declaration");
        auto initializer = parse_expression();

        ast::span pos = ast::merge(start.location, ast::span_of(initializer));
        return ast::const_decl{std::move(pos), name.lexeme, std::move(annotation), std::move(initializer)};
    }

    ast::fn_decl rd_parser::parse_fn_decl() {
        const token& start = advance();  // 'fn'
        const token& name = consume_name("expected function name after 'fn'");
        consume(token_kind::lparen, "expected '(' after function name");

        std::vector<ast::param> params;
        if (!check(token_kind::rparen)) {
            params.push_back(parse_param());
            while (match(token_kind::comma)) {
                params.push_back(parse_param());
            }
        }

        consume(token_kind::rparen, "expected ')' after parameters");
        consume(token_kind::arrow, "expected '->' after parameters");
        auto return_type = parse_type();
        auto body = parse_block();

        ast::span pos = ast::merge(start.location, body.pos);
        return ast::fn_decl{std::move(pos), name.lexeme, std::move(params), std::move(return_type), std::move(body)};
    }

    ast::param rd_parser::parse_param() {
        const token& name = consume_name("expected parameter name");
        consume(token_kind::colon, "expected ':' after parameter name");
        auto annotation = parse_type();

        ast::span pos = ast::merge(name.location, ast::span_of(annotation));
        return ast::param{std::move(pos), name.lexeme, std::move(annotation)};
    }

    ast::struct_decl rd_parser::parse_struct_decl() {
        const token& start = advance();  // 'struct'
        const token& name = consume_name("expected struct name after 'struct'");
        consume(token_kind::lbrace, "expected '{' after struct name");

        std::vector<ast::field_decl> fields;
        while (!check(token_kind::rbrace)) {
            const token& field = consume_name("expected field name");
            consume(token_kind::colon, "expected ':' after field name");
            auto annotation = parse_type();
            ast::span field_pos = ast::merge(field.location, ast::span_of(annotation));
            fields.push_back(ast::field_decl{std::move(field_pos), field.lexeme, std::move(annotation)});

            if (!match(token_kind::comma)) {
                break;
            }
        }

        const token& end = consume(token_kind::rbrace, "expected '}' after struct fields");
        return ast::struct_decl{ast::merge(start.location, end.location), name.lexeme, std::move(fields)};
    }

    ast::enum_decl rd_parser::parse_enum_decl() {
        const token& start = advance();  // 'enum'
        const token& name = consume_name("expected enum name after 'enum'");
        consume(token_kind::lbrace, "expected '{' after enum name");

        if (check(token_kind::rbrace)) {
            error("enum must have at least one variant");
        }

        std::vector<ast::enum_variant> variants;
        do {
            if (check(token_kind::rbrace) && !variants.empty()) {
                break;  // trailing comma
            }
            const token& variant = consume_name("expected variant name");
            variants.push_back(ast::enum_variant{variant.location, variant.lexeme});
        } while (match(token_kind::comma));

        const token& end = consume(token_kind::rbrace, "expected '}' after enum variants");
        return ast::enum_decl{ast::merge(start.location, end.location), name.lexeme, std::move(variants)};
    }

    ast::import_decl rd_parser::parse_import_decl() {
        const token& start = advance();  // 'import'

        if (check(token_kind::string_literal)) {
            const token& path = advance();
            return ast::import_decl{ast::merge(start.location, path.location),
                                    std::get<std::string>(path.value), true};
        }

        const token& module = consume_name("expected module name or path after 'import'");
        return ast::import_decl{ast::merge(start.location, module.location), module.lexeme, false};
    }

    ast::type_annotation rd_parser::parse_type() {
        const token& start = peek();

        auto primitive = [&](ast::primitive_name name) {
            advance();
            return ast::type_annotation{ast::primitive_annotation{start.location, name}};
        };

        switch (start.kind) {
            case token_kind::kw_int:
                return primitive(ast::primitive_name::int_);
            case token_kind::kw_float:
                return primitive(ast::primitive_name::float_);
            case token_kind::kw_bool:
                return primitive(ast::primitive_name::bool_);
            case token_kind::kw_str:
                return primitive(ast::primitive_name::str);

            case token_kind::lbracket: {
                advance();
                auto element = std::make_unique<ast::type_annotation>(parse_type());
                const token& end = consume(token_kind::rbracket, "expected ']' after list element type");
                return ast::type_annotation{
                    ast::list_annotation{ast::merge(start.location, end.location), std::move(element)}
                };
            }

            case token_kind::identifier: {
                advance();
                if (start.lexeme == "Dict" && check(token_kind::lbracket)) {
                    advance();
                    auto key = std::make_unique<ast::type_annotation>(parse_type());
                    consume(token_kind::comma, "expected ',' after dict key type");
                    auto value = std::make_unique<ast::type_annotation>(parse_type());
                    const token& end = consume(token_kind::rbracket, "expected ']' after dict value type");
                    return ast::type_annotation{
                        ast::dict_annotation{ast::merge(start.location, end.location), std::move(key), std::move(value)}
                    };
                }
                return ast::type_annotation{ast::named_annotation{start.location, start.lexeme}};
            }

            default:
                error("expected type name");
        }
    }
}
