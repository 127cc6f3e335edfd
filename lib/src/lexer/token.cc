//
// Created by igor on 02/12/2025.
//

#include <quasar/token.hh>

namespace quasar {
    const char* token_kind_name(token_kind kind) {
        switch (kind) {
            case token_kind::kw_let: return "'let'";
            case token_kind::kw_const: return "'const'";
            case token_kind::kw_fn: return "'fn'";
            case token_kind::kw_return: return "'return'";
            case token_kind::kw_if: return "'if'";
            case token_kind::kw_else: return "'else'";
            case token_kind::kw_while: return "'while'";
            case token_kind::kw_for: return "'for'";
            case token_kind::kw_in: return "'in'";
            case token_kind::kw_break: return "'break'";
            case token_kind::kw_continue: return "'continue'";
            case token_kind::kw_true: return "'true'";
            case token_kind::kw_false: return "'false'";
            case token_kind::kw_print: return "'print'";
            case token_kind::kw_sep: return "'sep'";
            case token_kind::kw_end: return "'end'";
            case token_kind::kw_struct: return "'struct'";
            case token_kind::kw_enum: return "'enum'";
            case token_kind::kw_import: return "'import'";
            case token_kind::kw_int: return "'int'";
            case token_kind::kw_float: return "'float'";
            case token_kind::kw_bool: return "'bool'";
            case token_kind::kw_str: return "'str'";
            case token_kind::int_literal: return "integer literal";
            case token_kind::float_literal: return "float literal";
            case token_kind::string_literal: return "string literal";
            case token_kind::identifier: return "identifier";
            case token_kind::plus: return "'+'";
            case token_kind::minus: return "'-'";
            case token_kind::star: return "'*'";
            case token_kind::slash: return "'/'";
            case token_kind::percent: return "'%'";
            case token_kind::equal_equal: return "'=='";
            case token_kind::bang_equal: return "'!='";
            case token_kind::less: return "'<'";
            case token_kind::greater: return "'>'";
            case token_kind::less_equal: return "'<='";
            case token_kind::greater_equal: return "'>='";
            case token_kind::and_and: return "'&&'";
            case token_kind::or_or: return "'||'";
            case token_kind::bang: return "'!'";
            case token_kind::equal: return "'='";
            case token_kind::lparen: return "'('";
            case token_kind::rparen: return "')'";
            case token_kind::lbrace: return "'{'";
            case token_kind::rbrace: return "'}'";
            case token_kind::lbracket: return "'['";
            case token_kind::rbracket: return "']'";
            case token_kind::colon: return "':'";
            case token_kind::comma: return "','";
            case token_kind::arrow: return "'->'";
            case token_kind::dot: return "'.'";
            case token_kind::dot_dot: return "'..'";
            case token_kind::end_of_file: return "end of file";
        }
        return "unknown token";
    }
}
