//
// Created by igor on 05/12/2025.
//
// Single-pass checker behind semantic::analyze().
//
// Walks the program once, in source order, with a scope stack, a loop
// nesting counter and the return type of the enclosing function. Every
// expression's type is recorded in analyzed_program::expression_types.
// The first violation throws semantic_failure, which analyze() turns into
// the result's only diagnostic.
//

#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

#include <quasar/semantic.hh>

namespace quasar::semantic::phases {
    struct semantic_failure {
        diagnostic diag;
    };

    class checker {
        public:
            checker(const analysis_options& opts, analyzed_program& out);

            void run(const ast::program& prog);

        private:
            // ---- declarations (check_declarations.cc) ----
            void check_declaration(const ast::declaration& decl);
            void check_var(const ast::var_decl& decl);
            void check_const(const ast::const_decl& decl);
            void check_binding(const std::string& name, const ast::type_annotation& annotation,
                               const ast::expr& initializer, bool is_const, const ast::span& where);
            void check_fn(const ast::fn_decl& decl);
            void check_struct(const ast::struct_decl& decl);
            void check_enum(const ast::enum_decl& decl);
            void check_import(const ast::import_decl& decl);

            types::type resolve(const ast::type_annotation& annotation, bool allow_void = false);
            [[nodiscard]] bool is_reserved(const std::string& name) const;
            void ensure_not_reserved(const std::string& name, const ast::span& where) const;
            void define(symbol sym, const ast::span& where);

            // ---- statements (check_statements.cc) ----
            void check_statement(const ast::statement& stmt);
            void check_block(const ast::block& body);
            void check_block_contents(const ast::block& body);
            void check_if(const ast::if_statement& stmt);
            void check_while(const ast::while_statement& stmt);
            void check_for(const ast::for_statement& stmt);
            void check_return(const ast::return_statement& stmt);
            void check_assign(const ast::assign_statement& stmt);
            void check_index_assign(const ast::index_assign_statement& stmt);
            void check_member_assign(const ast::member_assign_statement& stmt);
            void check_print(const ast::print_statement& stmt);
            void check_condition(const ast::expr& condition);

            // ---- expressions (check_expressions.cc) ----
            types::type check_expr(const ast::expr& e);
            types::type record(const ast::expr& e, types::type t);

            types::type check_identifier(const ast::identifier& e);
            types::type check_list(const ast::list_literal& e);
            types::type check_dict(const ast::dict_literal& e);
            types::type check_struct_init(const ast::struct_init& e);
            types::type check_unary(const ast::unary_expr& e);
            types::type check_binary(const ast::binary_expr& e);
            types::type check_index(const ast::index_expr& e);
            types::type check_member(const ast::member_access_expr& e);
            types::type check_range(const ast::range_expr& e);

            /// Enum name used as `Color.Red` receiver; nullptr when `e` is anything else
            const types::enum_info* enum_receiver(const ast::expr& e) const;

            // ---- calls (check_calls.cc) ----
            types::type check_call(const ast::call_expr& e);
            types::type check_len(const ast::call_expr& e);
            types::type check_push(const ast::call_expr& e);
            types::type check_input(const ast::call_expr& e);
            types::type check_cast(const ast::call_expr& e);
            types::type check_dict_view(const ast::call_expr& e, const char* code, bool keys);
            types::type check_user_call(const ast::call_expr& e);
            types::type check_method_call(const ast::method_call_expr& e);
            types::type check_static_call(const ast::method_call_expr& e, const std::string& ns);

            /// Static namespace named by `e`, if `e` is a bare reserved identifier
            std::optional<std::string> static_receiver(const ast::expr& e) const;

            [[noreturn]] void fail(const char* code, const std::string& message, const ast::span& where) const;

            const analysis_options& opts_;
            analyzed_program& out_;
            symbol_table symbols_;
            int loop_depth_ = 0;
            std::optional<types::type> return_type_;  ///< empty outside functions
            std::set<std::string> imported_;
    };

    // Display form used inside messages: 'int', '[str]', ...
    std::string quoted(const types::type& t);
}
