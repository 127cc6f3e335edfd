//
// Created by igor on 22/11/2025.
//

#pragma once
#include <string>
#include <cstdint>
#include <utility>
#include <variant>
#include <vector>
#include <memory>
#include <optional>

#include "span.hh"

namespace quasar::ast {
    // -----------------------------
    // Type annotations (unresolved)
    // -----------------------------

    enum class primitive_name {
        int_,
        float_,
        bool_,
        str
    };

    struct type_annotation;

    struct primitive_annotation {
        span pos;
        primitive_name name;
    };

    // [T]
    struct list_annotation {
        span pos;
        std::unique_ptr<type_annotation> element;
    };

    // Dict[K, V]
    struct dict_annotation {
        span pos;
        std::unique_ptr<type_annotation> key;
        std::unique_ptr<type_annotation> value;
    };

    // Bare identifier: struct/enum name or "void", resolved during analysis
    struct named_annotation {
        span pos;
        std::string name;
    };

    using type_annotation_node = std::variant<
        primitive_annotation,
        list_annotation,
        dict_annotation,
        named_annotation
    >;

    struct type_annotation {
        type_annotation_node node;
    };

    // -----------------------------
    // Expression node definitions
    // -----------------------------
    struct literal_int {
        span pos;
        std::int64_t value;
    };

    struct literal_float {
        span pos;
        double value;
    };

    struct literal_string {
        span pos;
        std::string value;
    };

    struct literal_bool {
        span pos;
        bool value;
    };

    struct identifier {
        span pos;
        std::string name;
    };

    // Forward declaration for recursive types
    struct expr;

    struct list_literal {
        span pos;
        std::vector<expr> elements;
    };

    struct dict_entry {
        span pos;
        std::unique_ptr<expr> key;
        std::unique_ptr<expr> value;
    };

    // Entries keep source order
    struct dict_literal {
        span pos;
        std::vector<dict_entry> entries;
    };

    struct field_init {
        span pos;
        std::string name;
        std::unique_ptr<expr> value;
    };

    // Point { x: 1, y: 2 }
    struct struct_init {
        span pos;
        std::string name;
        std::vector<field_init> fields;
    };

    enum class unary_op {
        neg,     // -
        log_not  // !
    };

    struct unary_expr {
        span pos;
        unary_op op;
        std::unique_ptr<expr> operand;
    };

    enum class binary_op {
        // Arithmetic
        add, sub, mul, div, mod,
        // Comparison
        eq, ne, lt, gt, le, ge,
        // Logical
        log_and, log_or
    };

    struct binary_expr {
        span pos;
        binary_op op;
        std::unique_ptr<expr> left;
        std::unique_ptr<expr> right;
    };

    // Function call; the callee is always a bare name
    struct call_expr {
        span pos;
        std::string callee;
        span callee_pos;
        std::vector<expr> arguments;
    };

    // target[index]
    struct index_expr {
        span pos;
        std::unique_ptr<expr> target;
        std::unique_ptr<expr> index;
    };

    // object.member
    struct member_access_expr {
        span pos;
        std::unique_ptr<expr> object;
        std::string member;
    };

    // object.method(args...)
    struct method_call_expr {
        span pos;
        std::unique_ptr<expr> object;
        std::string method;
        std::vector<expr> arguments;
    };

    // start..end
    struct range_expr {
        span pos;
        std::unique_ptr<expr> start;
        std::unique_ptr<expr> end;
        bool exclusive{true};
    };

    using expr_node = std::variant <
        literal_int,
        literal_float,
        literal_string,
        literal_bool,
        identifier,
        list_literal,
        dict_literal,
        struct_init,
        unary_expr,
        binary_expr,
        call_expr,
        index_expr,
        member_access_expr,
        method_call_expr,
        range_expr
    >;

    struct expr {
        expr_node node;
    };

    // -----------------------------
    // Statements
    // -----------------------------

    struct declaration;

    struct block {
        span pos;
        std::vector<declaration> declarations;
    };

    struct expression_statement {
        span pos;
        expr expression;
    };

    struct if_statement {
        span pos;
        expr condition;
        block then_block;
        std::optional<block> else_block;
    };

    struct while_statement {
        span pos;
        expr condition;
        block body;
    };

    struct for_statement {
        span pos;
        std::string variable;
        span variable_pos;
        expr iterable;
        block body;
    };

    // value is empty for a bare `return` in a void function
    struct return_statement {
        span pos;
        std::optional<expr> value;
    };

    struct break_statement {
        span pos;
    };

    struct continue_statement {
        span pos;
    };

    // name = value
    struct assign_statement {
        span pos;
        std::string target;
        span target_pos;
        expr value;
    };

    // target[index] = value
    struct index_assign_statement {
        span pos;
        expr target;
        expr index;
        expr value;
    };

    // object.member = value
    struct member_assign_statement {
        span pos;
        expr object;
        std::string member;
        expr value;
    };

    struct print_statement {
        span pos;
        std::vector<expr> arguments;
        std::optional<expr> sep;
        std::optional<expr> end;
    };

    using statement_node = std::variant<
        block,
        expression_statement,
        if_statement,
        while_statement,
        for_statement,
        return_statement,
        break_statement,
        continue_statement,
        assign_statement,
        index_assign_statement,
        member_assign_statement,
        print_statement
    >;

    struct statement {
        statement_node node;
    };

    // -----------------------------
    // Declarations
    // -----------------------------

    struct var_decl {
        span pos;
        std::string name;
        type_annotation annotation;
        expr initializer;
    };

    struct const_decl {
        span pos;
        std::string name;
        type_annotation annotation;
        expr initializer;
    };

    struct param {
        span pos;
        std::string name;
        type_annotation annotation;
    };

    struct fn_decl {
        span pos;
        std::string name;
        std::vector<param> params;
        type_annotation return_type;
        block body;
    };

    struct field_decl {
        span pos;
        std::string name;
        type_annotation annotation;
    };

    struct struct_decl {
        span pos;
        std::string name;
        std::vector<field_decl> fields;
    };

    struct enum_variant {
        span pos;
        std::string name;
    };

    struct enum_decl {
        span pos;
        std::string name;
        std::vector<enum_variant> variants;
    };

    // import math            -> module "math", is_local false
    // import "./utils.qsr"   -> module "./utils.qsr", is_local true
    struct import_decl {
        span pos;
        std::string module;
        bool is_local;
    };

    using declaration_node = std::variant<
        var_decl,
        const_decl,
        fn_decl,
        struct_decl,
        enum_decl,
        import_decl,
        statement
    >;

    struct declaration {
        declaration_node node;
    };

    struct program {
        std::string file;
        std::vector<declaration> declarations;
    };

    // Source span of any node
    [[nodiscard]] const span& span_of(const expr& e);
    [[nodiscard]] const span& span_of(const statement& s);
    [[nodiscard]] const span& span_of(const declaration& d);
    [[nodiscard]] const span& span_of(const type_annotation& t);

    /// Name bound by an import: "math" for `import math`, "utils" for `import "./lib/utils.qsr"`
    [[nodiscard]] std::string import_binding_name(const import_decl& imp);
}
