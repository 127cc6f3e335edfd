//
// Expression typing
//
// Every visited node gets its type stored in analyzed_program::expression_types.
//

#include "semantic/checker.h"

namespace quasar::semantic::phases {

namespace {
    bool is_logical(ast::binary_op op) {
        return op == ast::binary_op::log_and || op == ast::binary_op::log_or;
    }

    bool is_equality(ast::binary_op op) {
        return op == ast::binary_op::eq || op == ast::binary_op::ne;
    }

    bool is_relational(ast::binary_op op) {
        return op == ast::binary_op::lt || op == ast::binary_op::gt ||
               op == ast::binary_op::le || op == ast::binary_op::ge;
    }

    // Operator names as they appear in arithmetic diagnostics
    const char* arithmetic_name(ast::binary_op op) {
        switch (op) {
            case ast::binary_op::add: return "ADD";
            case ast::binary_op::sub: return "SUB";
            case ast::binary_op::mul: return "MUL";
            case ast::binary_op::div: return "DIV";
            case ast::binary_op::mod: return "MOD";
            default: return "?";
        }
    }

    const char* relational_symbol(ast::binary_op op) {
        switch (op) {
            case ast::binary_op::lt: return "<";
            case ast::binary_op::gt: return ">";
            case ast::binary_op::le: return "<=";
            case ast::binary_op::ge: return ">=";
            default: return "?";
        }
    }

    bool is_literal_zero(const ast::expr& e) {
        if (auto* i = std::get_if<ast::literal_int>(&e.node)) {
            return i->value == 0;
        }
        if (auto* f = std::get_if<ast::literal_float>(&e.node)) {
            return f->value == 0.0;
        }
        return false;
    }
}

types::type checker::record(const ast::expr& e, types::type t) {
    out_.expression_types[&e] = t;
    return t;
}

types::type checker::check_expr(const ast::expr& e) {
    auto t = std::visit([this](const auto& node) -> types::type {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, ast::literal_int>) {
            return types::make_int();
        } else if constexpr (std::is_same_v<T, ast::literal_float>) {
            return types::make_float();
        } else if constexpr (std::is_same_v<T, ast::literal_string>) {
            return types::make_str();
        } else if constexpr (std::is_same_v<T, ast::literal_bool>) {
            return types::make_bool();
        } else if constexpr (std::is_same_v<T, ast::identifier>) {
            return check_identifier(node);
        } else if constexpr (std::is_same_v<T, ast::list_literal>) {
            return check_list(node);
        } else if constexpr (std::is_same_v<T, ast::dict_literal>) {
            return check_dict(node);
        } else if constexpr (std::is_same_v<T, ast::struct_init>) {
            return check_struct_init(node);
        } else if constexpr (std::is_same_v<T, ast::unary_expr>) {
            return check_unary(node);
        } else if constexpr (std::is_same_v<T, ast::binary_expr>) {
            return check_binary(node);
        } else if constexpr (std::is_same_v<T, ast::call_expr>) {
            return check_call(node);
        } else if constexpr (std::is_same_v<T, ast::index_expr>) {
            return check_index(node);
        } else if constexpr (std::is_same_v<T, ast::member_access_expr>) {
            return check_member(node);
        } else if constexpr (std::is_same_v<T, ast::method_call_expr>) {
            return check_method_call(node);
        } else {
            static_assert(std::is_same_v<T, ast::range_expr>, "unhandled expression kind");
            return check_range(node);
        }
    }, e.node);

    return record(e, std::move(t));
}

types::type checker::check_identifier(const ast::identifier& e) {
    const symbol* sym = symbols_.lookup(e.name);
    if (!sym) {
        fail(diag_codes::E_UNDECLARED, "use of undeclared identifier '" + e.name + "'", e.pos);
    }
    // resolved holds the return type for functions
    if (sym->is_function) {
        fail(diag_codes::E_TYPE_MISMATCH, "'" + e.name + "' is a function, not a value", e.pos);
    }
    return sym->resolved;
}

// ============================================================================
// Literals
// ============================================================================

types::type checker::check_list(const ast::list_literal& e) {
    if (e.elements.empty()) {
        return types::make_list(types::make_void());
    }

    auto first = check_expr(e.elements.front());
    for (size_t i = 1; i < e.elements.size(); ++i) {
        auto element = check_expr(e.elements[i]);
        if (!types::types_equal(element, first)) {
            fail(diag_codes::E_HETEROGENEOUS_LIST,
                 "heterogeneous list: element " + std::to_string(i) + " has type " + quoted(element)
                 + " but expected " + quoted(first),
                 ast::span_of(e.elements[i]));
        }
    }
    return types::make_list(std::move(first));
}

types::type checker::check_dict(const ast::dict_literal& e) {
    if (e.entries.empty()) {
        return types::make_dict(types::make_void(), types::make_void());
    }

    const auto& head = e.entries.front();
    auto key = check_expr(*head.key);
    if (!types::is_hashable(key)) {
        fail(diag_codes::E_UNHASHABLE_KEY,
             "dict key type must be hashable (int, float, bool or str), got " + quoted(key),
             ast::span_of(*head.key));
    }
    auto value = check_expr(*head.value);

    for (size_t i = 1; i < e.entries.size(); ++i) {
        const auto& entry = e.entries[i];

        auto k = check_expr(*entry.key);
        if (!types::types_equal(k, key)) {
            fail(diag_codes::E_HETEROGENEOUS_KEYS,
                 "heterogeneous dict keys: entry " + std::to_string(i) + " has key type " + quoted(k)
                 + " but expected " + quoted(key),
                 ast::span_of(*entry.key));
        }

        auto v = check_expr(*entry.value);
        if (!types::types_equal(v, value)) {
            fail(diag_codes::E_HETEROGENEOUS_VALUES,
                 "heterogeneous dict values: entry " + std::to_string(i) + " has value type " + quoted(v)
                 + " but expected " + quoted(value),
                 ast::span_of(*entry.value));
        }
    }

    return types::make_dict(std::move(key), std::move(value));
}

types::type checker::check_struct_init(const ast::struct_init& e) {
    const auto* info = out_.types.find_struct(e.name);
    if (!info) {
        fail(diag_codes::E_UNKNOWN_STRUCT, "struct '" + e.name + "' is not defined", e.pos);
    }

    std::set<std::string> provided;
    for (const auto& init : e.fields) {
        const auto* field = info->find_field(init.name);
        if (!field) {
            fail(diag_codes::E_UNKNOWN_FIELD_INIT,
                 "unknown field '" + init.name + "' in struct '" + e.name + "'", init.pos);
        }
        if (!provided.insert(init.name).second) {
            fail(diag_codes::E_DUPLICATE_FIELD,
                 "duplicate field '" + init.name + "' in struct '" + e.name + "'", init.pos);
        }

        auto actual = check_expr(*init.value);
        if (!types::is_assignable(field->field_type, actual)) {
            fail(diag_codes::E_FIELD_INIT_TYPE,
                 "field '" + init.name + "' expects type " + quoted(field->field_type) + ", got " + quoted(actual),
                 ast::span_of(*init.value));
        }
    }

    // Reported in name order
    std::set<std::string> missing;
    for (const auto& field : info->fields) {
        if (!provided.contains(field.name)) {
            missing.insert(field.name);
        }
    }
    if (!missing.empty()) {
        std::string names;
        for (const auto& name : missing) {
            if (!names.empty()) {
                names += ", ";
            }
            names += name;
        }
        fail(diag_codes::E_MISSING_FIELDS, "missing field(s) in struct '" + e.name + "': " + names, e.pos);
    }

    return types::make_struct(*info);
}

// ============================================================================
// Operators
// ============================================================================

types::type checker::check_unary(const ast::unary_expr& e) {
    auto operand = check_expr(*e.operand);
    if (types::is<types::any_type>(operand)) {
        return e.op == ast::unary_op::log_not ? types::make_bool() : operand;
    }

    if (e.op == ast::unary_op::log_not) {
        if (!types::is<types::bool_type>(operand)) {
            fail(diag_codes::E_LOGICAL_OPERANDS,
                 "logical NOT requires bool operand, got " + types::type_to_string(operand),
                 ast::span_of(*e.operand));
        }
        return types::make_bool();
    }

    if (!types::is_numeric(operand)) {
        fail(diag_codes::E_ARITHMETIC_OPERANDS,
             "negation requires numeric type, got " + types::type_to_string(operand),
             ast::span_of(*e.operand));
    }
    return operand;
}

types::type checker::check_binary(const ast::binary_expr& e) {
    auto left = check_expr(*e.left);
    auto right = check_expr(*e.right);
    const auto op = e.op;

    const bool left_any = types::is<types::any_type>(left);
    const bool right_any = types::is<types::any_type>(right);

    types::type result;

    if (is_logical(op)) {
        if (!left_any && !types::is<types::bool_type>(left)) {
            fail(diag_codes::E_LOGICAL_OPERANDS,
                 "logical operator requires bool operands, got " + types::type_to_string(left),
                 ast::span_of(*e.left));
        }
        if (!right_any && !types::is<types::bool_type>(right)) {
            fail(diag_codes::E_LOGICAL_OPERANDS,
                 "logical operator requires bool operands, got " + types::type_to_string(right),
                 ast::span_of(*e.right));
        }
        return types::make_bool();
    }

    if (left_any || right_any) {
        // Module members are unchecked; the known side decides the result
        if (is_equality(op) || is_relational(op)) {
            result = types::make_bool();
        } else {
            result = left_any ? right : left;
        }
    } else if (is_equality(op) || is_relational(op)) {
        const auto* left_enum = std::get_if<types::enum_type>(&left.node);
        const auto* right_enum = std::get_if<types::enum_type>(&right.node);

        if (left_enum || right_enum) {
            if (is_relational(op)) {
                const auto& name = left_enum ? left_enum->name : right_enum->name;
                fail(diag_codes::E_ENUM_ORDERING,
                     "enum '" + name + "' only supports '==' and '!=', not '" + relational_symbol(op) + "'",
                     e.pos);
            }
            if (!types::types_equal(left, right)) {
                fail(diag_codes::E_ENUM_EQUALITY,
                     "cannot compare " + quoted(left) + " with " + quoted(right), e.pos);
            }
            return types::make_bool();
        }

        if (is_equality(op)) {
            if (!types::types_equal(left, right)) {
                fail(diag_codes::E_ARITHMETIC_OPERANDS,
                     "cannot compare " + types::type_to_string(left) + " with " + types::type_to_string(right),
                     e.pos);
            }
            return types::make_bool();
        }

        if (types::is<types::str_type>(left) || types::is<types::str_type>(right)) {
            fail(diag_codes::E_STRING_COMPARISON,
                 "string comparison with '<', '>', '<=', '>=' is not supported", e.pos);
        }
        if (!types::types_equal(left, right)) {
            fail(diag_codes::E_ARITHMETIC_OPERANDS,
                 "cannot compare " + types::type_to_string(left) + " with " + types::type_to_string(right),
                 e.pos);
        }
        if (!types::is_numeric(left)) {
            fail(diag_codes::E_ARITHMETIC_OPERANDS,
                 "comparison requires numeric types, got " + types::type_to_string(left), e.pos);
        }
        return types::make_bool();
    } else {
        const bool left_str = types::is<types::str_type>(left);
        const bool right_str = types::is<types::str_type>(right);

        if (left_str && right_str) {
            if (op != ast::binary_op::add) {
                fail(diag_codes::E_ARITHMETIC_OPERANDS,
                     std::string("operator '") + arithmetic_name(op) + "' not supported for strings", e.pos);
            }
            return types::make_str();
        }
        if (left_str || right_str) {
            fail(diag_codes::E_ARITHMETIC_OPERANDS,
                 "cannot perform arithmetic between " + types::type_to_string(left) + " and "
                 + types::type_to_string(right),
                 e.pos);
        }
        if (!types::types_equal(left, right)) {
            fail(diag_codes::E_ARITHMETIC_OPERANDS,
                 "cannot mix " + types::type_to_string(left) + " and " + types::type_to_string(right)
                 + " in arithmetic",
                 e.pos);
        }
        if (types::is<types::bool_type>(left)) {
            fail(diag_codes::E_ARITHMETIC_OPERANDS, "arithmetic operators not supported for bool", e.pos);
        }
        if (!types::is_numeric(left)) {
            fail(diag_codes::E_ARITHMETIC_OPERANDS,
                 "arithmetic requires numeric operands, got " + types::type_to_string(left), e.pos);
        }
        result = left;
    }

    if ((op == ast::binary_op::div || op == ast::binary_op::mod) && is_literal_zero(*e.right)) {
        fail(diag_codes::E_DIVISION_BY_ZERO, "division by zero", ast::span_of(*e.right));
    }

    return result;
}

types::type checker::check_range(const ast::range_expr& e) {
    auto start = check_expr(*e.start);
    if (!types::is<types::int_type>(start) && !types::is<types::any_type>(start)) {
        fail(diag_codes::E_RANGE_BOUNDS,
             "range start must be int, got " + types::type_to_string(start), ast::span_of(*e.start));
    }

    auto end = check_expr(*e.end);
    if (!types::is<types::int_type>(end) && !types::is<types::any_type>(end)) {
        fail(diag_codes::E_RANGE_BOUNDS,
             "range end must be int, got " + types::type_to_string(end), ast::span_of(*e.end));
    }

    return types::make_list(types::make_int());
}

// ============================================================================
// Index and member access
// ============================================================================

types::type checker::check_index(const ast::index_expr& e) {
    auto target = check_expr(*e.target);

    if (types::is<types::list_type>(target)) {
        auto index = check_expr(*e.index);
        if (!types::is<types::int_type>(index) && !types::is<types::any_type>(index)) {
            fail(diag_codes::E_INDEX_NOT_INT,
                 "list index must be 'int', got " + quoted(index), ast::span_of(*e.index));
        }
        return types::element_of(target);
    }

    if (types::is<types::dict_type>(target)) {
        const auto& key_type = types::key_of(target);
        auto key = check_expr(*e.index);
        if (!types::is_assignable(key_type, key)) {
            fail(diag_codes::E_DICT_KEY_TYPE,
                 "dict key type mismatch: expected " + quoted(key_type) + ", got " + quoted(key),
                 ast::span_of(*e.index));
        }
        return types::value_of(target);
    }

    if (types::is<types::any_type>(target)) {
        check_expr(*e.index);
        return types::make_any();
    }

    fail(diag_codes::E_NOT_INDEXABLE,
         "cannot index into non-list type " + quoted(target), ast::span_of(*e.target));
}

const types::enum_info* checker::enum_receiver(const ast::expr& e) const {
    auto* name = std::get_if<ast::identifier>(&e.node);
    if (!name || symbols_.lookup(name->name)) {
        return nullptr;
    }
    return out_.types.find_enum(name->name);
}

types::type checker::check_member(const ast::member_access_expr& e) {
    // Color.Red
    if (const auto* info = enum_receiver(*e.object)) {
        auto enum_type = record(*e.object, types::make_enum(*info));
        if (!info->has_variant(e.member)) {
            fail(diag_codes::E_UNKNOWN_VARIANT,
                 "enum '" + info->name + "' has no variant '" + e.member + "'", e.pos);
        }
        return enum_type;
    }

    auto object = check_expr(*e.object);

    if (types::is<types::any_type>(object)) {
        return types::make_any();
    }

    const auto* st = std::get_if<types::struct_type>(&object.node);
    if (!st) {
        fail(diag_codes::E_MEMBER_OF_NON_STRUCT,
             "cannot access field of non-struct type " + quoted(object), ast::span_of(*e.object));
    }

    const auto* info = st->info ? st->info : out_.types.find_struct(st->name);
    const auto* field = info ? info->find_field(e.member) : nullptr;
    if (!field) {
        fail(diag_codes::E_NO_SUCH_FIELD,
             "struct '" + st->name + "' has no field '" + e.member + "'", e.pos);
    }
    return field->field_type;
}

} // namespace quasar::semantic::phases
