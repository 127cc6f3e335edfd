//
// Statements: control flow, assignments, print
//

#include "semantic/checker.h"

namespace quasar::semantic::phases {

namespace {
    // Occurrences of "{}" once escaped braces are dropped
    std::size_t count_placeholders(std::string text) {
        for (const char* escaped : {"{{", "}}"}) {
            std::string::size_type at = 0;
            while ((at = text.find(escaped, at)) != std::string::npos) {
                text.erase(at, 2);
            }
        }

        std::size_t count = 0;
        std::string::size_type at = 0;
        while ((at = text.find("{}", at)) != std::string::npos) {
            ++count;
            at += 2;
        }
        return count;
    }
}

void checker::check_statement(const ast::statement& stmt) {
    std::visit([this](const auto& node) {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, ast::block>) {
            check_block(node);
        } else if constexpr (std::is_same_v<T, ast::expression_statement>) {
            check_expr(node.expression);
        } else if constexpr (std::is_same_v<T, ast::if_statement>) {
            check_if(node);
        } else if constexpr (std::is_same_v<T, ast::while_statement>) {
            check_while(node);
        } else if constexpr (std::is_same_v<T, ast::for_statement>) {
            check_for(node);
        } else if constexpr (std::is_same_v<T, ast::return_statement>) {
            check_return(node);
        } else if constexpr (std::is_same_v<T, ast::break_statement>) {
            if (loop_depth_ == 0) {
                fail(diag_codes::E_BREAK_OUTSIDE_LOOP, "'break' outside of loop", node.pos);
            }
        } else if constexpr (std::is_same_v<T, ast::continue_statement>) {
            if (loop_depth_ == 0) {
                fail(diag_codes::E_CONTINUE_OUTSIDE_LOOP, "'continue' outside of loop", node.pos);
            }
        } else if constexpr (std::is_same_v<T, ast::assign_statement>) {
            check_assign(node);
        } else if constexpr (std::is_same_v<T, ast::index_assign_statement>) {
            check_index_assign(node);
        } else if constexpr (std::is_same_v<T, ast::member_assign_statement>) {
            check_member_assign(node);
        } else if constexpr (std::is_same_v<T, ast::print_statement>) {
            check_print(node);
        }
    }, stmt.node);
}

void checker::check_block(const ast::block& body) {
    auto guard = symbols_.scoped();
    check_block_contents(body);
}

void checker::check_block_contents(const ast::block& body) {
    for (const auto& decl : body.declarations) {
        check_declaration(decl);
    }
}

void checker::check_condition(const ast::expr& condition) {
    auto t = check_expr(condition);
    if (!types::is<types::bool_type>(t) && !types::is<types::any_type>(t)) {
        fail(diag_codes::E_CONDITION_NOT_BOOL,
             "condition must be bool, got " + types::type_to_string(t),
             ast::span_of(condition));
    }
}

// ============================================================================
// Control flow
// ============================================================================

void checker::check_if(const ast::if_statement& stmt) {
    check_condition(stmt.condition);
    check_block(stmt.then_block);
    if (stmt.else_block) {
        check_block(*stmt.else_block);
    }
}

void checker::check_while(const ast::while_statement& stmt) {
    check_condition(stmt.condition);

    ++loop_depth_;
    check_block(stmt.body);
    --loop_depth_;
}

void checker::check_for(const ast::for_statement& stmt) {
    // A range is typed [int], so both forms go through the list rule
    types::type variable_type;
    auto iterable = check_expr(stmt.iterable);
    if (types::is<types::list_type>(iterable)) {
        variable_type = types::element_of(iterable);
    } else if (types::is<types::any_type>(iterable)) {
        variable_type = types::make_any();
    } else {
        fail(diag_codes::E_NOT_ITERABLE,
             "cannot iterate over " + types::type_to_string(iterable),
             ast::span_of(stmt.iterable));
    }

    ++loop_depth_;
    {
        // The loop variable lives in the body's scope
        auto guard = symbols_.scoped();

        ensure_not_reserved(stmt.variable, stmt.variable_pos);

        symbol variable;
        variable.name = stmt.variable;
        variable.resolved = std::move(variable_type);
        variable.declared_at = stmt.variable_pos;
        define(std::move(variable), stmt.variable_pos);

        check_block_contents(stmt.body);
    }
    --loop_depth_;
}

void checker::check_return(const ast::return_statement& stmt) {
    if (!return_type_) {
        fail(diag_codes::E_RETURN_OUTSIDE_FUNCTION, "'return' outside of function", stmt.pos);
    }

    const auto& expected = *return_type_;
    const bool void_function = types::is<types::void_type>(expected);

    if (!stmt.value) {
        if (!void_function) {
            fail(diag_codes::E_RETURN_MISMATCH,
                 "return type mismatch: expected " + types::type_to_string(expected) + ", got void",
                 stmt.pos);
        }
        return;
    }

    auto actual = check_expr(*stmt.value);
    if (void_function || !types::is_assignable(expected, actual)) {
        fail(diag_codes::E_RETURN_MISMATCH,
             "return type mismatch: expected " + types::type_to_string(expected) + ", got " + types::type_to_string(actual),
             ast::span_of(*stmt.value));
    }
}

// ============================================================================
// Assignments
// ============================================================================

void checker::check_assign(const ast::assign_statement& stmt) {
    const symbol* target = symbols_.lookup(stmt.target);
    if (!target) {
        fail(diag_codes::E_UNDECLARED, "use of undeclared identifier '" + stmt.target + "'", stmt.target_pos);
    }
    if (target->is_const) {
        fail(diag_codes::E_CONST_ASSIGN, "cannot assign to constant '" + stmt.target + "'", stmt.target_pos);
    }

    const types::type expected = target->resolved;
    auto actual = check_expr(stmt.value);
    if (!types::is_assignable(expected, actual)) {
        fail(diag_codes::E_TYPE_MISMATCH,
             "type mismatch: expected " + types::type_to_string(expected) + ", got " + types::type_to_string(actual),
             ast::span_of(stmt.value));
    }
}

void checker::check_index_assign(const ast::index_assign_statement& stmt) {
    auto target = check_expr(stmt.target);

    if (types::is<types::list_type>(target)) {
        auto index = check_expr(stmt.index);
        if (!types::is<types::int_type>(index) && !types::is<types::any_type>(index)) {
            fail(diag_codes::E_INDEX_NOT_INT,
                 "list index must be 'int', got " + quoted(index),
                 ast::span_of(stmt.index));
        }

        const auto& element = types::element_of(target);
        auto value = check_expr(stmt.value);
        if (!types::is_assignable(element, value)) {
            fail(diag_codes::E_ELEMENT_ASSIGN,
                 "cannot assign " + quoted(value) + " to list element of type " + quoted(element),
                 ast::span_of(stmt.value));
        }
        return;
    }

    if (types::is<types::dict_type>(target)) {
        const auto& key_type = types::key_of(target);
        auto key = check_expr(stmt.index);
        if (!types::is_assignable(key_type, key)) {
            fail(diag_codes::E_DICT_KEY_TYPE,
                 "dict key type mismatch: expected " + quoted(key_type) + ", got " + quoted(key),
                 ast::span_of(stmt.index));
        }

        const auto& value_type = types::value_of(target);
        auto value = check_expr(stmt.value);
        if (!types::is_assignable(value_type, value)) {
            fail(diag_codes::E_DICT_VALUE_TYPE,
                 "dict value type mismatch: expected " + quoted(value_type) + ", got " + quoted(value),
                 ast::span_of(stmt.value));
        }
        return;
    }

    if (types::is<types::any_type>(target)) {
        check_expr(stmt.index);
        check_expr(stmt.value);
        return;
    }

    fail(diag_codes::E_NOT_INDEXABLE,
         "cannot index into non-list type " + quoted(target),
         ast::span_of(stmt.target));
}

void checker::check_member_assign(const ast::member_assign_statement& stmt) {
    auto object = check_expr(stmt.object);

    if (types::is<types::any_type>(object)) {
        check_expr(stmt.value);
        return;
    }

    const auto* st = std::get_if<types::struct_type>(&object.node);
    if (!st) {
        fail(diag_codes::E_MEMBER_OF_NON_STRUCT,
             "cannot access field of non-struct type " + quoted(object),
             ast::span_of(stmt.object));
    }

    const auto* info = st->info ? st->info : out_.types.find_struct(st->name);
    const auto* field = info ? info->find_field(stmt.member) : nullptr;
    if (!field) {
        fail(diag_codes::E_NO_SUCH_FIELD,
             "struct '" + st->name + "' has no field '" + stmt.member + "'",
             stmt.pos);
    }

    auto value = check_expr(stmt.value);
    if (!types::is_assignable(field->field_type, value)) {
        fail(diag_codes::E_FIELD_ASSIGN_TYPE,
             "cannot assign " + quoted(value) + " to field '" + stmt.member + "' of type " + quoted(field->field_type),
             ast::span_of(stmt.value));
    }
}

// ============================================================================
// print
// ============================================================================

void checker::check_print(const ast::print_statement& stmt) {
    for (const auto& argument : stmt.arguments) {
        check_expr(argument);
    }

    if (stmt.arguments.size() > 1) {
        if (auto* format = std::get_if<ast::literal_string>(&stmt.arguments.front().node)) {
            const auto placeholders = count_placeholders(format->value);
            const auto provided = stmt.arguments.size() - 1;

            if (placeholders > 0 && placeholders > provided) {
                fail(diag_codes::E_FORMAT_TOO_MANY,
                     "format string has " + std::to_string(placeholders) + " placeholder(s) but only "
                     + std::to_string(provided) + " argument(s) provided",
                     format->pos);
            }
            if (placeholders > 0 && placeholders < provided) {
                fail(diag_codes::E_FORMAT_TOO_FEW,
                     "format string has " + std::to_string(placeholders) + " placeholder(s) but "
                     + std::to_string(provided) + " argument(s) provided",
                     format->pos);
            }
        }
    }

    if (stmt.sep) {
        auto t = check_expr(*stmt.sep);
        if (!types::is<types::str_type>(t)) {
            fail(diag_codes::E_PRINT_SEP,
                 "'sep' parameter must be type 'str', got " + quoted(t),
                 ast::span_of(*stmt.sep));
        }
    }

    if (stmt.end) {
        auto t = check_expr(*stmt.end);
        if (!types::is<types::str_type>(t)) {
            fail(diag_codes::E_PRINT_END,
                 "'end' parameter must be type 'str', got " + quoted(t),
                 ast::span_of(*stmt.end));
        }
    }
}

} // namespace quasar::semantic::phases
