//
// Calls: builtin functions, user functions, methods, File/Env namespaces
//

#include "semantic/builtins.h"
#include "semantic/checker.h"

namespace quasar::semantic::phases {

namespace {
    std::string given(const ast::call_expr& e) {
        return "(" + std::to_string(e.arguments.size()) + " given)";
    }

    bool is_any(const types::type& t) {
        return types::is<types::any_type>(t);
    }
}

types::type checker::check_call(const ast::call_expr& e) {
    // Builtins are resolved before user symbols
    if (e.callee == "len") {
        return check_len(e);
    }
    if (e.callee == "push") {
        return check_push(e);
    }
    if (e.callee == "input") {
        return check_input(e);
    }
    if (e.callee == "int" || e.callee == "float" || e.callee == "str" || e.callee == "bool") {
        return check_cast(e);
    }
    if (e.callee == "keys") {
        return check_dict_view(e, diag_codes::E_KEYS_ARGS, true);
    }
    if (e.callee == "values") {
        return check_dict_view(e, diag_codes::E_VALUES_ARGS, false);
    }
    return check_user_call(e);
}

// ============================================================================
// Builtin functions
// ============================================================================

types::type checker::check_len(const ast::call_expr& e) {
    if (e.arguments.size() != 1) {
        fail(diag_codes::E_LEN_ARGS, "len() takes exactly 1 argument " + given(e), e.pos);
    }

    const auto& arg = e.arguments.front();
    auto t = check_expr(arg);
    if (!types::is<types::list_type>(t) && !types::is<types::dict_type>(t) &&
        !types::is<types::str_type>(t) && !is_any(t)) {
        fail(diag_codes::E_LEN_ARGS,
             "len() argument must be a list, dict or str, got " + quoted(t), ast::span_of(arg));
    }
    return types::make_int();
}

types::type checker::check_push(const ast::call_expr& e) {
    if (e.arguments.size() != 2) {
        fail(diag_codes::E_PUSH_ARGS, "push() takes exactly 2 arguments " + given(e), e.pos);
    }

    auto list = check_expr(e.arguments[0]);
    if (is_any(list)) {
        check_expr(e.arguments[1]);
        return types::make_void();
    }
    if (!types::is<types::list_type>(list)) {
        fail(diag_codes::E_PUSH_ARGS,
             "push() first argument must be a list, got " + quoted(list), ast::span_of(e.arguments[0]));
    }

    const auto& element = types::element_of(list);
    auto value = check_expr(e.arguments[1]);
    if (!types::is_assignable(element, value)) {
        fail(diag_codes::E_PUSH_ARGS,
             "push() cannot add " + quoted(value) + " to list of " + quoted(element),
             ast::span_of(e.arguments[1]));
    }
    return types::make_void();
}

types::type checker::check_input(const ast::call_expr& e) {
    if (e.arguments.size() > 1) {
        fail(diag_codes::E_INPUT_ARGS, "input() takes at most 1 argument " + given(e), e.pos);
    }

    if (!e.arguments.empty()) {
        const auto& prompt = e.arguments.front();
        auto t = check_expr(prompt);
        if (!types::is<types::str_type>(t) && !is_any(t)) {
            fail(diag_codes::E_INPUT_PROMPT, "input() prompt must be str, got " + quoted(t), ast::span_of(prompt));
        }
    }
    return types::make_str();
}

types::type checker::check_cast(const ast::call_expr& e) {
    if (e.arguments.size() != 1) {
        fail(diag_codes::E_CAST_ARGS, e.callee + "() requires exactly 1 argument " + given(e), e.pos);
    }

    // Any source type is accepted; conversion failures are a runtime matter
    check_expr(e.arguments.front());

    if (e.callee == "int") {
        return types::make_int();
    }
    if (e.callee == "float") {
        return types::make_float();
    }
    if (e.callee == "str") {
        return types::make_str();
    }
    return types::make_bool();
}

// keys(d) / values(d)
types::type checker::check_dict_view(const ast::call_expr& e, const char* code, bool keys) {
    if (e.arguments.size() != 1) {
        fail(code, e.callee + "() takes exactly 1 argument " + given(e), e.pos);
    }

    const auto& arg = e.arguments.front();
    auto t = check_expr(arg);
    if (is_any(t)) {
        return types::make_list(types::make_any());
    }
    if (!types::is<types::dict_type>(t)) {
        fail(code, e.callee + "() argument must be a dict, got " + quoted(t), ast::span_of(arg));
    }
    return types::make_list(keys ? types::key_of(t) : types::value_of(t));
}

// ============================================================================
// User functions
// ============================================================================

types::type checker::check_user_call(const ast::call_expr& e) {
    const symbol* sym = symbols_.lookup(e.callee);
    if (!sym) {
        fail(diag_codes::E_UNDECLARED, "use of undeclared function '" + e.callee + "'", e.pos);
    }
    if (!sym->is_function) {
        fail(diag_codes::E_TYPE_MISMATCH, "'" + e.callee + "' is not a function", e.callee_pos);
    }

    const auto params = sym->params;
    const auto result = sym->resolved;

    if (e.arguments.size() != params.size()) {
        fail(diag_codes::E_TYPE_MISMATCH,
             "function '" + e.callee + "' expects " + std::to_string(params.size()) + " argument(s), got "
             + std::to_string(e.arguments.size()),
             e.pos);
    }

    for (size_t i = 0; i < params.size(); ++i) {
        auto actual = check_expr(e.arguments[i]);
        if (!types::is_assignable(params[i], actual)) {
            fail(diag_codes::E_TYPE_MISMATCH,
                 "argument " + std::to_string(i + 1) + " of '" + e.callee + "': type mismatch: expected "
                 + types::type_to_string(params[i]) + ", got " + types::type_to_string(actual),
                 ast::span_of(e.arguments[i]));
        }
    }

    return result;
}

// ============================================================================
// Methods
// ============================================================================

std::optional<std::string> checker::static_receiver(const ast::expr& e) const {
    auto* name = std::get_if<ast::identifier>(&e.node);
    if (!name || !is_reserved(name->name)) {
        return std::nullopt;
    }
    return name->name;
}

types::type checker::check_method_call(const ast::method_call_expr& e) {
    if (auto ns = static_receiver(*e.object)) {
        return check_static_call(e, *ns);
    }

    auto receiver = check_expr(*e.object);

    // Module members and values derived from them are not checked
    if (is_any(receiver)) {
        for (const auto& arg : e.arguments) {
            check_expr(arg);
        }
        return types::make_any();
    }

    const auto* method = builtins::find_method(receiver, e.method);
    if (!method) {
        if (builtins::methods_of(receiver).empty()) {
            fail(diag_codes::E_UNKNOWN_METHOD, "type " + quoted(receiver) + " has no methods", e.pos);
        }
        fail(diag_codes::E_UNKNOWN_METHOD,
             "type " + quoted(receiver) + " has no method '" + e.method + "'", e.pos);
    }

    if (e.method == "join" && types::is<types::list_type>(receiver) &&
        !types::is<types::str_type>(types::element_of(receiver))) {
        fail(diag_codes::E_JOIN_NOT_STR_LIST, "join() only works on [str], got " + quoted(receiver), e.pos);
    }

    if (e.arguments.size() != method->params.size()) {
        fail(diag_codes::E_METHOD_ARG_COUNT,
             "method '" + e.method + "' expects " + std::to_string(method->params.size())
             + " argument(s), got " + std::to_string(e.arguments.size()),
             e.pos);
    }

    for (size_t i = 0; i < method->params.size(); ++i) {
        const auto slot = method->params[i];
        auto expected = builtins::instantiate(slot, receiver);
        auto actual = check_expr(e.arguments[i]);
        if (types::is_assignable(expected, actual)) {
            continue;
        }

        if (builtins::is_generic(slot)) {
            fail(diag_codes::E_METHOD_GENERIC_ARG,
                 "method '" + e.method + "' expects " + builtins::generic_role(slot) + " type " + quoted(expected)
                 + ", got " + quoted(actual),
                 ast::span_of(e.arguments[i]));
        }
        fail(diag_codes::E_METHOD_ARG_TYPE,
             "method '" + e.method + "' expects " + quoted(expected) + ", got " + quoted(actual),
             ast::span_of(e.arguments[i]));
    }

    return builtins::instantiate(method->result, receiver);
}

// File.exists(path), Env.get(name, default), ...
types::type checker::check_static_call(const ast::method_call_expr& e, const std::string& ns) {
    const auto* method = builtins::find_static(ns, e.method);
    if (!method) {
        fail(diag_codes::E_UNKNOWN_METHOD, "module '" + ns + "' has no method '" + e.method + "'", e.pos);
    }

    if (e.arguments.size() != method->params.size()) {
        fail(diag_codes::E_METHOD_ARG_COUNT,
             "method '" + e.method + "' expects " + std::to_string(method->params.size())
             + " argument(s), got " + std::to_string(e.arguments.size()),
             e.pos);
    }

    const types::type no_receiver;
    for (size_t i = 0; i < method->params.size(); ++i) {
        auto expected = builtins::instantiate(method->params[i], no_receiver);
        auto actual = check_expr(e.arguments[i]);
        if (!types::is_assignable(expected, actual)) {
            fail(diag_codes::E_METHOD_ARG_TYPE,
                 "method '" + e.method + "' expects " + quoted(expected) + ", got " + quoted(actual),
                 ast::span_of(e.arguments[i]));
        }
    }

    return builtins::instantiate(method->result, no_receiver);
}

} // namespace quasar::semantic::phases
