//
// Declarations: bindings, functions, structs, enums, imports
//

#include <filesystem>

#include "semantic/builtins.h"
#include "semantic/checker.h"

namespace quasar::semantic::phases {

std::string quoted(const types::type& t) {
    return "'" + types::type_to_string(t) + "'";
}

checker::checker(const analysis_options& opts, analyzed_program& out)
    : opts_(opts),
      out_(out) {
}

void checker::run(const ast::program& prog) {
    for (const auto& decl : prog.declarations) {
        check_declaration(decl);
    }
    out_.globals = symbols_.globals();
}

void checker::fail(const char* code, const std::string& message, const ast::span& where) const {
    throw semantic_failure{diagnostic{
        diagnostic_level::error,
        code,
        message,
        where,
        std::nullopt,
        std::nullopt
    }};
}

// Only names with a static method table can be reserved
bool checker::is_reserved(const std::string& name) const {
    return opts_.reserved_namespaces.contains(name) && builtins::is_static_namespace(name);
}

void checker::ensure_not_reserved(const std::string& name, const ast::span& where) const {
    if (is_reserved(name)) {
        fail(diag_codes::E_RESERVED_NAME, "cannot shadow builtin module '" + name + "'", where);
    }
}

void checker::define(symbol sym, const ast::span& where) {
    const std::string name = sym.name;
    if (!symbols_.define(std::move(sym))) {
        fail(diag_codes::E_REDECLARATION, "redeclaration of '" + name + "' in the same scope", where);
    }
}

// ============================================================================
// Type annotations
// ============================================================================

types::type checker::resolve(const ast::type_annotation& annotation, bool allow_void) {
    if (auto* prim = std::get_if<ast::primitive_annotation>(&annotation.node)) {
        switch (prim->name) {
            case ast::primitive_name::int_: return types::make_int();
            case ast::primitive_name::float_: return types::make_float();
            case ast::primitive_name::bool_: return types::make_bool();
            case ast::primitive_name::str: return types::make_str();
        }
    }

    if (auto* list = std::get_if<ast::list_annotation>(&annotation.node)) {
        return types::make_list(resolve(*list->element));
    }

    if (auto* dict = std::get_if<ast::dict_annotation>(&annotation.node)) {
        auto key = resolve(*dict->key);
        if (!types::is_hashable(key)) {
            fail(diag_codes::E_UNHASHABLE_KEY,
                 "dict key type must be hashable (int, float, bool or str), got " + quoted(key),
                 ast::span_of(*dict->key));
        }
        return types::make_dict(std::move(key), resolve(*dict->value));
    }

    const auto& named = std::get<ast::named_annotation>(annotation.node);
    if (named.name == "void") {
        if (!allow_void) {
            fail(diag_codes::E_TYPE_MISMATCH, "'void' is only valid as a function return type", named.pos);
        }
        return types::make_void();
    }
    if (const auto* info = out_.types.find_struct(named.name)) {
        return types::make_struct(*info);
    }
    if (const auto* info = out_.types.find_enum(named.name)) {
        return types::make_enum(*info);
    }
    fail(diag_codes::E_UNKNOWN_STRUCT, "struct '" + named.name + "' is not defined", named.pos);
}

// ============================================================================
// Declarations
// ============================================================================

void checker::check_declaration(const ast::declaration& decl) {
    std::visit([this](const auto& node) {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, ast::var_decl>) {
            check_var(node);
        } else if constexpr (std::is_same_v<T, ast::const_decl>) {
            check_const(node);
        } else if constexpr (std::is_same_v<T, ast::fn_decl>) {
            check_fn(node);
        } else if constexpr (std::is_same_v<T, ast::struct_decl>) {
            check_struct(node);
        } else if constexpr (std::is_same_v<T, ast::enum_decl>) {
            check_enum(node);
        } else if constexpr (std::is_same_v<T, ast::import_decl>) {
            check_import(node);
        } else {
            check_statement(node);
        }
    }, decl.node);
}

void checker::check_var(const ast::var_decl& decl) {
    check_binding(decl.name, decl.annotation, decl.initializer, false, decl.pos);
}

void checker::check_const(const ast::const_decl& decl) {
    check_binding(decl.name, decl.annotation, decl.initializer, true, decl.pos);
}

// let / const: the initializer must match the annotation exactly
void checker::check_binding(const std::string& name, const ast::type_annotation& annotation,
                            const ast::expr& initializer, bool is_const, const ast::span& where) {
    ensure_not_reserved(name, where);

    auto declared = resolve(annotation);
    auto actual = check_expr(initializer);

    if (!types::is_assignable(declared, actual)) {
        fail(diag_codes::E_TYPE_MISMATCH,
             "type mismatch: expected " + types::type_to_string(declared) + ", got " + types::type_to_string(actual),
             ast::span_of(initializer));
    }

    symbol sym;
    sym.name = name;
    sym.resolved = std::move(declared);
    sym.is_const = is_const;
    sym.declared_at = where;
    define(std::move(sym), where);
}

void checker::check_fn(const ast::fn_decl& decl) {
    ensure_not_reserved(decl.name, decl.pos);

    auto return_type = resolve(decl.return_type, true);

    std::vector<types::type> param_types;
    param_types.reserve(decl.params.size());
    for (const auto& p : decl.params) {
        ensure_not_reserved(p.name, p.pos);
        param_types.push_back(resolve(p.annotation));
    }

    // The name goes into the enclosing scope first so the body can recurse
    symbol fn;
    fn.name = decl.name;
    fn.resolved = return_type;
    fn.is_const = true;
    fn.is_function = true;
    fn.params = param_types;
    fn.declared_at = decl.pos;
    define(std::move(fn), decl.pos);

    auto saved_return = return_type_;
    auto saved_loop_depth = loop_depth_;
    return_type_ = return_type;
    loop_depth_ = 0;

    {
        // One scope for the parameters and the body's own declarations
        auto guard = symbols_.scoped();

        for (size_t i = 0; i < decl.params.size(); ++i) {
            const auto& p = decl.params[i];
            symbol param;
            param.name = p.name;
            param.resolved = param_types[i];
            param.declared_at = p.pos;
            if (!symbols_.define(std::move(param))) {
                fail(diag_codes::E_REDECLARATION, "redeclaration of parameter '" + p.name + "'", p.pos);
            }
        }

        check_block_contents(decl.body);
    }

    return_type_ = std::move(saved_return);
    loop_depth_ = saved_loop_depth;

    if (!types::is<types::void_type>(return_type) && !definitely_returns(decl.body)) {
        fail(diag_codes::E_MISSING_RETURN,
             "function '" + decl.name + "' may not return a value on all paths", decl.pos);
    }
}

void checker::check_struct(const ast::struct_decl& decl) {
    ensure_not_reserved(decl.name, decl.pos);

    if (out_.types.find_struct(decl.name)) {
        fail(diag_codes::E_STRUCT_REDEFINITION, "redefinition of struct '" + decl.name + "'", decl.pos);
    }
    if (out_.types.find_enum(decl.name)) {
        fail(diag_codes::E_TYPE_REDECLARATION,
             "type '" + decl.name + "' is already declared as an enum", decl.pos);
    }

    auto info = std::make_unique<types::struct_info>();
    info->name = decl.name;

    for (const auto& field : decl.fields) {
        if (info->find_field(field.name)) {
            fail(diag_codes::E_DUPLICATE_FIELD,
                 "duplicate field '" + field.name + "' in struct '" + decl.name + "'", field.pos);
        }
        info->fields.push_back(types::field_info{field.name, resolve(field.annotation)});
    }

    out_.types.structs.emplace(decl.name, std::move(info));
}

void checker::check_enum(const ast::enum_decl& decl) {
    ensure_not_reserved(decl.name, decl.pos);

    if (out_.types.find_enum(decl.name) || out_.types.find_struct(decl.name)) {
        fail(diag_codes::E_TYPE_REDECLARATION, "redeclaration of type '" + decl.name + "'", decl.pos);
    }

    auto info = std::make_unique<types::enum_info>();
    info->name = decl.name;

    for (const auto& variant : decl.variants) {
        if (info->has_variant(variant.name)) {
            fail(diag_codes::E_DUPLICATE_VARIANT,
                 "duplicate variant '" + variant.name + "' in enum '" + decl.name + "'", variant.pos);
        }
        info->variants.push_back(variant.name);
    }

    out_.types.enums.emplace(decl.name, std::move(info));
}

void checker::check_import(const ast::import_decl& decl) {
    const std::string binding = ast::import_binding_name(decl);
    ensure_not_reserved(binding, decl.pos);

    if (imported_.contains(binding)) {
        fail(diag_codes::E_DUPLICATE_IMPORT, "duplicate import of module '" + binding + "'", decl.pos);
    }

    if (decl.is_local) {
        const auto path = opts_.base_dir / decl.module;
        const bool found = opts_.module_exists ? opts_.module_exists(path) : std::filesystem::exists(path);
        if (!found) {
            fail(diag_codes::E_MODULE_NOT_FOUND, "module not found: '" + decl.module + "'", decl.pos);
        }
    }

    imported_.insert(binding);

    symbol module;
    module.name = binding;
    module.resolved = types::make_any();
    module.is_const = true;
    module.declared_at = decl.pos;
    define(std::move(module), decl.pos);
}

} // namespace quasar::semantic::phases
