//
// Created by igor on 03/12/2025.
//

#include <quasar/types.hh>

#include <algorithm>

namespace quasar::types {
    namespace {
        const type& error_singleton() {
            static const type t{error_type{}};
            return t;
        }
    }

    const field_info* struct_info::find_field(const std::string& field) const {
        for (const auto& f : fields) {
            if (f.name == field) {
                return &f;
            }
        }
        return nullptr;
    }

    bool enum_info::has_variant(const std::string& variant) const {
        return std::find(variants.begin(), variants.end(), variant) != variants.end();
    }

    type make_error() { return type{error_type{}}; }
    type make_int() { return type{int_type{}}; }
    type make_float() { return type{float_type{}}; }
    type make_bool() { return type{bool_type{}}; }
    type make_str() { return type{str_type{}}; }
    type make_void() { return type{void_type{}}; }
    type make_any() { return type{any_type{}}; }

    type make_list(type element) {
        return type{list_type{std::make_shared<const type>(std::move(element))}};
    }

    type make_dict(type key, type value) {
        return type{dict_type{
            std::make_shared<const type>(std::move(key)),
            std::make_shared<const type>(std::move(value))
        }};
    }

    type make_struct(const struct_info& info) {
        return type{struct_type{info.name, &info}};
    }

    type make_enum(const enum_info& info) {
        return type{enum_type{info.name, &info}};
    }

    const type& element_of(const type& t) {
        if (auto* list = std::get_if<list_type>(&t.node)) {
            return *list->element;
        }
        return error_singleton();
    }

    const type& key_of(const type& t) {
        if (auto* dict = std::get_if<dict_type>(&t.node)) {
            return *dict->key;
        }
        return error_singleton();
    }

    const type& value_of(const type& t) {
        if (auto* dict = std::get_if<dict_type>(&t.node)) {
            return *dict->value;
        }
        return error_singleton();
    }

    bool types_equal(const type& a, const type& b) {
        if (a.node.index() != b.node.index()) {
            return false;
        }

        if (auto* la = std::get_if<list_type>(&a.node)) {
            const auto& lb = std::get<list_type>(b.node);
            return types_equal(*la->element, *lb.element);
        }
        if (auto* da = std::get_if<dict_type>(&a.node)) {
            const auto& db = std::get<dict_type>(b.node);
            return types_equal(*da->key, *db.key) && types_equal(*da->value, *db.value);
        }
        if (auto* sa = std::get_if<struct_type>(&a.node)) {
            return sa->name == std::get<struct_type>(b.node).name;
        }
        if (auto* ea = std::get_if<enum_type>(&a.node)) {
            return ea->name == std::get<enum_type>(b.node).name;
        }

        // Remaining alternatives carry no data
        return true;
    }

    bool operator==(const type& a, const type& b) {
        return types_equal(a, b);
    }

    bool is_hashable(const type& t) {
        return is<int_type>(t) || is<float_type>(t) || is<bool_type>(t) || is<str_type>(t);
    }

    bool is_numeric(const type& t) {
        return is<int_type>(t) || is<float_type>(t);
    }

    bool is_assignable(const type& target, const type& value) {
        if (is<any_type>(target) || is<any_type>(value)) {
            return true;
        }

        // [] has type [void] and fits any list
        if (is<list_type>(target) && is<list_type>(value) && is<void_type>(element_of(value))) {
            return true;
        }

        // {} has type Dict[void, void] and fits any dict
        if (is<dict_type>(target) && is<dict_type>(value) &&
            is<void_type>(key_of(value)) && is<void_type>(value_of(value))) {
            return true;
        }

        return types_equal(target, value);
    }

    std::string type_to_string(const type& t) {
        if (is<error_type>(t)) return "<error>";
        if (is<int_type>(t)) return "int";
        if (is<float_type>(t)) return "float";
        if (is<bool_type>(t)) return "bool";
        if (is<str_type>(t)) return "str";
        if (is<void_type>(t)) return "void";
        if (is<any_type>(t)) return "any";
        if (auto* list = std::get_if<list_type>(&t.node)) {
            return "[" + type_to_string(*list->element) + "]";
        }
        if (auto* dict = std::get_if<dict_type>(&t.node)) {
            return "Dict[" + type_to_string(*dict->key) + ", " + type_to_string(*dict->value) + "]";
        }
        if (auto* st = std::get_if<struct_type>(&t.node)) {
            return st->name;
        }
        if (auto* en = std::get_if<enum_type>(&t.node)) {
            return en->name;
        }
        return "<unknown>";
    }
}
