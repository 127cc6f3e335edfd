//
// Created by igor on 05/12/2025.
//

#include "semantic/builtins.h"

#include <map>

namespace quasar::semantic::builtins {
    namespace {
        const std::vector<method_signature>& no_methods() {
            static const std::vector<method_signature> none;
            return none;
        }

        const std::vector<method_signature>& str_methods() {
            static const std::vector<method_signature> methods = {
                {"len", {}, slot::int_},
                {"upper", {}, slot::str},
                {"lower", {}, slot::str},
                {"trim", {}, slot::str},
                {"replace", {slot::str, slot::str}, slot::str},
                {"split", {slot::str}, slot::list_of_str},
                {"contains", {slot::str}, slot::bool_},
                {"starts_with", {slot::str}, slot::bool_},
                {"ends_with", {slot::str}, slot::bool_},
                {"to_int", {}, slot::int_},
                {"to_float", {}, slot::float_},
            };
            return methods;
        }

        const std::vector<method_signature>& list_methods() {
            static const std::vector<method_signature> methods = {
                {"len", {}, slot::int_},
                {"push", {slot::element}, slot::void_},
                {"pop", {}, slot::element},
                {"contains", {slot::element}, slot::bool_},
                {"join", {slot::str}, slot::str},
                {"reverse", {}, slot::void_},
                {"clear", {}, slot::void_},
            };
            return methods;
        }

        const std::vector<method_signature>& dict_methods() {
            static const std::vector<method_signature> methods = {
                {"len", {}, slot::int_},
                {"has_key", {slot::key}, slot::bool_},
                {"get", {slot::key, slot::value}, slot::value},
                {"remove", {slot::key}, slot::void_},
                {"clear", {}, slot::void_},
                {"keys", {}, slot::list_of_key},
                {"values", {}, slot::list_of_value},
            };
            return methods;
        }

        const std::map<std::string, std::vector<method_signature>>& static_namespaces() {
            static const std::map<std::string, std::vector<method_signature>> namespaces = {
                {"File", {
                    {"exists", {slot::str}, slot::bool_},
                }},
                {"Env", {
                    {"args", {}, slot::list_of_str},
                    {"get", {slot::str, slot::str}, slot::str},
                }},
            };
            return namespaces;
        }

        const method_signature* find_in(const std::vector<method_signature>& methods, const std::string& name) {
            for (const auto& m : methods) {
                if (m.name == name) {
                    return &m;
                }
            }
            return nullptr;
        }
    }

    const std::vector<method_signature>& methods_of(const types::type& receiver) {
        if (types::is<types::str_type>(receiver)) {
            return str_methods();
        }
        if (types::is<types::list_type>(receiver)) {
            return list_methods();
        }
        if (types::is<types::dict_type>(receiver)) {
            return dict_methods();
        }
        return no_methods();
    }

    const method_signature* find_method(const types::type& receiver, const std::string& name) {
        return find_in(methods_of(receiver), name);
    }

    bool is_static_namespace(const std::string& ns) {
        return static_namespaces().count(ns) != 0;
    }

    const method_signature* find_static(const std::string& ns, const std::string& name) {
        const auto& namespaces = static_namespaces();
        auto it = namespaces.find(ns);
        if (it == namespaces.end()) {
            return nullptr;
        }
        return find_in(it->second, name);
    }

    types::type instantiate(slot s, const types::type& receiver) {
        switch (s) {
            case slot::int_: return types::make_int();
            case slot::float_: return types::make_float();
            case slot::bool_: return types::make_bool();
            case slot::str: return types::make_str();
            case slot::void_: return types::make_void();
            case slot::element: return types::element_of(receiver);
            case slot::key: return types::key_of(receiver);
            case slot::value: return types::value_of(receiver);
            case slot::list_of_str: return types::make_list(types::make_str());
            case slot::list_of_key: return types::make_list(types::key_of(receiver));
            case slot::list_of_value: return types::make_list(types::value_of(receiver));
        }
        return types::make_error();
    }

    bool is_generic(slot s) {
        return s == slot::element || s == slot::key || s == slot::value;
    }

    const char* generic_role(slot s) {
        switch (s) {
            case slot::element: return "element";
            case slot::key: return "key";
            case slot::value: return "value";
            default: return "argument";
        }
    }
}
