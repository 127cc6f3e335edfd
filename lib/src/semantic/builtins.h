//
// Created by igor on 05/12/2025.
//
// Fixed registry of builtin methods (per receiver type) and of the static
// namespaces File / Env.
//

#pragma once

#include <string>
#include <vector>

#include <quasar/types.hh>

namespace quasar::semantic::builtins {
    // Parameter / result types, possibly relative to the receiver
    enum class slot {
        int_,
        float_,
        bool_,
        str,
        void_,
        element,        ///< element type of the receiving list
        key,            ///< key type of the receiving dict
        value,          ///< value type of the receiving dict
        list_of_str,
        list_of_key,
        list_of_value
    };

    struct method_signature {
        std::string name;
        std::vector<slot> params;
        slot result;
    };

    /// Methods of the receiver's type; empty for types without methods
    [[nodiscard]] const std::vector<method_signature>& methods_of(const types::type& receiver);

    /// @return nullptr if the receiver's type has no such method
    [[nodiscard]] const method_signature* find_method(const types::type& receiver, const std::string& name);

    /// True if `ns` has a static method table (File, Env)
    [[nodiscard]] bool is_static_namespace(const std::string& ns);

    /// @return nullptr if `ns` is not a static namespace or has no such method
    [[nodiscard]] const method_signature* find_static(const std::string& ns, const std::string& name);

    /// Concrete type of `s` for a call on `receiver`
    [[nodiscard]] types::type instantiate(slot s, const types::type& receiver);

    /// True for slots that depend on the receiver (element/key/value)
    [[nodiscard]] bool is_generic(slot s);

    /// "element", "key" or "value"
    [[nodiscard]] const char* generic_role(slot s);
}
