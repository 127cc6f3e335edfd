//
// Created by igor on 03/12/2025.
//
// Resolved value types.
//
// Equality is structural for lists and dicts (no numeric widening anywhere),
// nominal for structs and enums. Struct and enum types point at their
// declarations in a registry owned by the analysis result; two types with the
// same name compare equal even when one of them carries no registry pointer.
//

#pragma once

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace quasar::types {
    struct type;
    struct struct_info;
    struct enum_info;

    // Sentinel for "no type"; also what a default-constructed type holds
    struct error_type {};

    struct int_type {};
    struct float_type {};
    struct bool_type {};
    struct str_type {};

    // Function return type only. [void] is the type of an empty list literal.
    struct void_type {};

    // Members of imported modules; assignable to and from everything
    struct any_type {};

    struct list_type {
        std::shared_ptr<const type> element;
    };

    struct dict_type {
        std::shared_ptr<const type> key;
        std::shared_ptr<const type> value;
    };

    struct struct_type {
        std::string name;
        const struct_info* info = nullptr;
    };

    struct enum_type {
        std::string name;
        const enum_info* info = nullptr;
    };

    using type_node = std::variant<
        error_type,
        int_type,
        float_type,
        bool_type,
        str_type,
        void_type,
        any_type,
        list_type,
        dict_type,
        struct_type,
        enum_type
    >;

    struct type {
        type_node node;
    };

    struct field_info {
        std::string name;
        type field_type;
    };

    struct struct_info {
        std::string name;
        std::vector<field_info> fields;  ///< declaration order

        [[nodiscard]] const field_info* find_field(const std::string& field) const;
    };

    struct enum_info {
        std::string name;
        std::vector<std::string> variants;  ///< declaration order

        [[nodiscard]] bool has_variant(const std::string& variant) const;
    };

    // Constructors
    type make_error();
    type make_int();
    type make_float();
    type make_bool();
    type make_str();
    type make_void();
    type make_any();
    type make_list(type element);
    type make_dict(type key, type value);
    type make_struct(const struct_info& info);
    type make_enum(const enum_info& info);

    template <typename T>
    [[nodiscard]] bool is(const type& t) {
        return std::holds_alternative<T>(t.node);
    }

    /// Element type of a list; error type if `t` is not a list
    [[nodiscard]] const type& element_of(const type& t);
    [[nodiscard]] const type& key_of(const type& t);
    [[nodiscard]] const type& value_of(const type& t);

    [[nodiscard]] bool types_equal(const type& a, const type& b);

    /// Int, Float, Bool and Str may be dictionary keys
    [[nodiscard]] bool is_hashable(const type& t);

    [[nodiscard]] bool is_numeric(const type& t);

    /// Exact equality, plus: Any on either side, [void] into any list,
    /// Dict[void, void] into any dict.
    [[nodiscard]] bool is_assignable(const type& target, const type& value);

    [[nodiscard]] std::string type_to_string(const type& t);

    bool operator==(const type& a, const type& b);
}
