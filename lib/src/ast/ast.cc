//
// Created by igor on 02/12/2025.
//

#include <quasar/ast.hh>

#include <filesystem>
#include <tuple>
#include <type_traits>

namespace quasar::ast {
    std::string span::str() const {
        return file + ":" + std::to_string(start_line) + ":" + std::to_string(start_column);
    }

    bool span::contains(const span& other) const {
        return std::tie(start_line, start_column) <= std::tie(other.start_line, other.start_column) &&
               std::tie(end_line, end_column) >= std::tie(other.end_line, other.end_column);
    }

    span merge(const span& first, const span& last) {
        span result = first;
        if (std::tie(last.start_line, last.start_column) < std::tie(result.start_line, result.start_column)) {
            result.start_line = last.start_line;
            result.start_column = last.start_column;
        }
        if (std::tie(last.end_line, last.end_column) > std::tie(result.end_line, result.end_column)) {
            result.end_line = last.end_line;
            result.end_column = last.end_column;
        }
        return result;
    }

    const span& span_of(const expr& e) {
        return std::visit([](const auto& node) -> const span& { return node.pos; }, e.node);
    }

    const span& span_of(const statement& s) {
        return std::visit([](const auto& node) -> const span& { return node.pos; }, s.node);
    }

    const span& span_of(const declaration& d) {
        return std::visit([](const auto& node) -> const span& {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, statement>) {
                return span_of(node);
            } else {
                return node.pos;
            }
        }, d.node);
    }

    const span& span_of(const type_annotation& t) {
        return std::visit([](const auto& node) -> const span& { return node.pos; }, t.node);
    }

    std::string import_binding_name(const import_decl& imp) {
        if (!imp.is_local) {
            return imp.module;
        }
        return std::filesystem::path(imp.module).stem().string();
    }
}
