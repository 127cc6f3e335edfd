//
// Created by igor on 06/12/2025.
//
// S-expression rendering of the AST, used by `qsr --dump-ast` and the parser tests.
//
//   1 + 2 * 3          ->  (+ 1 (* 2 3))
//   a[0].b(1)          ->  (method (index a 0) b 1)
//   let x: [int] = []  ->  (let x [int] (list))
//

#pragma once

#include <string>

#include "ast.hh"

namespace quasar::ast {
    [[nodiscard]] std::string to_sexpr(const expr& e);
    [[nodiscard]] std::string to_sexpr(const type_annotation& t);
    [[nodiscard]] std::string to_sexpr(const declaration& d);

    /// One top-level declaration per line, nested blocks indented by two spaces.
    [[nodiscard]] std::string dump(const program& prog);
}
