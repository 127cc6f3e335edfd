//
// Tests for declaration and statement parsing
//

#include <doctest/doctest.h>
#include <quasar/ast_printer.hh>
#include <quasar/parser.hh>

using namespace quasar;

namespace {
    std::string sexpr_of(const std::string& source) {
        auto prog = parse_quasar(source);
        REQUIRE(prog.declarations.size() == 1);
        return ast::to_sexpr(prog.declarations.front());
    }
}

TEST_SUITE("Parser - Declarations") {
    TEST_CASE("Variable and constant declarations") {
        CHECK(sexpr_of("let x: int = 5") == "(let x int 5)");
        CHECK(sexpr_of("const PI: float = 3.5") == "(const PI float 3.5)");
        CHECK(sexpr_of("let xs: [[int]] = []") == "(let xs [[int]] (list))");
    }

    TEST_CASE("Function declaration") {
        CHECK(sexpr_of("fn add(a: int, b: int) -> int { return a + b }") ==
              "(fn add ((a int) (b int)) int (block (return (+ a b))))");
        CHECK(sexpr_of("fn hello() -> void { print(\"hi\") }") ==
              "(fn hello () void (block (print \"hi\")))");
    }

    TEST_CASE("Struct declaration") {
        CHECK(sexpr_of("struct Point { x: int, y: int }") == "(struct Point (x int) (y int))");
        CHECK(sexpr_of("struct Empty { }") == "(struct Empty)");
    }

    TEST_CASE("Enum declaration allows a trailing comma") {
        CHECK(sexpr_of("enum Color { Red, Green, Blue, }") == "(enum Color Red Green Blue)");
    }

    TEST_CASE("Imports by name and by path") {
        CHECK(sexpr_of("import math") == "(import math)");
        CHECK(sexpr_of("import \"./lib/utils.qsr\"") == "(import \"./lib/utils.qsr\")");
    }

    TEST_CASE("Import binding names") {
        auto prog = parse_quasar("import math\nimport \"./lib/utils.qsr\"");
        REQUIRE(prog.declarations.size() == 2);
        CHECK(ast::import_binding_name(std::get<ast::import_decl>(prog.declarations[0].node)) == "math");
        CHECK(ast::import_binding_name(std::get<ast::import_decl>(prog.declarations[1].node)) == "utils");
    }

    TEST_CASE("Program keeps its file name") {
        auto prog = parse_quasar("let x: int = 1", "app.qsr");
        CHECK(prog.file == "app.qsr");
    }
}

TEST_SUITE("Parser - Statements") {
    TEST_CASE("If with else") {
        CHECK(sexpr_of("if a { x = 1 } else { x = 2 }") == "(if a (block (= x 1)) (block (= x 2)))");
    }

    TEST_CASE("Else-if becomes a nested if inside the else block") {
        CHECK(sexpr_of("if a { f() } else if b { g() } else { h() }") ==
              "(if a (block (call f)) (block (if b (block (call g)) (block (call h)))))");
    }

    TEST_CASE("Loops") {
        CHECK(sexpr_of("while i < 10 { i = i + 1 }") == "(while (< i 10) (block (= i (+ i 1))))");
        CHECK(sexpr_of("for i in 0..10 { continue }") == "(for i (.. 0 10) (block (continue)))");
        CHECK(sexpr_of("while true { break }") == "(while true (block (break)))");
    }

    TEST_CASE("Bare return before closing brace") {
        CHECK(sexpr_of("fn f() -> void { return }") == "(fn f () void (block (return)))");
    }

    TEST_CASE("Assignment forms") {
        CHECK(sexpr_of("x = 1") == "(= x 1)");
        CHECK(sexpr_of("xs[0] = 1") == "(= (index xs 0) 1)");
        CHECK(sexpr_of("p.x = 1") == "(= (. p x) 1)");
        CHECK(sexpr_of("m[\"k\"][0] = 2") == "(= (index (index m \"k\") 0) 2)");
    }

    TEST_CASE("Print with keyword arguments") {
        CHECK(sexpr_of("print(a, b, sep=\", \", end=\"\")") == "(print a b (sep \", \") (end \"\"))");
        CHECK(sexpr_of("print(\"{} + {}\", 1, 2)") == "(print \"{} + {}\" 1 2)");
    }

    TEST_CASE("Print argument named like a keyword but without '='") {
        CHECK(sexpr_of("print(sep)") == "(print sep)");
    }

    TEST_CASE("Nested block statement") {
        CHECK(sexpr_of("{ let x: int = 1 }") == "(block (let x int 1))");
    }

    TEST_CASE("Dump renders one declaration per line with indented blocks") {
        auto prog = parse_quasar("let x: int = 1\nfn f() -> int {\n  return x\n}\n");
        CHECK(ast::dump(prog) == "(let x int 1)\n(fn f () int (block\n  (return x)))\n");
    }
}
