//
// Tests for expression parsing: precedence, associativity, postfix forms
//

#include <doctest/doctest.h>
#include <quasar/ast_printer.hh>
#include <quasar/parser.hh>

using namespace quasar;

namespace {
    // S-expression of a single-statement program
    std::string sexpr_of(const std::string& source) {
        auto prog = parse_quasar(source);
        REQUIRE(prog.declarations.size() == 1);
        return ast::to_sexpr(prog.declarations.front());
    }

    const ast::expr& expression_of(const ast::program& prog) {
        const auto& stmt = std::get<ast::statement>(prog.declarations.front().node);
        return std::get<ast::expression_statement>(stmt.node).expression;
    }
}

TEST_SUITE("Parser - Expressions") {
    TEST_CASE("Multiplication binds tighter than addition") {
        CHECK(sexpr_of("1 + 2 * 3") == "(+ 1 (* 2 3))");
        CHECK(sexpr_of("1 * 2 + 3") == "(+ (* 1 2) 3)");
    }

    TEST_CASE("Binary operators are left associative") {
        CHECK(sexpr_of("1 - 2 - 3") == "(- (- 1 2) 3)");
        CHECK(sexpr_of("8 / 4 / 2") == "(/ (/ 8 4) 2)");
        CHECK(sexpr_of("a && b && c") == "(&& (&& a b) c)");
    }

    TEST_CASE("Unary minus applies before addition") {
        CHECK(sexpr_of("-a + b") == "(+ (- a) b)");
    }

    TEST_CASE("Unary operators nest to the right") {
        CHECK(sexpr_of("!!done") == "(! (! done))");
        CHECK(sexpr_of("- -x") == "(- (- x))");
    }

    TEST_CASE("Full precedence ladder") {
        CHECK(sexpr_of("a || b && c == d < e + f * g") ==
              "(|| a (&& b (== c (< d (+ e (* f g))))))");
    }

    TEST_CASE("Parentheses override precedence") {
        CHECK(sexpr_of("(1 + 2) * 3") == "(* (+ 1 2) 3)");
    }

    TEST_CASE("Range has the lowest precedence") {
        CHECK(sexpr_of("0..n - 1") == "(.. 0 (- n 1))");
    }

    TEST_CASE("Literals") {
        CHECK(sexpr_of("\"hi\"") == "\"hi\"");
        CHECK(sexpr_of("true") == "true");
        CHECK(sexpr_of("2.5") == "2.5");
    }

    TEST_CASE("Postfix chains") {
        CHECK(sexpr_of("a[0].b") == "(. (index a 0) b)");
        CHECK(sexpr_of("a[0].b(1)") == "(method (index a 0) b 1)");
        CHECK(sexpr_of("grid[i][j]") == "(index (index grid i) j)");
        CHECK(sexpr_of("s.trim().upper()") == "(method (method s trim) upper)");
    }

    TEST_CASE("Function calls") {
        CHECK(sexpr_of("f()") == "(call f)");
        CHECK(sexpr_of("max(a, b + 1)") == "(call max a (+ b 1))");
    }

    TEST_CASE("Type keywords followed by '(' are cast calls") {
        CHECK(sexpr_of("int(\"42\")") == "(call int \"42\")");
        CHECK(sexpr_of("str(3)") == "(call str 3)");
    }

    TEST_CASE("List and dict literals") {
        CHECK(sexpr_of("[1, 2, 3]") == "(list 1 2 3)");
        CHECK(sexpr_of("[1, 2,]") == "(list 1 2)");
        CHECK(sexpr_of("[]") == "(list)");
        CHECK(sexpr_of("let d: Dict[str, int] = {\"a\": 1, \"b\": 2}") ==
              "(let d Dict[str, int] (dict (\"a\" 1) (\"b\" 2)))");
        CHECK(sexpr_of("let d: Dict[str, int] = {}") == "(let d Dict[str, int] (dict))");
    }

    TEST_CASE("Struct literal needs the name-colon lookahead") {
        CHECK(sexpr_of("let p: Point = Point { x: 1, y: 2 }") ==
              "(let p Point (struct Point (x 1) (y 2)))");
    }

    TEST_CASE("Identifier before a block is not a struct literal") {
        CHECK(sexpr_of("for x in items { print(x) }") == "(for x items (block (print x)))");
        CHECK(sexpr_of("while ready { go() }") == "(while ready (block (call go)))");
    }

    TEST_CASE("sep and end are ordinary names outside print") {
        CHECK(sexpr_of("let sep: str = end") == "(let sep str end)");
    }

    TEST_CASE("Composite spans contain their children") {
        auto prog = parse_quasar("a + b * -c");
        const auto& root = expression_of(prog);
        const auto& add = std::get<ast::binary_expr>(root.node);
        const auto& mul = std::get<ast::binary_expr>(add.right->node);
        const auto& neg = std::get<ast::unary_expr>(mul.right->node);

        CHECK(add.pos.contains(ast::span_of(*add.left)));
        CHECK(add.pos.contains(mul.pos));
        CHECK(mul.pos.contains(ast::span_of(*mul.left)));
        CHECK(mul.pos.contains(neg.pos));
        CHECK(neg.pos.contains(ast::span_of(*neg.operand)));

        CHECK(add.pos.start_column == 1);
        CHECK(add.pos.end_column == 10);
    }

    TEST_CASE("Call and method spans cover the closing parenthesis") {
        auto prog = parse_quasar("obj.run(1, 2)");
        const auto& call = std::get<ast::method_call_expr>(expression_of(prog).node);
        CHECK(call.pos.start_column == 1);
        CHECK(call.pos.end_column == 13);
        CHECK(call.pos.contains(ast::span_of(call.arguments.back())));
    }
}
