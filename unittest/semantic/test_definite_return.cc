//
// Tests for definite return analysis
//

#include <doctest/doctest.h>
#include <quasar/parser.hh>
#include <quasar/semantic.hh>

using namespace quasar;

namespace {
    // Parses a single function and reports whether its body always returns
    bool body_returns(const std::string& source) {
        auto prog = parse_quasar(source);
        REQUIRE(prog.declarations.size() == 1);
        const auto& fn = std::get<ast::fn_decl>(prog.declarations.front().node);
        return semantic::phases::definitely_returns(fn.body);
    }
}

TEST_SUITE("Definite Return") {
    TEST_CASE("Trailing return") {
        CHECK(body_returns("fn f() -> int { let x: int = 1\n return x }"));
    }

    TEST_CASE("Empty body") {
        CHECK_FALSE(body_returns("fn f() -> int { }"));
    }

    TEST_CASE("Return that is not last does not count") {
        CHECK_FALSE(body_returns("fn f() -> int { return 1\n print(2) }"));
    }

    TEST_CASE("If needs an else where both branches return") {
        CHECK(body_returns("fn f(a: bool) -> int { if a { return 1 } else { return 2 } }"));
        CHECK_FALSE(body_returns("fn f(a: bool) -> int { if a { return 1 } }"));
        CHECK_FALSE(body_returns("fn f(a: bool) -> int { if a { return 1 } else { print(a) } }"));
    }

    TEST_CASE("Else-if chain returns only with a final else") {
        CHECK(body_returns(
            "fn f(n: int) -> int { if n < 0 { return 0 } else if n == 0 { return 1 } else { return 2 } }"));
        CHECK_FALSE(body_returns(
            "fn f(n: int) -> int { if n < 0 { return 0 } else if n == 0 { return 1 } }"));
    }

    TEST_CASE("Nested block") {
        CHECK(body_returns("fn f() -> int { { return 1 } }"));
    }

    TEST_CASE("Loops never count") {
        CHECK_FALSE(body_returns("fn f() -> int { while true { return 1 } }"));
        CHECK_FALSE(body_returns("fn f() -> int { for i in 0..3 { return i } }"));
    }
}
