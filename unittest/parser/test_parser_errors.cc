//
// Tests for syntax errors reported by the parser
//

#include <doctest/doctest.h>
#include <quasar/parser.hh>

#include <string>

using namespace quasar;

namespace {
    std::string syntax_error_of(const std::string& source) {
        try {
            (void)parse_quasar(source);
        } catch (const syntax_error& e) {
            return e.message();
        }
        return "";
    }
}

TEST_SUITE("Parser - Errors") {
    TEST_CASE("Missing pieces of a declaration") {
        CHECK(syntax_error_of("let x int = 1") == "expected ':' after variable name");
        CHECK(syntax_error_of("let x: int 1") == "expected '=' in variable declaration");
        CHECK(syntax_error_of("const = 1") == "expected constant name after 'const'");
        CHECK(syntax_error_of("fn f(a: int) { }") == "expected '->' after parameters");
        CHECK(syntax_error_of("fn f(a int) -> void { }") == "expected ':' after parameter name");
        CHECK(syntax_error_of("struct P { x: int") == "expected '}' after struct fields");
    }

    TEST_CASE("Bad type annotation") {
        CHECK(syntax_error_of("let x: 5 = 1") == "expected type name");
        CHECK(syntax_error_of("let d: Dict[str int] = {}") == "expected ',' after dict key type");
    }

    TEST_CASE("Enum needs a variant") {
        CHECK(syntax_error_of("enum Empty { }") == "enum must have at least one variant");
    }

    TEST_CASE("Missing expression") {
        CHECK(syntax_error_of("let x: int =") == "expected expression, got end of file");
        CHECK(syntax_error_of("let x: int = )") == "expected expression, got ')'");
    }

    TEST_CASE("Range expressions cannot be chained") {
        CHECK(syntax_error_of("for i in 0..1..2 { }") == "range expressions cannot be chained");
    }

    TEST_CASE("Only names can be called") {
        CHECK(syntax_error_of("f(1)(2)") == "can only call functions");
        CHECK(syntax_error_of("xs[0](1)") == "can only call functions");
    }

    TEST_CASE("Invalid assignment target") {
        CHECK(syntax_error_of("f() = 1") == "invalid assignment target");
        CHECK(syntax_error_of("1 + 2 = 3") == "invalid assignment target");
    }

    TEST_CASE("Print keyword arguments") {
        CHECK(syntax_error_of("print(1, sep=\"-\", 2)") == "positional argument follows keyword argument");
        CHECK(syntax_error_of("print(1, end=\"\", end=\"!\")") == "duplicate 'end' argument");
        CHECK(syntax_error_of("print()") == "expected expression, got ')'");
    }

    TEST_CASE("Unclosed block") {
        CHECK(syntax_error_of("fn f() -> void { print(1)") == "expected '}' after block");
    }

    TEST_CASE("Deep nesting is rejected instead of overflowing the stack") {
        const std::string source = "let x: int = " + std::string(300, '(') + "1" + std::string(300, ')');
        CHECK(syntax_error_of(source) == "nesting too deep (limit: 256)");
    }

    TEST_CASE("Long operator chains count against the nesting limit") {
        std::string sum = "let x: int = 1";
        std::string conj = "let b: bool = true";
        for (int i = 0; i < 300; ++i) {
            sum += " + 1";
            conj += " && true";
        }
        CHECK(syntax_error_of(sum) == "nesting too deep (limit: 256)");
        CHECK(syntax_error_of(conj) == "nesting too deep (limit: 256)");
    }

    TEST_CASE("Long postfix chains count against the nesting limit") {
        std::string index = "let x: int = xs";
        std::string fields = "let y: int = p";
        for (int i = 0; i < 300; ++i) {
            index += "[0]";
            fields += ".next";
        }
        CHECK(syntax_error_of(index) == "nesting too deep (limit: 256)");
        CHECK(syntax_error_of(fields) == "nesting too deep (limit: 256)");
    }

    TEST_CASE("Long else-if chains count against the nesting limit") {
        std::string source = "if a { }";
        for (int i = 0; i < 300; ++i) {
            source += " else if a { }";
        }
        CHECK(syntax_error_of(source) == "nesting too deep (limit: 256)");
    }

    TEST_CASE("Moderate chains are fine") {
        std::string sum = "let x: int = 1";
        std::string index = "let y: int = xs";
        std::string branches = "if a { }";
        for (int i = 0; i < 100; ++i) {
            sum += " + 1 * 2";
            index += "[0]";
            branches += " else if a { }";
        }
        CHECK_NOTHROW((void)parse_quasar(sum));
        CHECK_NOTHROW((void)parse_quasar(index));
        CHECK_NOTHROW((void)parse_quasar(branches));
    }

    TEST_CASE("Moderate nesting is fine") {
        const std::string source = "let x: int = " + std::string(100, '(') + "1" + std::string(100, ')');
        CHECK_NOTHROW((void)parse_quasar(source));
    }

    TEST_CASE("Error points at the offending token") {
        try {
            (void)parse_quasar("let a: int = 1\nlet b int = 2", "main.qsr");
            FAIL("expected syntax_error");
        } catch (const syntax_error& e) {
            CHECK(e.line() == 2);
            CHECK(e.column() == 7);
            CHECK(std::string(e.what()) == "main.qsr:2:7: syntax error: expected ':' after variable name");
        }
    }

    TEST_CASE("Lexical errors pass through parse_quasar") {
        CHECK_THROWS_AS((void)parse_quasar("let x: int = 1 & 2"), lex_error);
    }

    TEST_CASE("try_parse_quasar captures the first error") {
        auto good = try_parse_quasar("let x: int = 1");
        CHECK(good.ok());
        CHECK_FALSE(good.error.has_value());

        auto bad = try_parse_quasar("let x: int = ");
        CHECK_FALSE(bad.ok());
        REQUIRE(bad.error.has_value());
        CHECK(bad.error->message() == "expected expression, got end of file");

        auto lexical = try_parse_quasar("let s: str = \"open");
        REQUIRE(lexical.error.has_value());
        CHECK(lexical.error->message() == "unterminated string literal");
    }
}
