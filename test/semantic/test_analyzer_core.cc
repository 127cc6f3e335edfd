//
// Created by igor on 08/12/2025.
//
// Analyzer: bindings, scoping, operators, control flow, returns, imports
//

#include "analysis_fixture.hh"

using namespace quasar;
using quasar::test::analysis;
using quasar::test::with_modules;
namespace codes = quasar::semantic::diag_codes;

TEST_SUITE("Analyzer - Bindings") {
    TEST_CASE("Initializer must match the annotation exactly") {
        analysis a("let x: int = 3.14");
        CHECK(a.code() == codes::E_TYPE_MISMATCH);
        CHECK(a.message() == "type mismatch: expected int, got float");
    }

    TEST_CASE("Matching initializer defines a global") {
        analysis a("let x: int = 1\nconst NAME: str = \"q\"");
        REQUIRE(a.ok());
        CHECK(a.global_type("x") == "int");
        CHECK(a.global_type("NAME") == "str");
        CHECK(a.result().analyzed->globals.at("NAME").is_const);
    }

    TEST_CASE("Diagnostic display forms") {
        analysis a("let x: int = 3.14");
        const auto& diag = a.error();
        CHECK(diag.position.start_line == 1);
        CHECK(diag.position.start_column == 14);
        CHECK(diag.format() == "test.qsr:1:14: error: type mismatch: expected int, got float [E0100]\n");
        CHECK(diag.str() == "test.qsr:1:14: E0100: type mismatch: expected int, got float");
    }

    TEST_CASE("Analysis stops at the first error") {
        analysis a("let x: int = \"a\"\nlet y: str = 1");
        CHECK(a.result().error_count() == 1);
        CHECK_FALSE(a.result().analyzed.has_value());
    }

    TEST_CASE("void is only a return type") {
        analysis a("let x: void = 1");
        CHECK(a.code() == codes::E_TYPE_MISMATCH);
        CHECK(a.message() == "'void' is only valid as a function return type");
    }

    TEST_CASE("Unknown named type") {
        analysis a("let p: Point = 1");
        CHECK(a.code() == codes::E_UNKNOWN_STRUCT);
        CHECK(a.message() == "struct 'Point' is not defined");
    }

    TEST_CASE("Undeclared identifier") {
        analysis a("print(y)");
        CHECK(a.code() == codes::E_UNDECLARED);
        CHECK(a.message() == "use of undeclared identifier 'y'");
    }

    TEST_CASE("Assignment rules") {
        CHECK(analysis("let x: int = 1\nx = 2").ok());
        CHECK(analysis("y = 2").code() == codes::E_UNDECLARED);

        analysis to_const("const X: int = 1\nX = 2");
        CHECK(to_const.code() == codes::E_CONST_ASSIGN);
        CHECK(to_const.message() == "cannot assign to constant 'X'");

        CHECK(analysis("fn f() -> void { }\nf = 1").code() == codes::E_CONST_ASSIGN);

        analysis wrong_type("let x: int = 1\nx = \"two\"");
        CHECK(wrong_type.code() == codes::E_TYPE_MISMATCH);
        CHECK(wrong_type.message() == "type mismatch: expected int, got str");
    }

    TEST_CASE("Expression types are recorded") {
        analysis a("1 + 2\n1.5 * 2.0\n1 < 2\n\"a\" + \"b\"");
        REQUIRE(a.ok());
        CHECK(a.expression_type(0) == "int");
        CHECK(a.expression_type(1) == "float");
        CHECK(a.expression_type(2) == "bool");
        CHECK(a.expression_type(3) == "str");
    }
}

TEST_SUITE("Analyzer - Scoping") {
    TEST_CASE("Shadowing a parameter in a nested block") {
        CHECK(analysis("fn f(x: int) -> void { if true { let x: str = \"s\" } }").ok());
    }

    TEST_CASE("Redeclaration in the same block") {
        analysis a("fn f() -> void { let x: int = 1\n let x: int = 2 }");
        CHECK(a.code() == codes::E_REDECLARATION);
        CHECK(a.message() == "redeclaration of 'x' in the same scope");
    }

    TEST_CASE("Parameters share the body's scope") {
        CHECK(analysis("fn f(x: int) -> void { let x: int = 2 }").code() == codes::E_REDECLARATION);
    }

    TEST_CASE("Duplicate parameter") {
        analysis a("fn f(a: int, a: int) -> void { }");
        CHECK(a.code() == codes::E_REDECLARATION);
        CHECK(a.message() == "redeclaration of parameter 'a'");
    }

    TEST_CASE("Block locals are gone after the block") {
        CHECK(analysis("if true { let t: int = 1 }\nprint(t)").code() == codes::E_UNDECLARED);
    }

    TEST_CASE("Globals are visible inside functions") {
        CHECK(analysis("let limit: int = 3\nfn f() -> int { return limit }").ok());
    }

    TEST_CASE("Globals redeclared at top level") {
        CHECK(analysis("let x: int = 1\nlet x: int = 2").code() == codes::E_REDECLARATION);
    }
}

TEST_SUITE("Analyzer - Operators") {
    TEST_CASE("Mixed int and float arithmetic") {
        analysis a("let x: float = 1 + 2.0");
        CHECK(a.code() == codes::E_ARITHMETIC_OPERANDS);
        CHECK(a.message() == "cannot mix int and float in arithmetic");
    }

    TEST_CASE("String arithmetic") {
        CHECK(analysis("let s: str = \"a\" + \"b\"").ok());
        CHECK(analysis("let s: str = \"a\" - \"b\"").message() == "operator 'SUB' not supported for strings");
        CHECK(analysis("let s: str = \"a\" + 1").message() == "cannot perform arithmetic between str and int");
    }

    TEST_CASE("Booleans are never arithmetic operands") {
        analysis a("let b: bool = true + false");
        CHECK(a.code() == codes::E_ARITHMETIC_OPERANDS);
        CHECK(a.message() == "arithmetic operators not supported for bool");
    }

    TEST_CASE("Relational operators") {
        CHECK(analysis("let b: bool = 1 < 2").ok());
        CHECK(analysis("let b: bool = 1.5 >= 2.5").ok());
        CHECK(analysis("let b: bool = \"a\" < \"b\"").code() == codes::E_STRING_COMPARISON);
        CHECK(analysis("let b: bool = 1 < 2.0").message() == "cannot compare int with float");
        CHECK(analysis("let b: bool = true < false").message() == "comparison requires numeric types, got bool");
    }

    TEST_CASE("Equality needs identical types") {
        CHECK(analysis("let b: bool = \"a\" == \"b\"").ok());
        CHECK(analysis("let b: bool = [1] == [2]").ok());
        analysis a("let b: bool = 1 == 1.0");
        CHECK(a.code() == codes::E_ARITHMETIC_OPERANDS);
        CHECK(a.message() == "cannot compare int with float");
    }

    TEST_CASE("Logical operators need bool") {
        CHECK(analysis("let b: bool = true && !false").ok());

        analysis a("let b: bool = 1 && true");
        CHECK(a.code() == codes::E_LOGICAL_OPERANDS);
        CHECK(a.message() == "logical operator requires bool operands, got int");

        CHECK(analysis("let b: bool = !1").message() == "logical NOT requires bool operand, got int");
    }

    TEST_CASE("Negation needs a number") {
        CHECK(analysis("let x: float = -1.5").ok());
        analysis a("let b: bool = -true");
        CHECK(a.code() == codes::E_ARITHMETIC_OPERANDS);
        CHECK(a.message() == "negation requires numeric type, got bool");
    }

    TEST_CASE("Division by a literal zero") {
        analysis a("let x: int = 10 / 0");
        CHECK(a.code() == codes::E_DIVISION_BY_ZERO);
        CHECK(a.message() == "division by zero");

        CHECK(analysis("let x: float = 1.0 % 0.0").code() == codes::E_DIVISION_BY_ZERO);
        CHECK(analysis("let x: int = 10 / (1 - 1)").ok());
    }
}

TEST_SUITE("Analyzer - Control Flow") {
    TEST_CASE("Conditions must be bool") {
        analysis a("if 1 { }");
        CHECK(a.code() == codes::E_CONDITION_NOT_BOOL);
        CHECK(a.message() == "condition must be bool, got int");
        CHECK(analysis("while \"yes\" { }").code() == codes::E_CONDITION_NOT_BOOL);
    }

    TEST_CASE("break inside a loop") {
        CHECK(analysis("while true { break }").ok());
        CHECK(analysis("for i in 0..3 { if i == 1 { continue } }").ok());
    }

    TEST_CASE("break in an if without a loop") {
        analysis a("if true { break }");
        CHECK(a.code() == codes::E_BREAK_OUTSIDE_LOOP);
        CHECK(a.message() == "'break' outside of loop");
        CHECK(analysis("continue").code() == codes::E_CONTINUE_OUTSIDE_LOOP);
    }

    TEST_CASE("A function body does not inherit the loop around it") {
        CHECK(analysis("while true { fn f() -> void { break } }").code() == codes::E_BREAK_OUTSIDE_LOOP);
    }

    TEST_CASE("Loop depth is restored after the loop") {
        CHECK(analysis("while true { }\nbreak").code() == codes::E_BREAK_OUTSIDE_LOOP);
    }
}

TEST_SUITE("Analyzer - Functions") {
    TEST_CASE("Missing return without else") {
        analysis a("fn f(a: bool) -> int { if a { return 1 } }");
        CHECK(a.code() == codes::E_MISSING_RETURN);
        CHECK(a.message() == "function 'f' may not return a value on all paths");
    }

    TEST_CASE("Both branches return") {
        CHECK(analysis("fn f(a: bool) -> int { if a { return 1 } else { return 2 } }").ok());
    }

    TEST_CASE("Void functions are exempt") {
        CHECK(analysis("fn f() -> void { print(1) }").ok());
    }

    TEST_CASE("Return outside a function") {
        analysis a("return 1");
        CHECK(a.code() == codes::E_RETURN_OUTSIDE_FUNCTION);
        CHECK(a.message() == "'return' outside of function");
    }

    TEST_CASE("Return type must match") {
        analysis a("fn f() -> int { return \"a\" }");
        CHECK(a.code() == codes::E_RETURN_MISMATCH);
        CHECK(a.message() == "return type mismatch: expected int, got str");

        CHECK(analysis("fn f() -> int { return }").message() == "return type mismatch: expected int, got void");
        CHECK(analysis("fn f() -> void { return 1 }").code() == codes::E_RETURN_MISMATCH);
        CHECK(analysis("fn f() -> void { return }").ok());
    }

    TEST_CASE("Recursion sees the function's own name") {
        CHECK(analysis("fn fact(n: int) -> int { if n <= 1 { return 1 } else { return n * fact(n - 1) } }").ok());
    }

    TEST_CASE("Function symbol records its signature") {
        analysis a("fn add(a: int, b: float) -> float { return b }");
        REQUIRE(a.ok());
        const auto& fn = a.result().analyzed->globals.at("add");
        CHECK(fn.is_function);
        CHECK(fn.params.size() == 2);
        CHECK(types::type_to_string(fn.params[1]) == "float");
        CHECK(a.global_type("add") == "float");
    }
}

TEST_SUITE("Analyzer - Reserved Names") {
    TEST_CASE("File and Env cannot be declared") {
        analysis a("let File: int = 1");
        CHECK(a.code() == codes::E_RESERVED_NAME);
        CHECK(a.message() == "cannot shadow builtin module 'File'");

        CHECK(analysis("const Env: int = 1").code() == codes::E_RESERVED_NAME);
        CHECK(analysis("fn File() -> void { }").code() == codes::E_RESERVED_NAME);
        CHECK(analysis("fn f(Env: int) -> void { }").code() == codes::E_RESERVED_NAME);
        CHECK(analysis("struct File { x: int }").code() == codes::E_RESERVED_NAME);
        CHECK(analysis("enum Env { A }").code() == codes::E_RESERVED_NAME);
        CHECK(analysis("for File in 0..2 { }").code() == codes::E_RESERVED_NAME);
        CHECK(analysis("if true { let Env: int = 1 }").code() == codes::E_RESERVED_NAME);
    }

    TEST_CASE("Reserved set is configurable") {
        semantic::analysis_options opts;
        opts.reserved_namespaces = {};
        CHECK(analysis("let File: int = 1", opts).ok());
    }

    TEST_CASE("Only builtin namespaces can be reserved") {
        semantic::analysis_options opts;
        opts.reserved_namespaces = {"File", "Net"};

        CHECK(analysis("let Net: int = 1\nlet n: int = Net + 1", opts).ok());
        CHECK(analysis("let Net: str = \"x\"\nNet.upper()", opts).ok());
        CHECK(analysis("let File: int = 1", opts).code() == codes::E_RESERVED_NAME);
        CHECK(analysis("File.exists(\"a.txt\")", opts).ok());
    }

    TEST_CASE("Dropping a namespace frees its name") {
        semantic::analysis_options opts;
        opts.reserved_namespaces = {"File"};

        CHECK(analysis("let Env: str = \"x\"\nEnv.upper()", opts).ok());
        CHECK(analysis("Env.args()", opts).code() == codes::E_UNDECLARED);
    }
}

TEST_SUITE("Analyzer - Imports") {
    TEST_CASE("Module members have type any") {
        analysis a("import math\nmath.pi\nmath.sqrt(2.0)\nmath.pi * 2.0");
        REQUIRE(a.ok());
        CHECK(a.expression_type(1) == "any");
        CHECK(a.expression_type(2) == "any");
        CHECK(a.expression_type(3) == "float");
    }

    TEST_CASE("Module values fit any annotation") {
        CHECK(analysis("import os\nlet home: str = os.getenv(\"HOME\")\nif os.ready { }").ok());
    }

    TEST_CASE("Modules are constants") {
        CHECK(analysis("import math\nmath = 1").code() == codes::E_CONST_ASSIGN);
    }

    TEST_CASE("Using a module that was never imported") {
        CHECK(analysis("let x: float = math.pi").code() == codes::E_UNDECLARED);
    }

    TEST_CASE("Duplicate import") {
        analysis a("import math\nimport math");
        CHECK(a.code() == codes::E_DUPLICATE_IMPORT);
        CHECK(a.message() == "duplicate import of module 'math'");
    }

    TEST_CASE("Local module resolved against the base directory") {
        analysis found("import \"./lib/utils.qsr\"\nutils.helper()", with_modules({"src/./lib/utils.qsr"}));
        CHECK(found.ok());

        analysis missing("import \"./lib/utils.qsr\"", with_modules({}));
        CHECK(missing.code() == codes::E_MODULE_NOT_FOUND);
        CHECK(missing.message() == "module not found: './lib/utils.qsr'");
    }

    TEST_CASE("Named imports are not checked on disk") {
        CHECK(analysis("import collections", with_modules({})).ok());
    }
}
