//
// Tests for the scope stack
//

#include <doctest/doctest.h>
#include <quasar/semantic.hh>

using namespace quasar;
using namespace quasar::semantic;

namespace {
    symbol variable(const std::string& name, types::type t) {
        symbol sym;
        sym.name = name;
        sym.resolved = std::move(t);
        return sym;
    }
}

TEST_SUITE("Symbol Table") {
    TEST_CASE("Starts with only the global frame") {
        symbol_table table;
        CHECK(table.depth() == 1);
        CHECK(table.globals().empty());
        CHECK(table.lookup("x") == nullptr);
    }

    TEST_CASE("Define and look up") {
        symbol_table table;
        CHECK(table.define(variable("x", types::make_int())));

        const symbol* found = table.lookup("x");
        REQUIRE(found != nullptr);
        CHECK(found->resolved == types::make_int());
        CHECK(table.globals().count("x") == 1);
    }

    TEST_CASE("Redefinition in the same frame is rejected") {
        symbol_table table;
        CHECK(table.define(variable("x", types::make_int())));
        CHECK_FALSE(table.define(variable("x", types::make_str())));
        CHECK(table.lookup("x")->resolved == types::make_int());
    }

    TEST_CASE("Inner frame shadows the outer one until it is popped") {
        symbol_table table;
        table.define(variable("x", types::make_int()));

        table.enter_scope();
        CHECK(table.lookup_current_scope("x") == nullptr);
        CHECK(table.define(variable("x", types::make_str())));
        CHECK(table.lookup("x")->resolved == types::make_str());
        table.exit_scope();

        CHECK(table.lookup("x")->resolved == types::make_int());
    }

    TEST_CASE("Outer names are visible from inner frames") {
        symbol_table table;
        table.define(variable("total", types::make_float()));
        table.enter_scope();
        table.enter_scope();
        CHECK(table.lookup("total") != nullptr);
        CHECK(table.lookup_current_scope("total") == nullptr);
    }

    TEST_CASE("Scope guard pops its frame") {
        symbol_table table;
        {
            auto guard = table.scoped();
            CHECK(table.depth() == 2);
            table.define(variable("tmp", types::make_bool()));
        }
        CHECK(table.depth() == 1);
        CHECK(table.lookup("tmp") == nullptr);
    }

    TEST_CASE("The global frame is never popped") {
        symbol_table table;
        table.define(variable("g", types::make_int()));
        table.exit_scope();
        table.exit_scope();
        CHECK(table.depth() == 1);
        CHECK(table.lookup("g") != nullptr);
    }
}
