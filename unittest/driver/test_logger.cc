//
// Tests for diagnostic rendering in the qsr logger
//

#include <doctest/doctest.h>
#include <quasar/parser.hh>
#include <quasar/semantic.hh>

#include <sstream>
#include <string>

#include "logger.hh"

using namespace quasar;
using quasar::driver::ColorMode;
using quasar::driver::Logger;
using quasar::driver::LogLevel;

namespace {
    // termcolor still colours a terminal under nocolorize
    std::string strip_escapes(const std::string& text) {
        std::string out;
        for (std::size_t i = 0; i < text.size(); ++i) {
            if (text[i] == '\033') {
                while (i < text.size() && text[i] != 'm') {
                    ++i;
                }
                continue;
            }
            out += text[i];
        }
        return out;
    }

    template<typename Emit>
    std::string captured_stderr(LogLevel level, Emit emit) {
        std::ostringstream captured;
        auto* saved = std::cerr.rdbuf(captured.rdbuf());
        Logger logger(level, ColorMode::Never);
        emit(logger);
        std::cerr.rdbuf(saved);
        return strip_escapes(captured.str());
    }

    std::string rendered(const semantic::diagnostic& diag, LogLevel level = LogLevel::Normal) {
        return captured_stderr(level, [&](Logger& logger) { logger.diagnostic(diag); });
    }

    semantic::diagnostic redeclaration() {
        semantic::diagnostic diag;
        diag.level = semantic::diagnostic_level::error;
        diag.code = semantic::diag_codes::E_REDECLARATION;
        diag.message = "redeclaration of 'x' in the same scope";
        diag.position = ast::span(2, 5, 2, 5, "main.qsr");
        return diag;
    }
}

TEST_SUITE("Driver - Logger") {
    TEST_CASE("Diagnostic text matches the plain format") {
        const auto diag = redeclaration();
        CHECK(rendered(diag) == diag.format());
        CHECK(rendered(diag) == "main.qsr:2:5: error: redeclaration of 'x' in the same scope [E0002]\n");
    }

    TEST_CASE("Related location is rendered as a note") {
        auto diag = redeclaration();
        diag.related_position = ast::span(1, 5, 1, 5, "main.qsr");
        diag.related_message = "previous declaration is here";
        CHECK(rendered(diag) == diag.format());
    }

    TEST_CASE("Warnings and diagnostics without a code") {
        auto diag = redeclaration();
        diag.level = semantic::diagnostic_level::warning;
        diag.code.clear();
        CHECK(rendered(diag) == "main.qsr:2:5: warning: redeclaration of 'x' in the same scope\n");
    }

    TEST_CASE("Quiet level still reports diagnostics") {
        const auto diag = redeclaration();
        CHECK(rendered(diag, LogLevel::Quiet) == diag.format());
    }

    TEST_CASE("Syntax errors keep the exception's display form") {
        try {
            (void)parse_quasar("let x: int =");
            FAIL("expected a syntax error");
        } catch (const syntax_error& e) {
            const auto out = captured_stderr(LogLevel::Normal, [&](Logger& logger) {
                logger.located_error("syntax error", e);
            });
            CHECK(out == std::string(e.what()) + "\n");
        }
    }
}
