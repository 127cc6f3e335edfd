#pragma once

#include <iostream>
#include <string>

#include <quasar/parser_error.hh>
#include <quasar/semantic.hh>

namespace quasar::driver {

enum class LogLevel {
    Quiet,   // Errors only
    Normal,  // Errors, warnings, info, success
    Verbose, // + verbose messages
    Debug    // + debug messages
};

enum class ColorMode {
    Auto,    // Auto-detect TTY
    Always,  // Force colors
    Never    // Disable colors
};

/**
 * Console logger for qsr.
 *
 * Output routing:
 * - Errors, warnings -> stderr
 * - Info, success, verbose, debug -> stdout
 */
class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::Normal,
                   ColorMode color = ColorMode::Auto);

    void error(const std::string& message);
    void warning(const std::string& message);
    void info(const std::string& message);
    void success(const std::string& message);
    void verbose(const std::string& message);
    void debug(const std::string& message);

    /// Analyzer diagnostic in the semantic::diagnostic::format() layout,
    /// with the location in bold and the severity word coloured
    void diagnostic(const semantic::diagnostic& diag);

    /// Lexer or parser failure: "file:line:col: <kind>: message"
    void located_error(const std::string& kind, const quasar::source_error& e);

    void indent(const std::string& message, int spaces = 2, LogLevel min_level = LogLevel::Normal);

private:
    LogLevel level_;
    ColorMode color_mode_;

    bool should_log(LogLevel required_level) const;
    void location_line(const ast::span& where, semantic::diagnostic_level level,
                       const std::string& label, const std::string& message);
};

} // namespace quasar::driver
