#include "logger.hh"

#include <termcolor/termcolor.hpp>

namespace quasar::driver {

namespace {
    const char* label_of(semantic::diagnostic_level level) {
        switch (level) {
            case semantic::diagnostic_level::error: return "error";
            case semantic::diagnostic_level::warning: return "warning";
            case semantic::diagnostic_level::note: return "note";
        }
        return "error";
    }
}

Logger::Logger(LogLevel level, ColorMode color)
    : level_(level)
    , color_mode_(color)
{
    switch (color_mode_) {
        case ColorMode::Always:
            std::cout << termcolor::colorize;
            std::cerr << termcolor::colorize;
            break;
        case ColorMode::Never:
            std::cout << termcolor::nocolorize;
            std::cerr << termcolor::nocolorize;
            break;
        case ColorMode::Auto:
            // termcolor checks for a TTY itself
            break;
    }
}

bool Logger::should_log(LogLevel required_level) const {
    return static_cast<int>(level_) >= static_cast<int>(required_level);
}

void Logger::error(const std::string& message) {
    if (!should_log(LogLevel::Quiet)) return;

    std::cerr << termcolor::bold << termcolor::red
              << "error: " << termcolor::reset
              << message << "\n";
}

void Logger::warning(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    std::cerr << termcolor::bold << termcolor::yellow
              << "warning: " << termcolor::reset
              << message << "\n";
}

void Logger::info(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    std::cout << message << "\n";
}

void Logger::success(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    std::cout << termcolor::bold << termcolor::green
              << "ok: " << termcolor::reset
              << message << "\n";
}

void Logger::verbose(const std::string& message) {
    if (!should_log(LogLevel::Verbose)) return;

    std::cout << termcolor::cyan
              << message << termcolor::reset << "\n";
}

void Logger::debug(const std::string& message) {
    if (!should_log(LogLevel::Debug)) return;

    std::cout << termcolor::magenta
              << "[debug] " << termcolor::reset
              << message << "\n";
}

// Only the location and the severity label are styled
void Logger::location_line(const ast::span& where, semantic::diagnostic_level level,
                           const std::string& label, const std::string& message) {
    std::cerr << termcolor::bold << where.str() << ":" << termcolor::reset << " ";

    switch (level) {
        case semantic::diagnostic_level::error:
            std::cerr << termcolor::bold << termcolor::red;
            break;
        case semantic::diagnostic_level::warning:
            std::cerr << termcolor::bold << termcolor::yellow;
            break;
        case semantic::diagnostic_level::note:
            std::cerr << termcolor::bold << termcolor::cyan;
            break;
    }
    std::cerr << label << ":" << termcolor::reset << " " << message;
}

void Logger::diagnostic(const semantic::diagnostic& diag) {
    if (!should_log(LogLevel::Quiet)) return;

    location_line(diag.position, diag.level, label_of(diag.level), diag.message);
    if (!diag.code.empty()) {
        std::cerr << termcolor::grey << " [" << diag.code << "]" << termcolor::reset;
    }
    std::cerr << "\n";

    if (diag.related_position && diag.related_message) {
        location_line(*diag.related_position, semantic::diagnostic_level::note, "note", *diag.related_message);
        std::cerr << "\n";
    }
}

void Logger::located_error(const std::string& kind, const quasar::source_error& e) {
    if (!should_log(LogLevel::Quiet)) return;

    location_line(e.location(), semantic::diagnostic_level::error, kind, e.message());
    std::cerr << "\n";
}

void Logger::indent(const std::string& message, int spaces, LogLevel min_level) {
    if (!should_log(min_level)) return;

    std::cout << std::string(static_cast<size_t>(spaces), ' ') << message << "\n";
}

} // namespace quasar::driver
