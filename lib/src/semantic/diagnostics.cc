//
// Diagnostic formatting and utilities
//

#include <quasar/semantic.hh>
#include <sstream>
#include <algorithm>

namespace quasar::semantic {

// ============================================================================
// Diagnostic Formatting
// ============================================================================

std::string diagnostic::format() const {
    std::ostringstream oss;

    // Format: file:line:column: level: message [code]
    oss << position.str() << ": ";

    switch (level) {
        case diagnostic_level::error:
            oss << "error: ";
            break;
        case diagnostic_level::warning:
            oss << "warning: ";
            break;
        case diagnostic_level::note:
            oss << "note: ";
            break;
    }

    oss << message;

    // Add diagnostic code
    if (!code.empty()) {
        oss << " [" << code << "]";
    }

    oss << "\n";

    // Add related location if present
    if (related_position && related_message) {
        oss << related_position->str() << ": note: "
            << related_message.value() << "\n";
    }

    return oss.str();
}

std::string diagnostic::str() const {
    return position.str() + ": " + code + ": " + message;
}

// ============================================================================
// Analysis Result Methods
// ============================================================================

bool analysis_result::has_errors() const {
    return std::any_of(diagnostics.begin(), diagnostics.end(),
        [](const auto& d) { return d.level == diagnostic_level::error; });
}

size_t analysis_result::error_count() const {
    return std::count_if(diagnostics.begin(), diagnostics.end(),
        [](const auto& d) { return d.level == diagnostic_level::error; });
}

const diagnostic* analysis_result::first_error() const {
    auto it = std::find_if(diagnostics.begin(), diagnostics.end(),
        [](const auto& d) { return d.level == diagnostic_level::error; });
    return it != diagnostics.end() ? &*it : nullptr;
}

void analysis_result::print_diagnostics(std::ostream& os) const {
    for (const auto& diag : diagnostics) {
        os << diag.format();
    }

    // Summary
    if (!diagnostics.empty()) {
        size_t errors = error_count();
        if (errors > 0) {
            os << "\n" << errors << " error" << (errors != 1 ? "s" : "") << " generated.\n";
        }
    }
}

// ============================================================================
// Registry / output lookups
// ============================================================================

const types::struct_info* type_registry::find_struct(const std::string& name) const {
    if (auto it = structs.find(name); it != structs.end()) {
        return it->second.get();
    }
    return nullptr;
}

const types::enum_info* type_registry::find_enum(const std::string& name) const {
    if (auto it = enums.find(name); it != enums.end()) {
        return it->second.get();
    }
    return nullptr;
}

const types::type* analyzed_program::type_of(const ast::expr& e) const {
    if (auto it = expression_types.find(&e); it != expression_types.end()) {
        return &it->second;
    }
    return nullptr;
}

} // namespace quasar::semantic
