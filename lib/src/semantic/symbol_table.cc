//
// Scope stack with shadowing
//

#include <quasar/semantic.hh>

namespace quasar::semantic {

// ============================================================================
// Scope guard
// ============================================================================

scope_guard::scope_guard(symbol_table& table)
    : table_(table) {
    table_.enter_scope();
}

scope_guard::~scope_guard() {
    table_.exit_scope();
}

// ============================================================================
// Frames
// ============================================================================

symbol_table::symbol_table()
    : frames_(1) {
}

void symbol_table::enter_scope() {
    frames_.emplace_back();
}

void symbol_table::exit_scope() {
    // The global frame stays
    if (frames_.size() > 1) {
        frames_.pop_back();
    }
}

scope_guard symbol_table::scoped() {
    return scope_guard(*this);
}

bool symbol_table::define(symbol sym) {
    auto& current = frames_.back();
    if (current.contains(sym.name)) {
        return false;
    }
    std::string name = sym.name;
    current.emplace(std::move(name), std::move(sym));
    return true;
}

// ============================================================================
// Lookup (innermost to outermost)
// ============================================================================

const symbol* symbol_table::lookup(const std::string& name) const {
    for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
        if (auto found = it->find(name); found != it->end()) {
            return &found->second;
        }
    }
    return nullptr;
}

const symbol* symbol_table::lookup_current_scope(const std::string& name) const {
    const auto& current = frames_.back();
    if (auto found = current.find(name); found != current.end()) {
        return &found->second;
    }
    return nullptr;
}

} // namespace quasar::semantic
