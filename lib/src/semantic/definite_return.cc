//
// Definite return analysis
//
// Conservative: only the last declaration of a block is inspected, and loops
// are assumed to possibly run zero times.
//

#include <quasar/semantic.hh>

namespace quasar::semantic::phases {

bool definitely_returns(const ast::block& body) {
    if (body.declarations.empty()) {
        return false;
    }

    const auto* stmt = std::get_if<ast::statement>(&body.declarations.back().node);
    if (!stmt) {
        return false;
    }
    return definitely_returns(*stmt);
}

bool definitely_returns(const ast::statement& stmt) {
    if (std::holds_alternative<ast::return_statement>(stmt.node)) {
        return true;
    }

    if (auto* if_stmt = std::get_if<ast::if_statement>(&stmt.node)) {
        if (!if_stmt->else_block) {
            return false;
        }
        return definitely_returns(if_stmt->then_block) && definitely_returns(*if_stmt->else_block);
    }

    if (auto* nested = std::get_if<ast::block>(&stmt.node)) {
        return definitely_returns(*nested);
    }

    // while / for bodies may not execute at all
    return false;
}

} // namespace quasar::semantic::phases
