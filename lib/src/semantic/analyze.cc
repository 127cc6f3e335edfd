//
// Main semantic analysis entry point
//

#include <quasar/semantic.hh>

#include "semantic/checker.h"

namespace quasar::semantic {
    analysis_result analyze(const ast::program& program, const analysis_options& opts) {
        analysis_result result;

        analyzed_program analyzed;
        analyzed.original = &program;

        try {
            phases::checker walker(opts, analyzed);
            walker.run(program);
        } catch (phases::semantic_failure& failure) {
            // Fail-fast: the first violation is the only diagnostic
            result.diagnostics.push_back(std::move(failure.diag));
            return result;
        }

        // Only set analyzed if no errors
        result.analyzed = std::move(analyzed);
        return result;
    }
} // namespace quasar::semantic
