//
// Semantic Analysis for Quasar
//
// A single pass over the parsed program that resolves every name, checks every
// expression against the type rules and validates control flow. Analysis is
// fail-fast: the first violation stops the walk and becomes the only diagnostic.
//
// CHECKS PERFORMED:
//   - Scoping           - undeclared names, same-scope redeclaration, const reassignment
//   - Types             - exact-match binding, operator operand classes, containers
//   - User types        - struct literals/fields, enum variants
//   - Calls             - builtin functions, method registry, File/Env namespaces
//   - Control flow      - break/continue nesting, return placement and type
//   - Definite return   - every non-void function returns on all paths
//
// USAGE EXAMPLE:
//   auto program = parse_quasar(source, "main.qsr");
//
//   semantic::analysis_options opts;
//   opts.base_dir = "src";
//
//   auto result = semantic::analyze(program, opts);
//
//   if (result.has_errors()) {
//       result.print_diagnostics(std::cerr);
//       return 1;
//   }
//
//   // Resolved type of any expression node
//   const auto& analyzed = result.analyzed.value();
//   const types::type* t = analyzed.type_of(some_expr);
//

#pragma once

#include "ast.hh"
#include "types.hh"
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace quasar::semantic {

// ============================================================================
// Diagnostics
// ============================================================================

/// Severity level for diagnostic messages.
enum class diagnostic_level {
    error,      ///< Must fix - prevents compilation
    warning,    ///< Should fix
    note        ///< Additional context for errors/warnings
};

/// Stable diagnostic codes.
///
/// Categories:
/// - E00xx: Scoping (undeclared, redeclared, const reassignment)
/// - E01xx: Type and operator errors
/// - E02xx: Loop control and reserved names
/// - E03xx: Functions and returns
/// - E04xx: print()
/// - E05xx: Lists, ranges, len/push
/// - E06xx: input() and casts
/// - E08xx: Structs
/// - E09xx: Imports
/// - E10xx: Dicts
/// - E11xx: Methods
/// - E12xx: Enums
namespace diag_codes {
    // Scoping (E0001-E0003)
    constexpr const char* E_UNDECLARED = "E0001";             ///< Name not found in any enclosing scope
    constexpr const char* E_REDECLARATION = "E0002";          ///< Name already defined in the same scope
    constexpr const char* E_CONST_ASSIGN = "E0003";           ///< Assignment to a constant or function

    // Types and operators (E0100-E0104)
    constexpr const char* E_TYPE_MISMATCH = "E0100";          ///< Value type differs from the expected type
    constexpr const char* E_CONDITION_NOT_BOOL = "E0101";     ///< if/while condition is not bool
    constexpr const char* E_ARITHMETIC_OPERANDS = "E0102";    ///< Bad operands for arithmetic/equality/relational
    constexpr const char* E_STRING_COMPARISON = "E0103";      ///< < > <= >= applied to str
    constexpr const char* E_LOGICAL_OPERANDS = "E0104";       ///< && || ! on non-bool
    constexpr const char* E_DIVISION_BY_ZERO = "E0104";       ///< Division or modulo by literal zero

    // Loops and reserved names (E0200-E0205)
    constexpr const char* E_BREAK_OUTSIDE_LOOP = "E0200";
    constexpr const char* E_CONTINUE_OUTSIDE_LOOP = "E0201";
    constexpr const char* E_RESERVED_NAME = "E0205";          ///< Declaration shadows File/Env

    // Functions (E0302-E0304)
    constexpr const char* E_RETURN_MISMATCH = "E0302";        ///< Returned value differs from declared return type
    constexpr const char* E_MISSING_RETURN = "E0303";         ///< Non-void function may fall off the end
    constexpr const char* E_RETURN_OUTSIDE_FUNCTION = "E0304";

    // print (E0402-E0411)
    constexpr const char* E_PRINT_SEP = "E0402";              ///< sep= is not str
    constexpr const char* E_PRINT_END = "E0403";              ///< end= is not str
    constexpr const char* E_FORMAT_TOO_MANY = "E0410";        ///< More {} placeholders than arguments
    constexpr const char* E_FORMAT_TOO_FEW = "E0411";         ///< Fewer {} placeholders than arguments

    // Lists (E0500-E0507)
    constexpr const char* E_HETEROGENEOUS_LIST = "E0500";
    constexpr const char* E_INDEX_NOT_INT = "E0501";
    constexpr const char* E_NOT_INDEXABLE = "E0502";
    constexpr const char* E_ELEMENT_ASSIGN = "E0503";
    constexpr const char* E_RANGE_BOUNDS = "E0504";
    constexpr const char* E_NOT_ITERABLE = "E0505";
    constexpr const char* E_PUSH_ARGS = "E0506";
    constexpr const char* E_LEN_ARGS = "E0507";

    // input() and casts (E0600-E0602)
    constexpr const char* E_INPUT_ARGS = "E0600";
    constexpr const char* E_INPUT_PROMPT = "E0601";
    constexpr const char* E_CAST_ARGS = "E0602";

    // Structs (E0800-E0809)
    constexpr const char* E_STRUCT_REDEFINITION = "E0800";
    constexpr const char* E_DUPLICATE_FIELD = "E0801";
    constexpr const char* E_UNKNOWN_STRUCT = "E0803";         ///< Type name not declared
    constexpr const char* E_MISSING_FIELDS = "E0804";
    constexpr const char* E_UNKNOWN_FIELD_INIT = "E0805";
    constexpr const char* E_FIELD_INIT_TYPE = "E0806";
    constexpr const char* E_MEMBER_OF_NON_STRUCT = "E0807";
    constexpr const char* E_NO_SUCH_FIELD = "E0808";
    constexpr const char* E_FIELD_ASSIGN_TYPE = "E0809";

    // Imports (E0900-E0901)
    constexpr const char* E_DUPLICATE_IMPORT = "E0900";
    constexpr const char* E_MODULE_NOT_FOUND = "E0901";

    // Dicts (E1000-E1006)
    constexpr const char* E_HETEROGENEOUS_KEYS = "E1000";
    constexpr const char* E_HETEROGENEOUS_VALUES = "E1001";
    constexpr const char* E_UNHASHABLE_KEY = "E1002";
    constexpr const char* E_DICT_KEY_TYPE = "E1003";
    constexpr const char* E_DICT_VALUE_TYPE = "E1004";
    constexpr const char* E_KEYS_ARGS = "E1005";
    constexpr const char* E_VALUES_ARGS = "E1006";

    // Methods (E1100-E1107)
    constexpr const char* E_METHOD_GENERIC_ARG = "E1100";    ///< Element/key/value argument type mismatch
    constexpr const char* E_JOIN_NOT_STR_LIST = "E1102";
    constexpr const char* E_UNKNOWN_METHOD = "E1105";
    constexpr const char* E_METHOD_ARG_COUNT = "E1106";
    constexpr const char* E_METHOD_ARG_TYPE = "E1107";

    // Enums (E1200-E1205)
    constexpr const char* E_TYPE_REDECLARATION = "E1200";    ///< Enum/struct name already taken
    constexpr const char* E_DUPLICATE_VARIANT = "E1201";
    constexpr const char* E_UNKNOWN_VARIANT = "E1202";
    constexpr const char* E_ENUM_EQUALITY = "E1204";         ///< == / != across different enums
    constexpr const char* E_ENUM_ORDERING = "E1205";         ///< < > <= >= on enums
}

/// A single diagnostic message.
///
/// Example output:
///   main.qsr:3:14: error: type mismatch: expected int, got float [E0100]
struct diagnostic {
    diagnostic_level level;         ///< Severity
    std::string code;               ///< Diagnostic code (e.g., "E0100")
    std::string message;            ///< Human-readable error message
    ast::span position;             ///< Primary location in source file

    // Optional related location (e.g., "previous definition here")
    std::optional<ast::span> related_position;  ///< Secondary location for context
    std::optional<std::string> related_message;       ///< Message for related location

    /// Compiler-style multi-line form: "file:line:col: error: message [code]"
    std::string format() const;

    /// Single-line form: "file:line:col: CODE: message"
    std::string str() const;
};

// ============================================================================
// Symbol Table
// ============================================================================

struct symbol {
    std::string name;
    types::type resolved;              ///< Value type; return type for functions
    bool is_const = false;             ///< Constants, functions and imported modules
    bool is_function = false;
    std::vector<types::type> params;   ///< Parameter types (functions only)
    ast::span declared_at;
};

class symbol_table;

/// Pushes a frame on construction and pops it when destroyed.
class scope_guard {
public:
    explicit scope_guard(symbol_table& table);
    ~scope_guard();

    scope_guard(const scope_guard&) = delete;
    scope_guard& operator=(const scope_guard&) = delete;

private:
    symbol_table& table_;
};

/// Stack of name -> symbol frames. Frame 0 is the global scope and is never popped.
///
/// Lookup walks innermost to outermost. define() only rejects names already
/// present in the innermost frame, so shadowing an outer frame always works.
class symbol_table {
public:
    symbol_table();

    void enter_scope();
    void exit_scope();

    /// Push a frame and return a guard that pops it.
    [[nodiscard]] scope_guard scoped();

    /// @return false if the innermost frame already has this name
    bool define(symbol sym);

    [[nodiscard]] const symbol* lookup(const std::string& name) const;
    [[nodiscard]] const symbol* lookup_current_scope(const std::string& name) const;

    [[nodiscard]] std::size_t depth() const { return frames_.size(); }

    /// Symbols of the global frame
    [[nodiscard]] const std::map<std::string, symbol>& globals() const { return frames_.front(); }

private:
    std::vector<std::map<std::string, symbol>> frames_;
};

// ============================================================================
// Analysis Output
// ============================================================================

/// Declared structs and enums. Entries are heap-allocated so the pointers held
/// by types::struct_type / types::enum_type stay valid when the registry moves.
struct type_registry {
    std::map<std::string, std::unique_ptr<types::struct_info>> structs;
    std::map<std::string, std::unique_ptr<types::enum_info>> enums;

    [[nodiscard]] const types::struct_info* find_struct(const std::string& name) const;
    [[nodiscard]] const types::enum_info* find_enum(const std::string& name) const;
};

/// Validated program. The tree itself is never modified; resolved types live
/// in a side table keyed by node identity.
struct analyzed_program {
    const ast::program* original = nullptr;

    /// Resolved type of every expression node in the program
    std::map<const ast::expr*, types::type> expression_types;

    type_registry types;

    /// Top-level bindings (variables, constants, functions, imported modules)
    std::map<std::string, symbol> globals;

    /// @return nullptr if `e` is not part of the analyzed program
    [[nodiscard]] const types::type* type_of(const ast::expr& e) const;
};

struct analysis_result {
    /// Set only when there are no errors
    std::optional<analyzed_program> analyzed;

    std::vector<diagnostic> diagnostics;

    bool has_errors() const;

    size_t error_count() const;

    /// First error, or nullptr
    const diagnostic* first_error() const;

    void print_diagnostics(std::ostream& os) const;
};

// ============================================================================
// Analysis Options
// ============================================================================

struct analysis_options {
    /// Directory local imports are resolved against
    std::filesystem::path base_dir = ".";

    /// Existence check for local imports; std::filesystem::exists when empty
    std::function<bool(const std::filesystem::path&)> module_exists;

    /// Builtin static namespaces that can never be declared. The set only
    /// narrows the builtin tables: names other than File and Env are ignored.
    std::set<std::string> reserved_namespaces = {"File", "Env"};
};

// ============================================================================
// Main Analysis Interface
// ============================================================================

/// Analyze `program`. The returned result refers to `program` by pointer, so
/// `program` must outlive it.
analysis_result analyze(const ast::program& program,
                        const analysis_options& opts = {});

// ============================================================================
// Flow analysis (exposed for testing)
// ============================================================================

namespace phases {

/// True if every path through `body` reaches a `return`.
/// The last declaration decides: a return does, an if/else does when both
/// branches do, a nested block does when its contents do; loops never do.
[[nodiscard]] bool definitely_returns(const ast::block& body);

[[nodiscard]] bool definitely_returns(const ast::statement& stmt);

} // namespace phases

} // namespace quasar::semantic
