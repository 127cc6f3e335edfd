//
// Created by igor on 06/12/2025.
//

#include <quasar/ast_printer.hh>

#include <sstream>
#include <type_traits>

namespace quasar::ast {
    namespace {
        const char* op_to_string(binary_op op) {
            switch (op) {
                case binary_op::add: return "+";
                case binary_op::sub: return "-";
                case binary_op::mul: return "*";
                case binary_op::div: return "/";
                case binary_op::mod: return "%";
                case binary_op::eq: return "==";
                case binary_op::ne: return "!=";
                case binary_op::lt: return "<";
                case binary_op::gt: return ">";
                case binary_op::le: return "<=";
                case binary_op::ge: return ">=";
                case binary_op::log_and: return "&&";
                case binary_op::log_or: return "||";
            }
            return "?";
        }

        const char* op_to_string(unary_op op) {
            switch (op) {
                case unary_op::neg: return "-";
                case unary_op::log_not: return "!";
            }
            return "?";
        }

        // Writes nodes into a stream; blocks go multi-line only when `multiline_` is set
        class sexpr_writer {
            public:
                explicit sexpr_writer(bool multiline)
                    : multiline_(multiline) {
                }

                std::string str() const { return out_.str(); }

                void write(const type_annotation& t) {
                    std::visit([this](const auto& node) { write_type(node); }, t.node);
                }

                void write(const expr& e) {
                    std::visit([this](const auto& node) { write_expr(node); }, e.node);
                }

                void write(const declaration& d) {
                    std::visit([this](const auto& node) { write_decl(node); }, d.node);
                }

            private:
                std::ostringstream out_;
                bool multiline_;
                int indent_ = 0;

                void write_list(const std::vector<expr>& items) {
                    for (const auto& item : items) {
                        out_ << ' ';
                        write(item);
                    }
                }

                // ---- types ----
                void write_type(const primitive_annotation& t) {
                    switch (t.name) {
                        case primitive_name::int_: out_ << "int"; break;
                        case primitive_name::float_: out_ << "float"; break;
                        case primitive_name::bool_: out_ << "bool"; break;
                        case primitive_name::str: out_ << "str"; break;
                    }
                }

                void write_type(const list_annotation& t) {
                    out_ << '[';
                    write(*t.element);
                    out_ << ']';
                }

                void write_type(const dict_annotation& t) {
                    out_ << "Dict[";
                    write(*t.key);
                    out_ << ", ";
                    write(*t.value);
                    out_ << ']';
                }

                void write_type(const named_annotation& t) {
                    out_ << t.name;
                }

                // ---- expressions ----
                void write_expr(const literal_int& e) { out_ << e.value; }
                void write_expr(const literal_float& e) { out_ << e.value; }
                void write_expr(const literal_string& e) { out_ << '"' << e.value << '"'; }
                void write_expr(const literal_bool& e) { out_ << (e.value ? "true" : "false"); }
                void write_expr(const identifier& e) { out_ << e.name; }

                void write_expr(const list_literal& e) {
                    out_ << "(list";
                    write_list(e.elements);
                    out_ << ')';
                }

                void write_expr(const dict_literal& e) {
                    out_ << "(dict";
                    for (const auto& entry : e.entries) {
                        out_ << " (";
                        write(*entry.key);
                        out_ << ' ';
                        write(*entry.value);
                        out_ << ')';
                    }
                    out_ << ')';
                }

                void write_expr(const struct_init& e) {
                    out_ << "(struct " << e.name;
                    for (const auto& field : e.fields) {
                        out_ << " (" << field.name << ' ';
                        write(*field.value);
                        out_ << ')';
                    }
                    out_ << ')';
                }

                void write_expr(const unary_expr& e) {
                    out_ << '(' << op_to_string(e.op) << ' ';
                    write(*e.operand);
                    out_ << ')';
                }

                void write_expr(const binary_expr& e) {
                    out_ << '(' << op_to_string(e.op) << ' ';
                    write(*e.left);
                    out_ << ' ';
                    write(*e.right);
                    out_ << ')';
                }

                void write_expr(const call_expr& e) {
                    out_ << "(call " << e.callee;
                    write_list(e.arguments);
                    out_ << ')';
                }

                void write_expr(const index_expr& e) {
                    out_ << "(index ";
                    write(*e.target);
                    out_ << ' ';
                    write(*e.index);
                    out_ << ')';
                }

                void write_expr(const member_access_expr& e) {
                    out_ << "(. ";
                    write(*e.object);
                    out_ << ' ' << e.member << ')';
                }

                void write_expr(const method_call_expr& e) {
                    out_ << "(method ";
                    write(*e.object);
                    out_ << ' ' << e.method;
                    write_list(e.arguments);
                    out_ << ')';
                }

                void write_expr(const range_expr& e) {
                    out_ << "(.. ";
                    write(*e.start);
                    out_ << ' ';
                    write(*e.end);
                    out_ << ')';
                }

                // ---- statements ----
                void newline() {
                    out_ << '\n' << std::string(static_cast<size_t>(indent_) * 2, ' ');
                }

                void write_block(const block& b) {
                    out_ << "(block";
                    if (!multiline_) {
                        for (const auto& d : b.declarations) {
                            out_ << ' ';
                            write(d);
                        }
                        out_ << ')';
                        return;
                    }
                    ++indent_;
                    for (const auto& d : b.declarations) {
                        newline();
                        write(d);
                    }
                    --indent_;
                    out_ << ')';
                }

                void write_stmt(const block& s) { write_block(s); }

                void write_stmt(const expression_statement& s) { write(s.expression); }

                void write_stmt(const if_statement& s) {
                    out_ << "(if ";
                    write(s.condition);
                    out_ << ' ';
                    write_block(s.then_block);
                    if (s.else_block) {
                        out_ << ' ';
                        write_block(*s.else_block);
                    }
                    out_ << ')';
                }

                void write_stmt(const while_statement& s) {
                    out_ << "(while ";
                    write(s.condition);
                    out_ << ' ';
                    write_block(s.body);
                    out_ << ')';
                }

                void write_stmt(const for_statement& s) {
                    out_ << "(for " << s.variable << ' ';
                    write(s.iterable);
                    out_ << ' ';
                    write_block(s.body);
                    out_ << ')';
                }

                void write_stmt(const return_statement& s) {
                    out_ << "(return";
                    if (s.value) {
                        out_ << ' ';
                        write(*s.value);
                    }
                    out_ << ')';
                }

                void write_stmt(const break_statement&) { out_ << "(break)"; }
                void write_stmt(const continue_statement&) { out_ << "(continue)"; }

                void write_stmt(const assign_statement& s) {
                    out_ << "(= " << s.target << ' ';
                    write(s.value);
                    out_ << ')';
                }

                void write_stmt(const index_assign_statement& s) {
                    out_ << "(= (index ";
                    write(s.target);
                    out_ << ' ';
                    write(s.index);
                    out_ << ") ";
                    write(s.value);
                    out_ << ')';
                }

                void write_stmt(const member_assign_statement& s) {
                    out_ << "(= (. ";
                    write(s.object);
                    out_ << ' ' << s.member << ") ";
                    write(s.value);
                    out_ << ')';
                }

                void write_stmt(const print_statement& s) {
                    out_ << "(print";
                    write_list(s.arguments);
                    if (s.sep) {
                        out_ << " (sep ";
                        write(*s.sep);
                        out_ << ')';
                    }
                    if (s.end) {
                        out_ << " (end ";
                        write(*s.end);
                        out_ << ')';
                    }
                    out_ << ')';
                }

                // ---- declarations ----
                void write_decl(const var_decl& d) {
                    out_ << "(let " << d.name << ' ';
                    write(d.annotation);
                    out_ << ' ';
                    write(d.initializer);
                    out_ << ')';
                }

                void write_decl(const const_decl& d) {
                    out_ << "(const " << d.name << ' ';
                    write(d.annotation);
                    out_ << ' ';
                    write(d.initializer);
                    out_ << ')';
                }

                void write_decl(const fn_decl& d) {
                    out_ << "(fn " << d.name << " (";
                    for (size_t i = 0; i < d.params.size(); ++i) {
                        if (i > 0) out_ << ' ';
                        out_ << '(' << d.params[i].name << ' ';
                        write(d.params[i].annotation);
                        out_ << ')';
                    }
                    out_ << ") ";
                    write(d.return_type);
                    out_ << ' ';
                    write_block(d.body);
                    out_ << ')';
                }

                void write_decl(const struct_decl& d) {
                    out_ << "(struct " << d.name;
                    for (const auto& field : d.fields) {
                        out_ << " (" << field.name << ' ';
                        write(field.annotation);
                        out_ << ')';
                    }
                    out_ << ')';
                }

                void write_decl(const enum_decl& d) {
                    out_ << "(enum " << d.name;
                    for (const auto& variant : d.variants) {
                        out_ << ' ' << variant.name;
                    }
                    out_ << ')';
                }

                void write_decl(const import_decl& d) {
                    out_ << "(import ";
                    if (d.is_local) {
                        out_ << '"' << d.module << '"';
                    } else {
                        out_ << d.module;
                    }
                    out_ << ')';
                }

                void write_decl(const statement& s) {
                    std::visit([this](const auto& node) { write_stmt(node); }, s.node);
                }
        };
    }

    std::string to_sexpr(const expr& e) {
        sexpr_writer writer(false);
        writer.write(e);
        return writer.str();
    }

    std::string to_sexpr(const type_annotation& t) {
        sexpr_writer writer(false);
        writer.write(t);
        return writer.str();
    }

    std::string to_sexpr(const declaration& d) {
        sexpr_writer writer(false);
        writer.write(d);
        return writer.str();
    }

    std::string dump(const program& prog) {
        std::string result;
        for (const auto& decl : prog.declarations) {
            sexpr_writer writer(true);
            writer.write(decl);
            result += writer.str();
            result += '\n';
        }
        return result;
    }
}
