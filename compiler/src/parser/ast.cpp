//! # AST Factories and Printing
//!
//! | Function          | Purpose                                 |
//! |-------------------|-----------------------------------------|
//! | `make_number`     | Integer literal node                    |
//! | `make_identifier` | Variable reference node                 |
//! | `make_binary`     | Binary node spanning both operands      |
//! | `AstPrinter`      | Indented tree dump (`wolf parse`)       |
//! | `to_source`       | Parenthesized one-line rendering        |

#include "parser/ast.hpp"

#include <type_traits>

namespace wolf::parser {

auto make_number(int64_t value, SourceSpan span) -> ExprPtr {
    return make_box<Expr>(Expr{.kind = NumberLiteral{.value = value}, .span = span});
}

auto make_identifier(std::string name, SourceSpan span) -> ExprPtr {
    return make_box<Expr>(
        Expr{.kind = IdentifierReference{.name = std::move(name)}, .span = span});
}

auto make_binary(BinaryOp op, ExprPtr left, ExprPtr right) -> ExprPtr {
    auto span = SourceSpan::merge(left->span, right->span);
    return make_box<Expr>(Expr{
        .kind = BinaryOperation{.op = op, .left = std::move(left), .right = std::move(right)},
        .span = span});
}

auto binary_op_name(BinaryOp op) -> std::string_view {
    switch (op) {
    case BinaryOp::Add:
        return "Add";
    case BinaryOp::Subtract:
        return "Subtract";
    case BinaryOp::Multiply:
        return "Multiply";
    case BinaryOp::Divide:
        return "Divide";
    }
    return "Unknown";
}

auto binary_op_symbol(BinaryOp op) -> std::string_view {
    switch (op) {
    case BinaryOp::Add:
        return "+";
    case BinaryOp::Subtract:
        return "-";
    case BinaryOp::Multiply:
        return "*";
    case BinaryOp::Divide:
        return "/";
    }
    return "?";
}

// ============================================================================
// AstPrinter
// ============================================================================

auto AstPrinter::print(const Program& program) -> std::string {
    out_.clear();
    indent_ = 0;
    emit_line("Program");
    ++indent_;
    for (const auto& stmt : program.statements) {
        visit(*stmt);
    }
    return out_;
}

auto AstPrinter::print(const Stmt& stmt) -> std::string {
    out_.clear();
    indent_ = 0;
    visit(stmt);
    return out_;
}

auto AstPrinter::print(const Expr& expr) -> std::string {
    out_.clear();
    indent_ = 0;
    visit(expr);
    return out_;
}

void AstPrinter::emit_line(std::string_view text) {
    out_.append(static_cast<size_t>(indent_) * 2, ' ');
    out_ += text;
    out_ += '\n';
}

void AstPrinter::visit(const Stmt& stmt) {
    if (stmt.is<ExpressionStatement>()) {
        emit_line("ExpressionStatement");
        ++indent_;
        visit(*stmt.as<ExpressionStatement>().expr);
        --indent_;
        return;
    }

    const auto& decl = stmt.as<VariableDeclaration>();
    emit_line("VariableDeclaration(name=" + decl.name + ")");
    ++indent_;
    visit(*decl.value);
    --indent_;
}

void AstPrinter::visit(const Expr& expr) {
    std::visit(
        [this](const auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, NumberLiteral>) {
                emit_line("NumberLiteral(" + std::to_string(node.value) + ")");
            } else if constexpr (std::is_same_v<T, IdentifierReference>) {
                emit_line("IdentifierReference(" + node.name + ")");
            } else {
                emit_line("BinaryOperation(" + std::string(binary_op_name(node.op)) + ")");
                ++indent_;
                visit(*node.left);
                visit(*node.right);
                --indent_;
            }
        },
        expr.kind);
}

auto to_source(const Expr& expr) -> std::string {
    return std::visit(
        [](const auto& node) -> std::string {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, NumberLiteral>) {
                return std::to_string(node.value);
            } else if constexpr (std::is_same_v<T, IdentifierReference>) {
                return node.name;
            } else {
                return "(" + to_source(*node.left) + " " + std::string(binary_op_symbol(node.op)) +
                       " " + to_source(*node.right) + ")";
            }
        },
        expr.kind);
}

} // namespace wolf::parser
