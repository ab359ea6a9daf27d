//! # Abstract Syntax Tree
//!
//! The tree produced by the parser and consumed by IR lowering.
//!
//! ```text
//! Program
//!   VariableDeclaration(name=x)
//!     BinaryOperation(Add)
//!       NumberLiteral(2)
//!       NumberLiteral(3)
//!   ExpressionStatement
//!     IdentifierReference(x)
//! ```
//!
//! Children are exclusively owned through `Box<T>`; the tree is acyclic and
//! immutable once built.

#ifndef WOLF_PARSER_AST_HPP
#define WOLF_PARSER_AST_HPP

#include "common.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace wolf::parser {

struct Expr;
struct Stmt;

using ExprPtr = Box<Expr>;
using StmtPtr = Box<Stmt>;

// ============================================================================
// Expressions
// ============================================================================

/// Arithmetic operators, all left-associative.
enum class BinaryOp {
    Add,      ///< `+`
    Subtract, ///< `-`
    Multiply, ///< `*`
    Divide,   ///< `/` (signed, truncating)
};

/// A signed 64-bit integer literal.
struct NumberLiteral {
    int64_t value;
};

/// A use of a previously declared variable.
struct IdentifierReference {
    std::string name;
};

/// `left op right`.
struct BinaryOperation {
    BinaryOp op;
    ExprPtr left;
    ExprPtr right;
};

struct Expr {
    std::variant<NumberLiteral, IdentifierReference, BinaryOperation> kind;
    SourceSpan span;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    /// Throws `std::bad_variant_access` if this is not a `T`.
    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }
};

// ============================================================================
// Statements
// ============================================================================

/// `expr;` The value is kept as a candidate program result.
struct ExpressionStatement {
    ExprPtr expr;
};

/// `let name = value;` Redeclaring a name overwrites the existing binding.
struct VariableDeclaration {
    std::string name;
    ExprPtr value;
};

struct Stmt {
    std::variant<ExpressionStatement, VariableDeclaration> kind;
    SourceSpan span;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }
};

/// An ordered list of statements; the last one yields the program result.
struct Program {
    std::vector<StmtPtr> statements;
};

// ============================================================================
// Construction Helpers
// ============================================================================

[[nodiscard]] auto make_number(int64_t value, SourceSpan span = {}) -> ExprPtr;
[[nodiscard]] auto make_identifier(std::string name, SourceSpan span = {}) -> ExprPtr;
[[nodiscard]] auto make_binary(BinaryOp op, ExprPtr left, ExprPtr right) -> ExprPtr;

// ============================================================================
// Printing
// ============================================================================

/// Returns the name used in dumps: "Add", "Subtract", "Multiply", "Divide".
[[nodiscard]] auto binary_op_name(BinaryOp op) -> std::string_view;

/// Returns the source symbol: "+", "-", "*", "/".
[[nodiscard]] auto binary_op_symbol(BinaryOp op) -> std::string_view;

/// Renders an indented tree, two spaces per level, one node per line.
class AstPrinter {
public:
    [[nodiscard]] auto print(const Program& program) -> std::string;
    [[nodiscard]] auto print(const Stmt& stmt) -> std::string;
    [[nodiscard]] auto print(const Expr& expr) -> std::string;

private:
    std::string out_;
    int indent_ = 0;

    void emit_line(std::string_view text);
    void visit(const Stmt& stmt);
    void visit(const Expr& expr);
};

/// Renders an expression on one line, fully parenthesized: `(1 + (2 * 3))`.
[[nodiscard]] auto to_source(const Expr& expr) -> std::string;

} // namespace wolf::parser

#endif // WOLF_PARSER_AST_HPP
