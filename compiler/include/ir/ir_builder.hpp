//! # IR Builder
//!
//! Lowers a parsed `Program` into a single IR function named `main`.
//!
//! ## Lowering Rules
//!
//! | AST node                     | IR                                    |
//! |------------------------------|---------------------------------------|
//! | `NumberLiteral(v)`           | `const v`                             |
//! | `IdentifierReference(n)`     | `load slot(n)`                        |
//! | `BinaryOperation(op, l, r)`  | lower `l`, lower `r`, then `op`       |
//! | `VariableDeclaration(n, v)`  | lower `v`, `store slot(n)`            |
//!
//! A name maps to one slot for the whole function: redeclaring it
//! overwrites the same slot. The value of a declaration statement is its
//! initializer's value. The function returns the value of the last
//! statement.

#ifndef WOLF_IR_IR_BUILDER_HPP
#define WOLF_IR_IR_BUILDER_HPP

#include "common.hpp"
#include "ir/ir.hpp"
#include "parser/ast.hpp"

#include <string>
#include <unordered_map>

namespace wolf::ir {

/// Why a program could not be lowered.
struct LoweringError {
    enum class Kind {
        UndefinedVariable, ///< A name was read before any `let` bound it.
        EmptyProgram,      ///< There is no statement to produce a result.
    };

    Kind kind;
    std::string name; ///< The undefined variable, empty otherwise.
    std::string message;
    SourceSpan span;
};

class IrBuilder {
public:
    IrBuilder() = default;

    /// Lowers `program` into a function with one sealed, terminated block.
    /// The result is not verified here; `LLVMBackend::build_module` runs
    /// `verify_function` before emitting it.
    [[nodiscard]] auto build(const parser::Program& program, const std::string& name = "main")
        -> Result<Function, LoweringError>;

private:
    Function func_;
    uint32_t current_block_ = 0;
    std::unordered_map<std::string, SlotId> variables_;

    auto lower_stmt(const parser::Stmt& stmt) -> Result<ValueId, LoweringError>;
    auto lower_expr(const parser::Expr& expr) -> Result<ValueId, LoweringError>;

    auto emit(Instruction inst, SourceSpan span) -> ValueId;
    void emit_void(Instruction inst, SourceSpan span);
    void emit_return(ValueId value);

    /// Returns the slot bound to `name`, creating it on first use.
    auto get_or_create_slot(const std::string& name) -> SlotId;

    static auto get_binop(parser::BinaryOp op) -> BinOp;
};

} // namespace wolf::ir

#endif // WOLF_IR_IR_BUILDER_HPP
