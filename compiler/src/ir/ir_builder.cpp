//! # IR Builder Implementation
//!
//! Operands are lowered left to right, so the instruction order matches the
//! source order of the subexpressions.

#include "ir/ir_builder.hpp"

#include "log/log.hpp"


namespace wolf::ir {

auto IrBuilder::build(const parser::Program& program, const std::string& name)
    -> Result<Function, LoweringError> {
    func_ = Function{.name = name};
    variables_.clear();

    current_block_ = func_.create_block("entry");
    // The function has a single block with no predecessors.
    func_.get_block(current_block_)->sealed = true;

    if (program.statements.empty()) {
        return LoweringError{.kind = LoweringError::Kind::EmptyProgram,
                             .name = {},
                             .message = "Program had no statements",
                             .span = {}};
    }

    ValueId last = INVALID_VALUE;
    for (const auto& stmt : program.statements) {
        auto value = lower_stmt(*stmt);
        if (is_err(value)) {
            return unwrap_err(value);
        }
        last = unwrap(value);
    }

    emit_return(last);

    WOLF_LOG_DEBUG("ir", "Lowered '" << name << "': " << func_.instruction_count()
                                     << " instructions, " << func_.slots.size() << " slots");
    return std::move(func_);
}

auto IrBuilder::lower_stmt(const parser::Stmt& stmt) -> Result<ValueId, LoweringError> {
    if (stmt.is<parser::ExpressionStatement>()) {
        return lower_expr(*stmt.as<parser::ExpressionStatement>().expr);
    }

    const auto& decl = stmt.as<parser::VariableDeclaration>();
    auto value = lower_expr(*decl.value);
    if (is_err(value)) {
        return value;
    }

    SlotId slot = get_or_create_slot(decl.name);
    emit_void(StoreInst{.slot = slot, .value = unwrap(value)}, stmt.span);
    return value;
}

auto IrBuilder::lower_expr(const parser::Expr& expr) -> Result<ValueId, LoweringError> {
    if (expr.is<parser::NumberLiteral>()) {
        return emit(ConstInst{.value = expr.as<parser::NumberLiteral>().value}, expr.span);
    }

    if (expr.is<parser::IdentifierReference>()) {
        const auto& ident = expr.as<parser::IdentifierReference>();
        auto it = variables_.find(ident.name);
        if (it == variables_.end()) {
            return LoweringError{.kind = LoweringError::Kind::UndefinedVariable,
                                 .name = ident.name,
                                 .message = "Undefined variable: " + ident.name,
                                 .span = expr.span};
        }
        return emit(LoadInst{.slot = it->second}, expr.span);
    }

    const auto& bin = expr.as<parser::BinaryOperation>();
    auto left = lower_expr(*bin.left);
    if (is_err(left)) {
        return left;
    }
    auto right = lower_expr(*bin.right);
    if (is_err(right)) {
        return right;
    }

    return emit(BinaryInst{.op = get_binop(bin.op), .left = unwrap(left), .right = unwrap(right)},
                expr.span);
}

auto IrBuilder::emit(Instruction inst, SourceSpan span) -> ValueId {
    ValueId id = func_.fresh_value();
    func_.get_block(current_block_)
        ->instructions.push_back(
            InstructionData{.result = id, .inst = std::move(inst), .span = span});
    return id;
}

void IrBuilder::emit_void(Instruction inst, SourceSpan span) {
    // Stores still consume an instruction number so ids stay positional.
    (void)func_.fresh_value();
    func_.get_block(current_block_)
        ->instructions.push_back(
            InstructionData{.result = INVALID_VALUE, .inst = std::move(inst), .span = span});
}

void IrBuilder::emit_return(ValueId value) {
    func_.get_block(current_block_)->terminator = ReturnTerm{.value = value};
}

auto IrBuilder::get_or_create_slot(const std::string& name) -> SlotId {
    auto it = variables_.find(name);
    if (it != variables_.end()) {
        return it->second;
    }
    SlotId slot = func_.create_slot(name);
    variables_.emplace(name, slot);
    WOLF_LOG_TRACE("ir", "Allocated slot" << slot << " for '" << name << "'");
    return slot;
}

auto IrBuilder::get_binop(parser::BinaryOp op) -> BinOp {
    switch (op) {
    case parser::BinaryOp::Add:
        return BinOp::Add;
    case parser::BinaryOp::Subtract:
        return BinOp::Sub;
    case parser::BinaryOp::Multiply:
        return BinOp::Mul;
    case parser::BinaryOp::Divide:
        return BinOp::SDiv;
    }
    return BinOp::Add;
}

} // namespace wolf::ir
