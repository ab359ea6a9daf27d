//! # IR Pretty Printer
//!
//! Human-readable IR output for the `wolf ir` command and tests.

#include "ir/ir.hpp"

#include <sstream>
#include <type_traits>

namespace wolf::ir {

auto binop_name(BinOp op) -> std::string_view {
    switch (op) {
    case BinOp::Add:
        return "add";
    case BinOp::Sub:
        return "sub";
    case BinOp::Mul:
        return "mul";
    case BinOp::SDiv:
        return "sdiv";
    }
    return "?";
}

auto IrPrinter::print_function(const Function& func) -> std::string {
    std::ostringstream out;
    out << "function " << func.name << "() -> i64 {\n";

    for (size_t i = 0; i < func.slots.size(); ++i) {
        out << "  slot" << i << ": i64 ; " << func.slots[i].name << "\n";
    }

    for (const auto& block : func.blocks) {
        out << block.name << ":\n";
        for (const auto& inst : block.instructions) {
            out << "  " << print_instruction(inst) << "\n";
        }
        if (block.terminator) {
            out << "  return %" << block.terminator->value << "\n";
        }
    }

    out << "}\n";
    return out.str();
}

auto IrPrinter::print_instruction(const InstructionData& data) -> std::string {
    std::ostringstream out;
    if (data.defines_value()) {
        out << "%" << data.result << " = ";
    }

    std::visit(
        [&out](const auto& inst) {
            using T = std::decay_t<decltype(inst)>;
            if constexpr (std::is_same_v<T, ConstInst>) {
                out << "const " << inst.value;
            } else if constexpr (std::is_same_v<T, LoadInst>) {
                out << "load slot" << inst.slot;
            } else if constexpr (std::is_same_v<T, StoreInst>) {
                out << "store slot" << inst.slot << ", %" << inst.value;
            } else {
                out << binop_name(inst.op) << " %" << inst.left << ", %" << inst.right;
            }
        },
        data.inst);

    return out.str();
}

} // namespace wolf::ir
