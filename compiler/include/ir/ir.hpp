//! # wolf IR
//!
//! A linear, value-based intermediate representation in SSA form.
//!
//! ## Design
//!
//! - A `Function` owns a table of stack slots and a list of basic blocks.
//! - Values are identified by `ValueId`, the index of the defining
//!   instruction in the function's instruction numbering. Every value is
//!   defined exactly once and never changes.
//! - Mutable variables live in slots: `store` writes a slot, `load` reads
//!   it back as a fresh value. A slot is 8 bytes, 8-aligned, and holds one
//!   signed 64-bit integer.
//! - Every block ends in exactly one terminator.
//!
//! ```text
//! function main() -> i64 {
//!   slot0: i64 ; x
//! entry:
//!   %0 = const 2
//!   %1 = const 3
//!   %2 = add %0, %1
//!   store slot0, %2
//!   %4 = load slot0
//!   return %4
//! }
//! ```

#ifndef WOLF_IR_IR_HPP
#define WOLF_IR_IR_HPP

#include "common.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace wolf::ir {

using ValueId = uint32_t;
constexpr ValueId INVALID_VALUE = UINT32_MAX;

using SlotId = uint32_t;

// ============================================================================
// Instructions
// ============================================================================

/// Integer arithmetic on i64. `SDiv` is signed, truncating division.
enum class BinOp { Add, Sub, Mul, SDiv };

/// result = constant
struct ConstInst {
    int64_t value;
};

/// result = *slot
struct LoadInst {
    SlotId slot;
};

/// *slot = value (defines no value)
struct StoreInst {
    SlotId slot;
    ValueId value;
};

/// result = left op right
struct BinaryInst {
    BinOp op;
    ValueId left;
    ValueId right;
};

using Instruction = std::variant<ConstInst, LoadInst, StoreInst, BinaryInst>;

struct InstructionData {
    ValueId result; ///< INVALID_VALUE for stores.
    Instruction inst;
    SourceSpan span;

    [[nodiscard]] auto defines_value() const -> bool {
        return result != INVALID_VALUE;
    }
};

/// Returns from the function with `value`.
struct ReturnTerm {
    ValueId value;
};

// ============================================================================
// Functions
// ============================================================================

/// An 8-byte, 8-aligned stack location named after its variable.
struct StackSlot {
    std::string name;
    uint32_t size = 8;
    uint32_t align = 8;
};

struct BasicBlock {
    uint32_t id;
    std::string name;
    std::vector<InstructionData> instructions;
    std::optional<ReturnTerm> terminator;

    /// A sealed block gets no new predecessors.
    bool sealed = false;
};

/// A function with no parameters returning i64.
struct Function {
    std::string name;
    std::vector<StackSlot> slots;
    std::vector<BasicBlock> blocks;
    ValueId next_value_id = 0;

    /// Reserves the next instruction number.
    auto fresh_value() -> ValueId {
        return next_value_id++;
    }

    auto create_block(const std::string& label = "") -> uint32_t;

    [[nodiscard]] auto get_block(uint32_t id) -> BasicBlock*;
    [[nodiscard]] auto get_block(uint32_t id) const -> const BasicBlock*;

    /// Appends a slot; the returned id indexes `slots`.
    auto create_slot(const std::string& name) -> SlotId;

    /// Finds the instruction defining `id`, or nullptr.
    [[nodiscard]] auto find_definition(ValueId id) const -> const InstructionData*;

    [[nodiscard]] auto instruction_count() const -> size_t;
};

/// Checks the structural invariants of a function:
/// every block is terminated, every operand refers to an earlier
/// value-defining instruction, every slot id is in range.
/// The error describes the first violation.
[[nodiscard]] auto verify_function(const Function& func) -> Result<bool, std::string>;

// ============================================================================
// Printing
// ============================================================================

[[nodiscard]] auto binop_name(BinOp op) -> std::string_view;

/// Renders a function in the textual form shown above.
class IrPrinter {
public:
    [[nodiscard]] auto print_function(const Function& func) -> std::string;

private:
    [[nodiscard]] auto print_instruction(const InstructionData& inst) -> std::string;
};

} // namespace wolf::ir

#endif // WOLF_IR_IR_HPP
