//! # IR Function Operations
//!
//! Block and slot management plus the structural verifier.

#include "ir/ir.hpp"

#include <type_traits>

namespace wolf::ir {

auto Function::create_block(const std::string& label) -> uint32_t {
    auto id = static_cast<uint32_t>(blocks.size());
    blocks.push_back(BasicBlock{.id = id,
                                .name = label.empty() ? "bb" + std::to_string(id) : label,
                                .instructions = {},
                                .terminator = std::nullopt,
                                .sealed = false});
    return id;
}

auto Function::get_block(uint32_t id) -> BasicBlock* {
    return id < blocks.size() ? &blocks[id] : nullptr;
}

auto Function::get_block(uint32_t id) const -> const BasicBlock* {
    return id < blocks.size() ? &blocks[id] : nullptr;
}

auto Function::create_slot(const std::string& slot_name) -> SlotId {
    auto id = static_cast<SlotId>(slots.size());
    slots.push_back(StackSlot{.name = slot_name});
    return id;
}

auto Function::find_definition(ValueId id) const -> const InstructionData* {
    if (id == INVALID_VALUE) {
        return nullptr;
    }
    for (const auto& block : blocks) {
        for (const auto& inst : block.instructions) {
            if (inst.result == id) {
                return &inst;
            }
        }
    }
    return nullptr;
}

auto Function::instruction_count() const -> size_t {
    size_t count = 0;
    for (const auto& block : blocks) {
        count += block.instructions.size();
    }
    return count;
}

auto verify_function(const Function& func) -> Result<bool, std::string> {
    if (func.blocks.empty()) {
        return "function '" + func.name + "' has no blocks";
    }

    std::vector<bool> defined(func.next_value_id, false);
    auto check_operand = [&](ValueId id) -> bool { return id < defined.size() && defined[id]; };

    for (const auto& block : func.blocks) {
        for (const auto& data : block.instructions) {
            std::string problem = std::visit(
                [&](const auto& inst) -> std::string {
                    using T = std::decay_t<decltype(inst)>;
                    if constexpr (std::is_same_v<T, ConstInst>) {
                        return {};
                    } else if constexpr (std::is_same_v<T, LoadInst>) {
                        return inst.slot < func.slots.size() ? "" : "load from unknown slot";
                    } else if constexpr (std::is_same_v<T, StoreInst>) {
                        if (inst.slot >= func.slots.size())
                            return "store to unknown slot";
                        return check_operand(inst.value) ? "" : "store of undefined value";
                    } else {
                        return check_operand(inst.left) && check_operand(inst.right)
                                   ? ""
                                   : "binary operand is undefined";
                    }
                },
                data.inst);

            if (!problem.empty()) {
                return problem + " in block '" + block.name + "'";
            }
            if (data.defines_value()) {
                if (data.result >= defined.size() || defined[data.result]) {
                    return "value %" + std::to_string(data.result) + " defined twice or out of range";
                }
                defined[data.result] = true;
            }
        }

        if (!block.terminator) {
            return "block '" + block.name + "' has no terminator";
        }
        if (!check_operand(block.terminator->value)) {
            return "return of undefined value in block '" + block.name + "'";
        }
    }

    return true;
}

} // namespace wolf::ir
