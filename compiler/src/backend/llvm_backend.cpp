//! # LLVM Backend Implementation
//!
//! Builds the module with the LLVM C API builder and emits it through a
//! target machine configured for PIC.

#include "backend/llvm_backend.hpp"

#include "log/log.hpp"

#include <type_traits>

#include <llvm-c/Analysis.h>
#include <llvm-c/Core.h>
#include <llvm-c/Error.h>
#include <llvm-c/Target.h>
#include <llvm-c/TargetMachine.h>
#include <llvm-c/Transforms/PassBuilder.h>
#include <llvm/Config/llvm-config.h>

namespace wolf::backend {

// ============================================================================
// Helper Functions
// ============================================================================

/// Copies an LLVM-owned message and disposes it.
static std::string take_message(char* error) {
    if (error == nullptr) {
        return "";
    }
    std::string msg(error);
    LLVMDisposeMessage(error);
    return msg;
}

static std::string consume_llvm_error(LLVMErrorRef error) {
    char* msg = LLVMGetErrorMessage(error);
    std::string result(msg);
    LLVMDisposeErrorMessage(msg);
    return result;
}

static const char* get_opt_level_string(int level) {
    switch (level) {
    case 1:
        return "default<O1>";
    case 2:
        return "default<O2>";
    default:
        return "default<O3>";
    }
}

static LLVMCodeGenOptLevel get_codegen_opt_level(int level) {
    switch (level) {
    case 0:
        return LLVMCodeGenLevelNone;
    case 1:
        return LLVMCodeGenLevelLess;
    case 2:
        return LLVMCodeGenLevelDefault;
    default:
        return LLVMCodeGenLevelAggressive;
    }
}

static auto make_failure(LLVMErrorKind kind, std::string message) -> LLVMCompileResult {
    LLVMCompileResult result;
    result.success = false;
    result.error_kind = kind;
    result.error_message = std::move(message);
    return result;
}

// ============================================================================
// LLVMBackend Implementation
// ============================================================================

LLVMBackend::LLVMBackend() = default;

LLVMBackend::~LLVMBackend() {
    if (context_) {
        LLVMContextDispose(static_cast<LLVMContextRef>(context_));
        context_ = nullptr;
    }
}

auto LLVMBackend::initialize() -> bool {
    if (initialized_) {
        return true;
    }

    if (LLVMInitializeNativeTarget() != 0 || LLVMInitializeNativeAsmPrinter() != 0) {
        last_error_ = "Failed to initialize the native LLVM target";
        return false;
    }

    context_ = LLVMContextCreate();
    if (!context_) {
        last_error_ = "Failed to create LLVM context";
        return false;
    }

    initialized_ = true;
    return true;
}

auto LLVMBackend::get_default_target_triple() const -> std::string {
    char* triple = LLVMGetDefaultTargetTriple();
    std::string result(triple);
    LLVMDisposeMessage(triple);
    return result;
}

auto LLVMBackend::build_module(const ir::Function& func) -> void* {
    auto ctx = static_cast<LLVMContextRef>(context_);

    auto verified = ir::verify_function(func);
    if (is_err(verified)) {
        last_error_ = unwrap_err(verified);
        return nullptr;
    }

    LLVMModuleRef module = LLVMModuleCreateWithNameInContext("wolf", ctx);
    LLVMTypeRef i64 = LLVMInt64TypeInContext(ctx);
    LLVMTypeRef fn_type = LLVMFunctionType(i64, nullptr, 0, 0);
    LLVMValueRef fn = LLVMAddFunction(module, func.name.c_str(), fn_type);
    LLVMSetLinkage(fn, LLVMExternalLinkage);
    LLVMSetFunctionCallConv(fn, LLVMCCallConv);

    std::vector<LLVMBasicBlockRef> blocks;
    blocks.reserve(func.blocks.size());
    for (const auto& block : func.blocks) {
        blocks.push_back(LLVMAppendBasicBlockInContext(ctx, fn, block.name.c_str()));
    }

    LLVMBuilderRef builder = LLVMCreateBuilderInContext(ctx);
    LLVMPositionBuilderAtEnd(builder, blocks[0]);

    std::vector<LLVMValueRef> slots;
    slots.reserve(func.slots.size());
    for (const auto& slot : func.slots) {
        LLVMValueRef alloca = LLVMBuildAlloca(builder, i64, slot.name.c_str());
        LLVMSetAlignment(alloca, slot.align);
        slots.push_back(alloca);
    }

    std::vector<LLVMValueRef> values(func.next_value_id, nullptr);

    for (size_t b = 0; b < func.blocks.size(); ++b) {
        const auto& block = func.blocks[b];
        LLVMPositionBuilderAtEnd(builder, blocks[b]);

        for (const auto& data : block.instructions) {
            LLVMValueRef value = std::visit(
                [&](const auto& inst) -> LLVMValueRef {
                    using T = std::decay_t<decltype(inst)>;
                    if constexpr (std::is_same_v<T, ir::ConstInst>) {
                        return LLVMConstInt(i64, static_cast<unsigned long long>(inst.value), 1);
                    } else if constexpr (std::is_same_v<T, ir::LoadInst>) {
                        LLVMValueRef load = LLVMBuildLoad2(builder, i64, slots[inst.slot], "");
                        LLVMSetAlignment(load, func.slots[inst.slot].align);
                        return load;
                    } else if constexpr (std::is_same_v<T, ir::StoreInst>) {
                        LLVMValueRef store =
                            LLVMBuildStore(builder, values[inst.value], slots[inst.slot]);
                        LLVMSetAlignment(store, func.slots[inst.slot].align);
                        return nullptr;
                    } else {
                        LLVMValueRef lhs = values[inst.left];
                        LLVMValueRef rhs = values[inst.right];
                        switch (inst.op) {
                        case ir::BinOp::Add:
                            return LLVMBuildAdd(builder, lhs, rhs, "");
                        case ir::BinOp::Sub:
                            return LLVMBuildSub(builder, lhs, rhs, "");
                        case ir::BinOp::Mul:
                            return LLVMBuildMul(builder, lhs, rhs, "");
                        case ir::BinOp::SDiv:
                            return LLVMBuildSDiv(builder, lhs, rhs, "");
                        }
                        return nullptr;
                    }
                },
                data.inst);

            if (data.defines_value()) {
                values[data.result] = value;
            }
        }

        LLVMBuildRet(builder, values[block.terminator->value]);
    }

    LLVMDisposeBuilder(builder);
    return module;
}

auto LLVMBackend::compile_function(const ir::Function& func, const LLVMCompileOptions& options)
    -> LLVMCompileResult {
    if (!initialized_) {
        return make_failure(LLVMErrorKind::NotInitialized, "LLVM backend not initialized");
    }

    std::string host_triple = get_default_target_triple();
    std::string target_triple = options.target_triple.empty() ? host_triple : options.target_triple;

    LLVMTargetRef target = nullptr;
    char* error = nullptr;
    if (LLVMGetTargetFromTriple(target_triple.c_str(), &target, &error) != 0) {
        return make_failure(LLVMErrorKind::UnsupportedTarget,
                            "Unsupported target '" + target_triple +
                                "': " + take_message(error));
    }

    // Host CPU and features only make sense when targeting the host.
    std::string cpu = options.cpu;
    std::string features = options.features;
    if (target_triple == host_triple) {
        if (cpu.empty() || cpu == "native") {
            cpu = take_message(LLVMGetHostCPUName());
        }
        if (features.empty()) {
            features = take_message(LLVMGetHostCPUFeatures());
        }
    } else if (cpu.empty() || cpu == "native") {
        cpu = "generic";
    }

    LLVMRelocMode reloc_mode = options.position_independent ? LLVMRelocPIC : LLVMRelocDefault;
    LLVMTargetMachineRef target_machine = LLVMCreateTargetMachine(
        target, target_triple.c_str(), cpu.c_str(), features.c_str(),
        get_codegen_opt_level(options.optimization_level), reloc_mode, LLVMCodeModelDefault);
    if (!target_machine) {
        return make_failure(LLVMErrorKind::TargetMachine,
                            "Failed to create target machine for '" + target_triple + "'");
    }

    auto module = static_cast<LLVMModuleRef>(build_module(func));
    if (!module) {
        LLVMDisposeTargetMachine(target_machine);
        return make_failure(LLVMErrorKind::InvalidFunction, last_error_);
    }

    LLVMSetTarget(module, target_triple.c_str());
    LLVMTargetDataRef data_layout = LLVMCreateTargetDataLayout(target_machine);
    char* data_layout_str = LLVMCopyStringRepOfTargetData(data_layout);
    LLVMSetDataLayout(module, data_layout_str);
    LLVMDisposeMessage(data_layout_str);
    LLVMDisposeTargetData(data_layout);

    LLVMCompileResult result;

    error = nullptr;
    if (LLVMVerifyModule(module, LLVMReturnStatusAction, &error) != 0) {
        auto failure = make_failure(LLVMErrorKind::InvalidModule,
                                    "Module verification failed: " + take_message(error));
        LLVMDisposeModule(module);
        LLVMDisposeTargetMachine(target_machine);
        return failure;
    }
    LLVMDisposeMessage(error);

    if (options.optimization_level > 0) {
        LLVMPassBuilderOptionsRef pass_opts = LLVMCreatePassBuilderOptions();
        const char* passes = get_opt_level_string(options.optimization_level);
        if (LLVMErrorRef pass_error = LLVMRunPasses(module, passes, target_machine, pass_opts)) {
            result.warnings.push_back("Optimization pipeline failed: " +
                                      consume_llvm_error(pass_error));
        }
        LLVMDisposePassBuilderOptions(pass_opts);
    }

    LLVMMemoryBufferRef buffer = nullptr;
    error = nullptr;
    if (LLVMTargetMachineEmitToMemoryBuffer(target_machine, module, LLVMObjectFile, &error,
                                            &buffer) != 0) {
        auto failure = make_failure(LLVMErrorKind::EmissionFailed,
                                    "Failed to emit object file: " + take_message(error));
        LLVMDisposeModule(module);
        LLVMDisposeTargetMachine(target_machine);
        return failure;
    }

    const auto* start = reinterpret_cast<const uint8_t*>(LLVMGetBufferStart(buffer));
    result.object_data.assign(start, start + LLVMGetBufferSize(buffer));
    result.success = true;

    WOLF_LOG_DEBUG("codegen", "Emitted " << result.object_data.size() << " bytes for "
                                         << target_triple);

    LLVMDisposeMemoryBuffer(buffer);
    LLVMDisposeModule(module);
    LLVMDisposeTargetMachine(target_machine);
    return result;
}

auto LLVMBackend::emit_llvm_ir(const ir::Function& func) -> LLVMCompileResult {
    if (!initialized_) {
        return make_failure(LLVMErrorKind::NotInitialized, "LLVM backend not initialized");
    }

    auto module = static_cast<LLVMModuleRef>(build_module(func));
    if (!module) {
        return make_failure(LLVMErrorKind::InvalidFunction, last_error_);
    }

    std::string triple = get_default_target_triple();
    LLVMSetTarget(module, triple.c_str());

    LLVMCompileResult result;
    result.llvm_ir = take_message(LLVMPrintModuleToString(module));
    result.success = true;
    LLVMDisposeModule(module);
    return result;
}

// ============================================================================
// Module-level Functions
// ============================================================================

auto get_llvm_version() -> std::string {
    unsigned major = 0, minor = 0, patch = 0;
#if LLVM_VERSION_MAJOR >= 16
    LLVMGetVersion(&major, &minor, &patch);
#else
    major = LLVM_VERSION_MAJOR;
    minor = LLVM_VERSION_MINOR;
    patch = LLVM_VERSION_PATCH;
#endif
    return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
}

} // namespace wolf::backend
