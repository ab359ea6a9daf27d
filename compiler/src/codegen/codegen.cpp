//! # Code Generation Entry Points
//!
//! Glue between the IR builder and the LLVM backend, mapping each stage's
//! failure onto `CodegenError`.

#include "codegen/codegen.hpp"

#include "backend/llvm_backend.hpp"
#include "ir/ir_builder.hpp"
#include "log/log.hpp"

#include <optional>

namespace wolf::codegen {

namespace {

auto from_lowering(const ir::LoweringError& error) -> CodegenError {
    switch (error.kind) {
    case ir::LoweringError::Kind::UndefinedVariable:
        return CodegenError{.kind = CodegenError::Kind::UndefinedVariable,
                            .message = error.message};
    case ir::LoweringError::Kind::EmptyProgram:
        return CodegenError{.kind = CodegenError::Kind::EmptyProgram, .message = error.message};
    }
    return CodegenError{.kind = CodegenError::Kind::InvalidModule, .message = error.message};
}

auto from_backend(const backend::LLVMCompileResult& result) -> CodegenError {
    CodegenError::Kind kind = CodegenError::Kind::EmissionFailed;
    switch (result.error_kind) {
    case backend::LLVMErrorKind::UnsupportedTarget:
        kind = CodegenError::Kind::UnsupportedTarget;
        break;
    case backend::LLVMErrorKind::NotInitialized:
    case backend::LLVMErrorKind::TargetMachine:
        kind = CodegenError::Kind::TargetMachine;
        break;
    case backend::LLVMErrorKind::InvalidFunction:
    case backend::LLVMErrorKind::InvalidModule:
        kind = CodegenError::Kind::InvalidModule;
        break;
    case backend::LLVMErrorKind::None:
    case backend::LLVMErrorKind::EmissionFailed:
        kind = CodegenError::Kind::EmissionFailed;
        break;
    }
    return CodegenError{.kind = kind, .message = result.error_message};
}

auto initialized_backend(backend::LLVMBackend& llvm) -> std::optional<CodegenError> {
    if (!llvm.initialize()) {
        return CodegenError{.kind = CodegenError::Kind::TargetMachine,
                            .message = llvm.get_last_error()};
    }
    return std::nullopt;
}

} // anonymous namespace

auto codegen_error_kind_name(CodegenError::Kind kind) -> std::string_view {
    switch (kind) {
    case CodegenError::Kind::UnsupportedTarget:
        return "unsupported target";
    case CodegenError::Kind::TargetMachine:
        return "target machine";
    case CodegenError::Kind::UndefinedVariable:
        return "undefined variable";
    case CodegenError::Kind::EmptyProgram:
        return "empty program";
    case CodegenError::Kind::InvalidModule:
        return "invalid module";
    case CodegenError::Kind::EmissionFailed:
        return "emission failed";
    }
    return "unknown";
}

auto lower_program(const parser::Program& program) -> Result<ir::Function, CodegenError> {
    ir::IrBuilder builder;
    auto func = builder.build(program);
    if (is_err(func)) {
        return from_lowering(unwrap_err(func));
    }
    return std::move(unwrap(func));
}

auto compile_program_to_object(const parser::Program& program, const CodegenOptions& options)
    -> Result<std::vector<uint8_t>, CodegenError> {
    auto func = lower_program(program);
    if (is_err(func)) {
        return unwrap_err(func);
    }

    backend::LLVMBackend llvm;
    if (auto error = initialized_backend(llvm)) {
        return *error;
    }

    backend::LLVMCompileOptions llvm_opts;
    llvm_opts.optimization_level = options.optimization_level;
    llvm_opts.target_triple = options.target_triple;
    llvm_opts.position_independent = true;

    auto result = llvm.compile_function(unwrap(func), llvm_opts);
    for (const auto& warning : result.warnings) {
        WOLF_LOG_WARN("codegen", warning);
    }
    if (!result.success) {
        WOLF_LOG_DEBUG("codegen", "Emission failed: " << result.error_message);
        return from_backend(result);
    }

    return std::move(result.object_data);
}

auto render_llvm_ir(const parser::Program& program) -> Result<std::string, CodegenError> {
    auto func = lower_program(program);
    if (is_err(func)) {
        return unwrap_err(func);
    }

    backend::LLVMBackend llvm;
    if (auto error = initialized_backend(llvm)) {
        return *error;
    }

    auto result = llvm.emit_llvm_ir(unwrap(func));
    if (!result.success) {
        return from_backend(result);
    }
    return std::move(result.llvm_ir);
}

} // namespace wolf::codegen
