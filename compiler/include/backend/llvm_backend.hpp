//! # LLVM Backend
//!
//! Translates a wolf IR function into an LLVM module through the LLVM C API
//! and emits a relocatable object file for the host into memory.
//!
//! ## Usage
//!
//! ```cpp
//! LLVMBackend backend;
//! if (!backend.initialize()) {
//!     // backend.get_last_error()
//! }
//!
//! LLVMCompileOptions opts;
//! auto result = backend.compile_function(func, opts);
//! if (result.success) {
//!     write(result.object_data);
//! }
//! ```
//!
//! ## Module Shape
//!
//! - Module name `wolf`, host triple and data layout
//! - One exported function `i64 @main()` with the C calling convention
//! - One `alloca i64, align 8` per IR slot at the top of the entry block
//! - Arithmetic without `nsw`/`nuw` flags, so overflow wraps

#pragma once

#include "ir/ir.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace wolf::backend {

/// Options for object emission.
struct LLVMCompileOptions {
    /// Optimization level (0-3). 0 skips the pass pipeline entirely.
    int optimization_level = 0;

    /// Target triple. Empty means the host.
    std::string target_triple;

    /// CPU name; "native" means the host CPU when targeting the host.
    std::string cpu = "native";

    /// CPU features (e.g., "+avx2"). Empty means host features for the host.
    std::string features;

    /// Generate position-independent code.
    bool position_independent = true;
};

/// Which stage of emission failed.
enum class LLVMErrorKind {
    None,
    NotInitialized,    ///< `initialize()` was not called or failed.
    InvalidFunction,   ///< The IR function broke a structural invariant.
    UnsupportedTarget, ///< No registered target for the triple.
    TargetMachine,     ///< The target machine could not be created.
    InvalidModule,     ///< The generated LLVM module failed verification.
    EmissionFailed,    ///< Object emission reported an error.
};

/// Result of object emission.
struct LLVMCompileResult {
    bool success = false;

    /// Raw bytes of the relocatable object.
    std::vector<uint8_t> object_data;

    /// Textual module, filled by `emit_llvm_ir`.
    std::string llvm_ir;

    LLVMErrorKind error_kind = LLVMErrorKind::None;
    std::string error_message;
    std::vector<std::string> warnings;
};

/// LLVM Backend for wolf IR.
///
/// Owns an LLVM context. Non-copyable; one instance per thread.
class LLVMBackend {
public:
    LLVMBackend();
    ~LLVMBackend();

    LLVMBackend(const LLVMBackend&) = delete;
    LLVMBackend& operator=(const LLVMBackend&) = delete;

    /// Registers the native target and creates the context.
    [[nodiscard]] auto initialize() -> bool;

    [[nodiscard]] auto is_initialized() const -> bool {
        return initialized_;
    }

    /// Builds, verifies and emits `func` as an object file in memory.
    [[nodiscard]] auto compile_function(const ir::Function& func,
                                        const LLVMCompileOptions& options) -> LLVMCompileResult;

    /// Builds `func` and renders the module as LLVM assembly into `llvm_ir`.
    [[nodiscard]] auto emit_llvm_ir(const ir::Function& func) -> LLVMCompileResult;

    [[nodiscard]] auto get_default_target_triple() const -> std::string;

    [[nodiscard]] auto get_last_error() const -> const std::string& {
        return last_error_;
    }

private:
    bool initialized_ = false;
    std::string last_error_;

    // LLVMContextRef, kept opaque so the C API headers stay out of this header.
    void* context_ = nullptr;

    /// Translates `func` into a new module. Returns nullptr and sets
    /// `last_error_` on failure; the caller disposes the module.
    [[nodiscard]] auto build_module(const ir::Function& func) -> void*;
};

/// Returns the linked LLVM version, e.g. "14.0.6".
[[nodiscard]] auto get_llvm_version() -> std::string;

} // namespace wolf::backend
