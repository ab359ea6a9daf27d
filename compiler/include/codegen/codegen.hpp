//! # Code Generation
//!
//! Turns a parsed program into the bytes of a native relocatable object
//! exporting `main`. Lowering to IR happens first, so undefined variables
//! and empty programs are reported before LLVM is touched.
//!
//! ```cpp
//! auto object = codegen::compile_program_to_object(program);
//! if (is_err(object)) {
//!     std::cerr << unwrap_err(object).message << "\n";
//! }
//! ```

#ifndef WOLF_CODEGEN_CODEGEN_HPP
#define WOLF_CODEGEN_CODEGEN_HPP

#include "common.hpp"
#include "ir/ir.hpp"
#include "parser/ast.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace wolf::codegen {

struct CodegenOptions {
    /// 0 emits the module as built; 1-3 run LLVM's default pipelines first.
    int optimization_level = 0;

    /// Empty means the host triple.
    std::string target_triple;
};

struct CodegenError {
    enum class Kind {
        UnsupportedTarget, ///< No backend for the requested triple.
        TargetMachine,     ///< Backend or target machine configuration failed.
        UndefinedVariable, ///< A variable was read before being declared.
        EmptyProgram,      ///< No statement produces a result.
        InvalidModule,     ///< The generated module failed verification.
        EmissionFailed,    ///< Object emission failed.
    };

    Kind kind;
    std::string message;
};

[[nodiscard]] auto codegen_error_kind_name(CodegenError::Kind kind) -> std::string_view;

/// Lowers `program` to IR without emitting anything.
[[nodiscard]] auto lower_program(const parser::Program& program)
    -> Result<ir::Function, CodegenError>;

/// Lowers `program` and emits a host object file into memory.
[[nodiscard]] auto compile_program_to_object(const parser::Program& program,
                                             const CodegenOptions& options = {})
    -> Result<std::vector<uint8_t>, CodegenError>;

/// Lowers `program` and renders the resulting LLVM module as text.
[[nodiscard]] auto render_llvm_ir(const parser::Program& program)
    -> Result<std::string, CodegenError>;

} // namespace wolf::codegen

#endif // WOLF_CODEGEN_CODEGEN_HPP
