//! # Compilation Driver
//!
//! Runs the whole pipeline for one source file:
//!
//! 1. Read the source
//! 2. Lex and parse
//! 3. Lower and emit object bytes
//! 4. Write `<source>.o` (the source path with its extension replaced)
//! 5. Link into the executable (the source path without its extension,
//!    unless an output path is given)
//!
//! The first failing stage ends the run. The object file is left on disk
//! whether or not linking succeeds.

#ifndef WOLF_DRIVER_DRIVER_HPP
#define WOLF_DRIVER_DRIVER_HPP

#include "backend/system_linker.hpp"
#include "codegen/codegen.hpp"
#include "common.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace wolf::driver {

namespace fs = std::filesystem;

struct CompilationOptions {
    /// Executable path; defaults to the source path without its extension.
    std::optional<fs::path> output_path;

    /// Linker to use; null runs a `backend::SystemLinker` with `link_options`.
    backend::Linker* linker = nullptr;

    backend::LinkOptions link_options;

    codegen::CodegenOptions codegen;
};

/// The pipeline stage that failed.
enum class Stage {
    ReadError,
    ParseFailed,
    CodegenFailed,
    WriteError,
    LinkFailed,
};

struct DriverError {
    Stage stage;

    /// The underlying cause, without the stage prefix.
    std::string message;

    /// "<stage description>: <cause>".
    [[nodiscard]] auto to_string() const -> std::string;
};

/// Human-readable stage description, e.g. "Failed to read file".
[[nodiscard]] auto stage_name(Stage stage) -> std::string_view;

/// `source` with its extension replaced by `.o`.
[[nodiscard]] auto object_path_for(const fs::path& source) -> fs::path;

/// `source` with its extension removed; `<source>.out` when it has none.
[[nodiscard]] auto executable_path_for(const fs::path& source) -> fs::path;

/// Compiles and links `source`; returns the executable path.
[[nodiscard]] auto compile_file(const fs::path& source, const CompilationOptions& options = {})
    -> Result<fs::path, DriverError>;

} // namespace wolf::driver

#endif // WOLF_DRIVER_DRIVER_HPP
