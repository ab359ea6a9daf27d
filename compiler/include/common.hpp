//! # Common Definitions
//!
//! Types, utilities, and constants shared by every stage of the wolf
//! compiler pipeline.
//!
//! ## Overview
//!
//! - **Version Information**: Compiler version constants
//! - **Compiler Options**: Global configuration set by the command line
//! - **Source Locations**: Positions and spans inside a source file
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: Aliases for owning pointers
//!
//! Every fallible operation in the pipeline returns `Result<T, E>`; the error
//! alternative is a small struct owned by the stage that produced it.

#ifndef WOLF_COMMON_HPP
#define WOLF_COMMON_HPP

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace wolf {

// ============================================================================
// Version Information
// ============================================================================

/// The compiler version string.
constexpr const char* VERSION = "0.1.0";

// ============================================================================
// Compiler Configuration
// ============================================================================

/// Global compiler configuration options.
///
/// Set once by the command line before any compilation starts. Library
/// callers should prefer the per-call option structs
/// (`driver::CompilationOptions`, `codegen::CodegenOptions`).
struct CompilerOptions {
    /// Enable verbose output to stderr.
    static inline bool verbose = false;

    /// Optimization level: 0-3 for O0-O3.
    static inline int optimization_level = 0;

    /// Target triple for code generation (empty = host system).
    static inline std::string target_triple;
};

// ============================================================================
// Debug Macros
// ============================================================================

/// Outputs a debug message with newline to stderr if verbose mode is enabled.
#define WOLF_DEBUG_LN(msg)                                                                         \
    do {                                                                                           \
        if (::wolf::CompilerOptions::verbose) {                                                    \
            std::cerr << msg << "\n";                                                              \
        }                                                                                          \
    } while (0)

// ============================================================================
// Source Location Types
// ============================================================================

/// A precise location in source code.
///
/// - `file`: Path to the source file
/// - `line`: 1-based line number
/// - `column`: 1-based column number
/// - `offset`: 0-based byte offset from file start
/// - `length`: Length of the source element in bytes
struct SourceLocation {
    std::string_view file;
    uint32_t line;
    uint32_t column;
    uint32_t offset;
    uint32_t length;

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

/// A span of source code from start to end location.
struct SourceSpan {
    SourceLocation start;
    SourceLocation end;

    /// Merges two spans into one running from the start of `a` to the end of `b`.
    [[nodiscard]] static auto merge(const SourceSpan& a, const SourceSpan& b) -> SourceSpan {
        return {a.start, b.end};
    }
};

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// auto result = parser.parse_program();
/// if (is_err(result)) {
///     report(unwrap_err(result));
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer. AST children are held through `Box<T>`.
template <typename T> using Box = std::unique_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace wolf

#endif // WOLF_COMMON_HPP
