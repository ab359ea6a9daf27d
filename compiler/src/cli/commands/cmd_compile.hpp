//! # Compile Command Interface
//!
//! `wolf compile <path> [-o <exe>] [-O<n>] [--target=<triple>]
//!               [--linker=<program>] [--link-timeout=<secs>]`

#pragma once

#include "driver/driver.hpp"

#include <optional>
#include <string>
#include <vector>

namespace wolf::cli {

struct CompileArgs {
    std::string source;
    driver::CompilationOptions options;
};

/// Parses the arguments following `compile`. Returns nullopt and prints an
/// error for malformed input.
auto parse_compile_args(const std::vector<std::string>& args) -> std::optional<CompileArgs>;

int run_compile(const std::vector<std::string>& args);

} // namespace wolf::cli
