//! # CLI Utilities Interface
//!
//! | Function           | Description                                  |
//! |--------------------|----------------------------------------------|
//! | `print_usage()`    | Print CLI help text                          |
//! | `print_version()`  | Print compiler version                       |
//! | `print_error()`    | Print `Error: <message>` to stderr           |
//! | `load_source()`    | Read a file into a `Source`, reporting errors|

#pragma once

#include "lexer/source.hpp"

#include <optional>
#include <string>

namespace wolf::cli {

void print_usage();
void print_version();
void print_error(const std::string& message);

/// Reads `path`; prints the reason and returns nullopt on failure.
auto load_source(const std::string& path) -> std::optional<lexer::Source>;

} // namespace wolf::cli
