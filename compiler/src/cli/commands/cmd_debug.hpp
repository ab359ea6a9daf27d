//! # Debug Commands Interface
//!
//! | Function      | Command      | Output                        |
//! |---------------|--------------|-------------------------------|
//! | `run_lex()`   | `wolf lex`   | Token stream                  |
//! | `run_parse()` | `wolf parse` | AST tree                      |
//! | `run_ir()`    | `wolf ir`    | wolf IR followed by LLVM IR   |

#pragma once

#include <string>

namespace wolf::cli {

int run_lex(const std::string& path);
int run_parse(const std::string& path);
int run_ir(const std::string& path);

} // namespace wolf::cli
