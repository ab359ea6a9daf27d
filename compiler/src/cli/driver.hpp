//! # Compiler Driver Interface
//!
//! `wolf_main()` dispatches to the command handler named by argv[1].

#pragma once

namespace wolf::cli {

/// Runs the `wolf` command line. Returns the process exit code.
int wolf_main(int argc, char* argv[]);

} // namespace wolf::cli
