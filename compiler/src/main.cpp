//! # wolf Compiler Entry Point
//!
//! ```bash
//! wolf compile answer.wolf      # Compile and link an executable
//! wolf parse answer.wolf        # Dump the AST
//! wolf version
//! ```
//!
//! All work happens in `cli::wolf_main()`.

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return wolf::cli::wolf_main(argc, argv);
}
