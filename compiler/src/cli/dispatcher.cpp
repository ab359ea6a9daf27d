//! # CLI Command Dispatcher
//!
//! ```text
//! wolf_main()
//!   ├─ help, --help, -h, (none) → print_usage()
//!   ├─ version, --version, -V   → print_version()
//!   ├─ compile                  → run_compile()
//!   ├─ lex                      → run_lex()
//!   ├─ parse                    → run_parse()
//!   └─ ir                       → run_ir()
//! ```
//!
//! Logging flags (`-v`, `--log-level=...`, see `log::parse_log_options`) are
//! accepted anywhere after the command.

#include "commands/cmd_compile.hpp"
#include "commands/cmd_debug.hpp"
#include "common.hpp"
#include "driver.hpp"
#include "log/log.hpp"
#include "utils.hpp"

#include <string>
#include <vector>

namespace wolf::cli {

namespace {

/// Returns the first argument after the command that is not a log flag.
auto positional_path(const std::vector<std::string>& args) -> std::string {
    for (const auto& arg : args) {
        if (!log::is_log_option(arg)) {
            return arg;
        }
    }
    return {};
}

} // anonymous namespace

/// Exit codes: 0 on success, 1 on any error.
int wolf_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    if (argc < 2) {
        print_usage();
        return 0;
    }

    std::string command = argv[1];
    std::vector<std::string> args(argv + 2, argv + argc);

    CompilerOptions::verbose = log::Logger::instance().level() <= log::LogLevel::Info;

    if (command == "help" || command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }

    if (command == "version" || command == "--version" || command == "-V") {
        print_version();
        return 0;
    }

    if (command == "compile") {
        return run_compile(args);
    }

    if (command == "lex" || command == "parse" || command == "ir") {
        std::string path = positional_path(args);
        if (path.empty()) {
            print_error("The " + command + " command requires a source path.");
            return 1;
        }
        if (command == "lex")
            return run_lex(path);
        if (command == "parse")
            return run_parse(path);
        return run_ir(path);
    }

    print_error("Unknown command: " + command);
    return 1;
}

} // namespace wolf::cli
