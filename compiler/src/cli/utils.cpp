//! # CLI Utilities

#include "utils.hpp"

#include "common.hpp"

#include <iostream>

namespace wolf::cli {

void print_usage() {
    std::cout << "wolf " << VERSION << "\n\n";
    std::cout << "Usage: wolf <command> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  compile <path>   Compile a source file to a native executable\n";
    std::cout << "  lex <path>       Print the token stream (debug)\n";
    std::cout << "  parse <path>     Print the syntax tree (debug)\n";
    std::cout << "  ir <path>        Print wolf IR and LLVM IR (debug)\n";
    std::cout << "  version          Show version\n";
    std::cout << "  help             Show this help\n";
    std::cout << "\nCompile options:\n";
    std::cout << "  -o <path>              Executable path (default: source without extension)\n";
    std::cout << "  -O0...-O3              Optimization level\n";
    std::cout << "  --target=<triple>      Target triple (default: host)\n";
    std::cout << "  --linker=<program>     Linker driver (default: $WOLF_LINKER or cc)\n";
    std::cout << "  --link-timeout=<secs>  Kill the linker after this many seconds\n";
    std::cout << "\nLogging options:\n";
    std::cout << "  -v, -vv, -vvv          Info, debug, trace logging\n";
    std::cout << "  -q, --quiet            Errors only\n";
    std::cout << "  --log-level=<level>    trace|debug|info|warn|error|off\n";
    std::cout << "  --log-filter=<spec>    e.g. codegen=trace,*=warn\n";
    std::cout << "  --log-file=<path>      Also write logs to a file\n";
    std::cout << "  --log-format=json      JSON log lines\n";
}

void print_version() {
    std::cout << "wolf version " << VERSION << "\n";
}

void print_error(const std::string& message) {
    std::cerr << "Error: " << message << "\n";
}

auto load_source(const std::string& path) -> std::optional<lexer::Source> {
    auto loaded = lexer::Source::from_file(path);
    if (is_err(loaded)) {
        print_error("Failed to read file: " + unwrap_err(loaded));
        return std::nullopt;
    }
    return std::move(unwrap(loaded));
}

} // namespace wolf::cli
