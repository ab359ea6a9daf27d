//! # Compile Command
//!
//! Parses the compile flags, runs the driver and reports the outcome:
//! `Executable written to <path>` on stdout, or
//! `Error: Compilation failed: <cause>` on stderr with exit code 1.

#include "cmd_compile.hpp"

#include "common.hpp"
#include "log/log.hpp"
#include "utils.hpp"

#include <charconv>
#include <iostream>

namespace wolf::cli {

namespace {

auto parse_int(std::string_view text) -> std::optional<int> {
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

} // anonymous namespace

auto parse_compile_args(const std::vector<std::string>& args) -> std::optional<CompileArgs> {
    CompileArgs result;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-o") {
            if (i + 1 >= args.size()) {
                print_error("-o requires a path");
                return std::nullopt;
            }
            result.options.output_path = args[++i];
        } else if (arg.size() == 3 && arg.starts_with("-O") && arg[2] >= '0' && arg[2] <= '3') {
            result.options.codegen.optimization_level = arg[2] - '0';
        } else if (arg.starts_with("--target=")) {
            result.options.codegen.target_triple = arg.substr(9);
        } else if (arg.starts_with("--linker=")) {
            result.options.link_options.program = arg.substr(9);
        } else if (arg.starts_with("--link-timeout=")) {
            auto secs = parse_int(std::string_view(arg).substr(15));
            if (!secs || *secs < 0) {
                print_error("Invalid link timeout: " + arg.substr(15));
                return std::nullopt;
            }
            result.options.link_options.timeout_seconds = *secs;
        } else if (log::is_log_option(arg)) {
            continue;
        } else if (arg.starts_with("-")) {
            print_error("Unknown option: " + arg);
            return std::nullopt;
        } else if (result.source.empty()) {
            result.source = arg;
        } else {
            print_error("Unexpected argument: " + arg);
            return std::nullopt;
        }
    }

    if (result.source.empty()) {
        print_error("The compile command requires a source path.");
        return std::nullopt;
    }

    return result;
}

int run_compile(const std::vector<std::string>& args) {
    auto parsed = parse_compile_args(args);
    if (!parsed) {
        return 1;
    }

    CompilerOptions::optimization_level = parsed->options.codegen.optimization_level;
    CompilerOptions::target_triple = parsed->options.codegen.target_triple;

    auto result = driver::compile_file(parsed->source, parsed->options);
    if (is_err(result)) {
        const auto& error = unwrap_err(result);
        WOLF_LOG_DEBUG("cli", "Stage " << driver::stage_name(error.stage) << " failed");
        print_error("Compilation failed: " + error.to_string());
        return 1;
    }

    WOLF_DEBUG_LN("Object file: " << driver::object_path_for(parsed->source).string());
    std::cout << "Executable written to " << unwrap(result).string() << "\n";
    return 0;
}

} // namespace wolf::cli
