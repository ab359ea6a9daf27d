//! # Compilation Driver Implementation

#include "driver/driver.hpp"

#include "lexer/source.hpp"
#include "log/log.hpp"
#include "parser/parser.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>

namespace wolf::driver {

auto stage_name(Stage stage) -> std::string_view {
    switch (stage) {
    case Stage::ReadError:
        return "Failed to read file";
    case Stage::ParseFailed:
        return "Parse failed";
    case Stage::CodegenFailed:
        return "Code generation failed";
    case Stage::WriteError:
        return "Failed to write object file";
    case Stage::LinkFailed:
        return "Linking failed";
    }
    return "Compilation failed";
}

auto DriverError::to_string() const -> std::string {
    return std::string(stage_name(stage)) + ": " + message;
}

auto object_path_for(const fs::path& source) -> fs::path {
    fs::path object = source;
    object.replace_extension(".o");
    return object;
}

auto executable_path_for(const fs::path& source) -> fs::path {
    fs::path exe = source;
    exe.replace_extension();
    // Never let the executable overwrite an extensionless source.
    if (exe == source) {
        exe += ".out";
    }
    return exe;
}

namespace {

auto write_object(const fs::path& path, const std::vector<uint8_t>& bytes)
    -> std::optional<std::string> {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return "cannot open '" + path.string() + "': " + std::strerror(errno);
    }
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out) {
        return "cannot write '" + path.string() + "'";
    }
    return std::nullopt;
}

} // anonymous namespace

auto compile_file(const fs::path& source, const CompilationOptions& options)
    -> Result<fs::path, DriverError> {
    WOLF_LOG_INFO("driver", "Compiling " << source.string());

    auto loaded = lexer::Source::from_file(source);
    if (is_err(loaded)) {
        return DriverError{.stage = Stage::ReadError, .message = unwrap_err(loaded)};
    }
    // Tokens and spans point into this Source, so it stays inside `loaded`.
    const lexer::Source& src = unwrap(loaded);

    auto program = parser::parse_source(src);
    if (is_err(program)) {
        return DriverError{.stage = Stage::ParseFailed,
                           .message = parser::frontend_error_message(unwrap_err(program))};
    }

    auto object = codegen::compile_program_to_object(unwrap(program), options.codegen);
    if (is_err(object)) {
        return DriverError{.stage = Stage::CodegenFailed, .message = unwrap_err(object).message};
    }

    fs::path object_path = object_path_for(source);
    if (auto write_error = write_object(object_path, unwrap(object))) {
        return DriverError{.stage = Stage::WriteError, .message = *write_error};
    }
    WOLF_LOG_DEBUG("driver", "Wrote " << unwrap(object).size() << " bytes to "
                                      << object_path.string());

    fs::path exe_path = options.output_path.value_or(executable_path_for(source));

    backend::SystemLinker system_linker(options.link_options);
    backend::Linker& linker = options.linker ? *options.linker : system_linker;

    auto linked = linker.link(object_path, exe_path);
    if (!linked.success) {
        return DriverError{.stage = Stage::LinkFailed, .message = linked.error_message};
    }

    WOLF_LOG_INFO("driver", "Executable written to " << exe_path.string());
    return exe_path;
}

} // namespace wolf::driver
