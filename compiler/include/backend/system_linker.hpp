//! # System Linker
//!
//! Links an object file into an executable by running the host C toolchain
//! driver as a subprocess:
//!
//! ```text
//! cc <object-file> -o <executable>
//! ```
//!
//! The driver program defaults to `cc` and can be replaced through
//! `LinkOptions::program` or the `WOLF_LINKER` environment variable.
//!
//! ## Usage
//!
//! ```cpp
//! SystemLinker linker;
//! auto result = linker.link("prog.o", "prog");
//! if (!result.success) {
//!     std::cerr << result.error_message << "\n";
//! }
//! ```

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace wolf::backend {

/// Options for the system linker.
struct LinkOptions {
    /// Linker driver. Empty means `$WOLF_LINKER`, then `cc`.
    std::string program;

    /// Flags appended after `-o <executable>`.
    std::vector<std::string> extra_flags;

    /// Kill the linker after this many seconds. 0 waits indefinitely.
    int timeout_seconds = 0;
};

/// Result of one link attempt.
struct LinkResult {
    /// True when the linker ran and exited with status 0.
    bool success = false;

    /// False when the linker program could not be started at all.
    bool launched = false;

    bool timed_out = false;

    /// Exit status, or -1 when the process did not exit normally.
    int exit_code = -1;

    fs::path output_file;

    /// Everything the linker wrote to stderr.
    std::string stderr_output;

    /// One-line description of the failure, empty on success.
    std::string error_message;
};

/// Turns one object file into an executable.
///
/// The driver depends on this interface so tests can substitute a fake.
class Linker {
public:
    virtual ~Linker() = default;

    [[nodiscard]] virtual auto link(const fs::path& object_file, const fs::path& output_path)
        -> LinkResult = 0;
};

/// Linker backed by the host C toolchain.
class SystemLinker : public Linker {
public:
    explicit SystemLinker(LinkOptions options = {});

    [[nodiscard]] auto link(const fs::path& object_file, const fs::path& output_path)
        -> LinkResult override;

    /// The program `link` will run after applying defaults.
    [[nodiscard]] auto resolve_program() const -> std::string;

    [[nodiscard]] auto options() const -> const LinkOptions& {
        return options_;
    }

private:
    LinkOptions options_;
};

// ============================================================================
// Subprocess
// ============================================================================

struct SubprocessResult {
    bool launched = false;
    bool timed_out = false;
    int exit_code = -1;
    std::string stdout_output;
    std::string stderr_output;

    /// Why the process could not be started (e.g. "No such file or directory").
    std::string launch_error;
};

/// Runs `program args...` found through PATH, capturing stdout and stderr.
///
/// `timeout_seconds` of 0 waits for the process to exit.
[[nodiscard]] auto run_subprocess(const std::string& program, const std::vector<std::string>& args,
                                  int timeout_seconds) -> SubprocessResult;

} // namespace wolf::backend
