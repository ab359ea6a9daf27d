//! # System Linker Implementation
//!
//! fork/exec of the toolchain driver with stdout and stderr captured
//! through pipes. A third close-on-exec pipe reports `execvp` failures
//! back to the parent, so a missing linker is distinguished from one that
//! ran and failed.

#include "backend/system_linker.hpp"

#include "log/log.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace wolf::backend {

// ============================================================================
// Subprocess
// ============================================================================

namespace {

void close_pipe(int fds[2]) {
    if (fds[0] >= 0)
        close(fds[0]);
    if (fds[1] >= 0)
        close(fds[1]);
}

/// Reads whatever is available on `fd` into `out`. Returns false at EOF.
auto drain(int fd, std::string& out) -> bool {
    char buf[4096];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

} // anonymous namespace

auto run_subprocess(const std::string& program, const std::vector<std::string>& args,
                    int timeout_seconds) -> SubprocessResult {
    using Clock = std::chrono::steady_clock;

    SubprocessResult result;

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0 || pipe2(exec_pipe, O_CLOEXEC) != 0) {
        result.launch_error = std::string("Failed to create pipes: ") + std::strerror(errno);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(exec_pipe);
        return result;
    }

    std::vector<char*> c_args;
    c_args.push_back(const_cast<char*>(program.c_str()));
    for (const auto& a : args) {
        c_args.push_back(const_cast<char*>(a.c_str()));
    }
    c_args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.launch_error = std::string("Failed to fork: ") + std::strerror(errno);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(exec_pipe);
        return result;
    }

    if (pid == 0) {
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        close(exec_pipe[0]);

        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        execvp(program.c_str(), c_args.data());

        int err = errno;
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    close(exec_pipe[1]);

    // The exec pipe closes without data when execvp succeeds.
    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        waitpid(pid, &status, 0);
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        result.launch_error = std::strerror(exec_errno);
        return result;
    }

    result.launched = true;

    fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

    bool has_deadline = timeout_seconds > 0;
    auto deadline = Clock::now() + std::chrono::seconds(timeout_seconds);

    int status = 0;
    bool finished = false;
    bool stdout_open = true;
    bool stderr_open = true;

    while (!finished) {
        pollfd fds[2] = {{stdout_pipe[0], POLLIN, 0}, {stderr_pipe[0], POLLIN, 0}};
        poll(fds, 2, 10);

        if (stdout_open)
            stdout_open = drain(stdout_pipe[0], result.stdout_output);
        if (stderr_open)
            stderr_open = drain(stderr_pipe[0], result.stderr_output);

        pid_t ret = waitpid(pid, &status, WNOHANG);
        if (ret > 0) {
            finished = true;
        } else if (has_deadline && Clock::now() >= deadline) {
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            result.timed_out = true;
            break;
        }
    }

    // A killed driver may leave children holding the pipes, so only block
    // for the remaining output after a normal exit.
    if (!result.timed_out) {
        fcntl(stdout_pipe[0], F_SETFL, 0);
        fcntl(stderr_pipe[0], F_SETFL, 0);
        if (stdout_open)
            drain(stdout_pipe[0], result.stdout_output);
        if (stderr_open)
            drain(stderr_pipe[0], result.stderr_output);
    }
    close(stdout_pipe[0]);
    close(stderr_pipe[0]);

    if (!result.timed_out && WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = -1;
    }

    return result;
}

// ============================================================================
// SystemLinker
// ============================================================================

namespace {

// Joins the non-empty lines of `text` with "; ".
auto join_lines(const std::string& text) -> std::string {
    std::string joined;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            end = text.size();
        }
        auto line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            if (!joined.empty()) {
                joined += "; ";
            }
            joined += line;
        }
        start = end + 1;
    }
    return joined;
}

} // anonymous namespace

SystemLinker::SystemLinker(LinkOptions options) : options_(std::move(options)) {}

auto SystemLinker::resolve_program() const -> std::string {
    if (!options_.program.empty()) {
        return options_.program;
    }
    const char* env = std::getenv("WOLF_LINKER");
    if (env && *env) {
        return env;
    }
    return "cc";
}

auto SystemLinker::link(const fs::path& object_file, const fs::path& output_path) -> LinkResult {
    std::string program = resolve_program();

    std::vector<std::string> args = {object_file.string(), "-o", output_path.string()};
    args.insert(args.end(), options_.extra_flags.begin(), options_.extra_flags.end());

    WOLF_LOG_INFO("linker", "Running " << program << " " << object_file.string() << " -o "
                                       << output_path.string());

    auto raw = run_subprocess(program, args, options_.timeout_seconds);

    LinkResult result;
    result.launched = raw.launched;
    result.timed_out = raw.timed_out;
    result.exit_code = raw.exit_code;
    result.stderr_output = std::move(raw.stderr_output);

    if (!raw.launched) {
        result.error_message = "Failed to execute linker '" + program + "': " + raw.launch_error;
    } else if (raw.timed_out) {
        result.error_message = "Linker '" + program + "' timed out after " +
                               std::to_string(options_.timeout_seconds) + "s";
    } else if (raw.exit_code != 0) {
        result.error_message = "Linker failed with status " + std::to_string(raw.exit_code);
        auto diagnostics = join_lines(result.stderr_output);
        if (!diagnostics.empty()) {
            result.error_message += ": " + diagnostics;
        }
    } else {
        result.success = true;
        result.output_file = output_path;
    }

    if (!result.success) {
        WOLF_LOG_DEBUG("linker", result.error_message);
    }
    return result;
}

} // namespace wolf::backend
