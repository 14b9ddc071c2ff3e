//! # Subprocess Execution
//!
//! Every external tool the pipeline drives (bundlers, `hdiutil`, `osascript`,
//! icon converters, downloaded tools) is launched through `run_process()`.
//!
//! ## Platform Support
//!
//! POSIX only: fork + execvp with pipe-based stdout/stderr capture and an
//! optional stdin payload.

#ifndef RELPACK_PROCESS_SUBPROCESS_HPP
#define RELPACK_PROCESS_SUBPROCESS_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace relpack::process {

/// Options for a single process launch.
struct ProcessOptions {
    fs::path cwd;                              ///< Working directory (empty = inherit)
    std::map<std::string, std::string> env;    ///< Variables added to the inherited environment
    std::string stdin_data;                    ///< Written to the child's stdin, then closed
    int timeout_seconds = 0;                   ///< 0 = wait forever
    bool echo_output = false;                  ///< Also copy child output to our stdout/stderr
};

/// Outcome of a process launch.
struct ProcessResult {
    bool launched = false;
    bool timed_out = false;
    int exit_code = -1;
    std::string stdout_output;
    std::string stderr_output;
    int64_t duration_us = 0;

    bool ok() const {
        return launched && !timed_out && exit_code == 0;
    }
};

/// Runs `argv[0]` (looked up on PATH) with the remaining arguments and waits
/// for it to exit.
ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& options = {});

/// Searches PATH for an executable named `name`. Names containing a slash are
/// checked directly.
std::optional<fs::path> find_program(std::string_view name);

/// True if `path` is a regular file with an execute bit set for this user.
bool is_executable(const fs::path& path);

/// Renders argv as a shell-like string for log messages.
std::string format_command(const std::vector<std::string>& argv);

} // namespace relpack::process

#endif // RELPACK_PROCESS_SUBPROCESS_HPP
