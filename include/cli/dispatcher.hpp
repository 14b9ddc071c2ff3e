//! # CLI Dispatcher Interface
//!
//! Entry point of the `relpack` binary and the argument parser behind it.
//!
//! ```text
//! relpack [command] [--config=<path>] [--arch=<list>] [--jobs=N] [--keep]
//!         [--log-level=..] [--log-filter=..] [--log-file=..] [-v|-q]
//! ```

#ifndef RELPACK_CLI_DISPATCHER_HPP
#define RELPACK_CLI_DISPATCHER_HPP

#include "common.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace relpack::cli {

/// Parsed command line, minus the logging options.
struct CliOptions {
    std::string command = "all";
    std::vector<std::string> args; ///< Positional arguments after the command
    fs::path config_path = "relpack.toml";
    std::optional<std::string> arch;
    std::optional<int> jobs;
    bool keep = false;
    bool help = false;
    bool version = false;
};

Result<CliOptions> parse_cli_args(int argc, char* argv[]);

/// Main entry point. Returns the process exit code.
int relpack_main(int argc, char* argv[]);

} // namespace relpack::cli

#endif // RELPACK_CLI_DISPATCHER_HPP
