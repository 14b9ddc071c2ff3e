//! # Verifier
//!
//! Post-build inspection of a bundle and an interactive debugging helper.
//! Nothing here modifies the bundle.
//!
//! ## Report Contents
//!
//! | Check            | Source                                            |
//! |------------------|---------------------------------------------------|
//! | Executable       | presence and execute permission                   |
//! | Architectures    | Mach-O header of the executable                   |
//! | Metadata         | `Contents/Info.plist` name, version, identifier   |
//! | Crash reports    | `*.crash` / `*.ips` named after the app, last 24h |
//!
//! ## Interactive Menu
//!
//! ```text
//! 1) Relaunch with full output
//! 2) Relaunch showing only errors
//! 3) Inspect the embedded runtime
//! 4) Show the latest crash report
//! 5) Quit
//! ```

#ifndef RELPACK_VERIFY_VERIFIER_HPP
#define RELPACK_VERIFY_VERIFIER_HPP

#include "common.hpp"

#include <chrono>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace relpack::verify {

struct BundleMetadata {
    std::string name;
    std::string version;
    std::string identifier;
};

struct Report {
    fs::path bundle_path;
    fs::path executable_path;
    bool bundle_exists = false;
    bool executable_present = false;
    bool executable_runnable = false;
    std::vector<std::string> architectures; ///< Empty if not Mach-O
    std::optional<BundleMetadata> metadata;
    std::vector<fs::path> crash_reports; ///< Newest first
    std::vector<std::string> problems;

    bool ok() const {
        return bundle_exists && executable_present && executable_runnable;
    }
};

struct VerifierOptions {
    fs::path diagnostics_dir;             ///< Empty = ~/Library/Logs/DiagnosticReports
    std::chrono::hours lookback{24};
    size_t max_crash_reports = 5;
    int launch_timeout_seconds = 0;       ///< 0 = wait for the app to exit
};

class Verifier {
public:
    explicit Verifier(VerifierOptions options = {});

    Report inspect(const fs::path& bundle) const;

    /// Runs the debug menu, reading choices from `in` and writing to `out`,
    /// until the user quits or input ends. Returns the process exit code.
    int run_interactive(const fs::path& bundle, std::istream& in, std::ostream& out) const;

    /// Crash reports for `app_name` newer than the look-back window.
    std::vector<fs::path> find_crash_reports(const std::string& app_name) const;

    const fs::path& diagnostics_dir() const {
        return options_.diagnostics_dir;
    }

private:
    VerifierOptions options_;

    void relaunch(const Report& report, bool errors_only, std::ostream& out) const;
    void inspect_runtime(const Report& report, std::ostream& out) const;
    void show_latest_crash(const Report& report, std::ostream& out) const;
};

/// Human-readable rendering of a report.
std::string format_report(const Report& report);

/// Lines of `output` mentioning error, exception, traceback or failed
/// (case-insensitive).
std::vector<std::string> filter_error_lines(const std::string& output);

/// First executable `python*` file under the bundle's `Contents` (or the
/// bundle root for a flat layout), in path order.
std::optional<fs::path> find_embedded_interpreter(const fs::path& bundle);

/// Locates the primary executable of a `.app` or flat bundle.
fs::path find_executable(const fs::path& bundle);

} // namespace relpack::verify

#endif // RELPACK_VERIFY_VERIFIER_HPP
