//! # Architecture Builder
//!
//! Runs the configured bundler once per target architecture and checks that
//! it produced a bundle.
//!
//! ## Per-Architecture Layout
//!
//! ```text
//! <work>/<arch>/dist/<bundle>     bundler output ({dist})
//! <work>/<arch>/build/            bundler scratch ({work})
//! <work>/bundles/<Name>-<arch>    collected artifact
//! ```
//!
//! ## Command Placeholders
//!
//! | Placeholder    | Value                               |
//! |----------------|-------------------------------------|
//! | `{arch}`       | target architecture                 |
//! | `{dist}`       | `<work>/<arch>/dist`                |
//! | `{work}`       | `<work>/<arch>/build`               |
//! | `{entry}`      | entry point                         |
//! | `{source}`     | source tree                         |
//! | `{name}`       | package name                        |
//! | `{identifier}` | bundle identifier                   |
//! | `{version}`    | package version                     |
//! | `{min_os}`     | minimum OS version                  |
//! | `{icon}`       | master icon (may be empty)          |
//!
//! The bundler also sees `TARGET_ARCH` and `MACOSX_DEPLOYMENT_TARGET`.

#ifndef RELPACK_BUILD_ARCH_BUILDER_HPP
#define RELPACK_BUILD_ARCH_BUILDER_HPP

#include "common.hpp"
#include "config/build_config.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace relpack::build {

/// A bundle built for one architecture.
struct Artifact {
    std::string arch;
    fs::path bundle_path;
    fs::path executable_path;
};

class ArchitectureBuilder {
public:
    explicit ArchitectureBuilder(const config::BuildConfig& config);

    /// Removes previous intermediates and the stale package, then recreates
    /// the work and dist directories. Only the first call per instance does
    /// anything.
    Result<Unit> clean();

    /// Builds one architecture. CompileError if the expected bundle or its
    /// executable is missing afterwards, whatever the exit code was.
    Result<Artifact> build(const std::string& arch);

    /// Builds every configured architecture on up to `build.jobs` workers.
    /// Artifacts come back in configured order; the first is the merge template.
    Result<std::vector<Artifact>> build_all();

    /// Placeholder values for `arch`.
    std::map<std::string, std::string> placeholders(const std::string& arch) const;

    /// The bundler command line for `arch`, placeholders expanded.
    std::vector<std::string> command_for(const std::string& arch) const;

    /// Non-fatal problems seen while building (e.g. non-zero exit with output).
    std::vector<std::string> warnings() const;

    /// Finds an already collected artifact for `arch` at its well-known path.
    static std::optional<Artifact> locate(const config::BuildConfig& config,
                                          const std::string& arch);

private:
    const config::BuildConfig& config_;
    bool cleaned_ = false;
    mutable std::mutex warnings_mutex_;
    std::vector<std::string> warnings_;

    void warn(const std::string& message);
};

} // namespace relpack::build

#endif // RELPACK_BUILD_ARCH_BUILDER_HPP
