//! # Build Configuration
//!
//! `BuildConfig` is the single description of a packaging run. It is loaded
//! once from `relpack.toml` plus a snapshot of the environment and then passed
//! by const reference to every stage; no stage reads the environment itself.
//!
//! ## Manifest Format
//!
//! ```toml
//! [package]
//! name = "My App"
//! identifier = "com.example.myapp"
//! version = "1.2.0"
//! minimum_os = "11.0"
//!
//! [paths]
//! entry_point = "src/main.py"
//! source_dir = "src"
//! icon = "assets/icon.svg"
//!
//! [build]
//! architectures = ["x86_64", "arm64"]
//! command = ["pyinstaller", "--name", "{name}", "--distpath", "{dist}", "{entry}"]
//! jobs = 2
//!
//! [assembly]
//! format = "dmg"
//! size_margin_mb = 50
//!
//! [tool.appimagetool]
//! version = "13"
//! url = "https://example.com/appimagetool-x86_64.AppImage"
//! ```
//!
//! ## Environment Overrides
//!
//! | Variable               | Effect                                          |
//! |------------------------|-------------------------------------------------|
//! | `TARGET_ARCH`          | one arch, a comma list, or `universal`          |
//! | `RELPACK_IMAGE_FORMAT` | `dmg` or `appimage`                             |
//! | `RELPACK_CACHE_DIR`    | tool cache directory                            |
//! | `RELPACK_DIST_DIR`     | output directory for the package                |

#ifndef RELPACK_CONFIG_BUILD_CONFIG_HPP
#define RELPACK_CONFIG_BUILD_CONFIG_HPP

#include "common.hpp"
#include "config/toml.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace relpack::config {

using EnvMap = std::map<std::string, std::string>;

enum class ImageFormat { Dmg, AppImage };

/// What the merger does with non-executable files that differ between arches.
enum class ResourcePolicy {
    Strict,   ///< Fail with MergeError
    FirstWins ///< Keep the template's copy and warn
};

const char* format_name(ImageFormat format);
const char* format_extension(ImageFormat format);

struct PackageInfo {
    std::string name;       ///< Display name, also the bundle and executable name
    std::string identifier; ///< Reverse-DNS bundle identifier
    std::string version;    ///< Semantic version
    std::string minimum_os = "11.0";
};

struct PathsConfig {
    fs::path entry_point;
    fs::path source_dir;
    fs::path icon;         ///< Master icon, may be empty
    fs::path default_icon; ///< Used when the icon stage is skipped, may be empty
    fs::path work_dir;
    fs::path dist_dir;
    fs::path cache_dir;
};

struct BuildSettings {
    std::vector<std::string> command; ///< Bundler argv with `{placeholder}` tokens
    int jobs = 1;
    ResourcePolicy resources = ResourcePolicy::Strict;
    std::vector<std::string> required_tools;
};

struct Point {
    int x = 0;
    int y = 0;
};

/// Finder window layout for the disk image.
struct WindowLayout {
    int left = 400;
    int top = 100;
    int right = 900;
    int bottom = 450;
    int icon_size = 128;
    Point app_position{125, 180};
    Point link_position{375, 180};
};

struct AssemblySettings {
    ImageFormat format = ImageFormat::Dmg;
    int size_margin_mb = 50;
    int mount_timeout_ms = 10000;
    int mount_poll_ms = 100;
    bool presentation = true;
    fs::path background; ///< Optional background picture for the image window
    WindowLayout window;
    bool keep_intermediates = false;
};

/// An external tool obtained through the ToolCache.
struct ToolSpec {
    std::string name;
    std::string version;
    std::string url;
    std::vector<std::string> smoke_args{"--version"};
};

/// Everything a packaging run needs to know.
struct BuildConfig {
    fs::path project_dir; ///< Directory relative paths were resolved against
    PackageInfo package;
    std::vector<std::string> architectures;
    PathsConfig paths;
    BuildSettings build;
    AssemblySettings assembly;
    std::map<std::string, ToolSpec> tools;

    bool is_universal() const {
        return architectures.size() > 1;
    }

    /// "Universal" for several arches, otherwise the single arch.
    std::string arch_label() const;

    /// `<AppName>-<Version>-<ArchLabel>.<ext>`, spaces in the name replaced by '_'.
    std::string package_file_name() const;
    fs::path package_path() const {
        return paths.dist_dir / package_file_name();
    }

    /// Bundle directory name produced by the bundler: `<Name>.app` for disk
    /// images, `<Name>` for the flat layout used by AppImage.
    std::string bundle_dir_name() const;

    /// Primary executable relative to the bundle root.
    fs::path executable_relpath() const;

    /// Where the bundler writes for `arch`: `<work>/<arch>`.
    fs::path arch_work_dir(std::string_view arch) const {
        return paths.work_dir / std::string(arch);
    }

    fs::path bundles_dir() const {
        return paths.work_dir / "bundles";
    }

    /// Per-architecture artifact: `<work>/bundles/<Name>-<arch>[.app]`.
    fs::path artifact_path(std::string_view arch) const;

    /// Merged (or promoted) bundle: `<work>/bundles/<bundle_dir_name>`.
    fs::path merged_bundle_path() const {
        return bundles_dir() / bundle_dir_name();
    }

    fs::path icon_dir() const {
        return paths.work_dir / "icon";
    }

    fs::path staging_dir() const {
        return paths.work_dir / "staging";
    }

    /// The tool spec for `name`, or a spec with only the name filled in.
    ToolSpec tool(const std::string& name) const;
};

// ============================================================================
// Loading
// ============================================================================

/// Snapshot of the variables relpack reads from the process environment.
EnvMap capture_environment();

/// Host architecture from `uname -m`, normalized (`aarch64` -> `arm64`).
std::string host_architecture();

/// True when running on macOS.
bool host_is_darwin();

bool is_known_architecture(std::string_view arch);
bool is_valid_semver(std::string_view version);
bool is_valid_bundle_identifier(std::string_view identifier);

/// Parses `TARGET_ARCH`-style selectors: "x86_64", "x86_64,arm64",
/// "universal". Unknown or duplicate arches produce a ConfigError.
Result<std::vector<std::string>> parse_arch_selector(std::string_view selector);

/// Builds a config from an already parsed manifest. Relative paths are
/// resolved against `project_dir`.
Result<BuildConfig> build_config_from_toml(const TomlDocument& doc, const fs::path& project_dir,
                                           const EnvMap& env);

/// Reads and validates `manifest_path`.
Result<BuildConfig> load_build_config(const fs::path& manifest_path, const EnvMap& env);

/// Checks cross-field invariants (arch set, format, version, identifier).
Result<Unit> validate(const BuildConfig& config);

/// Replaces `{placeholder}` tokens in `text`. Unknown placeholders are kept.
std::string expand_placeholders(std::string_view text,
                                const std::map<std::string, std::string>& values);

} // namespace relpack::config

#endif // RELPACK_CONFIG_BUILD_CONFIG_HPP
