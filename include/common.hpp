//! # Common Definitions
//!
//! Types and constants shared by every relpack component.
//!
//! ## Overview
//!
//! - **Version Information**: Tool version constants
//! - **Error Type**: `PackError` and the `ErrorKind` taxonomy
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: Aliases for unique and shared pointers
//!
//! ## Error Policy
//!
//! Stages never throw across module boundaries. Every fallible operation
//! returns `Result<T>`; `std::filesystem` exceptions are caught where they
//! occur and converted into the stage's own `ErrorKind`.

#ifndef RELPACK_COMMON_HPP
#define RELPACK_COMMON_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace relpack {

// ============================================================================
// Version Information
// ============================================================================

/// The tool version string (e.g., "0.3.0").
constexpr const char* VERSION = "0.3.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Errors
// ============================================================================

/// Classification of everything that can go wrong while packaging.
///
/// | Kind                  | Fatal | Raised by              |
/// |-----------------------|-------|------------------------|
/// | `ConfigError`         | yes   | manifest / environment |
/// | `PrereqMissing`       | yes   | prerequisite check     |
/// | `FetchError`          | yes   | ToolCache              |
/// | `CompileError`        | yes   | ArchitectureBuilder    |
/// | `MergeError`          | yes   | UniversalMerger        |
/// | `IconError`           | yes   | IconPipeline           |
/// | `IconUnavailable`     | no    | IconPipeline           |
/// | `AssemblyError`       | yes   | assemblers             |
/// | `MountTimeout`        | yes   | BundleAssembler        |
/// | `PresentationWarning` | no    | BundleAssembler        |
enum class ErrorKind {
    ConfigError,
    PrereqMissing,
    FetchError,
    CompileError,
    MergeError,
    IconError,
    IconUnavailable,
    AssemblyError,
    MountTimeout,
    PresentationWarning,
};

/// Returns the display name of an error kind (e.g., "MergeError").
const char* error_kind_name(ErrorKind kind);

/// Returns true for kinds that abort the pipeline.
constexpr bool is_fatal(ErrorKind kind) {
    return kind != ErrorKind::IconUnavailable && kind != ErrorKind::PresentationWarning;
}

/// An error or warning produced by a stage.
struct PackError {
    ErrorKind kind;
    std::string message;
    std::string hint; ///< Remediation suggestion, may be empty

    bool fatal() const {
        return is_fatal(kind);
    }

    /// "MergeError: <message>"
    std::string to_string() const;
};

/// Convenience constructor used throughout the stages.
inline PackError make_error(ErrorKind kind, std::string message, std::string hint = {}) {
    return PackError{kind, std::move(message), std::move(hint)};
}

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// Result<fs::path> find_bundle(const fs::path& dir) {
///     if (!fs::exists(dir / "App.app"))
///         return make_error(ErrorKind::CompileError, "bundle missing");
///     return dir / "App.app";
/// }
/// ```
template <typename T, typename E = PackError> using Result = std::variant<T, E>;

/// Success value for operations that produce nothing.
using Unit = std::monostate;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

/// Reference-counted shared pointer.
template <typename T> using Rc = std::shared_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

} // namespace relpack

#endif // RELPACK_COMMON_HPP
