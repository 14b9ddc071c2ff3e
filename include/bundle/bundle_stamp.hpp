//! # Bundle Stamping
//!
//! Writes package metadata and the icon into a `.app` bundle before it is
//! packed into an image.
//!
//! | Info.plist key               | Source                       |
//! |------------------------------|------------------------------|
//! | `CFBundleName`               | `[package] name`             |
//! | `CFBundleDisplayName`        | `[package] name`             |
//! | `CFBundleIdentifier`         | `[package] identifier`       |
//! | `CFBundleShortVersionString` | `[package] version`          |
//! | `CFBundleVersion`            | `[package] version`          |
//! | `LSMinimumSystemVersion`     | `[package] minimum_os`       |
//! | `CFBundleIconFile`           | installed icon, if any       |
//! | `NSHighResolutionCapable`    | always true                  |

#ifndef RELPACK_BUNDLE_BUNDLE_STAMP_HPP
#define RELPACK_BUNDLE_BUNDLE_STAMP_HPP

#include "common.hpp"
#include "config/build_config.hpp"

#include <optional>

namespace relpack::bundle {

/// Installs `icon` (or `paths.default_icon` when `icon` is empty) into
/// `Contents/Resources` and updates `Contents/Info.plist`. Bundles in the
/// flat layout have no Info.plist and are left alone.
Result<Unit> stamp_bundle(const fs::path& bundle, const config::BuildConfig& config,
                          const std::optional<fs::path>& icon);

} // namespace relpack::bundle

#endif // RELPACK_BUNDLE_BUNDLE_STAMP_HPP
