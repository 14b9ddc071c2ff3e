//! # AppImage Assembler
//!
//! Linux counterpart of the disk image assembler. Lays out an AppDir around
//! the bundle and runs `appimagetool` (obtained through the ToolCache).
//!
//! ```text
//! AppDir/
//! ├── AppRun                                   launcher script
//! ├── <identifier>.desktop
//! ├── <identifier>.png                         256px icon
//! ├── .DirIcon -> <identifier>.png
//! └── usr/
//!     ├── lib/<name>/                          the bundle
//!     └── share/
//!         ├── applications/<identifier>.desktop
//!         ├── icons/hicolor/256x256/apps/<identifier>.png
//!         └── metainfo/<identifier>.appdata.xml
//! ```

#ifndef RELPACK_ASSEMBLE_APPIMAGE_ASSEMBLER_HPP
#define RELPACK_ASSEMBLE_APPIMAGE_ASSEMBLER_HPP

#include "assemble/bundle_assembler.hpp"
#include "common.hpp"
#include "config/build_config.hpp"
#include "tools/tool_cache.hpp"

#include <optional>
#include <string>

namespace relpack::assemble {

/// AppImage architecture name for a relpack arch (`arm64` -> `aarch64`).
std::string appimage_arch(const std::string& arch);

/// Tool spec for appimagetool: the configured one, or the upstream release.
config::ToolSpec appimagetool_spec(const config::BuildConfig& config);

std::string desktop_entry(const config::BuildConfig& config);
std::string appstream_metainfo(const config::BuildConfig& config);
std::string apprun_script(const config::BuildConfig& config);

class AppImageAssembler {
public:
    AppImageAssembler(const config::BuildConfig& config, tools::ToolCache& tools);

    Result<PackageImage> assemble(const merge::MergedArtifact& merged,
                                  const std::optional<icon::IconSet>& icons);

    /// Builds the AppDir only. Returns its path.
    Result<fs::path> build_appdir(const merge::MergedArtifact& merged,
                                  const std::optional<icon::IconSet>& icons);

    std::vector<std::string> warnings() const {
        return warnings_;
    }

private:
    const config::BuildConfig& config_;
    tools::ToolCache& tools_;
    std::vector<std::string> warnings_;

    std::optional<fs::path> pick_icon(const std::optional<icon::IconSet>& icons) const;
};

} // namespace relpack::assemble

#endif // RELPACK_ASSEMBLE_APPIMAGE_ASSEMBLER_HPP
