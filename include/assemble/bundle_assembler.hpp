//! # Bundle Assembler
//!
//! Packs the merged bundle into a compressed disk image.
//!
//! ```text
//! stamp bundle (Info.plist, icon)
//!   → staging: <bundle> + Applications -> /Applications
//!   → create rw image (du(staging) + margin MB), attach      [TransientMount]
//!   → poll for the mount point (MountTimeout)
//!   → copy staging + .background onto the volume
//!   → presentation script (PresentationWarning on failure)
//!   → detach                                                 [released]
//!   → finalize (UDZO) into <dist>/<package name>
//! ```

#ifndef RELPACK_ASSEMBLE_BUNDLE_ASSEMBLER_HPP
#define RELPACK_ASSEMBLE_BUNDLE_ASSEMBLER_HPP

#include "assemble/image_backend.hpp"
#include "assemble/presentation.hpp"
#include "common.hpp"
#include "config/build_config.hpp"
#include "icon/icon_pipeline.hpp"
#include "merge/universal_merger.hpp"

#include <optional>
#include <vector>

namespace relpack::assemble {

/// The distributable produced by an assembler.
struct PackageImage {
    fs::path path;
    uint64_t size = 0;
    config::ImageFormat format = config::ImageFormat::Dmg;
    std::vector<PackError> warnings; ///< Non-fatal problems (e.g. presentation)
};

/// Size in MB for an image holding `content_bytes`: rounded up, plus margin.
uint64_t image_size_mb(uint64_t content_bytes, int margin_mb);

/// Checks that the finished package exists and is non-empty.
Result<PackageImage> check_package(const fs::path& path, config::ImageFormat format);

class BundleAssembler {
public:
    /// `presentation` may be null to skip window customization.
    BundleAssembler(const config::BuildConfig& config, ImageBackend& backend,
                    PresentationRunner* presentation);

    Result<PackageImage> assemble(const merge::MergedArtifact& merged,
                                  const std::optional<icon::IconSet>& icons);

private:
    const config::BuildConfig& config_;
    ImageBackend& backend_;
    PresentationRunner* presentation_;

    Result<Unit> stage(const merge::MergedArtifact& merged, const fs::path& staging);
    Result<Unit> wait_for_mount(const MountHandle& handle);
};

} // namespace relpack::assemble

#endif // RELPACK_ASSEMBLE_BUNDLE_ASSEMBLER_HPP
