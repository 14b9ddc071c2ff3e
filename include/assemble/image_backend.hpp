//! # Disk Image Backend
//!
//! Operations the bundle assembler needs from a disk image tool. The default
//! backend drives `hdiutil`; tests substitute a directory-based fake.
//!
//! | Operation  | hdiutil invocation                                              |
//! |------------|-----------------------------------------------------------------|
//! | `create`   | `create -size <N>m -fs HFS+ -volname <name> -ov <image>`        |
//! | `attach`   | `attach -readwrite -noverify -noautoopen <image>`               |
//! | `detach`   | `detach <device> [-force]`                                      |
//! | `finalize` | `convert <image> -format UDZO -imagekey zlib-level=9 -o <out>`  |

#ifndef RELPACK_ASSEMBLE_IMAGE_BACKEND_HPP
#define RELPACK_ASSEMBLE_IMAGE_BACKEND_HPP

#include "common.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace relpack::assemble {

/// An attached volume.
struct MountHandle {
    std::string device;  ///< e.g. /dev/disk4
    fs::path mount_point; ///< e.g. /Volumes/My App
};

class ImageBackend {
public:
    virtual ~ImageBackend() = default;

    virtual std::string name() const = 0;

    /// Tools that must be on PATH before the pipeline starts.
    virtual std::vector<std::string> required_tools() const = 0;

    /// Creates an empty writable image of `size_mb` megabytes.
    virtual Result<Unit> create(const std::string& volume_name, uint64_t size_mb,
                                const fs::path& image) = 0;

    /// Attaches `image` read-write. The mount point may appear later; callers
    /// poll for it.
    virtual Result<MountHandle> attach(const fs::path& image, const std::string& volume_name) = 0;

    virtual Result<Unit> detach(const MountHandle& handle, bool force) = 0;

    /// Converts the writable image into the compressed read-only `final_image`.
    virtual Result<Unit> finalize(const fs::path& rw_image, const fs::path& final_image) = 0;
};

class HdiutilBackend : public ImageBackend {
public:
    std::string name() const override {
        return "hdiutil";
    }
    std::vector<std::string> required_tools() const override {
        return {"hdiutil"};
    }

    Result<Unit> create(const std::string& volume_name, uint64_t size_mb,
                        const fs::path& image) override;
    Result<MountHandle> attach(const fs::path& image, const std::string& volume_name) override;
    Result<Unit> detach(const MountHandle& handle, bool force) override;
    Result<Unit> finalize(const fs::path& rw_image, const fs::path& final_image) override;
};

/// Extracts the device and mount point from `hdiutil attach` output. Falls
/// back to `/Volumes/<volume_name>` when no mount point is listed.
std::optional<MountHandle> parse_attach_output(std::string_view output,
                                               const std::string& volume_name);

} // namespace relpack::assemble

#endif // RELPACK_ASSEMBLE_IMAGE_BACKEND_HPP
