#include "assemble/bundle_assembler.hpp"

#include "assemble/transient_mount.hpp"
#include "bundle/bundle_stamp.hpp"
#include "common/fs_utils.hpp"
#include "log/log.hpp"

#include <chrono>
#include <thread>

namespace relpack::assemble {

namespace {

constexpr uint64_t BYTES_PER_MB = 1024 * 1024;

PackError assembly_error(std::string message, std::string hint = {}) {
    return make_error(ErrorKind::AssemblyError, std::move(message), std::move(hint));
}

} // namespace

uint64_t image_size_mb(uint64_t content_bytes, int margin_mb) {
    uint64_t content_mb = (content_bytes + BYTES_PER_MB - 1) / BYTES_PER_MB;
    return content_mb + static_cast<uint64_t>(margin_mb < 0 ? 0 : margin_mb);
}

Result<PackageImage> check_package(const fs::path& path, config::ImageFormat format) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return assembly_error("package " + path.string() + " was not produced");
    }
    uint64_t size = fs::file_size(path, ec);
    if (ec || size == 0) {
        return assembly_error("package " + path.string() + " is empty");
    }
    PackageImage image;
    image.path = path;
    image.size = size;
    image.format = format;
    return image;
}

BundleAssembler::BundleAssembler(const config::BuildConfig& config, ImageBackend& backend,
                                 PresentationRunner* presentation)
    : config_(config), backend_(backend), presentation_(presentation) {}

Result<Unit> BundleAssembler::stage(const merge::MergedArtifact& merged, const fs::path& staging) {
    remove_tree(staging);
    std::error_code ec;
    fs::create_directories(staging, ec);
    if (ec) {
        return assembly_error("cannot create staging directory: " + ec.message());
    }

    std::string error = copy_tree(merged.bundle_path, staging / merged.bundle_path.filename());
    if (!error.empty())
        return assembly_error(error);

    fs::create_directory_symlink("/Applications", staging / "Applications", ec);
    if (ec) {
        return assembly_error("cannot create Applications link: " + ec.message());
    }
    return Unit{};
}

Result<Unit> BundleAssembler::wait_for_mount(const MountHandle& handle) {
    const auto& assembly = config_.assembly;
    auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(assembly.mount_timeout_ms);

    while (true) {
        std::error_code ec;
        if (fs::is_directory(handle.mount_point, ec)) {
            return Unit{};
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return make_error(ErrorKind::MountTimeout,
                              "volume " + handle.mount_point.string() + " did not appear within " +
                                  std::to_string(assembly.mount_timeout_ms) + "ms",
                              "raise [assembly] mount_timeout_ms or check for a stale volume with "
                              "the same name");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(assembly.mount_poll_ms));
    }
}

Result<PackageImage> BundleAssembler::assemble(const merge::MergedArtifact& merged,
                                               const std::optional<icon::IconSet>& icons) {
    std::optional<fs::path> icon_file;
    if (icons)
        icon_file = icons->container;
    auto stamped = bundle::stamp_bundle(merged.bundle_path, config_, icon_file);
    if (is_err(stamped))
        return unwrap_err(stamped);

    fs::path staging = config_.staging_dir();
    const std::string volume_name = config_.package.name;
    fs::path rw_image = config_.paths.work_dir / (sanitize_file_name(volume_name) + "-rw.dmg");
    fs::path final_image = config_.package_path();

    // Declared before the mount so the volume is detached first.
    ScratchPaths scratch;
    scratch.add(staging);
    scratch.add(rw_image);

    auto staged = stage(merged, staging);
    if (is_err(staged))
        return unwrap_err(staged);

    uint64_t size_mb = image_size_mb(directory_size(staging), config_.assembly.size_margin_mb);

    RELPACK_LOG_INFO("assemble", "Creating " << size_mb << "MB image for " << volume_name);
    auto created = backend_.create(volume_name, size_mb, rw_image);
    if (is_err(created))
        return unwrap_err(created);

    auto attached = backend_.attach(rw_image, volume_name);
    if (is_err(attached))
        return unwrap_err(attached);

    PackageImage package;
    {
        TransientMount mount(backend_, unwrap(attached));

        auto ready = wait_for_mount(mount.handle());
        if (is_err(ready))
            return unwrap_err(ready);

        const fs::path& volume = mount.handle().mount_point;
        std::string copy_error = copy_tree(staging, volume);
        if (!copy_error.empty())
            return assembly_error(copy_error, "check that the image is large enough");

        std::string background_file;
        const fs::path& background = config_.assembly.background;
        if (!background.empty()) {
            if (fs::is_regular_file(background)) {
                std::string error = copy_tree(background, volume / ".background" /
                                                              background.filename());
                if (!error.empty())
                    return assembly_error(error);
                background_file = background.filename().string();
            } else {
                RELPACK_LOG_WARN("assemble", "Background " << background.string()
                                                           << " not found, skipping");
            }
        }

        if (config_.assembly.presentation && presentation_) {
            PresentationRequest request;
            request.volume_name = volume_name;
            request.app_item = merged.bundle_path.filename().string();
            request.background_file = background_file;
            request.layout = config_.assembly.window;

            auto presented = presentation_->apply(mount.handle(), request);
            if (is_err(presented)) {
                auto warning = unwrap_err(presented);
                warning.kind = ErrorKind::PresentationWarning;
                RELPACK_LOG_WARN("assemble", warning.message);
                package.warnings.push_back(warning);
            }
        }

        auto released = mount.release();
        if (is_err(released)) {
            auto error = unwrap_err(released);
            return assembly_error("cannot detach " + mount.handle().device + ": " + error.message,
                                  "eject the volume by hand with `hdiutil detach -force`");
        }
    }

    std::error_code ec;
    fs::create_directories(final_image.parent_path(), ec);
    fs::remove(final_image, ec);

    ScratchPaths partial;
    partial.add(final_image);

    RELPACK_LOG_INFO("assemble", "Compressing into " << final_image.filename().string());
    auto finalized = backend_.finalize(rw_image, final_image);
    if (is_err(finalized))
        return unwrap_err(finalized);

    auto checked = check_package(final_image, config::ImageFormat::Dmg);
    if (is_err(checked))
        return unwrap_err(checked);

    partial.dismiss();

    auto& result = unwrap(checked);
    result.warnings = std::move(package.warnings);
    RELPACK_LOG_INFO("assemble", "Created " << result.path.string() << " (" << result.size
                                            << " bytes)");
    return result;
}

} // namespace relpack::assemble
