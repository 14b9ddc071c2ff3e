#include "bundle/bundle_stamp.hpp"

#include "bundle/info_plist.hpp"
#include "log/log.hpp"

namespace relpack::bundle {

namespace {

PackError assembly_error(std::string message, std::string hint = {}) {
    return make_error(ErrorKind::AssemblyError, std::move(message), std::move(hint));
}

} // namespace

Result<Unit> stamp_bundle(const fs::path& bundle, const config::BuildConfig& config,
                          const std::optional<fs::path>& icon) {
    if (config.assembly.format != config::ImageFormat::Dmg) {
        return Unit{};
    }

    fs::path contents = bundle / "Contents";
    fs::path resources = contents / "Resources";
    fs::path plist_path = contents / "Info.plist";

    std::error_code ec;
    fs::create_directories(resources, ec);
    if (ec) {
        return assembly_error("cannot create " + resources.string() + ": " + ec.message());
    }

    std::optional<fs::path> source = icon;
    if (!source && !config.paths.default_icon.empty()) {
        if (fs::is_regular_file(config.paths.default_icon)) {
            source = config.paths.default_icon;
        } else {
            RELPACK_LOG_WARN("bundle", "Default icon " << config.paths.default_icon.string()
                                                       << " not found");
        }
    }

    std::string icon_file;
    if (source) {
        fs::path target = resources / source->filename();
        fs::copy_file(*source, target, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            return assembly_error("cannot install icon " + source->string() + ": " + ec.message());
        }
        icon_file = source->stem().string();
        RELPACK_LOG_DEBUG("bundle", "Installed icon " << target.filename().string());
    }

    InfoPlist plist;
    if (fs::exists(plist_path)) {
        std::string error;
        auto loaded = InfoPlist::load(plist_path, &error);
        if (!loaded) {
            return assembly_error("cannot parse " + plist_path.string() + ": " + error,
                                  "the bundler produced an invalid Info.plist");
        }
        plist = std::move(*loaded);
    }

    const auto& pkg = config.package;
    plist.set_string("CFBundleName", pkg.name);
    plist.set_string("CFBundleDisplayName", pkg.name);
    plist.set_string("CFBundleIdentifier", pkg.identifier);
    plist.set_string("CFBundleShortVersionString", pkg.version);
    plist.set_string("CFBundleVersion", pkg.version);
    plist.set_string("LSMinimumSystemVersion", pkg.minimum_os);
    if (!plist.contains("CFBundleExecutable"))
        plist.set_string("CFBundleExecutable", pkg.name);
    if (!plist.contains("CFBundlePackageType"))
        plist.set_string("CFBundlePackageType", "APPL");
    if (!icon_file.empty())
        plist.set_string("CFBundleIconFile", icon_file);
    plist.set_bool("NSHighResolutionCapable", true);

    if (!plist.save(plist_path)) {
        return assembly_error("cannot write " + plist_path.string());
    }

    RELPACK_LOG_INFO("bundle", "Stamped " << bundle.filename().string() << " as "
                                          << pkg.identifier << " " << pkg.version);
    return Unit{};
}

} // namespace relpack::bundle
