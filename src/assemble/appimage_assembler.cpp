#include "assemble/appimage_assembler.hpp"

#include "bundle/info_plist.hpp"
#include "common/fs_utils.hpp"
#include "log/log.hpp"
#include "process/subprocess.hpp"

#include <sstream>

namespace relpack::assemble {

namespace {

constexpr int APPIMAGETOOL_TIMEOUT_SECONDS = 1800;
constexpr const char* APPIMAGETOOL_RELEASE_URL =
    "https://github.com/AppImage/appimagetool/releases/download/continuous/appimagetool-";

fs::path appdir_path(const config::BuildConfig& config) {
    return config.paths.work_dir / "AppDir";
}

PackError assembly_error(std::string message, std::string hint = {}) {
    return make_error(ErrorKind::AssemblyError, std::move(message), std::move(hint));
}

} // namespace

std::string appimage_arch(const std::string& arch) {
    if (arch == "arm64" || arch == "arm64e")
        return "aarch64";
    if (arch == "i386")
        return "i686";
    return arch;
}

config::ToolSpec appimagetool_spec(const config::BuildConfig& config) {
    auto spec = config.tool("appimagetool");
    if (spec.url.empty()) {
        spec.version = "continuous";
        spec.url = std::string(APPIMAGETOOL_RELEASE_URL) +
                   appimage_arch(config::host_architecture()) + ".AppImage";
    }
    if (spec.version.empty())
        spec.version = "continuous";
    // AppImages need FUSE unless told to extract themselves.
    spec.smoke_args = {"--appimage-extract-and-run", "--version"};
    return spec;
}

std::string desktop_entry(const config::BuildConfig& config) {
    std::ostringstream out;
    out << "[Desktop Entry]\n"
        << "Type=Application\n"
        << "Name=" << config.package.name << "\n"
        << "Exec=" << config.package.name << "\n"
        << "Icon=" << config.package.identifier << "\n"
        << "Categories=Utility;\n"
        << "Terminal=false\n"
        << "X-AppImage-Version=" << config.package.version << "\n";
    return out.str();
}

std::string appstream_metainfo(const config::BuildConfig& config) {
    const auto& pkg = config.package;
    std::ostringstream out;
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        << "<component type=\"desktop-application\">\n"
        << "  <id>" << bundle::xml_escape(pkg.identifier) << "</id>\n"
        << "  <name>" << bundle::xml_escape(pkg.name) << "</name>\n"
        << "  <summary>" << bundle::xml_escape(pkg.name) << "</summary>\n"
        << "  <metadata_license>CC0-1.0</metadata_license>\n"
        << "  <launchable type=\"desktop-id\">" << bundle::xml_escape(pkg.identifier)
        << ".desktop</launchable>\n"
        << "  <provides>\n"
        << "    <binary>" << bundle::xml_escape(pkg.name) << "</binary>\n"
        << "  </provides>\n"
        << "  <releases>\n"
        << "    <release version=\"" << bundle::xml_escape(pkg.version) << "\"/>\n"
        << "  </releases>\n"
        << "</component>\n";
    return out.str();
}

std::string apprun_script(const config::BuildConfig& config) {
    std::string exe = "usr/lib/" + config.package.name + "/" + config.executable_relpath().string();
    std::ostringstream out;
    out << "#!/bin/sh\n"
        << "HERE=\"$(dirname \"$(readlink -f \"$0\")\")\"\n"
        << "export PATH=\"$HERE/usr/bin:$PATH\"\n"
        << "exec \"$HERE/" << exe << "\" \"$@\"\n";
    return out.str();
}

AppImageAssembler::AppImageAssembler(const config::BuildConfig& config, tools::ToolCache& tools)
    : config_(config), tools_(tools) {}

std::optional<fs::path> AppImageAssembler::pick_icon(
    const std::optional<icon::IconSet>& icons) const {
    if (icons) {
        if (auto png = icons->image_for(256))
            return *png;
    }
    for (const auto& candidate : {config_.paths.default_icon, config_.paths.icon}) {
        if (candidate.empty() || !fs::is_regular_file(candidate))
            continue;
        std::string ext = candidate.extension().string();
        if (ext == ".png" || ext == ".svg")
            return candidate;
    }
    return std::nullopt;
}

Result<fs::path> AppImageAssembler::build_appdir(const merge::MergedArtifact& merged,
                                                 const std::optional<icon::IconSet>& icons) {
    const auto& pkg = config_.package;
    fs::path appdir = appdir_path(config_);
    remove_tree(appdir);

    std::string error = copy_tree(merged.bundle_path, appdir / "usr" / "lib" / pkg.name);
    if (!error.empty())
        return assembly_error(error);

    fs::path apprun = appdir / "AppRun";
    std::string desktop = desktop_entry(config_);
    std::string desktop_name = pkg.identifier + ".desktop";
    if (!write_file(apprun, apprun_script(config_)) || !make_executable(apprun) ||
        !write_file(appdir / desktop_name, desktop) ||
        !write_file(appdir / "usr" / "share" / "applications" / desktop_name, desktop) ||
        !write_file(appdir / "usr" / "share" / "metainfo" / (pkg.identifier + ".appdata.xml"),
                    appstream_metainfo(config_))) {
        return assembly_error("cannot write AppDir metadata under " + appdir.string());
    }

    auto icon = pick_icon(icons);
    if (icon) {
        std::string ext = icon->extension().string();
        std::string icon_name = pkg.identifier + ext;
        std::string hicolor = ext == ".svg" ? "scalable" : "256x256";
        fs::path hicolor_dir = appdir / "usr" / "share" / "icons" / "hicolor" / hicolor / "apps";

        std::string icon_error = copy_tree(*icon, appdir / icon_name);
        if (icon_error.empty())
            icon_error = copy_tree(*icon, hicolor_dir / icon_name);
        if (!icon_error.empty())
            return assembly_error(icon_error);

        std::error_code ec;
        fs::create_symlink(icon_name, appdir / ".DirIcon", ec);
        if (ec)
            return assembly_error("cannot create .DirIcon: " + ec.message());
    } else {
        std::string message = "no PNG or SVG icon for the AppImage";
        RELPACK_LOG_WARN("assemble", message);
        warnings_.push_back(message);
    }

    RELPACK_LOG_DEBUG("assemble", "AppDir ready at " << appdir.string());
    return appdir;
}

Result<PackageImage> AppImageAssembler::assemble(const merge::MergedArtifact& merged,
                                                 const std::optional<icon::IconSet>& icons) {
    ScratchPaths scratch;
    scratch.add(appdir_path(config_));

    auto appdir = build_appdir(merged, icons);
    if (is_err(appdir))
        return unwrap_err(appdir);

    auto tool = tools_.acquire(appimagetool_spec(config_));
    if (is_err(tool))
        return unwrap_err(tool);

    fs::path output = config_.package_path();
    std::error_code ec;
    fs::create_directories(output.parent_path(), ec);
    fs::remove(output, ec);
    ScratchPaths partial;
    partial.add(output);

    std::vector<std::string> argv{unwrap(tool).string(), "--appimage-extract-and-run",
                                  unwrap(appdir).string(), output.string()};
    process::ProcessOptions options;
    options.env["ARCH"] = appimage_arch(config_.architectures.front());
    options.timeout_seconds = APPIMAGETOOL_TIMEOUT_SECONDS;
    options.cwd = config_.paths.work_dir;

    RELPACK_LOG_INFO("assemble", "Building " << output.filename().string());
    auto result = process::run_process(argv, options);
    if (!result.ok()) {
        std::string detail = result.stderr_output.empty() ? result.stdout_output
                                                          : result.stderr_output;
        RELPACK_LOG_DEBUG("assemble", "appimagetool output:\n" << detail);
        return assembly_error("appimagetool failed with exit code " +
                                  std::to_string(result.exit_code),
                              "run with -v to see the appimagetool output");
    }

    auto checked = check_package(output, config::ImageFormat::AppImage);
    if (is_err(checked))
        return unwrap_err(checked);
    make_executable(output);
    partial.dismiss();

    auto& package = unwrap(checked);
    for (const auto& warning : warnings_) {
        package.warnings.push_back(make_error(ErrorKind::IconUnavailable, warning));
    }
    RELPACK_LOG_INFO("assemble", "Created " << package.path.string() << " (" << package.size
                                            << " bytes)");
    return package;
}

} // namespace relpack::assemble
