#include "assemble/image_backend.hpp"

#include "log/log.hpp"
#include "process/subprocess.hpp"

#include <cctype>
#include <sstream>

namespace relpack::assemble {

namespace {

constexpr int HDIUTIL_TIMEOUT_SECONDS = 600;

std::string trim(std::string_view s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start])))
        ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
        --end;
    return std::string(s.substr(start, end - start));
}

Result<process::ProcessResult> run_hdiutil(const std::vector<std::string>& args) {
    std::vector<std::string> argv{"hdiutil"};
    argv.insert(argv.end(), args.begin(), args.end());
    RELPACK_LOG_DEBUG("assemble", "Running " << process::format_command(argv));

    process::ProcessOptions options;
    options.timeout_seconds = HDIUTIL_TIMEOUT_SECONDS;
    auto result = process::run_process(argv, options);
    if (!result.ok()) {
        std::string detail = trim(result.stderr_output.empty() ? result.stdout_output
                                                               : result.stderr_output);
        return make_error(ErrorKind::AssemblyError,
                          "hdiutil " + args.front() + " failed (exit code " +
                              std::to_string(result.exit_code) + ")" +
                              (detail.empty() ? std::string() : ": " + detail),
                          "check free disk space and that no other volume uses the same name");
    }
    return result;
}

} // namespace

std::optional<MountHandle> parse_attach_output(std::string_view output,
                                               const std::string& volume_name) {
    MountHandle handle;
    std::istringstream in{std::string(output)};
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("/dev/", 0) != 0)
            continue;
        if (handle.device.empty()) {
            size_t end = line.find_first_of(" \t");
            handle.device = line.substr(0, end);
        }
        // Columns: device \t content-hint \t mount-point
        size_t first_tab = line.find('\t');
        size_t second_tab = first_tab == std::string::npos ? std::string::npos
                                                            : line.find('\t', first_tab + 1);
        if (second_tab != std::string::npos && handle.mount_point.empty()) {
            std::string mount = trim(std::string_view(line).substr(second_tab + 1));
            if (!mount.empty())
                handle.mount_point = mount;
        }
    }
    if (handle.device.empty())
        return std::nullopt;
    if (handle.mount_point.empty())
        handle.mount_point = fs::path("/Volumes") / volume_name;
    return handle;
}

Result<Unit> HdiutilBackend::create(const std::string& volume_name, uint64_t size_mb,
                                    const fs::path& image) {
    auto result = run_hdiutil({"create", "-size", std::to_string(size_mb) + "m", "-fs", "HFS+",
                               "-volname", volume_name, "-ov", image.string()});
    if (is_err(result))
        return unwrap_err(result);
    return Unit{};
}

Result<MountHandle> HdiutilBackend::attach(const fs::path& image, const std::string& volume_name) {
    auto result =
        run_hdiutil({"attach", "-readwrite", "-noverify", "-noautoopen", image.string()});
    if (is_err(result))
        return unwrap_err(result);

    auto handle = parse_attach_output(unwrap(result).stdout_output, volume_name);
    if (!handle) {
        return make_error(ErrorKind::AssemblyError,
                          "hdiutil attach reported no device for " + image.filename().string());
    }
    RELPACK_LOG_DEBUG("assemble", "Attached " << handle->device << " at "
                                              << handle->mount_point.string());
    return *handle;
}

Result<Unit> HdiutilBackend::detach(const MountHandle& handle, bool force) {
    std::vector<std::string> args{"detach", handle.device};
    if (force)
        args.push_back("-force");
    auto result = run_hdiutil(args);
    if (is_err(result))
        return unwrap_err(result);
    return Unit{};
}

Result<Unit> HdiutilBackend::finalize(const fs::path& rw_image, const fs::path& final_image) {
    std::error_code ec;
    fs::remove(final_image, ec);
    auto result = run_hdiutil({"convert", rw_image.string(), "-format", "UDZO", "-imagekey",
                               "zlib-level=9", "-o", final_image.string()});
    if (is_err(result))
        return unwrap_err(result);
    return Unit{};
}

} // namespace relpack::assemble
