#include "icon/icon_converter.hpp"

#include "process/subprocess.hpp"

#include <algorithm>
#include <cctype>

namespace relpack::icon {

namespace {

constexpr int CONVERT_TIMEOUT_SECONDS = 120;

std::string lower_extension(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string run_converter(const std::vector<std::string>& argv) {
    process::ProcessOptions options;
    options.timeout_seconds = CONVERT_TIMEOUT_SECONDS;
    auto result = process::run_process(argv, options);
    if (result.ok())
        return {};
    if (!result.launched)
        return argv.front() + " could not be started";
    if (result.timed_out)
        return argv.front() + " timed out";
    std::string detail = result.stderr_output.empty() ? result.stdout_output
                                                      : result.stderr_output;
    while (!detail.empty() && (detail.back() == '\n' || detail.back() == '\r'))
        detail.pop_back();
    return argv.front() + " exited with code " + std::to_string(result.exit_code) +
           (detail.empty() ? std::string() : ": " + detail);
}

} // namespace

bool is_raster_image(const fs::path& path) {
    static const char* raster[] = {".png", ".jpg", ".jpeg", ".tif", ".tiff", ".bmp", ".gif"};
    std::string ext = lower_extension(path);
    return std::any_of(std::begin(raster), std::end(raster),
                       [&](const char* candidate) { return ext == candidate; });
}

// ============================================================================
// rsvg-convert
// ============================================================================

bool RsvgConverter::available() const {
    return process::find_program("rsvg-convert").has_value();
}

bool RsvgConverter::accepts(const fs::path& master) const {
    std::string ext = lower_extension(master);
    return ext == ".svg" || ext == ".svgz";
}

std::string RsvgConverter::convert(const fs::path& master, int pixels, const fs::path& output) {
    std::string size = std::to_string(pixels);
    return run_converter({"rsvg-convert", "-w", size, "-h", size, "-f", "png", "-o",
                          output.string(), master.string()});
}

// ============================================================================
// sips
// ============================================================================

bool SipsConverter::available() const {
    return process::find_program("sips").has_value();
}

bool SipsConverter::accepts(const fs::path& master) const {
    return is_raster_image(master);
}

std::string SipsConverter::convert(const fs::path& master, int pixels, const fs::path& output) {
    std::string size = std::to_string(pixels);
    return run_converter({"sips", "-s", "format", "png", "-z", size, size, master.string(),
                          "--out", output.string()});
}

// ============================================================================
// ImageMagick
// ============================================================================

std::optional<std::string> ImageMagickConverter::program() const {
    for (const char* candidate : {"magick", "convert"}) {
        if (process::find_program(candidate))
            return std::string(candidate);
    }
    return std::nullopt;
}

bool ImageMagickConverter::available() const {
    return program().has_value();
}

bool ImageMagickConverter::accepts(const fs::path& master) const {
    std::string ext = lower_extension(master);
    return is_raster_image(master) || ext == ".svg";
}

/// Non-square masters are centered on a transparent square canvas.
std::string ImageMagickConverter::convert(const fs::path& master, int pixels,
                                          const fs::path& output) {
    auto tool = program();
    if (!tool)
        return "neither magick nor convert is on PATH";
    std::string size = std::to_string(pixels) + "x" + std::to_string(pixels);
    return run_converter({*tool, "-background", "none", master.string(), "-resize", size,
                          "-gravity", "center", "-extent", size, "png:" + output.string()});
}

// ============================================================================
// qlmanage
// ============================================================================

bool QuickLookConverter::available() const {
    return process::find_program("qlmanage").has_value();
}

bool QuickLookConverter::accepts(const fs::path& /*master*/) const {
    return true;
}

/// qlmanage writes `<outdir>/<master file name>.png`; it is renamed to `output`.
std::string QuickLookConverter::convert(const fs::path& master, int pixels,
                                        const fs::path& output) {
    fs::path out_dir = output.parent_path() / ".qlmanage";
    std::error_code ec;
    fs::create_directories(out_dir, ec);
    if (ec)
        return "cannot create " + out_dir.string() + ": " + ec.message();

    std::string error = run_converter(
        {"qlmanage", "-t", "-s", std::to_string(pixels), "-o", out_dir.string(), master.string()});
    if (!error.empty()) {
        fs::remove_all(out_dir, ec);
        return error;
    }

    fs::path thumbnail = out_dir / (master.filename().string() + ".png");
    fs::rename(thumbnail, output, ec);
    std::error_code cleanup_ec;
    fs::remove_all(out_dir, cleanup_ec);
    if (ec)
        return "qlmanage produced no thumbnail for " + master.filename().string();
    return {};
}

} // namespace relpack::icon
