#include "icon/icon_pipeline.hpp"

#include "common/fs_utils.hpp"
#include "icon/icns_writer.hpp"
#include "log/log.hpp"

namespace relpack::icon {

namespace {

PackError unavailable(std::string message, std::string hint) {
    return make_error(ErrorKind::IconUnavailable, std::move(message), std::move(hint));
}

PackError icon_error(std::string message, std::string hint = {}) {
    return make_error(ErrorKind::IconError, std::move(message), std::move(hint));
}

fs::path iconset_dir_for(const config::BuildConfig& config) {
    return config.icon_dir() / (std::string(ICON_BASE_NAME) + ".iconset");
}

fs::path container_for(const config::BuildConfig& config) {
    return config.icon_dir() / (std::string(ICON_BASE_NAME) + ".icns");
}

} // namespace

// ============================================================================
// IconSet
// ============================================================================

std::string IconImage::file_name() const {
    std::string dim = std::to_string(points);
    std::string name = "icon_" + dim + "x" + dim;
    if (scale > 1)
        name += "@" + std::to_string(scale) + "x";
    return name + ".png";
}

std::vector<IconImage> required_images() {
    std::vector<IconImage> images;
    for (int points : {16, 32, 128, 256, 512}) {
        for (int scale : {1, 2}) {
            IconImage image;
            image.points = points;
            image.scale = scale;
            images.push_back(image);
        }
    }
    return images;
}

bool IconSet::complete() const {
    auto required = required_images();
    if (images.size() != required.size())
        return false;
    for (size_t i = 0; i < required.size(); ++i) {
        if (images[i].points != required[i].points || images[i].scale != required[i].scale)
            return false;
        std::error_code ec;
        if (!fs::is_regular_file(images[i].file, ec) || fs::file_size(images[i].file, ec) == 0)
            return false;
    }
    return true;
}

std::optional<fs::path> IconSet::image_for(int pixels) const {
    for (int scale : {1, 2}) {
        for (const auto& image : images) {
            if (image.scale == scale && image.pixels() == pixels)
                return image.file;
        }
    }
    return std::nullopt;
}

// ============================================================================
// IconPipeline
// ============================================================================

IconPipeline::IconPipeline(const config::BuildConfig& config,
                           std::vector<Box<IconConverter>> converters)
    : config_(config), converters_(std::move(converters)) {}

std::vector<Box<IconConverter>> IconPipeline::default_converters() {
    std::vector<Box<IconConverter>> converters;
    converters.push_back(make_box<RsvgConverter>());
    converters.push_back(make_box<SipsConverter>());
    converters.push_back(make_box<ImageMagickConverter>());
    converters.push_back(make_box<QuickLookConverter>());
    return converters;
}

IconConverter* IconPipeline::select(const fs::path& master) const {
    for (const auto& converter : converters_) {
        if (converter->available() && converter->accepts(master))
            return converter.get();
    }
    return nullptr;
}

Result<IconOutcome> IconPipeline::build(const fs::path& master) {
    IconOutcome outcome;

    if (master.empty() || !fs::is_regular_file(master)) {
        std::string what = master.empty() ? "no master icon configured"
                                          : "master icon " + master.string() + " not found";
        outcome.warning = unavailable(what + "; using the default icon",
                                      "set [paths] icon in relpack.toml");
        RELPACK_LOG_WARN("icon", outcome.warning->message);
        return outcome;
    }

    IconConverter* converter = select(master);
    if (!converter) {
        std::string names;
        for (const auto& c : converters_) {
            if (!names.empty())
                names += ", ";
            names += c->name();
        }
        outcome.warning = unavailable("no icon converter available for " +
                                          master.filename().string() + " (tried " + names +
                                          "); using the default icon",
                                      "install librsvg (rsvg-convert) or ImageMagick to render "
                                      "icons");
        RELPACK_LOG_WARN("icon", outcome.warning->message);
        return outcome;
    }

    IconSet set;
    set.iconset_dir = iconset_dir_for(config_);
    set.container = container_for(config_);
    remove_tree(set.iconset_dir);
    std::error_code ec;
    fs::create_directories(set.iconset_dir, ec);
    if (ec) {
        return icon_error("cannot create " + set.iconset_dir.string() + ": " + ec.message());
    }

    RELPACK_LOG_INFO("icon", "Rendering " << master.filename().string() << " with "
                                          << converter->name());

    std::vector<std::pair<std::string, std::string>> entries;
    for (auto image : required_images()) {
        image.file = set.iconset_dir / image.file_name();
        std::string error = converter->convert(master, image.pixels(), image.file);
        if (!error.empty()) {
            return icon_error(converter->name() + " failed at " + std::to_string(image.pixels()) +
                                  "px: " + error,
                              "check that " + master.filename().string() + " is a valid image");
        }
        auto png = read_file(image.file);
        if (!png || png->empty()) {
            return icon_error(converter->name() + " produced no image at " +
                              std::to_string(image.pixels()) + "px");
        }
        if (!is_png(*png)) {
            return icon_error(converter->name() + " produced a non-PNG image at " +
                              std::to_string(image.pixels()) + "px");
        }
        entries.emplace_back(*icns_type(image.points, image.scale), std::move(*png));
        set.images.push_back(image);
    }

    if (!set.complete()) {
        return icon_error("icon set is incomplete");
    }

    if (!write_file(set.container, encode_icns(entries))) {
        return icon_error("cannot write " + set.container.string());
    }

    RELPACK_LOG_INFO("icon", "Wrote " << set.container.filename().string() << " ("
                                      << set.images.size() << " images)");
    outcome.icon_set = std::move(set);
    return outcome;
}

std::optional<IconSet> IconPipeline::locate(const config::BuildConfig& config) {
    IconSet set;
    set.iconset_dir = iconset_dir_for(config);
    set.container = container_for(config);
    if (!fs::is_regular_file(set.container))
        return std::nullopt;
    for (auto image : required_images()) {
        image.file = set.iconset_dir / image.file_name();
        set.images.push_back(image);
    }
    if (!set.complete())
        return std::nullopt;
    return set;
}

} // namespace relpack::icon
