//! # Icon Pipeline
//!
//! Turns one master image into the ten sizes an application icon needs and
//! packs them into an `.icns` container.
//!
//! ## Outcomes
//!
//! | Situation                             | Result                        |
//! |---------------------------------------|-------------------------------|
//! | Converter available, all sizes ok     | `IconOutcome` with an IconSet |
//! | No converter available / no master    | `IconOutcome` skipped + warning |
//! | Converter available, a size fails     | `IconError`                   |

#ifndef RELPACK_ICON_ICON_PIPELINE_HPP
#define RELPACK_ICON_ICON_PIPELINE_HPP

#include "common.hpp"
#include "config/build_config.hpp"
#include "icon/icon_converter.hpp"

#include <optional>
#include <string>
#include <vector>

namespace relpack::icon {

/// Base name of the icon container inside the bundle (`AppIcon.icns`).
constexpr const char* ICON_BASE_NAME = "AppIcon";

struct IconImage {
    int points = 0;
    int scale = 1;
    fs::path file;

    int pixels() const {
        return points * scale;
    }

    /// Iconset file name, e.g. `icon_32x32@2x.png`.
    std::string file_name() const;
};

struct IconSet {
    fs::path iconset_dir;
    std::vector<IconImage> images; ///< In `required_images()` order
    fs::path container;            ///< The `.icns` file

    /// True if all ten required images are present on disk.
    bool complete() const;

    /// The image rendered at exactly `pixels`, preferring @1x.
    std::optional<fs::path> image_for(int pixels) const;
};

/// 16, 32, 128, 256 and 512 points, each at @1x and @2x.
std::vector<IconImage> required_images();

struct IconOutcome {
    std::optional<IconSet> icon_set;
    std::optional<PackError> warning; ///< IconUnavailable when skipped

    bool skipped() const {
        return !icon_set.has_value();
    }
};

class IconPipeline {
public:
    IconPipeline(const config::BuildConfig& config,
                 std::vector<Box<IconConverter>> converters);

    /// rsvg-convert, sips, ImageMagick, qlmanage.
    static std::vector<Box<IconConverter>> default_converters();

    /// Builds the icon set and container from `master` under `<work>/icon`.
    Result<IconOutcome> build(const fs::path& master);

    /// The converter that would be used for `master`, or null.
    IconConverter* select(const fs::path& master) const;

    /// Finds a previously built container at its well-known path.
    static std::optional<IconSet> locate(const config::BuildConfig& config);

private:
    const config::BuildConfig& config_;
    std::vector<Box<IconConverter>> converters_;
};

} // namespace relpack::icon

#endif // RELPACK_ICON_ICON_PIPELINE_HPP
