//! # Icon Converters
//!
//! Each converter wraps one external rasterizer. The pipeline asks them in
//! priority order and uses the first that is available and accepts the
//! master image.
//!
//! | Converter            | Tool           | Accepts                  |
//! |----------------------|----------------|--------------------------|
//! | `RsvgConverter`      | `rsvg-convert` | SVG                      |
//! | `SipsConverter`      | `sips`         | raster images            |
//! | `ImageMagickConverter` | `magick` or `convert` | raster images, SVG |
//! | `QuickLookConverter` | `qlmanage`     | anything QuickLook reads |

#ifndef RELPACK_ICON_ICON_CONVERTER_HPP
#define RELPACK_ICON_ICON_CONVERTER_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace relpack::icon {

class IconConverter {
public:
    virtual ~IconConverter() = default;

    virtual std::string name() const = 0;

    /// True if the backing tool can be run on this machine.
    virtual bool available() const = 0;

    /// True if this converter can read `master`.
    virtual bool accepts(const fs::path& master) const = 0;

    /// Renders `master` as a `pixels` x `pixels` PNG at `output`. Returns an
    /// error description, or an empty string on success.
    virtual std::string convert(const fs::path& master, int pixels, const fs::path& output) = 0;
};

/// Vector rasterizer from librsvg.
class RsvgConverter : public IconConverter {
public:
    std::string name() const override {
        return "rsvg-convert";
    }
    bool available() const override;
    bool accepts(const fs::path& master) const override;
    std::string convert(const fs::path& master, int pixels, const fs::path& output) override;
};

/// macOS scriptable image processing; resizes raster images only.
class SipsConverter : public IconConverter {
public:
    std::string name() const override {
        return "sips";
    }
    bool available() const override;
    bool accepts(const fs::path& master) const override;
    std::string convert(const fs::path& master, int pixels, const fs::path& output) override;
};

/// ImageMagick, the portable resizer. Prefers the version 7 `magick`
/// driver and falls back to the version 6 `convert`.
class ImageMagickConverter : public IconConverter {
public:
    std::string name() const override {
        return "imagemagick";
    }
    bool available() const override;
    bool accepts(const fs::path& master) const override;
    std::string convert(const fs::path& master, int pixels, const fs::path& output) override;

    /// `magick` or `convert`, whichever is on PATH first in that order.
    std::optional<std::string> program() const;
};

/// QuickLook thumbnail generator, the fallback for vector masters on macOS.
class QuickLookConverter : public IconConverter {
public:
    std::string name() const override {
        return "qlmanage";
    }
    bool available() const override;
    bool accepts(const fs::path& master) const override;
    std::string convert(const fs::path& master, int pixels, const fs::path& output) override;
};

/// True for file extensions of raster formats (png, jpg, tiff, ...).
bool is_raster_image(const fs::path& path);

} // namespace relpack::icon

#endif // RELPACK_ICON_ICON_CONVERTER_HPP
