//! # Icon Pipeline Tests
//!
//! Converters are replaced by fakes that write tagged PNG signatures, so the
//! tests run without rsvg-convert or sips.

#include "icon/icns_writer.hpp"
#include "icon/icon_pipeline.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace relpack;
using namespace relpack::icon;
using relpack::testing::TempDir;

namespace {

const std::string PNG_SIGNATURE("\x89PNG\r\n\x1a\n", 8);

enum class Mode { Png, Fail, Empty, NotPng };

class FakeConverter : public IconConverter {
public:
    FakeConverter(std::string name, bool available, Mode mode = Mode::Png, int fail_at = 0)
        : name_(std::move(name)), available_(available), mode_(mode), fail_at_(fail_at) {}

    std::string name() const override {
        return name_;
    }
    bool available() const override {
        return available_;
    }
    bool accepts(const fs::path& master) const override {
        return master.extension() == ".svg" || is_raster_image(master);
    }
    std::string convert(const fs::path& /*master*/, int pixels, const fs::path& output) override {
        ++calls;
        if (fail_at_ != 0 && pixels != fail_at_) {
            write_file(output, PNG_SIGNATURE + std::to_string(pixels));
            return {};
        }
        switch (mode_) {
        case Mode::Png:
            write_file(output, PNG_SIGNATURE + std::to_string(pixels));
            return {};
        case Mode::Fail:
            return "render failed";
        case Mode::Empty:
            write_file(output, "");
            return {};
        case Mode::NotPng:
            write_file(output, "<svg/>");
            return {};
        }
        return {};
    }

    int calls = 0;

private:
    std::string name_;
    bool available_;
    Mode mode_;
    int fail_at_;
};

class IconPipelineTest : public ::testing::Test {
protected:
    TempDir dir;
    config::BuildConfig config;
    fs::path master;

    void SetUp() override {
        auto manifest =
            relpack::testing::write_project(dir.path(), dir / "unused_bundler.sh");
        auto result = config::load_build_config(manifest, {});
        ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
        config = unwrap(result);
        master = dir / "assets" / "icon.svg";
        write_file(master, "<svg xmlns=\"http://www.w3.org/2000/svg\"/>");
    }

    static std::vector<Box<IconConverter>> converters(Box<IconConverter> first,
                                                      Box<IconConverter> second = nullptr) {
        std::vector<Box<IconConverter>> list;
        list.push_back(std::move(first));
        if (second)
            list.push_back(std::move(second));
        return list;
    }
};

} // namespace

TEST(IconImageTest, RequiredImagesAndFileNames) {
    auto images = required_images();
    ASSERT_EQ(images.size(), 10u);
    EXPECT_EQ(images.front().file_name(), "icon_16x16.png");
    EXPECT_EQ(images[1].file_name(), "icon_16x16@2x.png");
    EXPECT_EQ(images[1].pixels(), 32);
    EXPECT_EQ(images.back().file_name(), "icon_512x512@2x.png");
    EXPECT_EQ(images.back().pixels(), 1024);
}

TEST_F(IconPipelineTest, BuildsIconSetAndContainer) {
    auto converter = make_box<FakeConverter>("fake", true);
    auto* fake = converter.get();
    IconPipeline pipeline(config, converters(std::move(converter)));

    auto result = pipeline.build(master);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    const auto& outcome = unwrap(result);
    ASSERT_FALSE(outcome.skipped());
    EXPECT_FALSE(outcome.warning.has_value());
    EXPECT_EQ(fake->calls, 10);

    const auto& set = *outcome.icon_set;
    EXPECT_TRUE(set.complete());
    EXPECT_EQ(set.iconset_dir, config.icon_dir() / "AppIcon.iconset");
    EXPECT_EQ(set.container, config.icon_dir() / "AppIcon.icns");
    EXPECT_TRUE(fs::exists(set.iconset_dir / "icon_128x128@2x.png"));

    auto container = read_file(set.container);
    ASSERT_TRUE(container.has_value());
    auto types = icns_entry_types(*container);
    ASSERT_TRUE(types.has_value());
    EXPECT_EQ(types->size(), 10u);
    EXPECT_EQ(types->front(), "icp4");
    EXPECT_EQ(types->back(), "ic10");
}

TEST_F(IconPipelineTest, ImageForPrefersSingleScale) {
    IconPipeline pipeline(config, converters(make_box<FakeConverter>("fake", true)));
    auto result = pipeline.build(master);
    ASSERT_TRUE(is_ok(result));
    const auto& set = *unwrap(result).icon_set;

    EXPECT_EQ(set.image_for(256), set.iconset_dir / "icon_256x256.png");
    EXPECT_EQ(set.image_for(1024), set.iconset_dir / "icon_512x512@2x.png");
    EXPECT_FALSE(set.image_for(48).has_value());
}

TEST_F(IconPipelineTest, SkipsUnavailableConverters) {
    auto unavailable = make_box<FakeConverter>("missing", false);
    auto available = make_box<FakeConverter>("second", true);
    auto* second = available.get();
    IconPipeline pipeline(config, converters(std::move(unavailable), std::move(available)));

    EXPECT_EQ(pipeline.select(master), second);
    ASSERT_TRUE(is_ok(pipeline.build(master)));
    EXPECT_EQ(second->calls, 10);
}

TEST_F(IconPipelineTest, NoConverterIsASkipWithWarning) {
    IconPipeline pipeline(config, converters(make_box<FakeConverter>("rsvg-convert", false)));

    auto result = pipeline.build(master);
    ASSERT_TRUE(is_ok(result));
    const auto& outcome = unwrap(result);
    EXPECT_TRUE(outcome.skipped());
    ASSERT_TRUE(outcome.warning.has_value());
    EXPECT_EQ(outcome.warning->kind, ErrorKind::IconUnavailable);
    EXPECT_NE(outcome.warning->message.find("rsvg-convert"), std::string::npos);
    EXPECT_FALSE(fs::exists(config.icon_dir() / "AppIcon.icns"));
}

TEST_F(IconPipelineTest, MissingMasterIsASkipWithWarning) {
    IconPipeline pipeline(config, converters(make_box<FakeConverter>("fake", true)));

    auto missing = pipeline.build(dir / "assets" / "nope.svg");
    ASSERT_TRUE(is_ok(missing));
    EXPECT_TRUE(unwrap(missing).skipped());
    EXPECT_NE(unwrap(missing).warning->message.find("not found"), std::string::npos);

    auto unset = pipeline.build(fs::path());
    ASSERT_TRUE(is_ok(unset));
    EXPECT_TRUE(unwrap(unset).skipped());
}

TEST_F(IconPipelineTest, ConverterFailureIsAnIconError) {
    IconPipeline pipeline(config,
                          converters(make_box<FakeConverter>("fake", true, Mode::Fail, 256)));

    auto result = pipeline.build(master);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::IconError);
    EXPECT_NE(unwrap_err(result).message.find("256px"), std::string::npos);
    EXPECT_NE(unwrap_err(result).message.find("render failed"), std::string::npos);
}

TEST_F(IconPipelineTest, EmptyOrNonPngOutputIsAnIconError) {
    IconPipeline empty(config, converters(make_box<FakeConverter>("fake", true, Mode::Empty)));
    auto result = empty.build(master);
    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).message.find("no image"), std::string::npos);

    IconPipeline not_png(config, converters(make_box<FakeConverter>("fake", true, Mode::NotPng)));
    result = not_png.build(master);
    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).message.find("non-PNG"), std::string::npos);
}

// ============================================================================
// ImageMagick
// ============================================================================

namespace {

/// A stand-in for an ImageMagick driver that writes a PNG signature to its
/// `png:<file>` argument and records its arguments. Uses shell builtins only,
/// so PATH can be restricted to `bin`.
void write_fake_imagemagick(const fs::path& bin, const std::string& name) {
    relpack::testing::write_executable(bin / name,
                                       "#!/bin/sh\n"
                                       "for arg; do out=\"$arg\"; done\n"
                                       "printf '%s\\n' \"$0\" \"$@\" > \"" +
                                           (bin / "args.txt").string() +
                                           "\"\n"
                                           "printf '\\211PNG\\r\\n\\032\\n' > \"${out#png:}\"\n");
}

} // namespace

TEST_F(IconPipelineTest, ImageMagickRendersRasterMaster) {
    fs::path bin = dir / "bin";
    write_fake_imagemagick(bin, "magick");
    write_fake_imagemagick(bin, "convert");
    relpack::testing::ScopedEnv path("PATH", bin.string());

    ImageMagickConverter converter;
    ASSERT_TRUE(converter.available());
    EXPECT_EQ(converter.program(), "magick");
    EXPECT_TRUE(converter.accepts(dir / "icon.PNG"));
    EXPECT_TRUE(converter.accepts(master));
    EXPECT_FALSE(converter.accepts(dir / "icon.icns"));

    fs::path output = dir / "out" / "icon_64.png";
    fs::create_directories(output.parent_path());
    EXPECT_EQ(converter.convert(dir / "icon.png", 64, output), "");
    EXPECT_EQ(read_file(output).value_or("").substr(0, 8), PNG_SIGNATURE);

    std::string args = read_file(bin / "args.txt").value_or("");
    EXPECT_NE(args.find("/magick\n-background\nnone\n"), std::string::npos) << args;
    EXPECT_NE(args.find("-resize\n64x64\n"), std::string::npos) << args;
    EXPECT_NE(args.find("png:" + output.string()), std::string::npos) << args;
}

TEST_F(IconPipelineTest, ImageMagickFallsBackToConvert) {
    fs::path bin = dir / "bin";
    write_fake_imagemagick(bin, "convert");
    relpack::testing::ScopedEnv path("PATH", bin.string());

    ImageMagickConverter converter;
    EXPECT_EQ(converter.program(), "convert");

    fs::path png_master = dir / "assets" / "icon.png";
    write_file(png_master, PNG_SIGNATURE + "master");
    std::vector<Box<IconConverter>> list;
    list.push_back(make_box<SipsConverter>());
    list.push_back(make_box<ImageMagickConverter>());
    IconPipeline pipeline(config, std::move(list));

    EXPECT_EQ(pipeline.select(png_master)->name(), "imagemagick");
    auto result = pipeline.build(png_master);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    ASSERT_FALSE(unwrap(result).skipped());
    EXPECT_TRUE(unwrap(result).icon_set->complete());
}

TEST_F(IconPipelineTest, ImageMagickMissingFromPath) {
    fs::path bin = dir / "empty_bin";
    fs::create_directories(bin);
    relpack::testing::ScopedEnv path("PATH", bin.string());

    ImageMagickConverter converter;
    EXPECT_FALSE(converter.available());
    EXPECT_NE(converter.convert(master, 16, dir / "x.png"), "");
}

TEST_F(IconPipelineTest, LocateFindsCompleteBuild) {
    EXPECT_FALSE(IconPipeline::locate(config).has_value());

    IconPipeline pipeline(config, converters(make_box<FakeConverter>("fake", true)));
    ASSERT_TRUE(is_ok(pipeline.build(master)));

    auto found = IconPipeline::locate(config);
    ASSERT_TRUE(found.has_value());
    EXPECT_TRUE(found->complete());

    fs::remove(found->iconset_dir / "icon_32x32.png");
    EXPECT_FALSE(IconPipeline::locate(config).has_value());
}
