//! # Universal Merger Tests
//!
//! Per-architecture bundles are laid out directly on disk, then merged.

#include "macho/fat_binary.hpp"
#include "merge/universal_merger.hpp"
#include "process/subprocess.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace relpack;
using namespace relpack::merge;
using relpack::testing::make_thin_macho;
using relpack::testing::TempDir;

namespace {

class UniversalMergerTest : public ::testing::Test {
protected:
    TempDir dir;
    config::BuildConfig config;

    void SetUp() override {
        auto manifest =
            relpack::testing::write_project(dir.path(), dir / "unused_bundler.sh");
        auto result = config::load_build_config(manifest, {});
        ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
        config = unwrap(result);
    }

    /// Lays out the bundle the bundler would have produced for `arch`.
    build::Artifact make_artifact(const std::string& arch) {
        build::Artifact artifact;
        artifact.arch = arch;
        artifact.bundle_path = config.artifact_path(arch);
        artifact.executable_path = artifact.bundle_path / config.executable_relpath();

        relpack::testing::write_executable(artifact.executable_path, make_thin_macho(arch));
        fs::path contents = artifact.bundle_path / "Contents";
        write_file(contents / "Info.plist", "<plist/>\n");
        write_file(contents / "Resources" / "data.txt", "shared resource\n");
        write_file(contents / "Frameworks" / "libcore.dylib",
                   make_thin_macho(arch, "core-" + arch));
        std::error_code ec;
        fs::create_directory_symlink("Resources", contents / "Links", ec);
        return artifact;
    }

    std::vector<build::Artifact> make_pair() {
        return {make_artifact("x86_64"), make_artifact("arm64")};
    }
};

} // namespace

TEST_F(UniversalMergerTest, MergedExecutableCarriesEveryArchitecture) {
    auto artifacts = make_pair();
    UniversalMerger merger(config);

    auto result = merger.merge(artifacts);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    const auto& merged = unwrap(result);

    EXPECT_EQ(merged.bundle_path, config.merged_bundle_path());
    EXPECT_EQ(merged.architectures, (std::vector<std::string>{"x86_64", "arm64"}));
    EXPECT_TRUE(merged.warnings.empty());

    auto info = macho::inspect(merged.executable_path);
    ASSERT_TRUE(info.has_value());
    EXPECT_TRUE(info->fat);
    EXPECT_EQ(info->architectures(), (std::vector<std::string>{"x86_64", "arm64"}));
    EXPECT_TRUE(process::is_executable(merged.executable_path));
}

TEST_F(UniversalMergerTest, DifferingMachOResourcesAreFused) {
    UniversalMerger merger(config);
    auto result = merger.merge(make_pair());
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    const auto& merged = unwrap(result);

    fs::path lib_rel = fs::path("Contents") / "Frameworks" / "libcore.dylib";
    ASSERT_EQ(merged.fused_files.size(), 1u);
    EXPECT_EQ(merged.fused_files[0], lib_rel);

    auto info = macho::inspect(merged.bundle_path / lib_rel);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->slices.size(), 2u);
}

TEST_F(UniversalMergerTest, IdenticalFilesAndSymlinksAreKept) {
    UniversalMerger merger(config);
    auto result = merger.merge(make_pair());
    ASSERT_TRUE(is_ok(result));

    fs::path contents = config.merged_bundle_path() / "Contents";
    EXPECT_EQ(read_file(contents / "Resources" / "data.txt").value_or(""), "shared resource\n");
    EXPECT_TRUE(fs::is_symlink(contents / "Links"));
}

TEST_F(UniversalMergerTest, PerArchitectureBundlesAreRemoved) {
    auto artifacts = make_pair();
    UniversalMerger merger(config);
    ASSERT_TRUE(is_ok(merger.merge(artifacts)));

    EXPECT_FALSE(fs::exists(artifacts[0].bundle_path));
    EXPECT_FALSE(fs::exists(artifacts[1].bundle_path));
}

TEST_F(UniversalMergerTest, StrictPolicyRejectsDifferingResource) {
    auto artifacts = make_pair();
    write_file(artifacts[1].bundle_path / "Contents" / "Resources" / "data.txt", "arm only\n");

    UniversalMerger merger(config);
    auto result = merger.merge(artifacts);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::MergeError);
    EXPECT_NE(unwrap_err(result).message.find("data.txt"), std::string::npos);
    EXPECT_NE(unwrap_err(result).hint.find("first-wins"), std::string::npos);
}

TEST_F(UniversalMergerTest, FirstWinsKeepsTemplateCopyAndWarns) {
    config.build.resources = config::ResourcePolicy::FirstWins;
    auto artifacts = make_pair();
    write_file(artifacts[1].bundle_path / "Contents" / "Resources" / "data.txt", "arm only\n");
    write_file(artifacts[1].bundle_path / "Contents" / "Resources" / "extra.txt", "extra\n");

    UniversalMerger merger(config);
    auto result = merger.merge(artifacts);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    const auto& merged = unwrap(result);

    fs::path resources = merged.bundle_path / "Contents" / "Resources";
    EXPECT_EQ(read_file(resources / "data.txt").value_or(""), "shared resource\n");
    EXPECT_EQ(read_file(resources / "extra.txt").value_or(""), "extra\n");
    EXPECT_EQ(merged.warnings.size(), 2u);
}

TEST_F(UniversalMergerTest, MissingFileIsAConflictWhenStrict) {
    auto artifacts = make_pair();
    fs::remove(artifacts[0].bundle_path / "Contents" / "Info.plist");

    UniversalMerger merger(config);
    auto result = merger.merge(artifacts);
    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).message.find("missing from x86_64"), std::string::npos);
}

TEST_F(UniversalMergerTest, RejectsSingleAndDuplicateArtifacts) {
    UniversalMerger merger(config);

    auto single = merger.merge({make_artifact("arm64")});
    ASSERT_TRUE(is_err(single));
    EXPECT_EQ(unwrap_err(single).kind, ErrorKind::MergeError);

    auto arm = make_artifact("arm64");
    auto duplicate = merger.merge({arm, arm});
    ASSERT_TRUE(is_err(duplicate));
    EXPECT_NE(unwrap_err(duplicate).message.find("more than once"), std::string::npos);
}

TEST_F(UniversalMergerTest, NonMachOExecutableIsAMergeError) {
    auto artifacts = make_pair();
    write_file(artifacts[1].executable_path, "#!/bin/sh\necho not a binary\n");

    UniversalMerger merger(config);
    auto result = merger.merge(artifacts);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::MergeError);
}

TEST_F(UniversalMergerTest, PromoteMovesSingleArtifact) {
    auto artifact = make_artifact("arm64");
    UniversalMerger merger(config);

    auto result = merger.promote(artifact);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    EXPECT_EQ(unwrap(result).architectures, std::vector<std::string>{"arm64"});
    EXPECT_TRUE(fs::exists(unwrap(result).executable_path));
    EXPECT_FALSE(fs::exists(artifact.bundle_path));
}

TEST_F(UniversalMergerTest, LocateReadsArchitecturesFromDisk) {
    EXPECT_FALSE(UniversalMerger::locate(config).has_value());

    UniversalMerger merger(config);
    ASSERT_TRUE(is_ok(merger.merge(make_pair())));

    auto found = UniversalMerger::locate(config);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->architectures, (std::vector<std::string>{"x86_64", "arm64"}));
}
