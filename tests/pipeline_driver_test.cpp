//! # Pipeline Driver Tests
//!
//! End-to-end runs against the fake bundler and the fake image backend. No
//! icon converter is offered, so every run takes the default-icon path.

#include "fake_backends.hpp"
#include "pipeline/driver.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace relpack;
using namespace relpack::pipeline;
using relpack::testing::FakeImageBackend;
using relpack::testing::FakePresentation;
using relpack::testing::TempDir;

namespace {

class PipelineDriverTest : public ::testing::Test {
protected:
    TempDir dir;
    config::BuildConfig config;
    FakeImageBackend* backend = nullptr;
    FakePresentation* presentation = nullptr;

    void load(const std::string& fail_arch = "", const std::string& extra = "",
              const config::EnvMap& env = {}) {
        auto bundler = relpack::testing::write_fake_bundler(dir.path(), fail_arch);
        auto manifest = relpack::testing::write_project(dir.path(), bundler, extra);
        auto result = config::load_build_config(manifest, env);
        ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
        config = unwrap(result);
    }

    PipelineServices services() {
        PipelineServices s;
        auto fake_backend = make_box<FakeImageBackend>(dir / "host");
        auto fake_presentation = make_box<FakePresentation>();
        backend = fake_backend.get();
        presentation = fake_presentation.get();
        s.image_backend = std::move(fake_backend);
        s.presentation = std::move(fake_presentation);
        s.converters = [] { return std::vector<Box<icon::IconConverter>>{}; };
        s.verifier.diagnostics_dir = dir / "DiagnosticReports";
        return s;
    }

    std::string package_bytes() const {
        return read_file(config.package_path()).value_or("");
    }
};

bool has_warning(const std::vector<std::string>& warnings, const std::string& needle) {
    for (const auto& warning : warnings) {
        if (warning.find(needle) != std::string::npos)
            return true;
    }
    return false;
}

} // namespace

// ============================================================================
// Full runs
// ============================================================================

TEST_F(PipelineDriverTest, UniversalRunReachesDone) {
    load();
    PipelineDriver driver(config, services());

    auto report = driver.run();
    ASSERT_TRUE(report.ok()) << report.error->to_string();
    EXPECT_EQ(report.states,
              (std::vector<State>{State::Init, State::PrereqChecked, State::Cleaned, State::Built,
                                  State::Merged, State::IconReady, State::Assembled,
                                  State::Verified, State::Done}));
    EXPECT_EQ(report.final_state(), State::Done);
    EXPECT_TRUE(report.failed_stage.empty());
    EXPECT_EQ(report.built_arches, (std::vector<std::string>{"x86_64", "arm64"}));

    ASSERT_TRUE(report.package.has_value());
    EXPECT_EQ(report.package->path.filename(), "Demo_App-1.2.0-Universal.dmg");
    EXPECT_TRUE(fs::is_regular_file(report.package->path));

    ASSERT_TRUE(report.verification.has_value());
    EXPECT_EQ(report.verification->architectures,
              (std::vector<std::string>{"x86_64", "arm64"}));
    ASSERT_TRUE(report.merged.has_value());
    EXPECT_EQ(report.merged->architectures, (std::vector<std::string>{"x86_64", "arm64"}));

    EXPECT_TRUE(has_warning(report.warnings, "IconUnavailable"));
    EXPECT_EQ(backend->detach_calls, 1);
    EXPECT_EQ(presentation->calls, 1);

    // Intermediates are removed once the run is done.
    EXPECT_FALSE(fs::exists(config.paths.work_dir));
}

TEST_F(PipelineDriverTest, RepeatedRunsProduceIdenticalPackages) {
    load();
    std::string first;
    {
        PipelineDriver driver(config, services());
        ASSERT_TRUE(driver.run().ok());
        first = package_bytes();
    }
    PipelineDriver driver(config, services());
    ASSERT_TRUE(driver.run().ok());

    EXPECT_FALSE(first.empty());
    EXPECT_EQ(package_bytes(), first);
}

TEST_F(PipelineDriverTest, SingleArchitectureIsPromoted) {
    load("", "", {{"TARGET_ARCH", "arm64"}});
    ASSERT_EQ(config.architectures, (std::vector<std::string>{"arm64"}));
    PipelineDriver driver(config, services());

    auto report = driver.run();
    ASSERT_TRUE(report.ok()) << report.error->to_string();
    EXPECT_EQ(report.package->path.filename(), "Demo_App-1.2.0-arm64.dmg");
    EXPECT_EQ(report.verification->architectures, (std::vector<std::string>{"arm64"}));
    EXPECT_EQ(report.built_arches, (std::vector<std::string>{"arm64"}));
}

TEST_F(PipelineDriverTest, KeepIntermediates) {
    load("", "keep_intermediates = true\n");
    ASSERT_TRUE(config.assembly.keep_intermediates);
    PipelineDriver driver(config, services());

    ASSERT_TRUE(driver.run().ok());
    EXPECT_TRUE(fs::is_directory(config.merged_bundle_path()));
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(PipelineDriverTest, MissingEntryPointStopsBeforeBuilding) {
    load();
    fs::remove(config.paths.entry_point);
    PipelineDriver driver(config, services());

    auto report = driver.run();
    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.failed_stage, "prerequisites");
    EXPECT_EQ(report.error->kind, ErrorKind::PrereqMissing);
    EXPECT_EQ(report.states, (std::vector<State>{State::Init, State::Failed}));
    EXPECT_FALSE(fs::exists(config.paths.work_dir));
}

TEST_F(PipelineDriverTest, MissingToolIsReportedByName) {
    load("", "", {});
    config.build.required_tools = {"/bin/sh", "relpack-no-such-tool"};
    PipelineDriver driver(config, services());

    auto result = driver.check_prerequisites();
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::PrereqMissing);
    EXPECT_NE(unwrap_err(result).message.find("relpack-no-such-tool"), std::string::npos);
    EXPECT_EQ(unwrap_err(result).message.find("/bin/sh"), std::string::npos);
}

TEST_F(PipelineDriverTest, BuildFailureStopsTheRun) {
    load("arm64");
    PipelineDriver driver(config, services());

    auto report = driver.run();
    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.failed_stage, "build");
    EXPECT_EQ(report.error->kind, ErrorKind::CompileError);
    EXPECT_EQ(report.final_state(), State::Failed);
    EXPECT_EQ(report.states,
              (std::vector<State>{State::Init, State::PrereqChecked, State::Cleaned,
                                  State::Failed}));
    EXPECT_TRUE(report.built_arches.empty());
    EXPECT_FALSE(report.package.has_value());
    EXPECT_FALSE(fs::exists(config.package_path()));
    EXPECT_EQ(backend->attach_count, 0);
}

TEST_F(PipelineDriverTest, VerifyRejectsArchitectureMismatch) {
    load();
    PipelineDriver driver(config, services());

    merge::MergedArtifact merged;
    merged.bundle_path = config.merged_bundle_path();
    merged.executable_path = merged.bundle_path / config.executable_relpath();
    merged.architectures = {"x86_64", "arm64"};
    relpack::testing::write_executable(merged.executable_path,
                                       relpack::testing::make_thin_macho("arm64"));
    assemble::PackageImage package;
    package.path = config.package_path();
    package.format = config.assembly.format;

    auto result = driver.verify(merged, package);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::MergeError);
    EXPECT_NE(unwrap_err(result).message.find("{arm64}"), std::string::npos);
}

// ============================================================================
// Standalone stages
// ============================================================================

TEST_F(PipelineDriverTest, StagesResumeFromWellKnownPaths) {
    load();
    {
        PipelineDriver driver(config, services());
        ASSERT_TRUE(is_ok(driver.clean()));
        ASSERT_TRUE(is_ok(driver.build()));
    }

    PipelineDriver merger(config, services());
    auto merged = merger.merge_existing();
    ASSERT_TRUE(is_ok(merged)) << unwrap_err(merged).to_string();
    EXPECT_EQ(unwrap(merged).bundle_path, config.merged_bundle_path());

    // The per-arch bundles are gone; the merged bundle is reused.
    auto again = merger.merge_existing();
    ASSERT_TRUE(is_ok(again)) << unwrap_err(again).to_string();

    PipelineDriver assembler(config, services());
    auto package = assembler.assemble_existing();
    ASSERT_TRUE(is_ok(package)) << unwrap_err(package).to_string();
    EXPECT_TRUE(fs::is_regular_file(unwrap(package).path));
}

TEST_F(PipelineDriverTest, StandaloneStagesReportMissingInputs) {
    load();
    PipelineDriver driver(config, services());

    auto merged = driver.merge_existing();
    ASSERT_TRUE(is_err(merged));
    EXPECT_EQ(unwrap_err(merged).kind, ErrorKind::MergeError);
    EXPECT_NE(unwrap_err(merged).hint.find("relpack build"), std::string::npos);

    auto package = driver.assemble_existing();
    ASSERT_TRUE(is_err(package));
    EXPECT_EQ(unwrap_err(package).kind, ErrorKind::AssemblyError);
}

TEST(PipelineStateTest, Names) {
    EXPECT_STREQ(state_name(State::PrereqChecked), "PrereqChecked");
    EXPECT_STREQ(state_name(State::Failed), "Failed");
}
