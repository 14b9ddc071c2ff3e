//! # Verifier Tests
//!
//! Bundles are small trees whose executable is a shell script; crash reports
//! live in a scratch diagnostics directory.

#include "bundle/info_plist.hpp"
#include "test_helpers.hpp"
#include "verify/verifier.hpp"

#include <gtest/gtest.h>
#include <sstream>

using namespace relpack;
using namespace relpack::verify;
using relpack::testing::TempDir;

namespace {

class VerifierTest : public ::testing::Test {
protected:
    TempDir dir;
    fs::path bundle;
    fs::path diagnostics;

    void SetUp() override {
        bundle = dir / "Demo App.app";
        diagnostics = dir / "DiagnosticReports";
        fs::create_directories(diagnostics);

        bundle::InfoPlist plist;
        plist.set_string("CFBundleName", "Demo App");
        plist.set_string("CFBundleShortVersionString", "1.2.0");
        plist.set_string("CFBundleIdentifier", "com.example.demo");
        plist.set_string("CFBundleExecutable", "demo");
        ASSERT_TRUE(plist.save(bundle / "Contents" / "Info.plist"));

        relpack::testing::write_executable(bundle / "Contents" / "MacOS" / "demo",
                                           "#!/bin/sh\n"
                                           "echo 'starting up'\n"
                                           "echo 'Traceback (most recent call last):' >&2\n"
                                           "echo 'ImportError: no module named demo' >&2\n"
                                           "exit 2\n");
    }

    Verifier make_verifier() const {
        VerifierOptions options;
        options.diagnostics_dir = diagnostics;
        options.launch_timeout_seconds = 10;
        return Verifier(options);
    }

    fs::path write_crash(const std::string& name, std::chrono::hours age) {
        fs::path path = diagnostics / name;
        write_file(path, "crash in " + name + "\n");
        fs::last_write_time(path, fs::file_time_type::clock::now() - age);
        return path;
    }
};

} // namespace

// ============================================================================
// Inspection
// ============================================================================

TEST_F(VerifierTest, ReportsHealthyBundle) {
    auto report = make_verifier().inspect(bundle);

    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.executable_path, bundle / "Contents" / "MacOS" / "demo");
    ASSERT_TRUE(report.metadata.has_value());
    EXPECT_EQ(report.metadata->name, "Demo App");
    EXPECT_EQ(report.metadata->version, "1.2.0");
    EXPECT_EQ(report.metadata->identifier, "com.example.demo");
    EXPECT_TRUE(report.architectures.empty());
    EXPECT_TRUE(report.problems.empty());

    std::string text = format_report(report);
    EXPECT_NE(text.find("[ok]"), std::string::npos);
    EXPECT_NE(text.find("none in the last 24h"), std::string::npos);
}

TEST_F(VerifierTest, ReportsArchitecturesOfMachOExecutable) {
    auto exe = bundle / "Contents" / "MacOS" / "demo";
    auto fused = macho::fuse_images({relpack::testing::make_thin_macho("x86_64"),
                                     relpack::testing::make_thin_macho("arm64")});
    ASSERT_TRUE(is_ok(fused));
    relpack::testing::write_executable(exe, unwrap(fused));

    auto report = make_verifier().inspect(bundle);
    EXPECT_EQ(report.architectures, (std::vector<std::string>{"x86_64", "arm64"}));
    EXPECT_NE(format_report(report).find("Architectures: x86_64, arm64"), std::string::npos);
}

TEST_F(VerifierTest, FlagsMissingPermission) {
    auto exe = bundle / "Contents" / "MacOS" / "demo";
    fs::permissions(exe, fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                    fs::perm_options::remove);

    auto report = make_verifier().inspect(bundle);
    EXPECT_FALSE(report.ok());
    EXPECT_TRUE(report.executable_present);
    ASSERT_EQ(report.problems.size(), 1u);
    EXPECT_NE(report.problems[0].find("chmod +x"), std::string::npos);
    EXPECT_NE(format_report(report).find("[not executable]"), std::string::npos);
}

TEST_F(VerifierTest, FlagsMissingBundleAndExecutable) {
    auto missing = make_verifier().inspect(dir / "Nope.app");
    EXPECT_FALSE(missing.bundle_exists);
    EXPECT_FALSE(missing.ok());

    fs::remove(bundle / "Contents" / "MacOS" / "demo");
    auto report = make_verifier().inspect(bundle);
    EXPECT_FALSE(report.executable_present);
    EXPECT_NE(format_report(report).find("[missing]"), std::string::npos);
}

TEST_F(VerifierTest, FindsRecentCrashReportsNewestFirst) {
    auto older = write_crash("Demo App_2026-10-18-090000_host.crash", std::chrono::hours(3));
    auto newer = write_crash("Demo App-2026-10-18-110000.ips", std::chrono::hours(1));
    write_crash("Demo App_2026-10-10-090000_host.crash", std::chrono::hours(24 * 8));
    write_crash("Other App_2026-10-18-100000_host.crash", std::chrono::hours(1));
    write_crash("Demo App_notes.txt", std::chrono::hours(1));

    auto report = make_verifier().inspect(bundle);
    ASSERT_EQ(report.crash_reports.size(), 2u);
    EXPECT_EQ(report.crash_reports[0], newer);
    EXPECT_EQ(report.crash_reports[1], older);
    EXPECT_TRUE(report.ok());
    EXPECT_NE(report.problems.back().find("2 recent crash report"), std::string::npos);
}

TEST_F(VerifierTest, CrashReportLimit) {
    for (int i = 0; i < 7; ++i) {
        write_crash("Demo App_" + std::to_string(i) + ".crash", std::chrono::hours(i + 1));
    }
    EXPECT_EQ(make_verifier().find_crash_reports("Demo App").size(), 5u);
}

TEST(VerifierHelpersTest, FilterErrorLines) {
    auto lines = filter_error_lines("ok\n"
                                    "Traceback (most recent call last):\n"
                                    "  File \"main.py\", line 1\n"
                                    "ValueError: bad\n"
                                    "Build FAILED\n"
                                    "unhandled Exception\n");
    EXPECT_EQ(lines, (std::vector<std::string>{"Traceback (most recent call last):",
                                               "ValueError: bad", "Build FAILED",
                                               "unhandled Exception"}));
}

TEST(VerifierHelpersTest, FindExecutableForFlatBundle) {
    TempDir dir;
    fs::create_directories(dir / "Demo App");
    EXPECT_EQ(find_executable(dir / "Demo App"), dir / "Demo App" / "Demo App");

    fs::create_directories(dir / "Plain.app" / "Contents");
    EXPECT_EQ(find_executable(dir / "Plain.app"), dir / "Plain.app" / "Contents" / "MacOS" / "Plain");
}

// ============================================================================
// Interactive menu
// ============================================================================

TEST_F(VerifierTest, MenuRelaunchShowsFullOutput) {
    std::istringstream in("1\n5\n");
    std::ostringstream out;

    EXPECT_EQ(make_verifier().run_interactive(bundle, in, out), 0);
    std::string text = out.str();
    EXPECT_NE(text.find("--- Application output ---"), std::string::npos);
    EXPECT_NE(text.find("starting up"), std::string::npos);
    EXPECT_NE(text.find("ImportError"), std::string::npos);
    EXPECT_NE(text.find("--- exited with code 2 ---"), std::string::npos);
}

TEST_F(VerifierTest, MenuErrorsOnlyFiltersOutput) {
    std::istringstream in("2\n");
    std::ostringstream out;

    EXPECT_EQ(make_verifier().run_interactive(bundle, in, out), 0);
    std::string text = out.str();
    auto section = text.substr(text.find("--- Application errors ---"));
    EXPECT_NE(section.find("Traceback"), std::string::npos);
    EXPECT_EQ(section.find("starting up"), std::string::npos);
}

TEST_F(VerifierTest, MenuShowsLatestCrash) {
    write_crash("Demo App_old.crash", std::chrono::hours(5));
    write_crash("Demo App_new.crash", std::chrono::hours(1));
    std::istringstream in("4\nx\n5\n");
    std::ostringstream out;

    EXPECT_EQ(make_verifier().run_interactive(bundle, in, out), 0);
    std::string text = out.str();
    EXPECT_NE(text.find("crash in Demo App_new.crash"), std::string::npos);
    EXPECT_EQ(text.find("crash in Demo App_old.crash"), std::string::npos);
    EXPECT_NE(text.find("Invalid choice 'x'"), std::string::npos);
}

TEST_F(VerifierTest, MenuInspectsEmbeddedRuntime) {
    fs::path lib = bundle / "Contents" / "Resources" / "lib";
    write_file(lib / "python3.12" / "site.pyc", "bytecode");
    relpack::testing::write_executable(bundle / "Contents" / "Resources" / "python3",
                                       "#!/bin/sh\n"
                                       "[ \"$1\" = -c ] || exit 3\n"
                                       "echo '" + lib.string() + "'\n"
                                       "echo '" + (lib / "python3.12").string() + "'\n");
    std::istringstream in("3\n5\n");
    std::ostringstream out;

    EXPECT_EQ(make_verifier().run_interactive(bundle, in, out), 0);
    std::string text = out.str();
    EXPECT_NE(text.find("Embedded interpreter: " +
                        (bundle / "Contents" / "Resources" / "python3").string()),
              std::string::npos);
    EXPECT_NE(text.find("--- Module search path ---\n" + lib.string() + "\n"), std::string::npos);
    EXPECT_EQ(text.find("Could not query"), std::string::npos);
}

TEST_F(VerifierTest, MenuReportsMissingEmbeddedRuntime) {
    // Not executable, so not an interpreter.
    write_file(bundle / "Contents" / "Resources" / "python3.txt", "notes");
    std::istringstream in("3\n5\n");
    std::ostringstream out;

    EXPECT_EQ(make_verifier().run_interactive(bundle, in, out), 0);
    EXPECT_NE(out.str().find("No embedded Python interpreter found in " + bundle.string()),
              std::string::npos);
}

TEST(VerifierHelpersTest, EmbeddedInterpreterSkipsBytecodeAndSources) {
    TempDir dir;
    fs::path contents = dir / "Demo.app" / "Contents";
    relpack::testing::write_executable(contents / "Resources" / "python_helpers.py", "#!/bin/sh\n");
    relpack::testing::write_executable(contents / "Frameworks" / "python3.12", "#!/bin/sh\n");
    relpack::testing::write_executable(contents / "MacOS" / "python3", "#!/bin/sh\n");

    auto found = find_embedded_interpreter(dir / "Demo.app");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, contents / "Frameworks" / "python3.12");

    fs::create_directories(dir / "Empty.app" / "Contents");
    EXPECT_FALSE(find_embedded_interpreter(dir / "Empty.app").has_value());
}

TEST_F(VerifierTest, MenuForMissingBundleExitsWithError) {
    std::istringstream in("5\n");
    std::ostringstream out;
    EXPECT_EQ(make_verifier().run_interactive(dir / "Missing.app", in, out), 1);
    EXPECT_EQ(out.str().find("1) Relaunch"), std::string::npos);
}
