//! # CLI Tests

#include "cli/dispatcher.hpp"
#include "cli/utils.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <sstream>

using namespace relpack;
using namespace relpack::cli;

namespace {

/// Owns the strings behind an argv array.
class Argv {
public:
    Argv(std::initializer_list<std::string> args) : storage_(args) {
        storage_.insert(storage_.begin(), "relpack");
        for (auto& arg : storage_)
            pointers_.push_back(arg.data());
        pointers_.push_back(nullptr);
    }

    int argc() const {
        return static_cast<int>(storage_.size());
    }
    char** argv() {
        return pointers_.data();
    }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

Result<CliOptions> parse(std::initializer_list<std::string> args) {
    Argv argv(args);
    return parse_cli_args(argv.argc(), argv.argv());
}

} // namespace

TEST(CliParseTest, Defaults) {
    auto result = parse({});
    ASSERT_TRUE(is_ok(result));
    const auto& options = unwrap(result);
    EXPECT_EQ(options.command, "all");
    EXPECT_TRUE(options.args.empty());
    EXPECT_EQ(options.config_path, "relpack.toml");
    EXPECT_FALSE(options.arch.has_value());
    EXPECT_FALSE(options.jobs.has_value());
    EXPECT_FALSE(options.keep);
    EXPECT_FALSE(options.help);
    EXPECT_FALSE(options.version);
}

TEST(CliParseTest, CommandOptionsAndPositionals) {
    auto result = parse({"--config=pkg/relpack.toml", "cache", "--arch=x86_64,arm64", "clear",
                         "--jobs=2", "--keep"});
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    const auto& options = unwrap(result);
    EXPECT_EQ(options.command, "cache");
    EXPECT_EQ(options.args, (std::vector<std::string>{"clear"}));
    EXPECT_EQ(options.config_path, "pkg/relpack.toml");
    EXPECT_EQ(options.arch, "x86_64,arm64");
    EXPECT_EQ(options.jobs, 2);
    EXPECT_TRUE(options.keep);
}

TEST(CliParseTest, HelpAndVersionFlags) {
    EXPECT_TRUE(unwrap(parse({"-h"})).help);
    EXPECT_TRUE(unwrap(parse({"--help"})).help);
    EXPECT_TRUE(unwrap(parse({"-V"})).version);
    EXPECT_TRUE(unwrap(parse({"build", "--version"})).version);
}

TEST(CliParseTest, LogOptionsAreLeftToTheLogger) {
    auto result = parse({"-vv", "--log-level=debug", "--log-filter=merge=trace", "merge", "-q"});
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).command, "merge");
    EXPECT_TRUE(unwrap(result).args.empty());
}

TEST(CliParseTest, RejectsBadJobCounts) {
    for (const char* bad : {"--jobs=0", "--jobs=-1", "--jobs=two", "--jobs=3x", "--jobs="}) {
        auto result = parse({bad});
        ASSERT_TRUE(is_err(result)) << bad;
        EXPECT_EQ(unwrap_err(result).kind, ErrorKind::ConfigError);
        EXPECT_NE(unwrap_err(result).message.find("positive integer"), std::string::npos);
    }
}

TEST(CliParseTest, RejectsUnknownOptions) {
    auto result = parse({"build", "--fast"});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::ConfigError);
    EXPECT_NE(unwrap_err(result).message.find("--fast"), std::string::npos);
    EXPECT_NE(unwrap_err(result).hint.find("--help"), std::string::npos);
}

// ============================================================================
// Entry point
// ============================================================================

TEST(CliMainTest, VersionExitsCleanly) {
    Argv argv{"--version", "-q"};
    EXPECT_EQ(relpack_main(argv.argc(), argv.argv()), 0);
}

TEST(CliMainTest, BadArgumentsFail) {
    Argv argv{"--jobs=0", "-q"};
    EXPECT_EQ(relpack_main(argv.argc(), argv.argv()), 1);
}

TEST(CliMainTest, MissingManifestFails) {
    relpack::testing::TempDir dir;
    Argv argv{"check", "--config=" + (dir / "relpack.toml").string(), "-q"};
    EXPECT_EQ(relpack_main(argv.argc(), argv.argv()), 1);
}

TEST(CliMainTest, DebugWithoutBundleFails) {
    Argv argv{"debug", "-q"};
    EXPECT_EQ(relpack_main(argv.argc(), argv.argv()), 1);
}

TEST(CliUtilsTest, FailureNamesStageAndHint) {
    std::ostringstream out;
    print_failure(out, "merge",
                  make_error(ErrorKind::MergeError, "no arm64 bundle", "run `relpack build` first"));
    EXPECT_EQ(out.str(), "error: stage 'merge' failed: no arm64 bundle\n"
                         "hint: run `relpack build` first\n");

    std::ostringstream warnings;
    print_warnings(warnings, {"IconUnavailable: no converter"});
    EXPECT_EQ(warnings.str(), "warning: IconUnavailable: no converter\n");
}
