//! # Tool Cache Tests
//!
//! The network is replaced by a Fetcher that writes canned content and
//! counts how often it was asked.

#include "common/sha256.hpp"
#include "process/subprocess.hpp"
#include "test_helpers.hpp"
#include "tools/tool_cache.hpp"

#include <gtest/gtest.h>

using namespace relpack;
using namespace relpack::tools;
using relpack::testing::TempDir;

namespace {

class FakeFetcher : public Fetcher {
public:
    FakeFetcher(std::string content, int* calls, std::string error = {})
        : content_(std::move(content)), calls_(calls), error_(std::move(error)) {}

    std::string fetch(const std::string& /*url*/, const fs::path& destination) override {
        ++*calls_;
        if (!error_.empty())
            return error_;
        write_file(destination, content_);
        return {};
    }

private:
    std::string content_;
    int* calls_;
    std::string error_;
};

const char* GOOD_TOOL = "#!/bin/sh\necho \"fake tool 1.0\"\nexit 0\n";
const char* BROKEN_TOOL = "#!/bin/sh\nexit 1\n";

} // namespace

TEST(ToolCacheTest, FetchesOnceThenServesFromCache) {
    TempDir dir;
    int calls = 0;
    ToolCache cache(dir / "cache", make_box<FakeFetcher>(GOOD_TOOL, &calls));

    auto first = cache.acquire("appimagetool", "13", "https://example.com/appimagetool");
    ASSERT_TRUE(is_ok(first)) << unwrap_err(first).to_string();
    EXPECT_EQ(unwrap(first), dir / "cache" / "appimagetool" / "13" / "appimagetool");
    EXPECT_TRUE(process::is_executable(unwrap(first)));
    EXPECT_FALSE(fs::exists(unwrap(first).string() + ".part"));

    auto second = cache.acquire("appimagetool", "13", "https://example.com/appimagetool");
    ASSERT_TRUE(is_ok(second));
    EXPECT_EQ(unwrap(second), unwrap(first));
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(cache.fetch_count(), 1u);
}

TEST(ToolCacheTest, CachedToolNeedsNoUrl) {
    TempDir dir;
    int calls = 0;
    {
        ToolCache cache(dir / "cache", make_box<FakeFetcher>(GOOD_TOOL, &calls));
        ASSERT_TRUE(is_ok(cache.acquire("tool", "1.0", "https://example.com/tool")));
    }

    // A second process with an empty url still finds the cached copy.
    ToolCache cache(dir / "cache", make_box<FakeFetcher>(GOOD_TOOL, &calls));
    auto again = cache.acquire("tool", "1.0", "");
    ASSERT_TRUE(is_ok(again));
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(cache.lookup("tool", "1.0").has_value());
    EXPECT_FALSE(cache.lookup("tool", "2.0").has_value());
}

TEST(ToolCacheTest, VersionsAreCachedSeparately) {
    TempDir dir;
    int calls = 0;
    ToolCache cache(dir / "cache", make_box<FakeFetcher>(GOOD_TOOL, &calls));

    ASSERT_TRUE(is_ok(cache.acquire("tool", "1.0", "https://example.com/1")));
    ASSERT_TRUE(is_ok(cache.acquire("tool", "2.0", "https://example.com/2")));
    EXPECT_EQ(calls, 2);
}

TEST(ToolCacheTest, RecordsIndexEntries) {
    TempDir dir;
    int calls = 0;
    ToolCache cache(dir / "cache", make_box<FakeFetcher>(GOOD_TOOL, &calls));
    ASSERT_TRUE(is_ok(cache.acquire("tool", "1.0", "https://example.com/tool")));

    auto entries = cache.entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].name, "tool");
    EXPECT_EQ(entries[0].version, "1.0");
    EXPECT_EQ(entries[0].size, std::string(GOOD_TOOL).size());
    EXPECT_EQ(entries[0].sha256, sha256_hex(GOOD_TOOL));
    EXPECT_TRUE(fs::exists(dir / "cache" / "tools.idx"));

    EXPECT_TRUE(cache.clear());
    EXPECT_TRUE(cache.entries().empty());
    EXPECT_FALSE(cache.lookup("tool", "1.0").has_value());
}

TEST(ToolCacheTest, TransferFailureLeavesNothingBehind) {
    TempDir dir;
    int calls = 0;
    ToolCache cache(dir / "cache", make_box<FakeFetcher>("", &calls, "HTTP 404"));

    auto result = cache.acquire("tool", "1.0", "https://example.com/missing");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::FetchError);
    EXPECT_NE(unwrap_err(result).message.find("HTTP 404"), std::string::npos);
    EXPECT_FALSE(fs::exists(cache.tool_path("tool", "1.0")));
    EXPECT_FALSE(fs::exists(cache.tool_path("tool", "1.0").string() + ".part"));
}

TEST(ToolCacheTest, EmptyDownloadIsAFetchError) {
    TempDir dir;
    int calls = 0;
    ToolCache cache(dir / "cache", make_box<FakeFetcher>("", &calls));

    auto result = cache.acquire("tool", "1.0", "https://example.com/empty");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::FetchError);
    EXPECT_FALSE(fs::exists(cache.tool_path("tool", "1.0")));
}

TEST(ToolCacheTest, SmokeTestFailureRemovesTool) {
    TempDir dir;
    int calls = 0;
    ToolCache cache(dir / "cache", make_box<FakeFetcher>(BROKEN_TOOL, &calls));

    auto result = cache.acquire("tool", "1.0", "https://example.com/broken");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::FetchError);
    EXPECT_NE(unwrap_err(result).message.find("smoke test"), std::string::npos);
    EXPECT_FALSE(fs::exists(cache.tool_path("tool", "1.0")));
    EXPECT_TRUE(cache.entries().empty());

    // Not cached, so the next attempt downloads again.
    EXPECT_TRUE(is_err(cache.acquire("tool", "1.0", "https://example.com/broken")));
    EXPECT_EQ(calls, 2);
}

TEST(ToolCacheTest, MissingUrlIsAFetchError) {
    TempDir dir;
    int calls = 0;
    ToolCache cache(dir / "cache", make_box<FakeFetcher>(GOOD_TOOL, &calls));

    auto result = cache.acquire("tool", "1.0", "");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::FetchError);
    EXPECT_EQ(calls, 0);
}
