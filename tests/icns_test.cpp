//! # ICNS Container Tests

#include "icon/icns_writer.hpp"

#include <gtest/gtest.h>

using namespace relpack::icon;

namespace {

const std::string PNG_SIGNATURE("\x89PNG\r\n\x1a\n", 8);

std::string fake_png(const std::string& tag) {
    return PNG_SIGNATURE + tag;
}

} // namespace

TEST(IcnsTest, TypeTableCoversEveryIconsetSlot) {
    EXPECT_EQ(icns_type(16, 1), "icp4");
    EXPECT_EQ(icns_type(16, 2), "ic11");
    EXPECT_EQ(icns_type(32, 1), "icp5");
    EXPECT_EQ(icns_type(128, 2), "ic13");
    EXPECT_EQ(icns_type(512, 2), "ic10");
    EXPECT_FALSE(icns_type(64, 1).has_value());
    EXPECT_FALSE(icns_type(16, 3).has_value());
}

TEST(IcnsTest, RecognizesPngSignature) {
    EXPECT_TRUE(is_png(fake_png("data")));
    EXPECT_FALSE(is_png("GIF89a"));
    EXPECT_FALSE(is_png(""));
    EXPECT_FALSE(is_png(PNG_SIGNATURE.substr(0, 4)));
}

TEST(IcnsTest, EncodesHeaderAndEntries) {
    std::string png16 = fake_png("16");
    std::string png32 = fake_png("32px");
    std::string icns = encode_icns({{"icp4", png16}, {"icp5", png32}});

    ASSERT_EQ(icns.size(), 8u + (8u + png16.size()) + (8u + png32.size()));
    EXPECT_EQ(icns.substr(0, 4), "icns");
    EXPECT_EQ(static_cast<uint8_t>(icns[7]), icns.size());
    EXPECT_EQ(icns.substr(8, 4), "icp4");
    EXPECT_EQ(static_cast<uint8_t>(icns[15]), 8u + png16.size());
    EXPECT_EQ(icns.substr(16, png16.size()), png16);

    auto types = icns_entry_types(icns);
    ASSERT_TRUE(types.has_value());
    EXPECT_EQ(*types, (std::vector<std::string>{"icp4", "icp5"}));
}

TEST(IcnsTest, RejectsMalformedContainers) {
    std::string icns = encode_icns({{"ic07", fake_png("128")}});

    EXPECT_FALSE(icns_entry_types("").has_value());
    EXPECT_FALSE(icns_entry_types(std::string("abcd\0\0\0\x08", 8)).has_value());
    // Truncated: header length no longer matches.
    EXPECT_FALSE(icns_entry_types(icns.substr(0, icns.size() - 1)).has_value());

    // Entry length past the end of the file.
    std::string bad = icns;
    bad[15] = static_cast<char>(0x7f);
    EXPECT_FALSE(icns_entry_types(bad).has_value());

    EXPECT_EQ(icns_entry_types(encode_icns({})), std::vector<std::string>{});
}
