#include <gtest/gtest.h>

#include "sandpool/utils/string_utils.hpp"

#include <set>

namespace sandpool {
namespace {

using utils::StringUtils;

TEST(StringUtilsTest, TrimAndLower) {
    EXPECT_EQ(StringUtils::Trim("  running\n"), "running");
    EXPECT_EQ(StringUtils::Trim(" \t "), "");
    EXPECT_EQ(StringUtils::ToLower("CoDeR"), "coder");
}

TEST(StringUtilsTest, SplitKeepsEmptyFields) {
    auto parts = StringUtils::Split("a,,b", ',');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[1], "");
    EXPECT_EQ(StringUtils::Join(parts, "|"), "a||b");
}

TEST(StringUtilsTest, TruncateAddsEllipsis) {
    EXPECT_EQ(StringUtils::Truncate("short", 10), "short");
    EXPECT_EQ(StringUtils::Truncate("abcdefghij", 6), "abc...");
    EXPECT_EQ(StringUtils::Truncate("abcdefghij", 2), "ab");
}

TEST(StringUtilsTest, ParsesDecimalAndBinaryUnits) {
    EXPECT_EQ(StringUtils::ParseByteSize("512B"), 512u);
    EXPECT_EQ(StringUtils::ParseByteSize("1.5kB"), 1500u);
    EXPECT_EQ(StringUtils::ParseByteSize("2MB"), 2000000u);
    EXPECT_EQ(StringUtils::ParseByteSize("1GB"), 1000000000u);
    EXPECT_EQ(StringUtils::ParseByteSize("1KiB"), 1024u);
    EXPECT_EQ(StringUtils::ParseByteSize("12.5MiB"), 13107200u);
    EXPECT_EQ(StringUtils::ParseByteSize("2GiB"), 2147483648u);
    EXPECT_EQ(StringUtils::ParseByteSize(" 42 "), 42u);
}

TEST(StringUtilsTest, UnparseableSizesAreZero) {
    EXPECT_EQ(StringUtils::ParseByteSize(""), 0u);
    EXPECT_EQ(StringUtils::ParseByteSize("--"), 0u);
    EXPECT_EQ(StringUtils::ParseByteSize("12parsecs"), 0u);
    EXPECT_EQ(StringUtils::ParseByteSize("-5MB"), 0u);
}

TEST(StringUtilsTest, FormatsSizes) {
    EXPECT_EQ(StringUtils::FormatSize(512), "512.00 B");
    EXPECT_EQ(StringUtils::FormatSize(13107200), "12.50 MB");
}

TEST(StringUtilsTest, GeneratedIdsAreUnique) {
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i) {
        ids.insert(StringUtils::GenerateId("coder"));
    }
    EXPECT_EQ(ids.size(), 1000u);
    EXPECT_TRUE(StringUtils::StartsWith(*ids.begin(), "coder-"));
}

} // namespace
} // namespace sandpool
