#include <gtest/gtest.h>
#include "beamdrop/core/utils.hpp"
#include "test_support.hpp"

using namespace beamdrop::core::utils;

namespace {
std::vector<std::uint8_t> bytes_of(const std::string& text) {
    return std::vector<std::uint8_t>(text.begin(), text.end());
}
}

TEST(StringUtilsTest, SplitAndJoin) {
    auto parts = StringUtils::split("docs/2024/report.pdf", '/');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "docs");
    EXPECT_EQ(parts[2], "report.pdf");
    EXPECT_EQ(StringUtils::join(parts, "/"), "docs/2024/report.pdf");
    EXPECT_EQ(StringUtils::join({}, "/"), "");
}

TEST(StringUtilsTest, TrimAndCase) {
    EXPECT_EQ(StringUtils::trim("  blobabc \n"), "blobabc");
    EXPECT_EQ(StringUtils::trim("   "), "");
    EXPECT_EQ(StringUtils::to_lower("DISABLED"), "disabled");
    EXPECT_TRUE(StringUtils::starts_with("blobxyz", "blob"));
    EXPECT_FALSE(StringUtils::starts_with("bl", "blob"));
    EXPECT_TRUE(StringUtils::ends_with("file.partial", ".partial"));
}

TEST(StringUtilsTest, FormatBytes) {
    EXPECT_EQ(StringUtils::format_bytes(0), "0.00 B");
    EXPECT_EQ(StringUtils::format_bytes(1536), "1.50 KB");
    EXPECT_EQ(StringUtils::format_bytes(5ULL * 1024 * 1024), "5.00 MB");
}

TEST(StringUtilsTest, FormatDuration) {
    using namespace std::chrono_literals;
    EXPECT_EQ(StringUtils::format_duration(250ms), "250ms");
    EXPECT_EQ(StringUtils::format_duration(42s), "42s");
    EXPECT_EQ(StringUtils::format_duration(125s), "2m 5s");
}

TEST(StringUtilsTest, Utf8Validation) {
    EXPECT_TRUE(StringUtils::is_valid_utf8("plain.txt"));
    EXPECT_TRUE(StringUtils::is_valid_utf8("r\xC3\xA9sum\xC3\xA9.pdf"));
    EXPECT_TRUE(StringUtils::is_valid_utf8("\xF0\x9F\x93\x81"));
    EXPECT_FALSE(StringUtils::is_valid_utf8("\xFF"));
    EXPECT_FALSE(StringUtils::is_valid_utf8("\xC3"));
    EXPECT_FALSE(StringUtils::is_valid_utf8("\xC0\xAF"));       // overlong '/'
    EXPECT_FALSE(StringUtils::is_valid_utf8("\xED\xA0\x80"));   // surrogate
}

TEST(EncodingUtilsTest, HexRoundTrip) {
    auto data = bytes_of("\x01\xab\xff");
    EXPECT_EQ(EncodingUtils::to_hex(data), "01abff");
    
    auto decoded = EncodingUtils::from_hex("01ABff");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, data);
    
    EXPECT_FALSE(EncodingUtils::from_hex("abc").has_value());
    EXPECT_FALSE(EncodingUtils::from_hex("zz").has_value());
}

TEST(EncodingUtilsTest, Base32MatchesRfc4648) {
    EXPECT_EQ(EncodingUtils::to_base32(bytes_of("")), "");
    EXPECT_EQ(EncodingUtils::to_base32(bytes_of("f")), "my");
    EXPECT_EQ(EncodingUtils::to_base32(bytes_of("foobar")), "mzxw6ytboi");
    
    auto decoded = EncodingUtils::from_base32("MZXW6YTBOI");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, bytes_of("foobar"));
}

TEST(EncodingUtilsTest, Base32RejectsGarbage) {
    EXPECT_FALSE(EncodingUtils::from_base32("mzxw1").has_value());
    EXPECT_FALSE(EncodingUtils::from_base32("m").has_value());
    // Non-zero trailing bits in the final symbol
    EXPECT_FALSE(EncodingUtils::from_base32("mz").has_value());
}

TEST(FileUtilsTest, ExpandHome) {
    auto home = FileUtils::get_home_dir();
    EXPECT_EQ(FileUtils::expand_home("~"), home);
    EXPECT_EQ(FileUtils::expand_home("~/Downloads"), home / "Downloads");
    EXPECT_EQ(FileUtils::expand_home("/tmp/out"), std::filesystem::path("/tmp/out"));
    EXPECT_EQ(FileUtils::expand_home("~other/x"), std::filesystem::path("~other/x"));
}

TEST(FileUtilsTest, ReadWriteAndRemove) {
    beamdrop::testing::TempDirectory dir("beamdrop_utils");
    auto file = dir / "nested" / "data.bin";
    std::filesystem::create_directories(file.parent_path());
    
    ASSERT_TRUE(FileUtils::write_file(file, "payload"));
    EXPECT_EQ(FileUtils::read_file(file).value_or(""), "payload");
    EXPECT_EQ(FileUtils::file_size(file).value_or(0), 7u);
    EXPECT_FALSE(FileUtils::file_size(dir / "missing").has_value());
    
    EXPECT_TRUE(FileUtils::remove_all_quietly(dir / "nested"));
    EXPECT_FALSE(FileUtils::exists(dir / "nested"));
    // Removing something that is already gone is not an error
    EXPECT_TRUE(FileUtils::remove_all_quietly(dir / "nested"));
}
