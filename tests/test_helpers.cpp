#include <gtest/gtest.h>
#include "utils/helpers.hpp"

TEST(HelpersTest, NormalizeExtension_StripsDotsAndLowercases) {
    EXPECT_EQ(normalize_extension(".PDF"), "pdf");
    EXPECT_EQ(normalize_extension("Docx"), "docx");
    EXPECT_EQ(normalize_extension("..tar"), "tar");
    EXPECT_EQ(normalize_extension("."), "");
    EXPECT_EQ(normalize_extension(""), "");
}

TEST(HelpersTest, NormalizeHex_UppercasesAndDropsSeparators) {
    EXPECT_EQ(normalize_hex("25 50 44 46"), "25504446");
    EXPECT_EQ(normalize_hex("ff:d8-ff"), "FFD8FF");
    EXPECT_EQ(normalize_hex("  \t"), "");
}

TEST(HelpersTest, HexToBytes_RejectsMalformedInput) {
    EXPECT_FALSE(hex_to_bytes("").has_value());
    EXPECT_FALSE(hex_to_bytes("ABC").has_value());
    EXPECT_FALSE(hex_to_bytes("ZZ").has_value());

    auto bytes = hex_to_bytes("89504e47");
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(*bytes, (std::vector<uint8_t>{0x89, 0x50, 0x4E, 0x47}));
}

TEST(HelpersTest, BytesToHex_IsUppercase) {
    EXPECT_EQ(bytes_to_hex({0x00, 0x0a, 0xff}), "000AFF");
    EXPECT_EQ(bytes_to_hex({}), "");
}

TEST(HelpersTest, ExtensionOf_UsesLastSuffix) {
    EXPECT_EQ(extension_of("/tmp/report.PDF"), "pdf");
    EXPECT_EQ(extension_of("archive.tar.gz"), "gz");
    EXPECT_EQ(extension_of("Makefile"), "");
    EXPECT_EQ(extension_of("/home/user/.bashrc"), "");
}

TEST(HelpersTest, LittleEndianReaders) {
    std::vector<uint8_t> blob = {0x50, 0x4B, 0x05, 0x06, 0x34, 0x12};
    EXPECT_EQ(read_le16(blob, 4), 0x1234);
    EXPECT_EQ(read_le32(blob, 0), 0x06054B50u);
}

TEST(HelpersTest, ToHex_FormatsOffsets) {
    EXPECT_EQ(to_hex(0), "0");
    EXPECT_EQ(to_hex(257), "101");
}
