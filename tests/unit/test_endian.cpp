#include <gtest/gtest.h>
#include "libnsdp/core/endian.h"

using namespace libnsdp;

TEST(Endian, Read16) {
    const uint8_t tlvHeader[] = {0x0C, 0x00, 0x00, 0x01};
    EXPECT_EQ(Endian::readBe16(tlvHeader), 0x0C00);
    EXPECT_EQ(Endian::readBe16(tlvHeader + 2), 0x0001);
}

TEST(Endian, Read32) {
    const uint8_t ip[] = {0xC0, 0xA8, 0x01, 0x64};
    EXPECT_EQ(Endian::readBe32(ip), 0xC0A80164u);
}

TEST(Endian, PatchInPlace) {
    uint8_t buf[4] = {0xFF, 0xFF, 0x00, 0x00};
    Endian::writeBe16(buf + 2, 0x0100);
    EXPECT_EQ(buf[2], 0x01);
    EXPECT_EQ(buf[3], 0x00);
    EXPECT_EQ(Endian::readBe16(buf), 0xFFFF);
}

TEST(Endian, Append) {
    std::vector<uint8_t> buf;
    Endian::appendBe16(buf, 0xFFFF);
    Endian::appendBe16(buf, 0x0C00);
    Endian::appendZeros(buf, 2);
    ASSERT_EQ(buf.size(), 6u);
    EXPECT_EQ(buf[0], 0xFF);
    EXPECT_EQ(buf[2], 0x0C);
    EXPECT_EQ(buf[3], 0x00);
    EXPECT_EQ(buf[4], 0x00);
    EXPECT_EQ(buf[5], 0x00);
}
