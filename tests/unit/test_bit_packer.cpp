#include <gtest/gtest.h>

#include "BitPacker.h"

using namespace HuffStream;

TEST(BitPackerTest, PacksMostSignificantBitFirst) {
    BitPacker packer;
    packer.appendCode("10110");

    EXPECT_EQ(packer.bitLength(), 5u);
    EXPECT_EQ(packer.paddingBits(), 3);
    ASSERT_EQ(packer.bytes().size(), 1u);
    EXPECT_EQ(packer.bytes()[0], 0xB0);
}

TEST(BitPackerTest, CrossesByteBoundary) {
    BitPacker packer;
    packer.appendCode("111111111");

    EXPECT_EQ(packer.paddingBits(), 7);
    EXPECT_EQ(packer.bytes(), (std::vector<uint8_t>{0xFF, 0x80}));
}

TEST(BitPackerTest, WholeBytesNeedNoPadding) {
    BitPacker packer;
    for (int i = 0; i < 16; ++i) {
        packer.appendBit(i % 2 == 0);
    }

    EXPECT_EQ(packer.paddingBits(), 0);
    EXPECT_EQ(packer.bytes(), (std::vector<uint8_t>{0xAA, 0xAA}));
}

TEST(BitPackerTest, FinishResetsThePacker) {
    BitPacker packer;
    packer.appendCode("1");
    auto bytes = packer.finish();

    EXPECT_EQ(bytes, std::vector<uint8_t>{0x80});
    EXPECT_EQ(packer.bitLength(), 0u);
    EXPECT_TRUE(packer.bytes().empty());
}

TEST(BitUnpackerTest, StopsBeforePadding) {
    const std::vector<uint8_t> data{0xB0};
    BitUnpacker bits(data.data(), data.size(), 3);

    EXPECT_EQ(bits.bitLength(), 5u);
    std::string read;
    while (bits.hasNext()) {
        read.push_back(bits.next() ? '1' : '0');
    }
    EXPECT_EQ(read, "10110");
    EXPECT_EQ(bits.remaining(), 0u);
}

TEST(BitUnpackerTest, UnpackMatchesPackedCode) {
    BitPacker packer;
    packer.appendCode("0001");
    packer.appendCode("110");
    packer.appendCode("01");

    EXPECT_EQ(BitUnpacker::unpack(packer.bytes(), packer.paddingBits()), "000111001");
}

TEST(BitUnpackerTest, EmptyBufferHasNoBits) {
    EXPECT_EQ(BitUnpacker::unpack({}, 0), "");
}
