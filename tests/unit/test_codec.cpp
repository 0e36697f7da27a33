#include <gtest/gtest.h>

#include "Codec.h"
#include "PathUtils.h"
#include "PayloadFormat.h"
#include "TestHelpers.h"

#include <algorithm>
#include <random>

using namespace HuffStream;
using HuffStream::test::bytesOf;
using HuffStream::test::TempDir;

namespace {

    std::vector<uint8_t> roundTrip(const std::vector<uint8_t>& input) {
        auto encoded = Codec::encode(input);
        auto decoded = Codec::decode(encoded.payload);
        EXPECT_TRUE(decoded) << (decoded ? "" : decoded.error().message);
        return decoded ? decoded.value() : std::vector<uint8_t>();
    }

    // codes b=0 c=10 a=11, bits 11 0 10 11 0 -> one full byte 0xD6, no padding
    std::vector<uint8_t> abcabPayload() {
        return Codec::encode(bytesOf("abcab")).payload;
    }

    constexpr std::size_t ABCAB_PADDING_OFFSET = 5;
    constexpr std::size_t ABCAB_COUNT_OFFSET = 13;
    constexpr std::size_t ABCAB_PACKED_OFFSET = PayloadFormat::HEADER_SIZE + 9;

} // namespace

TEST(CodecTest, SingleRepeatedSymbol) {
    auto built = Codec::buildPayload(bytesOf("AAAAA"));

    EXPECT_EQ(built.codeTable.size(), 1u);
    EXPECT_EQ(built.codeTable.code('A'), "0");
    EXPECT_EQ(built.paddingBits, 3);
    EXPECT_EQ(built.originalByteCount, 5u);
    EXPECT_EQ(built.packedBits, std::vector<uint8_t>{0x00});

    EXPECT_EQ(roundTrip(bytesOf("AAAAA")), bytesOf("AAAAA"));
}

TEST(CodecTest, EmptyInput) {
    auto encoded = Codec::encode({});
    EXPECT_TRUE(encoded.payload.empty());
    EXPECT_DOUBLE_EQ(encoded.ratio, 0.0);

    auto built = Codec::buildPayload({});
    EXPECT_TRUE(built.codeTable.empty());
    EXPECT_EQ(built.paddingBits, 0);
    EXPECT_EQ(built.originalByteCount, 0u);
    EXPECT_TRUE(built.packedBits.empty());

    auto decoded = Codec::decode({});
    ASSERT_TRUE(decoded);
    EXPECT_TRUE(decoded->empty());
}

TEST(CodecTest, PackedBitsFollowAssignedCodes) {
    auto built = Codec::buildPayload(bytesOf("abcab"));

    EXPECT_EQ(built.codeTable.code('b'), "0");
    EXPECT_EQ(built.codeTable.code('c'), "10");
    EXPECT_EQ(built.codeTable.code('a'), "11");
    EXPECT_EQ(built.paddingBits, 0);
    EXPECT_EQ(built.packedBits, std::vector<uint8_t>{0xD6});
}

TEST(CodecTest, AllByteValues) {
    std::vector<uint8_t> input;
    for (int i = 0; i < 256; ++i) {
        input.push_back(static_cast<uint8_t>(i));
    }

    EXPECT_EQ(roundTrip(input), input);

    auto parsed = PayloadFormat::parse(Codec::encode(input).payload);
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed->codeTable.size(), 256u);
    EXPECT_TRUE(parsed->codeTable.isPrefixFree());
}

TEST(CodecTest, SkewedRandomData) {
    std::mt19937 rng(1234);
    std::geometric_distribution<int> dist(0.05);

    std::vector<uint8_t> input(64 * 1024);
    for (auto& byte : input) {
        byte = static_cast<uint8_t>(dist(rng) % 256);
    }

    auto encoded = Codec::encode(input);
    EXPECT_LT(encoded.payload.size(), input.size());
    EXPECT_GT(encoded.ratio, 0.0);
    EXPECT_EQ(encoded.metadataSize + encoded.packedSize, encoded.payload.size());

    auto decoded = Codec::decode(encoded.payload);
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded.value(), input);
}

TEST(CodecTest, TextWithLineBreaksAndNulls) {
    std::string text("line one\nline two\r\n\0\0tail", 25);
    EXPECT_EQ(roundTrip(bytesOf(text)), bytesOf(text));
}

TEST(CodecTest, RatioCanBeNegative) {
    auto encoded = Codec::encode(bytesOf("AAAAA"));

    EXPECT_EQ(encoded.payload.size(), 28u);
    EXPECT_EQ(encoded.metadataSize, 27u);
    EXPECT_EQ(encoded.packedSize, 1u);
    EXPECT_NEAR(encoded.ratio, -460.0, 1e-9);
}

TEST(CodecTest, CompressionRatioFormula) {
    EXPECT_DOUBLE_EQ(Codec::compressionRatio(100, 25), 75.0);
    EXPECT_DOUBLE_EQ(Codec::compressionRatio(100, 100), 0.0);
    EXPECT_DOUBLE_EQ(Codec::compressionRatio(0, 0), 0.0);
}

TEST(CodecTest, DecodeRejectsBitsMatchingNoCode) {
    // "AAAAA" only has code "0"; a leading 1 walks off the tree
    auto payload = Codec::encode(bytesOf("AAAAA")).payload;
    payload.back() = 0x80;

    auto decoded = Codec::decode(payload);
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().code, hfs::ErrorCode::CodeTableMismatch);
    EXPECT_EQ(decoded.error().category(), hfs::ErrorCategory::Codec);
}

TEST(CodecTest, DecodeRejectsMoreSymbolsThanRecorded) {
    auto payload = abcabPayload();
    ASSERT_EQ(payload[ABCAB_COUNT_OFFSET], 5);
    payload[ABCAB_COUNT_OFFSET] = 4;

    auto decoded = Codec::decode(payload);
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().code, hfs::ErrorCode::SizeMismatch);
}

TEST(CodecTest, DecodeRejectsFewerSymbolsThanRecorded) {
    auto payload = abcabPayload();
    payload[ABCAB_COUNT_OFFSET] = 6;

    auto decoded = Codec::decode(payload);
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().code, hfs::ErrorCode::SizeMismatch);
}

TEST(CodecTest, DecodeRejectsStreamEndingInsideACode) {
    // Two padding bits leave "110101": a b c, then a dangling 1
    auto payload = abcabPayload();
    ASSERT_EQ(payload[ABCAB_PACKED_OFFSET], 0xD6);
    payload[ABCAB_PADDING_OFFSET] = 2;

    auto decoded = Codec::decode(payload);
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().code, hfs::ErrorCode::CodecError);
}

TEST(CodecTest, DecodeRejectsHugeRecordedSize) {
    auto payload = Codec::encode(bytesOf("AAAAA")).payload;
    std::fill(payload.begin() + 6, payload.begin() + 14, 0xFF);

    auto decoded = Codec::decode(payload);
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().code, hfs::ErrorCode::SizeMismatch);
}

TEST(CodecTest, DecodeRejectsGarbage) {
    auto decoded = Codec::decode(bytesOf("definitely not a payload"));
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().category(), hfs::ErrorCategory::Codec);
}

TEST(CodecTest, EncodeAndDecodeFiles) {
    TempDir dir;
    auto original = bytesOf("file contents for the codec tool\n");
    ASSERT_TRUE(PathUtils::writeFile(dir.file("in.txt"), original));

    auto encoded = Codec::encodeFile(dir.file("in.txt"), dir.file("in_encoded.txt"));
    ASSERT_TRUE(encoded);
    EXPECT_FALSE(encoded->payload.empty());

    auto decoded = Codec::decodeFile(dir.file("in_encoded.txt"), dir.file("in_decoded.txt"));
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded.value(), original.size());

    auto roundTripped = PathUtils::readFile(dir.file("in_decoded.txt"));
    ASSERT_TRUE(roundTripped);
    EXPECT_EQ(roundTripped.value(), original);
}

TEST(CodecTest, EncodeFileReportsMissingInput) {
    TempDir dir;
    auto encoded = Codec::encodeFile(dir.file("missing.txt"), dir.file("out.bin"));
    ASSERT_FALSE(encoded);
    EXPECT_EQ(encoded.error().code, hfs::ErrorCode::FileNotFound);
}
