#include "Codec.h"
#include "BitPacker.h"
#include "CodeTable.h"
#include "FrequencyModel.h"
#include "HuffmanTree.h"
#include "LoggerMacros.h"
#include "PathUtils.h"
#include <algorithm>

namespace HuffStream {

EncodedPayload Codec::buildPayload(const std::vector<uint8_t>& data) {
    EncodedPayload payload;
    if (data.empty()) {
        return payload;
    }

    FrequencyModel model(data);
    auto tree = HuffmanTree::build(model);
    payload.codeTable = CodeTable::fromTree(tree);

    BitPacker packer;
    packer.reserveBits(payload.codeTable.encodedBitLength(model));
    for (uint8_t byte : data) {
        packer.appendCode(payload.codeTable.code(byte));
    }

    payload.paddingBits = packer.paddingBits();
    payload.originalByteCount = data.size();
    payload.packedBits = packer.finish();
    return payload;
}

EncodeResult Codec::encode(const std::vector<uint8_t>& data) {
    SCOPED_TIMER_COMP("encode", "Codec");

    EncodeResult result;
    if (data.empty()) {
        return result;
    }

    auto payload = buildPayload(data);
    result.payload = PayloadFormat::serialize(payload);
    result.packedSize = payload.packedBits.size();
    result.metadataSize = result.payload.size() - result.packedSize;
    result.ratio = compressionRatio(data.size(), result.payload.size());

    LOG_DEBUG_COMP_IF("Encoded " + std::to_string(data.size()) + " bytes into " +
                      std::to_string(result.payload.size()) + " (" +
                      std::to_string(payload.codeTable.size()) + " symbols)", "Codec");
    return result;
}

hfs::Result<std::vector<uint8_t>> Codec::decode(const std::vector<uint8_t>& payload) {
    SCOPED_TIMER_COMP("decode", "Codec");

    if (payload.empty()) {
        return std::vector<uint8_t>();
    }

    auto parsed = PayloadFormat::parse(payload);
    if (!parsed) {
        return parsed.error();
    }
    return decodePayload(parsed.value());
}

hfs::Result<std::vector<uint8_t>> Codec::decodePayload(const EncodedPayload& payload) {
    auto tree = HuffmanTree::fromCodeTable(payload.codeTable);
    if (!tree) {
        return tree.error();
    }
    const HuffmanNode* root = tree->root();
    if (!root) {
        return hfs::Err<std::vector<uint8_t>>(hfs::ErrorCode::CodeTableMismatch, "Empty code table");
    }

    std::vector<uint8_t> output;
    std::size_t bitCount = payload.packedBits.size() * 8;
    output.reserve(static_cast<std::size_t>(std::min<uint64_t>(payload.originalByteCount, bitCount)));

    BitUnpacker bits(payload.packedBits.data(), payload.packedBits.size(), payload.paddingBits);
    const HuffmanNode* node = root;
    while (bits.hasNext()) {
        node = bits.next() ? node->right.get() : node->left.get();
        if (!node) {
            return hfs::Err<std::vector<uint8_t>>(hfs::ErrorCode::CodeTableMismatch,
                "Bit sequence matches no code at bit " + std::to_string(bits.bitLength() - bits.remaining()));
        }
        if (node->isLeaf()) {
            if (output.size() == payload.originalByteCount) {
                return hfs::Err<std::vector<uint8_t>>(hfs::ErrorCode::SizeMismatch,
                    "More symbols than the recorded " + std::to_string(payload.originalByteCount));
            }
            output.push_back(node->symbol);
            node = root;
        }
    }

    if (node != root) {
        return hfs::Err<std::vector<uint8_t>>(hfs::ErrorCode::CodecError,
                                              "Bit stream ends inside a code");
    }
    if (output.size() != payload.originalByteCount) {
        return hfs::Err<std::vector<uint8_t>>(hfs::ErrorCode::SizeMismatch,
            "Decoded " + std::to_string(output.size()) + " symbols, expected " +
            std::to_string(payload.originalByteCount));
    }
    return output;
}

hfs::Result<EncodeResult> Codec::encodeFile(const std::string& inputPath, const std::string& outputPath) {
    auto input = PathUtils::readFile(inputPath);
    if (!input) {
        return input.error();
    }

    auto result = encode(input.value());
    auto written = PathUtils::writeFile(outputPath, result.payload);
    if (!written) {
        return written.error();
    }

    LOG_INFO_COMP_IF("Encoded " + inputPath + " -> " + outputPath, "Codec");
    return result;
}

hfs::Result<std::size_t> Codec::decodeFile(const std::string& inputPath, const std::string& outputPath) {
    auto input = PathUtils::readFile(inputPath);
    if (!input) {
        return input.error();
    }

    auto decoded = decode(input.value());
    if (!decoded) {
        LOG_ERROR_COMP("Decoding " + inputPath + " failed: " + decoded.error().message, "Codec");
        return decoded.error();
    }

    auto written = PathUtils::writeFile(outputPath, decoded.value());
    if (!written) {
        return written.error();
    }

    LOG_INFO_COMP_IF("Decoded " + inputPath + " -> " + outputPath, "Codec");
    return decoded->size();
}

double Codec::compressionRatio(std::size_t originalSize, std::size_t payloadSize) {
    if (originalSize == 0) {
        return 0.0;
    }
    return (static_cast<double>(originalSize) - static_cast<double>(payloadSize)) /
           static_cast<double>(originalSize) * 100.0;
}

} // namespace HuffStream
