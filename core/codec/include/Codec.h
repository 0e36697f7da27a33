#pragma once

#include "PayloadFormat.h"
#include "Result.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace HuffStream {

struct EncodeResult {
    std::vector<uint8_t> payload;
    double ratio{0.0};          ///< (input - payload) / input * 100, may be negative
    std::size_t metadataSize{0};
    std::size_t packedSize{0};
};

/**
 * @brief Huffman codec over whole in-memory buffers.
 *
 * Stateless; every call builds a fresh model, tree and code table, and the
 * code table travels inside the payload. decode(encode(x).payload) == x for
 * every byte sequence.
 */
class Codec {
public:
    static EncodeResult encode(const std::vector<uint8_t>& data);

    /// Build the payload structure without serializing it
    static EncodedPayload buildPayload(const std::vector<uint8_t>& data);

    /**
     * @brief Reverse encode().
     *
     * An empty payload decodes to an empty buffer. Fails with a codec error
     * (1xx) for malformed or truncated metadata, bits that match no code, a
     * partial code at the end of the stream, or a symbol count that differs
     * from the recorded original size.
     */
    static hfs::Result<std::vector<uint8_t>> decode(const std::vector<uint8_t>& payload);

    static hfs::Result<std::vector<uint8_t>> decodePayload(const EncodedPayload& payload);

    /// Encode a file into another file
    static hfs::Result<EncodeResult> encodeFile(const std::string& inputPath, const std::string& outputPath);

    /// Decode a file into another file, returning the decoded size
    static hfs::Result<std::size_t> decodeFile(const std::string& inputPath, const std::string& outputPath);

    static double compressionRatio(std::size_t originalSize, std::size_t payloadSize);
};

} // namespace HuffStream
