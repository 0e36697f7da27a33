#pragma once

#include "CodeTable.h"
#include "Result.h"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace HuffStream {

/**
 * @brief Decoded view of an encoded payload.
 *
 * packedBits.size() * 8 - paddingBits is the sum of code lengths over the
 * original input.
 */
struct EncodedPayload {
    uint8_t paddingBits{0};
    uint64_t originalByteCount{0};
    CodeTable codeTable;
    std::vector<uint8_t> packedBits;
};

/**
 * @brief Binary layout of an encoded payload (all integers big-endian).
 *
 *   magic "HUF1"          4
 *   version               1
 *   paddingBits           1
 *   originalByteCount     8
 *   packedLength          8
 *   symbolCount           2   (1..256)
 *   symbolCount x {value 1, codeLength 1, code bits ceil(codeLength / 8)}
 *   packedBits            packedLength
 *
 * An empty input is represented by an empty payload, never by a header.
 */
class PayloadFormat {
public:
    static constexpr uint8_t MAGIC[4] = {'H', 'U', 'F', '1'};
    static constexpr uint8_t VERSION = 1;
    static constexpr std::size_t HEADER_SIZE = 24;
    static constexpr std::size_t MAX_CODE_LENGTH = 255;

    /// Header and code table only
    static std::vector<uint8_t> serializeMetadata(const EncodedPayload& payload);

    /// Metadata followed by the packed bits
    static std::vector<uint8_t> serialize(const EncodedPayload& payload);

    /**
     * @brief Parse and validate a non-empty payload.
     *
     * Fails with MalformedPayload, UnsupportedPayloadVersion, TruncatedPayload,
     * CodeTableMismatch, or SizeMismatch when originalByteCount exceeds the
     * packed bit count.
     */
    static hfs::Result<EncodedPayload> parse(const std::vector<uint8_t>& data);
};

} // namespace HuffStream
