#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace HuffStream {

/**
 * @brief Appends codes to a byte buffer, most significant bit first.
 *
 * The last byte is zero-padded; paddingBits() reports how many of its low
 * bits carry no data.
 */
class BitPacker {
public:
    BitPacker() = default;

    void appendBit(bool bit);

    /// Append a bitstring of '0' and '1' characters
    void appendCode(const std::string& code);

    void reserveBits(uint64_t bits) { bytes_.reserve(static_cast<std::size_t>((bits + 7) / 8)); }

    uint64_t bitLength() const { return bitLength_; }

    /// (8 - bitLength % 8) % 8
    uint8_t paddingBits() const { return static_cast<uint8_t>((8 - bitLength_ % 8) % 8); }

    const std::vector<uint8_t>& bytes() const { return bytes_; }

    /// Hand over the packed buffer and reset the packer
    std::vector<uint8_t> finish();

private:
    std::vector<uint8_t> bytes_;
    uint64_t bitLength_{0};
};

/**
 * @brief Reads bits back out of a packed buffer, skipping trailing padding.
 */
class BitUnpacker {
public:
    BitUnpacker(const uint8_t* data, std::size_t size, uint8_t paddingBits);

    bool hasNext() const { return position_ < bitLength_; }
    bool next();

    uint64_t bitLength() const { return bitLength_; }
    uint64_t remaining() const { return bitLength_ - position_; }

    /// Whole buffer as a '0'/'1' string without padding
    static std::string unpack(const std::vector<uint8_t>& data, uint8_t paddingBits);

private:
    const uint8_t* data_;
    uint64_t bitLength_{0};
    uint64_t position_{0};
};

} // namespace HuffStream
