#include "BitPacker.h"

namespace HuffStream {

void BitPacker::appendBit(bool bit) {
    const auto offset = static_cast<unsigned>(bitLength_ % 8);
    if (offset == 0) {
        bytes_.push_back(0);
    }
    if (bit) {
        bytes_.back() |= static_cast<uint8_t>(0x80u >> offset);
    }
    ++bitLength_;
}

void BitPacker::appendCode(const std::string& code) {
    for (char c : code) {
        appendBit(c == '1');
    }
}

std::vector<uint8_t> BitPacker::finish() {
    std::vector<uint8_t> out;
    out.swap(bytes_);
    bitLength_ = 0;
    return out;
}

BitUnpacker::BitUnpacker(const uint8_t* data, std::size_t size, uint8_t paddingBits)
    : data_(data) {
    const uint64_t total = static_cast<uint64_t>(size) * 8;
    bitLength_ = paddingBits <= total ? total - paddingBits : 0;
}

bool BitUnpacker::next() {
    const uint8_t byte = data_[position_ / 8];
    const bool bit = (byte >> (7 - position_ % 8)) & 1u;
    ++position_;
    return bit;
}

std::string BitUnpacker::unpack(const std::vector<uint8_t>& data, uint8_t paddingBits) {
    BitUnpacker reader(data.data(), data.size(), paddingBits);
    std::string bits;
    bits.reserve(static_cast<std::size_t>(reader.bitLength()));
    while (reader.hasNext()) {
        bits.push_back(reader.next() ? '1' : '0');
    }
    return bits;
}

} // namespace HuffStream
