#include "PayloadFormat.h"
#include "BitPacker.h"
#include "Version.h"
#include <cstring>

namespace HuffStream {

static_assert(PayloadFormat::VERSION == Version::PAYLOAD_FORMAT, "Version.h is out of step with the payload layout");

namespace {

    template<typename T>
    void writeBigEndian(std::vector<uint8_t>& out, T value) {
        for (int shift = static_cast<int>(sizeof(T) * 8) - 8; shift >= 0; shift -= 8) {
            out.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
        }
    }

    // Bounds-checked cursor over the payload bytes
    class Reader {
    public:
        explicit Reader(const std::vector<uint8_t>& data) : data_(data) {}

        bool has(std::size_t n) const { return data_.size() - offset_ >= n; }
        std::size_t remaining() const { return data_.size() - offset_; }

        template<typename T>
        bool read(T& value) {
            if (!has(sizeof(T))) return false;
            value = 0;
            for (std::size_t i = 0; i < sizeof(T); ++i) {
                value = static_cast<T>((value << 8) | data_[offset_++]);
            }
            return true;
        }

        bool readBytes(std::size_t n, std::vector<uint8_t>& out) {
            if (!has(n)) return false;
            out.assign(data_.begin() + static_cast<std::ptrdiff_t>(offset_),
                       data_.begin() + static_cast<std::ptrdiff_t>(offset_ + n));
            offset_ += n;
            return true;
        }

    private:
        const std::vector<uint8_t>& data_;
        std::size_t offset_{0};
    };

    hfs::Result<EncodedPayload> truncated(const std::string& what) {
        return hfs::Err<EncodedPayload>(hfs::ErrorCode::TruncatedPayload, "Payload truncated in " + what);
    }

    hfs::Result<EncodedPayload> malformed(const std::string& what) {
        return hfs::Err<EncodedPayload>(hfs::ErrorCode::MalformedPayload, what);
    }

} // namespace

std::vector<uint8_t> PayloadFormat::serializeMetadata(const EncodedPayload& payload) {
    std::vector<uint8_t> out;
    out.reserve(HEADER_SIZE + payload.codeTable.size() * 4);

    out.insert(out.end(), MAGIC, MAGIC + sizeof(MAGIC));
    out.push_back(VERSION);
    out.push_back(payload.paddingBits);
    writeBigEndian<uint64_t>(out, payload.originalByteCount);
    writeBigEndian<uint64_t>(out, static_cast<uint64_t>(payload.packedBits.size()));
    writeBigEndian<uint16_t>(out, static_cast<uint16_t>(payload.codeTable.size()));

    for (const auto& [symbol, code] : payload.codeTable.entries()) {
        out.push_back(symbol);
        out.push_back(static_cast<uint8_t>(code.size()));

        BitPacker packer;
        packer.appendCode(code);
        const auto& bits = packer.bytes();
        out.insert(out.end(), bits.begin(), bits.end());
    }
    return out;
}

std::vector<uint8_t> PayloadFormat::serialize(const EncodedPayload& payload) {
    auto out = serializeMetadata(payload);
    out.insert(out.end(), payload.packedBits.begin(), payload.packedBits.end());
    return out;
}

hfs::Result<EncodedPayload> PayloadFormat::parse(const std::vector<uint8_t>& data) {
    Reader reader(data);

    std::vector<uint8_t> magic;
    if (!reader.readBytes(sizeof(MAGIC), magic)) {
        return truncated("magic");
    }
    if (std::memcmp(magic.data(), MAGIC, sizeof(MAGIC)) != 0) {
        return malformed("Bad payload magic");
    }

    uint8_t version = 0;
    if (!reader.read(version)) {
        return truncated("version");
    }
    if (version != VERSION) {
        return hfs::Err<EncodedPayload>(hfs::ErrorCode::UnsupportedPayloadVersion,
                                        "Unsupported payload version " + std::to_string(version));
    }

    EncodedPayload payload;
    uint64_t packedLength = 0;
    uint16_t symbolCount = 0;
    if (!reader.read(payload.paddingBits) || !reader.read(payload.originalByteCount) ||
        !reader.read(packedLength) || !reader.read(symbolCount)) {
        return truncated("header");
    }

    if (payload.paddingBits > 7) {
        return malformed("Padding of " + std::to_string(payload.paddingBits) + " bits");
    }
    if (symbolCount == 0 || symbolCount > FrequencyModel::SYMBOL_COUNT) {
        return malformed("Symbol count " + std::to_string(symbolCount) + " out of range");
    }

    for (uint16_t i = 0; i < symbolCount; ++i) {
        uint8_t symbol = 0;
        uint8_t codeLength = 0;
        if (!reader.read(symbol) || !reader.read(codeLength)) {
            return truncated("code table");
        }
        if (codeLength == 0) {
            return malformed("Zero-length code for symbol " + std::to_string(symbol));
        }

        std::vector<uint8_t> codeBytes;
        if (!reader.readBytes((codeLength + 7u) / 8u, codeBytes)) {
            return truncated("code table");
        }

        auto code = BitUnpacker::unpack(codeBytes, static_cast<uint8_t>((8 - codeLength % 8) % 8));
        auto inserted = payload.codeTable.insert(symbol, code);
        if (!inserted) {
            return hfs::Err<EncodedPayload>(inserted.error().code, inserted.error().message);
        }
    }

    if (reader.remaining() < packedLength) {
        return truncated("packed bits");
    }
    if (reader.remaining() > packedLength) {
        return malformed(std::to_string(reader.remaining() - packedLength) + " trailing bytes after packed bits");
    }
    if (packedLength == 0 && payload.paddingBits != 0) {
        return malformed("Padding without packed bits");
    }

    // Every code is at least one bit long
    uint64_t bitCount = packedLength * 8 - payload.paddingBits;
    if (payload.originalByteCount == 0 || payload.originalByteCount > bitCount) {
        return hfs::Err<EncodedPayload>(hfs::ErrorCode::SizeMismatch,
            "Recorded " + std::to_string(payload.originalByteCount) + " symbols for " +
            std::to_string(bitCount) + " packed bits");
    }

    if (!reader.readBytes(static_cast<std::size_t>(packedLength), payload.packedBits)) {
        return truncated("packed bits");
    }
    return payload;
}

} // namespace HuffStream
