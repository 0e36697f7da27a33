#include "Crypto.h"
#include "Logger.h"
#include <openssl/rand.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace HuffStream {

std::vector<uint8_t> Crypto::randomBytes(size_t count) {
    std::vector<uint8_t> bytes(count);
    if (count > 0 && RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
        Logger::instance().log(LogLevel::ERROR, "Failed to generate random bytes", "Crypto");
        throw std::runtime_error("Failed to generate random bytes");
    }
    return bytes;
}

std::string Crypto::generateTransferId() {
    auto bytes = randomBytes(TRANSFER_ID_BYTES);

    // RFC 4122: version 4, variant 10xx
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    std::string hex = toHex(bytes);
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

std::string Crypto::toHex(const std::vector<uint8_t>& data) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (uint8_t byte : data) {
        ss << std::setw(2) << static_cast<int>(byte);
    }
    return ss.str();
}

} // namespace HuffStream
