#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace HuffStream {

/**
 * @brief Random identifiers backed by the OpenSSL CSPRNG.
 */
class Crypto {
public:
    static constexpr size_t TRANSFER_ID_BYTES = 16;

    /**
     * @brief Fill a buffer from RAND_bytes
     * @throws std::runtime_error if the generator fails
     */
    static std::vector<uint8_t> randomBytes(size_t count);

    /**
     * @brief Random (version 4) UUID in canonical 8-4-4-4-12 form
     * @throws std::runtime_error if the generator fails
     */
    static std::string generateTransferId();

    static std::string toHex(const std::vector<uint8_t>& data);
};

} // namespace HuffStream
