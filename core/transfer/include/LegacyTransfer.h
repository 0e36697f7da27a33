#pragma once

#include "PayloadStore.h"
#include "Result.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace HuffStream {

class Connection;

/**
 * @brief Single-channel transfer: one "<filename>|<filesize>" header frame,
 * then exactly filesize raw bytes, answered by one text frame.
 */
class LegacyTransfer {
public:
    LegacyTransfer(const PayloadStore& store, std::size_t bufferSize);

    /// Receive, store and decode one file, then reply success or failure
    void serve(Connection& connection);

    /**
     * @brief Send one encoded payload and wait for the reply
     * @return The receiver's reply text
     */
    static hfs::Result<std::string> send(Connection& connection, const std::string& filename,
                                         const std::vector<uint8_t>& payload, std::size_t chunkSize);

    static std::string formatHeader(const std::string& filename, uint64_t filesize);

    /// Splits at the last '|'; the size must be a plain decimal number
    static bool parseHeader(const std::string& header, std::string& filename, uint64_t& filesize);

private:
    bool receivePayload(Connection& connection, uint64_t filesize, std::vector<uint8_t>& payload);

    const PayloadStore& store_;
    std::size_t bufferSize_;
};

} // namespace HuffStream
