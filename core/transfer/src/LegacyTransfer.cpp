#include "LegacyTransfer.h"
#include "Connection.h"
#include "Constants.h"
#include "LoggerMacros.h"
#include <algorithm>

namespace HuffStream {

LegacyTransfer::LegacyTransfer(const PayloadStore& store, std::size_t bufferSize)
    : store_(store), bufferSize_(bufferSize == 0 ? hfs::config::DEFAULT_BUFFER_SIZE : bufferSize) {}

std::string LegacyTransfer::formatHeader(const std::string& filename, uint64_t filesize) {
    return filename + "|" + std::to_string(filesize);
}

bool LegacyTransfer::parseHeader(const std::string& header, std::string& filename, uint64_t& filesize) {
    auto pos = header.rfind('|');
    if (pos == std::string::npos || pos == 0) {
        return false;
    }

    std::string sizeText = header.substr(pos + 1);
    if (sizeText.empty() || sizeText.size() > 20 ||
        sizeText.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }

    try {
        filesize = std::stoull(sizeText);
    } catch (const std::exception&) {
        return false;
    }
    filename = header.substr(0, pos);
    return true;
}

void LegacyTransfer::serve(Connection& connection) {
    auto& logger = Logger::instance();
    const std::string failure(hfs::config::LEGACY_FAILURE_REPLY);

    auto header = connection.receiveTextFrame();
    if (!header) {
        LOG_DEBUG_COMP_IF("Legacy connection from " + connection.peerAddress() + " closed before the header",
                          "LegacyTransfer");
        return;
    }

    std::string filename;
    uint64_t filesize = 0;
    if (!parseHeader(*header, filename, filesize) || store_.encodedPath(filename).empty()) {
        logger.warn("Invalid legacy header from " + connection.peerAddress(), "LegacyTransfer");
        if (!connection.sendFrame(failure)) {
            LOG_DEBUG_COMP_IF("Could not deliver failure reply", "LegacyTransfer");
        }
        return;
    }

    logger.info("Receiving " + filename + " (" + std::to_string(filesize) + " bytes) from " +
                connection.peerAddress(), "LegacyTransfer");

    std::vector<uint8_t> payload;
    if (!receivePayload(connection, filesize, payload)) {
        logger.warn("Legacy transfer of " + filename + " ended after " + std::to_string(payload.size()) +
                    " of " + std::to_string(filesize) + " bytes", "LegacyTransfer");
        if (!connection.sendFrame(failure)) {
            LOG_DEBUG_COMP_IF("Could not deliver failure reply", "LegacyTransfer");
        }
        return;
    }

    std::string reply = hfs::config::LEGACY_SUCCESS_REPLY;
    auto saved = store_.saveEncoded(filename, payload);
    if (!saved) {
        logger.error("Could not store " + filename + ": " + saved.error().message, "LegacyTransfer");
        reply = failure;
    } else {
        auto decoded = store_.decodeAndSave(filename, payload);
        if (!decoded) {
            logger.error("Decoding " + filename + " failed: " + decoded.error().message, "LegacyTransfer");
            reply = failure;
        } else {
            logger.info("Decoded " + filename + " to " + decoded->string(), "LegacyTransfer");
        }
    }

    if (!connection.sendFrame(reply)) {
        logger.warn("Failed to send legacy reply to " + connection.peerAddress(), "LegacyTransfer");
    }
}

bool LegacyTransfer::receivePayload(Connection& connection, uint64_t filesize, std::vector<uint8_t>& payload) {
    std::vector<uint8_t> buffer(bufferSize_);
    while (payload.size() < filesize) {
        auto want = static_cast<std::size_t>(std::min<uint64_t>(bufferSize_, filesize - payload.size()));
        ssize_t n = connection.read(buffer.data(), want);
        if (n <= 0) {
            return false;
        }
        payload.insert(payload.end(), buffer.begin(), buffer.begin() + n);
    }
    return true;
}

hfs::Result<std::string> LegacyTransfer::send(Connection& connection, const std::string& filename,
                                              const std::vector<uint8_t>& payload, std::size_t chunkSize) {
    if (!connection.sendFrame(formatHeader(filename, payload.size()))) {
        return hfs::Err<std::string>(hfs::ErrorCode::SendFailed, "Failed to send legacy header");
    }

    const std::size_t step = chunkSize == 0 ? hfs::config::DEFAULT_BUFFER_SIZE : chunkSize;
    for (std::size_t offset = 0; offset < payload.size(); offset += step) {
        std::size_t len = std::min(step, payload.size() - offset);
        if (!connection.sendAll(payload.data() + offset, len)) {
            return hfs::Err<std::string>(hfs::ErrorCode::SendFailed,
                                         "Connection lost after " + std::to_string(offset) + " bytes");
        }
    }

    auto reply = connection.receiveTextFrame();
    if (!reply) {
        return hfs::Err<std::string>(hfs::ErrorCode::ConnectionClosed, "No reply from receiver");
    }
    return *reply;
}

} // namespace HuffStream
