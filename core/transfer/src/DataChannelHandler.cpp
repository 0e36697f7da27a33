#include "DataChannelHandler.h"
#include "Connection.h"
#include "Constants.h"
#include "LoggerMacros.h"
#include "ProtocolMessages.h"
#include <algorithm>

namespace HuffStream {

DataChannelHandler::DataChannelHandler(TransferRegistry& registry, const PayloadStore& store)
    : registry_(registry), store_(store) {}

void DataChannelHandler::serve(Connection& connection) {
    auto& logger = Logger::instance();

    auto transferId = readTransferId(connection);
    if (!transferId) {
        return;
    }

    auto record = registry_.beginReceiving(*transferId);
    if (!record) {
        logger.warn("Data connection from " + connection.peerAddress() +
                    " for unknown or inactive transfer " + *transferId, "DataChannel");
        return;
    }

    if (!connection.sendFrame(std::string(hfs::config::READY_SIGNAL))) {
        logger.warn("Failed to send READY for " + *transferId, "DataChannel");
        if (!registry_.transition(*transferId, TransferStatus::Receiving, TransferStatus::Incomplete)) {
            LOG_DEBUG_COMP_IF("Transfer " + *transferId + " left its receiving state early", "DataChannel");
        }
        return;
    }

    auto payload = receiveChunks(connection, record->declaredSize);

    if (payload.size() != record->declaredSize) {
        logger.warn("Transfer " + *transferId + " incomplete: received " + std::to_string(payload.size()) +
                    " of " + std::to_string(record->declaredSize) + " bytes", "DataChannel");
        if (!registry_.transition(*transferId, TransferStatus::Receiving, TransferStatus::Incomplete)) {
            LOG_DEBUG_COMP_IF("Transfer " + *transferId + " left its receiving state early", "DataChannel");
        }
        if (!connection.sendFrame(std::string(hfs::config::INCOMPLETE_SIGNAL))) {
            LOG_DEBUG_COMP_IF("Sender of " + *transferId + " is gone, INCOMPLETE not delivered", "DataChannel");
        }
        return;
    }

    if (registry_.transition(*transferId, TransferStatus::Receiving, TransferStatus::Received)) {
        finishTransfer(*record, payload);
    } else {
        logger.info("Transfer " + *transferId + " was cancelled while receiving, payload discarded",
                    "DataChannel");
    }

    if (!connection.sendFrame(std::string(hfs::config::COMPLETE_SIGNAL))) {
        logger.warn("Failed to send COMPLETE for " + *transferId, "DataChannel");
    }
}

std::optional<std::string> DataChannelHandler::readTransferId(Connection& connection) {
    auto frame = connection.receiveTextFrame();
    if (!frame) {
        LOG_DEBUG_COMP_IF("Data connection from " + connection.peerAddress() +
                          " closed before the handshake", "DataChannel");
        return std::nullopt;
    }

    Json::Value metadata;
    std::string errors;
    if (!ProtocolMessages::parse(*frame, metadata, errors) || !metadata.isObject() ||
        !metadata["transfer_id"].isString()) {
        LOG_WARN_COMP("Invalid data channel metadata from " + connection.peerAddress(), "DataChannel");
        return std::nullopt;
    }
    return metadata["transfer_id"].asString();
}

std::vector<uint8_t> DataChannelHandler::receiveChunks(Connection& connection, uint64_t expected) {
    std::vector<uint8_t> payload;
    payload.reserve(static_cast<std::size_t>(std::min<uint64_t>(expected, hfs::config::MAX_FRAME_SIZE)));

    while (payload.size() < expected) {
        auto chunk = connection.receiveFrame();
        if (!chunk) {
            break;
        }
        payload.insert(payload.end(), chunk->begin(), chunk->end());
    }
    return payload;
}

void DataChannelHandler::finishTransfer(const TransferRecord& record, const std::vector<uint8_t>& payload) {
    auto& logger = Logger::instance();
    SCOPED_TIMER_COMP("Transfer " + record.transferId, "DataChannel");

    auto saved = store_.saveEncoded(record.filename, payload);
    if (!saved) {
        logger.error("Could not store " + record.filename + ": " + saved.error().message, "DataChannel");
    } else {
        logger.info("Saved " + std::to_string(payload.size()) + " bytes to " + record.destinationPath,
                    "DataChannel");
    }

    auto decoded = store_.decodeAndSave(record.filename, payload);
    if (!decoded) {
        logger.error("Decoding transfer " + record.transferId + " failed: " + decoded.error().message,
                     "DataChannel");
        if (!registry_.transition(record.transferId, TransferStatus::Received, TransferStatus::DecodeFailed)) {
            LOG_DEBUG_COMP_IF("Transfer " + record.transferId + " changed state during decode", "DataChannel");
        }
        return;
    }

    if (!registry_.markDecoded(record.transferId, decoded->string())) {
        LOG_DEBUG_COMP_IF("Transfer " + record.transferId + " changed state during decode", "DataChannel");
    }
    logger.info("Transfer " + record.transferId + " decoded to " + decoded->string(), "DataChannel");
}

} // namespace HuffStream
