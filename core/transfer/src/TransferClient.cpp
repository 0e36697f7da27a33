#include "TransferClient.h"
#include "Codec.h"
#include "Connection.h"
#include "Crypto.h"
#include "LegacyTransfer.h"
#include "LoggerMacros.h"
#include "PathUtils.h"
#include "ProtocolMessages.h"
#include "TLSContext.h"
#include <algorithm>

namespace HuffStream {

TransferClient::TransferClient(ClientSettings settings)
    : settings_(std::move(settings)) {}

TransferClient::~TransferClient() = default;

hfs::Result<void> TransferClient::initialize() {
    auto valid = settings_.validate();
    if (!valid) {
        return valid;
    }

    if (!settings_.tls.enabled) {
        return hfs::Ok();
    }

    auto tls = std::make_shared<TLSContext>(TLSContext::Mode::CLIENT);
    if (!tls->initialize()) {
        return hfs::Err(hfs::ErrorCode::ConfigError, tls->getLastError());
    }

    if (settings_.tls.verify) {
        tls->setVerifyPeer(true);
        bool loaded = settings_.tls.caFile.empty()
            ? tls->useSystemCertificates()
            : tls->loadCACertificates(settings_.tls.caFile);
        if (!loaded) {
            return hfs::Err(hfs::ErrorCode::MissingTLSMaterial, tls->getLastError());
        }
    }

    tls_ = std::move(tls);
    return hfs::Ok();
}

DialOptions TransferClient::dialOptions() const {
    DialOptions options;
    options.retryAttempts = settings_.retryAttempts;
    options.retryDelayMs = settings_.retryDelayMs;
    options.tls = tls_;
    return options;
}

hfs::Result<Json::Value> TransferClient::request(const Json::Value& message) {
    auto conn = ConnectionManager::dial(settings_.host, settings_.controlPort, dialOptions());
    if (!conn) {
        return conn.error();
    }
    auto& connection = *conn.value();

    if (!connection.sendFrame(ProtocolMessages::toString(message))) {
        return hfs::Err<Json::Value>(hfs::ErrorCode::SendFailed, "Failed to send control request");
    }

    auto frame = connection.receiveTextFrame();
    if (!frame) {
        return hfs::Err<Json::Value>(hfs::ErrorCode::ConnectionClosed, "No reply on the control channel");
    }

    Json::Value reply;
    std::string errors;
    if (!ProtocolMessages::parse(*frame, reply, errors) || !reply.isObject() || !reply["status"].isString()) {
        return hfs::Err<Json::Value>(hfs::ErrorCode::UnexpectedReply, "Malformed control reply: " + *frame);
    }
    if (reply["status"].asString() == "error") {
        return hfs::Err<Json::Value>(hfs::ErrorCode::InvalidCommand, reply["message"].asString());
    }
    return reply;
}

hfs::Result<SendResult> TransferClient::sendFile(const std::string& path) {
    auto input = PathUtils::readFile(path);
    if (!input) {
        return input.error();
    }

    auto encoded = Codec::encode(input.value());
    Logger::instance().info("Encoded " + path + ": " + std::to_string(input->size()) + " -> " +
                            std::to_string(encoded.payload.size()) + " bytes (" +
                            std::to_string(encoded.ratio) + "%)", "TransferClient");

    std::string transferId;
    try {
        transferId = Crypto::generateTransferId();
    } catch (const std::exception& e) {
        return hfs::Err<SendResult>(hfs::ErrorCode::InternalError, e.what());
    }

    auto sent = sendPayload(transferId, PathUtils::encodedName(path), encoded.payload);
    if (!sent) {
        return sent;
    }

    sent->originalSize = input->size();
    sent->ratio = encoded.ratio;
    return sent;
}

hfs::Result<SendResult> TransferClient::sendPayload(const std::string& transferId, const std::string& remoteName,
                                                    const std::vector<uint8_t>& payload) {
    auto& logger = Logger::instance();

    auto prepared = request(ProtocolMessages::prepare(transferId, remoteName, payload.size()));
    if (!prepared) {
        return prepared.error();
    }
    if (prepared.value()["status"].asString() != "ready") {
        return hfs::Err<SendResult>(hfs::ErrorCode::UnexpectedReply,
                                    "Server did not accept transfer: " + prepared.value()["status"].asString());
    }

    auto conn = ConnectionManager::dial(settings_.host, settings_.dataPort, dialOptions());
    if (!conn) {
        return conn.error();
    }
    auto& connection = *conn.value();

    if (!connection.sendFrame(ProtocolMessages::toString(ProtocolMessages::dataHandshake(transferId)))) {
        return hfs::Err<SendResult>(hfs::ErrorCode::SendFailed, "Failed to send transfer metadata");
    }

    auto ready = connection.receiveTextFrame();
    if (!ready) {
        return hfs::Err<SendResult>(hfs::ErrorCode::ConnectionClosed,
                                    "Server closed the data channel for " + transferId);
    }
    if (*ready != hfs::config::READY_SIGNAL) {
        return hfs::Err<SendResult>(hfs::ErrorCode::UnexpectedReply, "Expected READY, got: " + *ready);
    }

    const std::size_t chunkSize = settings_.bufferSize;
    for (std::size_t offset = 0; offset < payload.size(); offset += chunkSize) {
        auto end = payload.begin() + static_cast<std::ptrdiff_t>(std::min(offset + chunkSize, payload.size()));
        std::vector<uint8_t> chunk(payload.begin() + static_cast<std::ptrdiff_t>(offset), end);
        if (!connection.sendFrame(chunk)) {
            return hfs::Err<SendResult>(hfs::ErrorCode::SendFailed,
                                        "Connection lost after " + std::to_string(offset) + " bytes");
        }
    }
    LOG_DEBUG_COMP_IF("Streamed " + std::to_string(payload.size()) + " bytes for " + transferId, "TransferClient");

    auto outcome = connection.receiveTextFrame();
    if (!outcome) {
        return hfs::Err<SendResult>(hfs::ErrorCode::ConnectionClosed, "No completion signal for " + transferId);
    }

    SendResult result;
    result.transferId = transferId;
    result.remoteName = remoteName;
    result.payloadSize = payload.size();

    if (*outcome == hfs::config::COMPLETE_SIGNAL) {
        result.complete = true;
        logger.info("Transfer " + transferId + " complete", "TransferClient");
    } else if (*outcome == hfs::config::INCOMPLETE_SIGNAL) {
        logger.warn("Server reported transfer " + transferId + " incomplete", "TransferClient");
    } else {
        return hfs::Err<SendResult>(hfs::ErrorCode::UnexpectedReply, "Unexpected completion signal: " + *outcome);
    }
    return result;
}

hfs::Result<std::string> TransferClient::checkStatus(const std::string& transferId) {
    auto reply = request(ProtocolMessages::status(transferId));
    if (!reply) {
        return reply.error();
    }
    return reply.value()["status"].asString();
}

hfs::Result<std::string> TransferClient::cancel(const std::string& transferId) {
    auto reply = request(ProtocolMessages::cancel(transferId));
    if (!reply) {
        return reply.error();
    }
    return reply.value()["status"].asString();
}

hfs::Result<std::string> TransferClient::sendLegacy(const std::string& path) {
    if (settings_.legacyPort == 0) {
        return hfs::Err<std::string>(hfs::ErrorCode::MissingConfig, "legacy_port is not configured");
    }

    auto input = PathUtils::readFile(path);
    if (!input) {
        return input.error();
    }
    auto encoded = Codec::encode(input.value());

    auto conn = ConnectionManager::dial(settings_.host, settings_.legacyPort, dialOptions());
    if (!conn) {
        return conn.error();
    }

    auto reply = LegacyTransfer::send(*conn.value(), PathUtils::encodedName(path), encoded.payload,
                                      settings_.bufferSize);
    if (reply) {
        Logger::instance().info("Legacy transfer of " + path + ": " + reply.value(), "TransferClient");
    }
    return reply;
}

} // namespace HuffStream
