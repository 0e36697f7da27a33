#include "ControlChannelHandler.h"
#include "Connection.h"
#include "LoggerMacros.h"
#include "PathUtils.h"
#include "ProtocolMessages.h"

namespace HuffStream {

ControlChannelHandler::ControlChannelHandler(TransferRegistry& registry, const PayloadStore& store)
    : registry_(registry), store_(store) {}

void ControlChannelHandler::serve(Connection& connection) {
    LOG_DEBUG_COMP_IF("Control session opened with " + connection.peerAddress(), "ControlChannel");

    for (;;) {
        auto frame = connection.receiveTextFrame();
        if (!frame) {
            if (connection.lastError() == hfs::ErrorCode::FrameTooLarge) {
                LOG_WARN_COMP("Closing control session with " + connection.peerAddress() +
                              ": oversized frame", "ControlChannel");
            }
            break;
        }

        if (!connection.sendFrame(handleFrame(*frame))) {
            LOG_WARN_COMP("Failed to send control reply to " + connection.peerAddress(), "ControlChannel");
            break;
        }
    }

    LOG_DEBUG_COMP_IF("Control session closed with " + connection.peerAddress(), "ControlChannel");
}

std::string ControlChannelHandler::handleFrame(const std::string& frame) {
    Json::Value request;
    std::string errors;
    if (!ProtocolMessages::parse(frame, request, errors)) {
        LOG_WARN_COMP("Invalid control frame: " + errors, "ControlChannel");
        return ProtocolMessages::toString(ProtocolMessages::error("Invalid JSON"));
    }

    if (!request.isObject()) {
        return ProtocolMessages::toString(ProtocolMessages::error("Request must be a JSON object"));
    }
    if (!request["command"].isString()) {
        return ProtocolMessages::toString(ProtocolMessages::error("Missing command"));
    }
    if (!request["transfer_id"].isString() || request["transfer_id"].asString().empty()) {
        return ProtocolMessages::toString(ProtocolMessages::error("Missing transfer_id"));
    }

    const std::string command = request["command"].asString();
    const std::string transferId = request["transfer_id"].asString();

    Json::Value reply;
    if (command == "prepare") {
        reply = handlePrepare(request, transferId);
    } else if (command == "status") {
        reply = handleStatus(transferId);
    } else if (command == "cancel") {
        reply = handleCancel(transferId);
    } else {
        LOG_WARN_COMP("Unknown control command: " + command, "ControlChannel");
        reply = ProtocolMessages::error("Unknown command: " + command);
    }
    return ProtocolMessages::toString(reply);
}

Json::Value ControlChannelHandler::handlePrepare(const Json::Value& request, const std::string& transferId) {
    const Json::Value& filename = request["filename"];
    const Json::Value& filesize = request["filesize"];

    if (!filename.isString() || PathUtils::safeBasename(filename.asString()).empty()) {
        return ProtocolMessages::error("Missing or invalid filename");
    }
    if (!filesize.isUInt64() || filesize.isBool()) {
        return ProtocolMessages::error("Missing or invalid filesize");
    }

    const std::string name = filename.asString();
    const uint64_t size = filesize.asUInt64();
    registry_.prepare(transferId, name, size, store_.encodedPath(name).string());

    Logger::instance().info("Transfer " + transferId + " prepared: " + name + " (" +
                            std::to_string(size) + " bytes)", "ControlChannel");
    return ProtocolMessages::reply("ready", transferId);
}

Json::Value ControlChannelHandler::handleStatus(const std::string& transferId) {
    auto status = registry_.status(transferId);
    return ProtocolMessages::reply(status ? toString(*status) : "unknown", transferId);
}

Json::Value ControlChannelHandler::handleCancel(const std::string& transferId) {
    if (registry_.cancel(transferId)) {
        Logger::instance().info("Transfer " + transferId + " cancelled", "ControlChannel");
    } else {
        LOG_DEBUG_COMP_IF("Cancel for unknown transfer " + transferId, "ControlChannel");
    }
    return ProtocolMessages::reply("cancelled", transferId);
}

} // namespace HuffStream
