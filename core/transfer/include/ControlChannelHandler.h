#pragma once

#include "PayloadStore.h"
#include "TransferRegistry.h"
#include <json/json.h>
#include <string>

namespace HuffStream {

class Connection;

/**
 * @brief Serves prepare / status / cancel requests on the control channel.
 *
 * Each request frame gets exactly one reply frame. Bad requests get an
 * error reply and the connection stays open; it closes when the peer
 * closes or sends an oversized frame.
 */
class ControlChannelHandler {
public:
    ControlChannelHandler(TransferRegistry& registry, const PayloadStore& store);

    /// Request loop for one connection
    void serve(Connection& connection);

    /// Reply text for one request text
    std::string handleFrame(const std::string& frame);

private:
    Json::Value handlePrepare(const Json::Value& request, const std::string& transferId);
    Json::Value handleStatus(const std::string& transferId);
    Json::Value handleCancel(const std::string& transferId);

    TransferRegistry& registry_;
    const PayloadStore& store_;
};

} // namespace HuffStream
