#pragma once

#include "PayloadStore.h"
#include "TransferRegistry.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace HuffStream {

class Connection;

/**
 * @brief Receives one transfer per data channel connection.
 *
 *   <- {"transfer_id":id}
 *   -> READY                        (only for a prepared transfer)
 *   <- chunk frames until declaredSize bytes or close
 *   -> COMPLETE | INCOMPLETE
 *
 * An unknown, already claimed or cancelled transfer id closes the
 * connection without a reply; a cancelled transfer stays cancelled.
 * A complete payload is stored and decoded before COMPLETE is sent;
 * decode failures are recorded on the transfer, not reported to the
 * sender.
 */
class DataChannelHandler {
public:
    DataChannelHandler(TransferRegistry& registry, const PayloadStore& store);

    void serve(Connection& connection);

private:
    std::optional<std::string> readTransferId(Connection& connection);

    /// Accumulate chunks until `expected` bytes arrived or the stream ended
    std::vector<uint8_t> receiveChunks(Connection& connection, uint64_t expected);

    void finishTransfer(const TransferRecord& record, const std::vector<uint8_t>& payload);

    TransferRegistry& registry_;
    const PayloadStore& store_;
};

} // namespace HuffStream
