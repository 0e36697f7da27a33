#pragma once

#include <optional>
#include <string>

namespace HuffStream {

/**
 * prepared -> receiving -> received -> decoded | decode_failed
 *                       -> incomplete
 * any -> cancelled
 */
enum class TransferStatus {
    Prepared,
    Receiving,
    Received,
    Decoded,
    DecodeFailed,
    Incomplete,
    Cancelled
};

inline const char* toString(TransferStatus status) {
    switch (status) {
        case TransferStatus::Prepared: return "prepared";
        case TransferStatus::Receiving: return "receiving";
        case TransferStatus::Received: return "received";
        case TransferStatus::Decoded: return "decoded";
        case TransferStatus::DecodeFailed: return "decode_failed";
        case TransferStatus::Incomplete: return "incomplete";
        case TransferStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

inline std::optional<TransferStatus> parseTransferStatus(const std::string& name) {
    if (name == "prepared") return TransferStatus::Prepared;
    if (name == "receiving") return TransferStatus::Receiving;
    if (name == "received") return TransferStatus::Received;
    if (name == "decoded") return TransferStatus::Decoded;
    if (name == "decode_failed") return TransferStatus::DecodeFailed;
    if (name == "incomplete") return TransferStatus::Incomplete;
    if (name == "cancelled") return TransferStatus::Cancelled;
    return std::nullopt;
}

inline bool isTerminal(TransferStatus status) {
    return status == TransferStatus::Decoded ||
           status == TransferStatus::DecodeFailed ||
           status == TransferStatus::Incomplete ||
           status == TransferStatus::Cancelled;
}

} // namespace HuffStream
