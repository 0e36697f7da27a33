#pragma once

#include "ConnectionManager.h"
#include "Result.h"
#include "TransferSettings.h"
#include <json/json.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace HuffStream {

class TLSContext;

struct SendResult {
    std::string transferId;
    std::string remoteName;        ///< name registered with the server
    std::size_t originalSize{0};
    std::size_t payloadSize{0};
    double ratio{0.0};
    bool complete{false};          ///< server answered COMPLETE
};

/**
 * @brief Sending side of both protocols.
 *
 * Every control request uses its own short-lived connection; a file send
 * opens one control and one data connection.
 */
class TransferClient {
public:
    explicit TransferClient(ClientSettings settings);
    ~TransferClient();

    TransferClient(const TransferClient&) = delete;
    TransferClient& operator=(const TransferClient&) = delete;

    /// Build the TLS context if enabled; must succeed before any transfer
    hfs::Result<void> initialize();

    /**
     * @brief Encode a file and stream it under a fresh transfer id
     *
     * The server registers it as <stem>_encoded<ext>.
     */
    hfs::Result<SendResult> sendFile(const std::string& path);

    /**
     * @brief Prepare, hand-shake and stream an already encoded payload
     */
    hfs::Result<SendResult> sendPayload(const std::string& transferId, const std::string& remoteName,
                                        const std::vector<uint8_t>& payload);

    /// Server-side state name, or "unknown"
    hfs::Result<std::string> checkStatus(const std::string& transferId);

    hfs::Result<std::string> cancel(const std::string& transferId);

    /**
     * @brief Encode a file and send it over the legacy single channel
     * @return The server's reply line
     */
    hfs::Result<std::string> sendLegacy(const std::string& path);

    const ClientSettings& settings() const { return settings_; }

private:
    DialOptions dialOptions() const;
    hfs::Result<Json::Value> request(const Json::Value& message);

    ClientSettings settings_;
    std::shared_ptr<TLSContext> tls_;
};

} // namespace HuffStream
