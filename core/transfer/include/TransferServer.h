#pragma once

#include "ConnectionManager.h"
#include "ControlChannelHandler.h"
#include "DataChannelHandler.h"
#include "LegacyTransfer.h"
#include "PayloadStore.h"
#include "Result.h"
#include "TransferRegistry.h"
#include "TransferSettings.h"
#include <memory>

namespace HuffStream {

/**
 * @brief Receiving side: registry, channel handlers and listeners.
 */
class TransferServer {
public:
    explicit TransferServer(ServerSettings settings);
    ~TransferServer();

    TransferServer(const TransferServer&) = delete;
    TransferServer& operator=(const TransferServer&) = delete;

    /**
     * @brief Set up TLS (if enabled), the save directory and every listener
     *
     * On failure nothing is left listening.
     */
    hfs::Result<void> start();

    void stop();

    bool isRunning() const { return connections_ && connections_->isRunning(); }

    /// Bound ports, valid after start(); 0 when the listener is disabled
    int controlPort() const { return controlPort_; }
    int dataPort() const { return dataPort_; }
    int legacyPort() const { return legacyPort_; }

    TransferRegistry& registry() { return registry_; }
    const ServerSettings& settings() const { return settings_; }

    std::size_t activeConnections() const;
    uint64_t rejectedConnections() const;

private:
    hfs::Result<std::shared_ptr<TLSContext>> createTlsContext() const;

    ServerSettings settings_;
    TransferRegistry registry_;
    PayloadStore store_;
    ControlChannelHandler control_;
    DataChannelHandler data_;
    LegacyTransfer legacy_;

    std::unique_ptr<ConnectionManager> connections_;
    int controlPort_{0};
    int dataPort_{0};
    int legacyPort_{0};
};

} // namespace HuffStream
