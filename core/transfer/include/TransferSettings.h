#pragma once

#include "Config.h"
#include "Constants.h"
#include "Result.h"
#include <cstddef>
#include <string>
#include <vector>

namespace HuffStream {

struct TlsSettings {
    bool enabled{false};
    bool verify{false};
    std::string certFile;
    std::string keyFile;
    std::string caFile;
};

/**
 * @brief Server parameters read from the key=value configuration.
 *
 * Port 0 binds an ephemeral port; legacy_port 0 disables the legacy
 * listener.
 */
struct ServerSettings {
    std::string host{"0.0.0.0"};
    int controlPort{hfs::config::DEFAULT_CONTROL_PORT};
    int dataPort{hfs::config::DEFAULT_DATA_PORT};
    int legacyPort{hfs::config::DEFAULT_LEGACY_PORT};
    std::size_t bufferSize{hfs::config::DEFAULT_BUFFER_SIZE};
    std::size_t maxConnections{hfs::config::DEFAULT_MAX_CONNECTIONS};
    std::string saveDirectory{hfs::config::DEFAULT_SAVE_DIRECTORY};
    TlsSettings tls;

    /// Fails with InvalidConfig naming the offending key
    static hfs::Result<ServerSettings> fromConfig(const Config& config);

    /// Fails with InvalidConfig, or MissingTLSMaterial when TLS lacks a certificate or key
    hfs::Result<void> validate() const;
};

struct ClientSettings {
    std::string host{"127.0.0.1"};
    int controlPort{hfs::config::DEFAULT_CONTROL_PORT};
    int dataPort{hfs::config::DEFAULT_DATA_PORT};
    int legacyPort{hfs::config::DEFAULT_LEGACY_PORT};
    std::size_t bufferSize{hfs::config::DEFAULT_BUFFER_SIZE};
    int retryAttempts{hfs::config::DEFAULT_RETRY_ATTEMPTS};
    int retryDelayMs{hfs::config::DEFAULT_RETRY_DELAY_MS};
    TlsSettings tls;

    static hfs::Result<ClientSettings> fromConfig(const Config& config);
    hfs::Result<void> validate() const;
};

/**
 * @brief Every key the configuration layer understands
 *
 * Used for environment overrides (HUFFSTREAM_<KEY>).
 */
const std::vector<std::string>& knownConfigKeys();

/**
 * @brief Apply log_file, log_level and log_max_size_mb to the Logger
 */
hfs::Result<void> applyLoggingConfig(const Config& config);

} // namespace HuffStream
