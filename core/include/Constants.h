#pragma once

/**
 * @file Constants.h
 * @brief Centralized configuration constants for HuffStream
 *
 * Defaults for every tunable the configuration layer exposes, plus the
 * fixed protocol literals shared by client and server.
 */

#include <cstddef>
#include <cstdint>

namespace hfs::config {

// =============================================================================
// Network Configuration
// =============================================================================

/// Default data channel port
constexpr int DEFAULT_DATA_PORT = 9000;

/// Default control channel port
constexpr int DEFAULT_CONTROL_PORT = 9001;

/// Legacy single-channel port (0 = disabled)
constexpr int DEFAULT_LEGACY_PORT = 0;

/// TCP server backlog size
constexpr int TCP_BACKLOG = 10;

/// Accept loop poll interval (milliseconds)
constexpr int ACCEPT_POLL_INTERVAL_MS = 1000;

/// Chunk size for data channel streaming (bytes)
constexpr std::size_t DEFAULT_BUFFER_SIZE = 4096;

/// Upper bound on a single frame body (bytes)
constexpr std::uint32_t MAX_FRAME_SIZE = 16 * 1024 * 1024;  // 16MB

/// Default worker pool size / connection cap
constexpr std::size_t DEFAULT_MAX_CONNECTIONS = 16;

// =============================================================================
// Retry Configuration
// =============================================================================

/// Dial attempts before a connect failure is fatal
constexpr int DEFAULT_RETRY_ATTEMPTS = 3;

/// Fixed delay between dial attempts (milliseconds)
constexpr int DEFAULT_RETRY_DELAY_MS = 1000;

// =============================================================================
// Protocol Literals
// =============================================================================

constexpr const char* READY_SIGNAL = "READY";
constexpr const char* COMPLETE_SIGNAL = "COMPLETE";
constexpr const char* INCOMPLETE_SIGNAL = "INCOMPLETE";

constexpr const char* LEGACY_SUCCESS_REPLY = "File received and decoded successfully";
constexpr const char* LEGACY_FAILURE_REPLY = "Error processing file";

// =============================================================================
// Storage Configuration
// =============================================================================

constexpr const char* DEFAULT_SAVE_DIRECTORY = "received_files";

/// Maximum log file size before rotation (MB)
constexpr std::size_t DEFAULT_LOG_MAX_SIZE_MB = 100;

} // namespace hfs::config
