#pragma once

#include "Constants.h"
#include "Result.h"
#include "SocketGuard.h"
#include <openssl/ssl.h>
#include <sys/types.h>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace HuffStream {

/**
 * @brief Established bidirectional byte stream, plain or TLS.
 *
 * Frame helpers write and read a 4-byte big-endian length followed by the
 * body. Failures map to false / std::nullopt; lastError() tells a closed
 * peer apart from an oversized frame.
 */
class Connection {
public:
    virtual ~Connection() = default;

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /**
     * @return Bytes read, 0 when the peer closed, -1 on error
     */
    virtual ssize_t read(void* buffer, size_t maxSize) = 0;

    /**
     * @return Bytes written, -1 on error
     */
    virtual ssize_t write(const void* data, size_t size) = 0;

    /**
     * @brief Shut the socket down so blocked reads return.
     *
     * May be called from any thread; the owner still releases the connection.
     */
    virtual void abort() = 0;

    virtual bool isTLS() const { return false; }

    bool sendAll(const void* data, size_t size);

    /// Fill exactly size bytes; false on close or error
    bool readExact(void* buffer, size_t size);

    bool sendFrame(const std::vector<uint8_t>& body);
    bool sendFrame(const std::string& body);

    /**
     * @brief Read one frame.
     * @return std::nullopt on close, error, or a length above maxSize
     */
    std::optional<std::vector<uint8_t>> receiveFrame(uint32_t maxSize = hfs::config::MAX_FRAME_SIZE);
    std::optional<std::string> receiveTextFrame(uint32_t maxSize = hfs::config::MAX_FRAME_SIZE);

    /// Reason for the last failed frame operation, Success otherwise
    hfs::ErrorCode lastError() const { return lastError_; }

    const std::string& peerAddress() const { return peerAddress_; }
    void setPeerAddress(const std::string& address) { peerAddress_ = address; }

protected:
    Connection() = default;

private:
    hfs::ErrorCode lastError_{hfs::ErrorCode::Success};
    std::string peerAddress_;
};

/**
 * @brief Plain TCP connection over an owned socket.
 */
class SocketConnection : public Connection {
public:
    explicit SocketConnection(hfs::SocketGuard socket);

    ssize_t read(void* buffer, size_t maxSize) override;
    ssize_t write(const void* data, size_t size) override;
    void abort() override;

    int fd() const { return socket_.get(); }

private:
    hfs::SocketGuard socket_;
};

/**
 * @brief TLS connection; owns both the SSL object and the socket.
 *
 * The handshake has already completed when one is constructed.
 */
class TlsConnection : public Connection {
public:
    TlsConnection(SSL* ssl, hfs::SocketGuard socket);
    ~TlsConnection() override;

    ssize_t read(void* buffer, size_t maxSize) override;
    ssize_t write(const void* data, size_t size) override;
    void abort() override;
    bool isTLS() const override { return true; }

    std::string protocolVersion() const;

private:
    SSL* ssl_{nullptr};
    hfs::SocketGuard socket_;
    bool aborted_{false};
    std::mutex abortMutex_;
};

} // namespace HuffStream
