#include "Connection.h"
#include "Logger.h"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <sys/socket.h>

namespace HuffStream {

bool Connection::sendAll(const void* data, size_t size) {
    const auto* cursor = static_cast<const uint8_t*>(data);
    size_t remaining = size;
    while (remaining > 0) {
        ssize_t sent = write(cursor, remaining);
        if (sent <= 0) {
            lastError_ = hfs::ErrorCode::SendFailed;
            return false;
        }
        cursor += sent;
        remaining -= static_cast<size_t>(sent);
    }
    return true;
}

bool Connection::readExact(void* buffer, size_t size) {
    auto* cursor = static_cast<uint8_t*>(buffer);
    size_t remaining = size;
    while (remaining > 0) {
        ssize_t received = read(cursor, remaining);
        if (received == 0) {
            lastError_ = hfs::ErrorCode::ConnectionClosed;
            return false;
        }
        if (received < 0) {
            lastError_ = hfs::ErrorCode::ReceiveFailed;
            return false;
        }
        cursor += received;
        remaining -= static_cast<size_t>(received);
    }
    return true;
}

bool Connection::sendFrame(const std::vector<uint8_t>& body) {
    if (body.size() > hfs::config::MAX_FRAME_SIZE) {
        lastError_ = hfs::ErrorCode::FrameTooLarge;
        return false;
    }

    uint32_t len = htonl(static_cast<uint32_t>(body.size()));
    if (!sendAll(&len, sizeof(len))) {
        return false;
    }
    return body.empty() || sendAll(body.data(), body.size());
}

bool Connection::sendFrame(const std::string& body) {
    return sendFrame(std::vector<uint8_t>(body.begin(), body.end()));
}

std::optional<std::vector<uint8_t>> Connection::receiveFrame(uint32_t maxSize) {
    uint32_t netLen = 0;
    if (!readExact(&netLen, sizeof(netLen))) {
        return std::nullopt;
    }

    uint32_t len = ntohl(netLen);
    if (len > maxSize) {
        lastError_ = hfs::ErrorCode::FrameTooLarge;
        Logger::instance().log(LogLevel::WARN,
            "Frame of " + std::to_string(len) + " bytes from " + peerAddress_ +
            " exceeds limit of " + std::to_string(maxSize), "Connection");
        return std::nullopt;
    }

    std::vector<uint8_t> body(len);
    if (len > 0 && !readExact(body.data(), len)) {
        return std::nullopt;
    }

    lastError_ = hfs::ErrorCode::Success;
    return body;
}

std::optional<std::string> Connection::receiveTextFrame(uint32_t maxSize) {
    auto body = receiveFrame(maxSize);
    if (!body) {
        return std::nullopt;
    }
    return std::string(body->begin(), body->end());
}

SocketConnection::SocketConnection(hfs::SocketGuard socket)
    : socket_(std::move(socket)) {}

ssize_t SocketConnection::read(void* buffer, size_t maxSize) {
    for (;;) {
        ssize_t n = ::recv(socket_.get(), buffer, maxSize, 0);
        if (n < 0 && errno == EINTR) continue;
        return n;
    }
}

ssize_t SocketConnection::write(const void* data, size_t size) {
    for (;;) {
        ssize_t n = ::send(socket_.get(), data, size, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        return n;
    }
}

void SocketConnection::abort() {
    socket_.shutdownBoth();
}

TlsConnection::TlsConnection(SSL* ssl, hfs::SocketGuard socket)
    : ssl_(ssl), socket_(std::move(socket)) {}

TlsConnection::~TlsConnection() {
    if (ssl_) {
        bool aborted;
        {
            std::lock_guard<std::mutex> lock(abortMutex_);
            aborted = aborted_;
        }
        if (!aborted) {
            // One-way close_notify; the peer's reply is not awaited
            SSL_shutdown(ssl_);
        }
        SSL_free(ssl_);
        ssl_ = nullptr;
    }
}

ssize_t TlsConnection::read(void* buffer, size_t maxSize) {
    int n = SSL_read(ssl_, buffer, static_cast<int>(maxSize));
    if (n > 0) {
        return n;
    }

    int err = SSL_get_error(ssl_, n);
    if (err == SSL_ERROR_ZERO_RETURN) {
        return 0;
    }
    return -1;
}

ssize_t TlsConnection::write(const void* data, size_t size) {
    int n = SSL_write(ssl_, data, static_cast<int>(size));
    return n > 0 ? n : -1;
}

void TlsConnection::abort() {
    std::lock_guard<std::mutex> lock(abortMutex_);
    aborted_ = true;
    socket_.shutdownBoth();
}

std::string TlsConnection::protocolVersion() const {
    return SSL_get_version(ssl_);
}

} // namespace HuffStream
