#pragma once

/**
 * @file SocketGuard.h
 * @brief Owning handle for a socket descriptor
 *
 * Listening, accepted and dialed sockets live in a SocketGuard until a
 * Connection takes them over, so every early return closes the fd.
 */

#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace hfs {

class SocketGuard {
public:
    SocketGuard() noexcept = default;
    explicit SocketGuard(int fd) noexcept : fd_(fd) {}

    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    SocketGuard(SocketGuard&& other) noexcept : fd_(other.fd_) {
        other.fd_ = -1;
    }

    SocketGuard& operator=(SocketGuard&& other) noexcept {
        if (this != &other) {
            reset(other.fd_);
            other.fd_ = -1;
        }
        return *this;
    }

    ~SocketGuard() { reset(); }

    int get() const noexcept { return fd_; }
    explicit operator bool() const noexcept { return fd_ >= 0; }

    /// Close the held descriptor (if any) and adopt fd
    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

    /**
     * @brief Wake any thread blocked in recv()/accept() on this socket
     *
     * The descriptor stays open; its owner still closes it.
     */
    void shutdownBoth() noexcept {
        if (fd_ >= 0) {
            ::shutdown(fd_, SHUT_RDWR);
        }
    }

    /// Port the socket is bound to, -1 if it is not an IPv4 socket
    int localPort() const noexcept {
        sockaddr_in addr{};
        socklen_t len = sizeof(addr);
        if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0 || addr.sin_family != AF_INET) {
            return -1;
        }
        return ntohs(addr.sin_port);
    }

private:
    int fd_{-1};
};

} // namespace hfs
