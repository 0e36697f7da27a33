#include "ConnectionManager.h"
#include "Logger.h"
#include "TLSContext.h"
#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>

namespace HuffStream {

namespace {

    std::string describe(const struct sockaddr_in& addr) {
        char ip[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &addr.sin_addr, ip, INET_ADDRSTRLEN);
        return std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
    }

    // One pass over the resolved addresses; the caller owns the retry policy
    hfs::SocketGuard connectOnce(const std::string& host, int port, std::string& error) {
        struct addrinfo hints;
        memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* results = nullptr;
        std::string service = std::to_string(port);
        int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &results);
        if (rc != 0) {
            error = "Cannot resolve " + host + ": " + gai_strerror(rc);
            return hfs::SocketGuard();
        }

        hfs::SocketGuard sock;
        for (auto* ai = results; ai != nullptr; ai = ai->ai_next) {
            hfs::SocketGuard candidate(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
            if (!candidate) {
                error = "Failed to create socket: " + std::string(strerror(errno));
                continue;
            }
            if (::connect(candidate.get(), ai->ai_addr, ai->ai_addrlen) == 0) {
                sock = std::move(candidate);
                break;
            }
            error = "Failed to connect to " + host + ":" + service + ": " + std::string(strerror(errno));
        }

        freeaddrinfo(results);
        return sock;
    }

} // namespace

ConnectionManager::ConnectionManager(std::size_t maxConnections, std::shared_ptr<TLSContext> tls)
    : tls_(std::move(tls))
    , pool_(maxConnections == 0 ? hfs::config::DEFAULT_MAX_CONNECTIONS : maxConnections)
{
}

ConnectionManager::~ConnectionManager() {
    stop();
}

hfs::Result<int> ConnectionManager::listen(const std::string& name, const std::string& host,
                                           int port, Handler handler) {
    auto& logger = Logger::instance();

    if (!running_) {
        return hfs::Err<int>(hfs::ErrorCode::TransportError, "Connection manager is stopped");
    }

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        return hfs::Err<int>(hfs::ErrorCode::InvalidConfig, "Invalid bind address: " + host);
    }

    hfs::SocketGuard sock(::socket(AF_INET, SOCK_STREAM, 0));
    if (!sock) {
        return hfs::Err<int>(hfs::ErrorCode::TransportError,
                             "Failed to create " + name + " socket: " + std::string(strerror(errno)));
    }

    int opt = 1;
    if (setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        return hfs::Err<int>(hfs::ErrorCode::TransportError,
                             "Failed to set socket options: " + std::string(strerror(errno)));
    }

    if (bind(sock.get(), reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        return hfs::Err<int>(hfs::ErrorCode::TransportError,
                             "Failed to bind " + name + " socket to " + host + ":" +
                             std::to_string(port) + ": " + std::string(strerror(errno)));
    }

    if (::listen(sock.get(), hfs::config::TCP_BACKLOG) < 0) {
        return hfs::Err<int>(hfs::ErrorCode::TransportError,
                             "Failed to listen on " + name + " socket: " + std::string(strerror(errno)));
    }

    int boundPort = sock.localPort();
    if (boundPort < 0) {
        return hfs::Err<int>(hfs::ErrorCode::TransportError,
                             "getsockname failed: " + std::string(strerror(errno)));
    }

    auto listener = std::make_unique<Listener>();
    listener->name = name;
    listener->port = boundPort;
    listener->socket = std::move(sock);
    listener->handler = std::move(handler);

    Listener* raw = listener.get();
    {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        listeners_.push_back(std::move(listener));
        raw->thread = std::thread(&ConnectionManager::acceptLoop, this, raw);
    }

    logger.log(LogLevel::INFO, "Listening for " + name + " connections on " + host + ":" +
               std::to_string(boundPort), "ConnectionManager");
    return boundPort;
}

void ConnectionManager::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    auto& logger = Logger::instance();
    logger.log(LogLevel::INFO, "Stopping connection manager", "ConnectionManager");

    {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        for (auto& listener : listeners_) {
            listener->socket.shutdownBoth();
        }
        for (auto& listener : listeners_) {
            if (listener->thread.joinable()) {
                listener->thread.join();
            }
        }
        listeners_.clear();
    }

    // Unblock every handler; their sockets are closed by the workers
    std::size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(liveMutex_);
        count = liveSockets_.size();
        for (const auto& pair : liveSockets_) {
            ::shutdown(pair.second, SHUT_RDWR);
        }
    }

    pool_.shutdown();

    logger.log(LogLevel::INFO, "Connection manager stopped, shut down " + std::to_string(count) +
               " connections", "ConnectionManager");
}

std::size_t ConnectionManager::activeConnections() const {
    std::lock_guard<std::mutex> lock(liveMutex_);
    return liveSockets_.size();
}

void ConnectionManager::acceptLoop(Listener* listener) {
    auto& logger = Logger::instance();
    const int listenFd = listener->socket.get();

    while (running_) {
        fd_set readfds;
        FD_ZERO(&readfds);
        FD_SET(listenFd, &readfds);

        struct timeval tv;
        tv.tv_sec = hfs::config::ACCEPT_POLL_INTERVAL_MS / 1000;
        tv.tv_usec = (hfs::config::ACCEPT_POLL_INTERVAL_MS % 1000) * 1000;

        int activity = select(listenFd + 1, &readfds, nullptr, nullptr, &tv);
        if (activity <= 0 || !running_) continue;

        struct sockaddr_in clientAddr;
        socklen_t len = sizeof(clientAddr);
        int clientSocket = accept(listenFd, reinterpret_cast<struct sockaddr*>(&clientAddr), &len);
        if (clientSocket < 0) {
            if (running_ && errno != EINTR && errno != ECONNABORTED) {
                logger.log(LogLevel::WARN, "Accept failed on " + listener->name + " port: " +
                           std::string(strerror(errno)), "ConnectionManager");
            }
            continue;
        }

        std::string peer = describe(clientAddr);
        auto socket = std::make_shared<hfs::SocketGuard>(clientSocket);

        bool accepted = pool_.trySubmit([this, listener, socket, peer]() {
            serve(listener, *socket, peer);
        });

        if (!accepted) {
            ++rejected_;
            logger.log(LogLevel::WARN, "Rejected " + listener->name + " connection from " + peer +
                       ": connection limit reached", "ConnectionManager");
            socket->reset();
            continue;
        }

        if (logger.isDebugEnabled()) {
            logger.log(LogLevel::DEBUG, "New " + listener->name + " connection from " + peer,
                       "ConnectionManager");
        }
    }
}

void ConnectionManager::serve(Listener* listener, hfs::SocketGuard& socket, const std::string& peer) {
    auto& logger = Logger::instance();

    uint64_t id = 0;
    if (!registerSocket(socket.get(), id)) {
        return;
    }

    std::unique_ptr<Connection> connection;
    if (tls_) {
        SSL* ssl = tls_->wrapSocket(socket.get());
        if (!ssl || !tls_->handshake(ssl)) {
            if (ssl) SSL_free(ssl);
            logger.log(LogLevel::WARN, "TLS handshake with " + peer + " failed: " + tls_->getLastError(),
                       "ConnectionManager");
            unregisterSocket(id);
            return;
        }
        connection = std::make_unique<TlsConnection>(ssl, std::move(socket));
    } else {
        connection = std::make_unique<SocketConnection>(std::move(socket));
    }
    connection->setPeerAddress(peer);

    try {
        listener->handler(*connection);
    } catch (const std::exception& e) {
        logger.log(LogLevel::ERROR, "Handler for " + listener->name + " connection from " + peer +
                   " failed: " + e.what(), "ConnectionManager");
    }

    unregisterSocket(id);
}

bool ConnectionManager::registerSocket(int fd, uint64_t& id) {
    std::lock_guard<std::mutex> lock(liveMutex_);
    if (!running_) {
        return false;
    }
    id = nextId_++;
    liveSockets_[id] = fd;
    return true;
}

void ConnectionManager::unregisterSocket(uint64_t id) {
    std::lock_guard<std::mutex> lock(liveMutex_);
    liveSockets_.erase(id);
}

hfs::Result<std::unique_ptr<Connection>> ConnectionManager::dial(const std::string& host, int port,
                                                                 const DialOptions& options) {
    using ConnectionResult = hfs::Result<std::unique_ptr<Connection>>;
    auto& logger = Logger::instance();

    const int attempts = options.retryAttempts < 1 ? 1 : options.retryAttempts;
    std::string error;
    hfs::SocketGuard sock;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        sock = connectOnce(host, port, error);
        if (sock) {
            break;
        }

        logger.log(LogLevel::WARN, "Connection attempt " + std::to_string(attempt) + "/" +
                   std::to_string(attempts) + " failed: " + error, "ConnectionManager");
        if (attempt < attempts) {
            std::this_thread::sleep_for(std::chrono::milliseconds(options.retryDelayMs));
        }
    }

    if (!sock) {
        logger.log(LogLevel::ERROR, "Giving up on " + host + ":" + std::to_string(port) + " after " +
                   std::to_string(attempts) + " attempts", "ConnectionManager");
        return hfs::Err<std::unique_ptr<Connection>>(hfs::ErrorCode::ConnectionFailed, error);
    }

    std::unique_ptr<Connection> connection;
    if (options.tls) {
        const std::string& serverName = options.serverName.empty() ? host : options.serverName;
        SSL* ssl = options.tls->wrapSocket(sock.get(), serverName);
        if (!ssl || !options.tls->handshake(ssl)) {
            if (ssl) SSL_free(ssl);
            return hfs::Err<std::unique_ptr<Connection>>(hfs::ErrorCode::HandshakeFailed,
                                                         options.tls->getLastError());
        }
        connection = std::make_unique<TlsConnection>(ssl, std::move(sock));
    } else {
        connection = std::make_unique<SocketConnection>(std::move(sock));
    }

    connection->setPeerAddress(host + ":" + std::to_string(port));
    if (logger.isDebugEnabled()) {
        logger.log(LogLevel::DEBUG, "Connected to " + connection->peerAddress() +
                   (connection->isTLS() ? " (TLS)" : ""), "ConnectionManager");
    }
    return ConnectionResult(std::move(connection));
}

} // namespace HuffStream
