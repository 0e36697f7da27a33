#pragma once

#include "Connection.h"
#include "Constants.h"
#include "Result.h"
#include "SocketGuard.h"
#include "ThreadPool.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace HuffStream {

class TLSContext;

/**
 * @brief Dial-side parameters.
 */
struct DialOptions {
    int retryAttempts{hfs::config::DEFAULT_RETRY_ATTEMPTS};
    int retryDelayMs{hfs::config::DEFAULT_RETRY_DELAY_MS};
    std::shared_ptr<TLSContext> tls;     ///< client-mode context, null for plain TCP
    std::string serverName;              ///< SNI / verification name, defaults to the host
};

/**
 * @brief Accepts connections on any number of ports and dials out.
 *
 * Each listening port gets its own accept thread. Accepted sockets are
 * wrapped in TLS when a server context is set and handed to the port's
 * handler on a worker of a bounded ThreadPool; when every worker is busy
 * the connection is closed immediately. Live sockets are tracked so stop()
 * can shut them down without waiting for their handlers.
 */
class ConnectionManager {
public:
    using Handler = std::function<void(Connection&)>;

    /**
     * @param maxConnections Worker count and cap on concurrent connections
     * @param tls Server-mode context, null for plain TCP
     */
    explicit ConnectionManager(std::size_t maxConnections,
                               std::shared_ptr<TLSContext> tls = nullptr);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Bind, listen and start accepting on host:port
     * @param name Channel name used in log lines ("control", "data", ...)
     * @param port Port to bind, 0 for an ephemeral port
     * @return The bound port
     */
    hfs::Result<int> listen(const std::string& name, const std::string& host, int port, Handler handler);

    /**
     * @brief Stop accepting and shut every live connection down.
     *
     * In-flight handlers are not drained; they observe closed sockets and
     * return. Idempotent.
     */
    void stop();

    bool isRunning() const { return running_; }

    /// Connections currently being served
    std::size_t activeConnections() const;

    /// Connections refused because the pool was saturated
    uint64_t rejectedConnections() const { return rejected_; }

    /**
     * @brief Connect to host:port, retrying with a fixed delay.
     *
     * Fails with ConnectionFailed once every attempt is used, or
     * HandshakeFailed if the TLS handshake is rejected (not retried).
     */
    static hfs::Result<std::unique_ptr<Connection>> dial(const std::string& host, int port,
                                                         const DialOptions& options = DialOptions());

private:
    struct Listener {
        std::string name;
        int port{0};
        hfs::SocketGuard socket;
        Handler handler;
        std::thread thread;
    };

    void acceptLoop(Listener* listener);
    void serve(Listener* listener, hfs::SocketGuard& socket, const std::string& peer);

    bool registerSocket(int fd, uint64_t& id);
    void unregisterSocket(uint64_t id);

    std::shared_ptr<TLSContext> tls_;
    ThreadPool pool_;

    std::vector<std::unique_ptr<Listener>> listeners_;
    std::mutex listenersMutex_;

    std::unordered_map<uint64_t, int> liveSockets_;
    mutable std::mutex liveMutex_;
    uint64_t nextId_{1};

    std::atomic<bool> running_{true};
    std::atomic<uint64_t> rejected_{0};
};

} // namespace HuffStream
