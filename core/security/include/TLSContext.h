#pragma once

#include <mutex>
#include <string>
#include <openssl/ssl.h>

namespace HuffStream {

/**
 * @brief OpenSSL context for one side of a TLS connection.
 *
 * Servers load a certificate and key; clients optionally load a CA bundle
 * and turn on peer verification, in which case the server name is also
 * checked against the certificate.
 */
class TLSContext {
public:
    enum class Mode {
        CLIENT,
        SERVER
    };

    explicit TLSContext(Mode mode);
    ~TLSContext();

    TLSContext(const TLSContext&) = delete;
    TLSContext& operator=(const TLSContext&) = delete;

    TLSContext(TLSContext&&) noexcept;
    TLSContext& operator=(TLSContext&&) noexcept;

    /**
     * @brief Create the SSL_CTX (TLS 1.2 minimum, strong ciphers only)
     * @return true on success
     */
    bool initialize();

    /**
     * @brief Load certificate and private key for server mode
     * @param certPath Path to PEM certificate file
     * @param keyPath Path to PEM private key file
     * @return true if both load and the key matches the certificate
     */
    bool loadCertificate(const std::string& certPath, const std::string& keyPath);

    /**
     * @brief Load trusted CA certificates
     * @param caPath PEM file or hashed certificate directory
     */
    bool loadCACertificates(const std::string& caPath);

    bool useSystemCertificates();

    /// Require a valid peer certificate (client mode)
    void setVerifyPeer(bool verify);
    bool verifyPeer() const { return verifyPeer_; }

    /**
     * @brief Attach a new SSL object to a connected socket
     * @param socket Connected socket descriptor (not owned)
     * @param hostname Server name for SNI and verification (client mode)
     * @return SSL pointer owned by the caller, nullptr on failure
     */
    SSL* wrapSocket(int socket, const std::string& hostname = "");

    /**
     * @brief Run SSL_accept or SSL_connect depending on the mode
     * @return false if the handshake or peer verification fails
     */
    bool handshake(SSL* ssl);

    Mode mode() const { return mode_; }
    SSL_CTX* getContext() const { return ctx_; }
    std::string getLastError() const;

private:
    void setLastError(const std::string& message);
    void reportError(const std::string& message);

    Mode mode_;
    SSL_CTX* ctx_{nullptr};
    bool verifyPeer_{false};
    std::string lastError_;
    mutable std::mutex errorMutex_;
};

} // namespace HuffStream
