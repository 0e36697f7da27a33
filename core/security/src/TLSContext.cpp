#include "TLSContext.h"
#include "Logger.h"
#include <openssl/err.h>
#include <openssl/x509_vfy.h>
#include <sys/stat.h>

namespace HuffStream {

namespace {
    // TLS 1.3 suites plus forward-secret AEAD TLS 1.2 ciphers
    const char* DEFAULT_CIPHERS =
        "TLS_AES_256_GCM_SHA384:"
        "TLS_CHACHA20_POLY1305_SHA256:"
        "TLS_AES_128_GCM_SHA256:"
        "ECDHE-ECDSA-AES256-GCM-SHA384:"
        "ECDHE-RSA-AES256-GCM-SHA384:"
        "ECDHE-ECDSA-CHACHA20-POLY1305:"
        "ECDHE-RSA-CHACHA20-POLY1305:"
        "ECDHE-ECDSA-AES128-GCM-SHA256:"
        "ECDHE-RSA-AES128-GCM-SHA256";

    std::string getOpenSSLError() {
        unsigned long err = ERR_get_error();
        if (err == 0) return "Unknown error";

        char buf[256];
        ERR_error_string_n(err, buf, sizeof(buf));
        return std::string(buf);
    }
}

TLSContext::TLSContext(Mode mode) : mode_(mode) {}

TLSContext::~TLSContext() {
    if (ctx_) {
        SSL_CTX_free(ctx_);
        ctx_ = nullptr;
    }
}

TLSContext::TLSContext(TLSContext&& other) noexcept
    : mode_(other.mode_)
    , ctx_(other.ctx_)
    , verifyPeer_(other.verifyPeer_)
    , lastError_(other.getLastError())
{
    other.ctx_ = nullptr;
}

TLSContext& TLSContext::operator=(TLSContext&& other) noexcept {
    if (this != &other) {
        if (ctx_) SSL_CTX_free(ctx_);

        mode_ = other.mode_;
        ctx_ = other.ctx_;
        verifyPeer_ = other.verifyPeer_;
        setLastError(other.getLastError());

        other.ctx_ = nullptr;
    }
    return *this;
}

bool TLSContext::initialize() {
    auto& logger = Logger::instance();

    const SSL_METHOD* method = (mode_ == Mode::SERVER)
        ? TLS_server_method()
        : TLS_client_method();

    ctx_ = SSL_CTX_new(method);
    if (!ctx_) {
        reportError("Failed to create SSL context: " + getOpenSSLError());
        return false;
    }

    SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);
    SSL_CTX_set_max_proto_version(ctx_, TLS1_3_VERSION);

    if (SSL_CTX_set_cipher_list(ctx_, DEFAULT_CIPHERS) != 1) {
        logger.log(LogLevel::WARN, "Failed to set cipher list, using defaults", "TLSContext");
    }

    SSL_CTX_set_options(ctx_,
        SSL_OP_NO_SSLv2 |
        SSL_OP_NO_SSLv3 |
        SSL_OP_NO_TLSv1 |
        SSL_OP_NO_TLSv1_1 |
        SSL_OP_NO_COMPRESSION |
        SSL_OP_CIPHER_SERVER_PREFERENCE |
        SSL_OP_NO_TICKET
    );
    SSL_CTX_set_mode(ctx_, SSL_MODE_AUTO_RETRY);

    setVerifyPeer(verifyPeer_);

    logger.log(LogLevel::DEBUG, "TLS context initialized successfully", "TLSContext");
    return true;
}

bool TLSContext::loadCertificate(const std::string& certPath, const std::string& keyPath) {
    if (!ctx_) {
        setLastError("TLS context not initialized");
        return false;
    }

    if (SSL_CTX_use_certificate_chain_file(ctx_, certPath.c_str()) != 1) {
        reportError("Failed to load certificate: " + getOpenSSLError());
        return false;
    }

    if (SSL_CTX_use_PrivateKey_file(ctx_, keyPath.c_str(), SSL_FILETYPE_PEM) != 1) {
        reportError("Failed to load private key: " + getOpenSSLError());
        return false;
    }

    if (SSL_CTX_check_private_key(ctx_) != 1) {
        reportError("Private key does not match certificate");
        return false;
    }

    Logger::instance().log(LogLevel::INFO, "Loaded TLS certificate: " + certPath, "TLSContext");
    return true;
}

bool TLSContext::loadCACertificates(const std::string& caPath) {
    if (!ctx_) {
        setLastError("TLS context not initialized");
        return false;
    }

    struct stat st;
    if (stat(caPath.c_str(), &st) != 0) {
        reportError("CA path does not exist: " + caPath);
        return false;
    }

    int result;
    if (S_ISDIR(st.st_mode)) {
        result = SSL_CTX_load_verify_locations(ctx_, nullptr, caPath.c_str());
    } else {
        result = SSL_CTX_load_verify_locations(ctx_, caPath.c_str(), nullptr);
    }

    if (result != 1) {
        reportError("Failed to load CA certificates: " + getOpenSSLError());
        return false;
    }

    Logger::instance().log(LogLevel::INFO, "Loaded CA certificates from: " + caPath, "TLSContext");
    return true;
}

bool TLSContext::useSystemCertificates() {
    if (!ctx_) {
        setLastError("TLS context not initialized");
        return false;
    }

    if (SSL_CTX_set_default_verify_paths(ctx_) != 1) {
        reportError("Failed to load system certificates: " + getOpenSSLError());
        return false;
    }

    Logger::instance().log(LogLevel::DEBUG, "Using system certificate store", "TLSContext");
    return true;
}

void TLSContext::setVerifyPeer(bool verify) {
    verifyPeer_ = verify;
    if (ctx_) {
        SSL_CTX_set_verify(ctx_, verify ? SSL_VERIFY_PEER : SSL_VERIFY_NONE, nullptr);
    }
}

SSL* TLSContext::wrapSocket(int socket, const std::string& hostname) {
    if (!ctx_) {
        setLastError("TLS context not initialized");
        return nullptr;
    }

    SSL* ssl = SSL_new(ctx_);
    if (!ssl) {
        reportError("Failed to create SSL object: " + getOpenSSLError());
        return nullptr;
    }

    if (SSL_set_fd(ssl, socket) != 1) {
        reportError("Failed to attach socket: " + getOpenSSLError());
        SSL_free(ssl);
        return nullptr;
    }

    if (mode_ == Mode::CLIENT && !hostname.empty()) {
        if (SSL_set_tlsext_host_name(ssl, hostname.c_str()) != 1 ||
            (verifyPeer_ && SSL_set1_host(ssl, hostname.c_str()) != 1)) {
            reportError("Failed to set server name " + hostname + ": " + getOpenSSLError());
            SSL_free(ssl);
            return nullptr;
        }
    }

    return ssl;
}

bool TLSContext::handshake(SSL* ssl) {
    if (!ssl) {
        setLastError("No SSL object");
        return false;
    }

    int rc = (mode_ == Mode::SERVER) ? SSL_accept(ssl) : SSL_connect(ssl);
    if (rc == 1) {
        return true;
    }

    std::string message;
    long verifyResult = SSL_get_verify_result(ssl);
    if (verifyResult != X509_V_OK) {
        message = std::string("Certificate verification failed: ") +
                  X509_verify_cert_error_string(verifyResult);
    } else {
        message = "TLS handshake failed: " + getOpenSSLError();
    }
    setLastError(message);
    Logger::instance().log(LogLevel::WARN, message, "TLSContext");
    return false;
}

std::string TLSContext::getLastError() const {
    std::lock_guard<std::mutex> lock(errorMutex_);
    return lastError_;
}

void TLSContext::setLastError(const std::string& message) {
    std::lock_guard<std::mutex> lock(errorMutex_);
    lastError_ = message;
}

void TLSContext::reportError(const std::string& message) {
    setLastError(message);
    Logger::instance().log(LogLevel::ERROR, message, "TLSContext");
}

} // namespace HuffStream
