#include "TransferServer.h"
#include "Logger.h"
#include "PathUtils.h"
#include "TLSContext.h"

namespace HuffStream {

TransferServer::TransferServer(ServerSettings settings)
    : settings_(std::move(settings))
    , store_(settings_.saveDirectory)
    , control_(registry_, store_)
    , data_(registry_, store_)
    , legacy_(store_, settings_.bufferSize)
{
}

TransferServer::~TransferServer() {
    stop();
}

hfs::Result<std::shared_ptr<TLSContext>> TransferServer::createTlsContext() const {
    if (!settings_.tls.enabled) {
        return std::shared_ptr<TLSContext>();
    }

    auto tls = std::make_shared<TLSContext>(TLSContext::Mode::SERVER);
    if (!tls->initialize()) {
        return hfs::Err<std::shared_ptr<TLSContext>>(hfs::ErrorCode::ConfigError, tls->getLastError());
    }
    if (!tls->loadCertificate(settings_.tls.certFile, settings_.tls.keyFile)) {
        return hfs::Err<std::shared_ptr<TLSContext>>(hfs::ErrorCode::MissingTLSMaterial, tls->getLastError());
    }
    return tls;
}

hfs::Result<void> TransferServer::start() {
    auto& logger = Logger::instance();

    if (isRunning()) {
        return hfs::Err(hfs::ErrorCode::InternalError, "Server already running");
    }

    auto valid = settings_.validate();
    if (!valid) {
        return valid;
    }

    auto dir = PathUtils::ensureDirectory(settings_.saveDirectory);
    if (!dir) {
        return dir;
    }

    auto tls = createTlsContext();
    if (!tls) {
        return tls.error();
    }

    connections_ = std::make_unique<ConnectionManager>(settings_.maxConnections, tls.value());

    auto control = connections_->listen("control", settings_.host, settings_.controlPort,
                                        [this](Connection& conn) { control_.serve(conn); });
    if (!control) {
        stop();
        return control.error();
    }
    controlPort_ = control.value();

    auto data = connections_->listen("data", settings_.host, settings_.dataPort,
                                     [this](Connection& conn) { data_.serve(conn); });
    if (!data) {
        stop();
        return data.error();
    }
    dataPort_ = data.value();

    if (settings_.legacyPort != 0) {
        auto legacy = connections_->listen("legacy", settings_.host, settings_.legacyPort,
                                           [this](Connection& conn) { legacy_.serve(conn); });
        if (!legacy) {
            stop();
            return legacy.error();
        }
        legacyPort_ = legacy.value();
    }

    logger.info("Transfer server ready (control " + std::to_string(controlPort_) + ", data " +
                std::to_string(dataPort_) +
                (legacyPort_ ? ", legacy " + std::to_string(legacyPort_) : std::string()) +
                (settings_.tls.enabled ? ", TLS" : "") + "), saving to " + settings_.saveDirectory, "Server");
    return hfs::Ok();
}

void TransferServer::stop() {
    if (connections_) {
        connections_->stop();
    }
}

std::size_t TransferServer::activeConnections() const {
    return connections_ ? connections_->activeConnections() : 0;
}

uint64_t TransferServer::rejectedConnections() const {
    return connections_ ? connections_->rejectedConnections() : 0;
}

} // namespace HuffStream
