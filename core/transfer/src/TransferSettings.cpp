#include "TransferSettings.h"
#include "Logger.h"
#include <cctype>
#include <filesystem>
#include <unordered_map>

namespace HuffStream {

namespace {

    bool parseInt(const std::string& value, long long& out) {
        if (value.empty()) return false;
        try {
            size_t consumed = 0;
            out = std::stoll(value, &consumed);
            return consumed == value.size();
        } catch (const std::exception&) {
            return false;
        }
    }

    Config::Validator intRange(long long min, long long max) {
        return [min, max](const std::string&, const std::string& value) {
            long long parsed = 0;
            return parseInt(value, parsed) && parsed >= min && parsed <= max;
        };
    }

    Config::Validator boolean() {
        return [](const std::string&, const std::string& value) {
            static const char* accepted[] = {"1", "0", "true", "false", "yes", "no", "on", "off"};
            std::string lower;
            for (char c : value) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            for (const char* candidate : accepted) {
                if (lower == candidate) return true;
            }
            return false;
        };
    }

    Config::Validator nonEmpty() {
        return [](const std::string&, const std::string& value) { return !value.empty(); };
    }

    std::unordered_map<std::string, Config::Validator> commonSchema() {
        return {
            {"host", nonEmpty()},
            {"control_port", intRange(0, 65535)},
            {"data_port", intRange(0, 65535)},
            {"legacy_port", intRange(0, 65535)},
            {"buffer_size", intRange(1, hfs::config::MAX_FRAME_SIZE)},
            {"tls_enabled", boolean()},
            {"tls_verify", boolean()},
        };
    }

    hfs::Result<void> checkSchema(const Config& config,
                                  const std::unordered_map<std::string, Config::Validator>& schema) {
        std::string failedKey;
        if (!config.validate(schema, &failedKey)) {
            return hfs::Err(hfs::ErrorCode::InvalidConfig,
                            "Invalid value for " + failedKey + ": '" + config.get(failedKey) + "'");
        }
        return hfs::Ok();
    }

    TlsSettings readTls(const Config& config) {
        TlsSettings tls;
        tls.enabled = config.getBool("tls_enabled", false);
        tls.verify = config.getBool("tls_verify", false);
        tls.certFile = config.get("tls_cert_file");
        tls.keyFile = config.get("tls_key_file");
        tls.caFile = config.get("tls_ca_file");
        return tls;
    }

    bool fileExists(const std::string& path) {
        std::error_code ec;
        return std::filesystem::exists(path, ec);
    }

} // namespace

hfs::Result<ServerSettings> ServerSettings::fromConfig(const Config& config) {
    auto schema = commonSchema();
    schema["max_connections"] = intRange(2, 4096);
    schema["save_directory"] = nonEmpty();

    auto checked = checkSchema(config, schema);
    if (!checked) {
        return checked.error();
    }

    ServerSettings settings;
    settings.host = config.get("host", settings.host);
    settings.controlPort = config.getInt("control_port", settings.controlPort);
    settings.dataPort = config.getInt("data_port", settings.dataPort);
    settings.legacyPort = config.getInt("legacy_port", settings.legacyPort);
    settings.bufferSize = config.getSize("buffer_size", settings.bufferSize);
    settings.maxConnections = config.getSize("max_connections", settings.maxConnections);
    settings.saveDirectory = config.get("save_directory", settings.saveDirectory);
    settings.tls = readTls(config);

    auto valid = settings.validate();
    if (!valid) {
        return valid.error();
    }
    return settings;
}

hfs::Result<void> ServerSettings::validate() const {
    if (host.empty()) {
        return hfs::Err(hfs::ErrorCode::InvalidConfig, "host must not be empty");
    }
    for (int port : {controlPort, dataPort, legacyPort}) {
        if (port < 0 || port > 65535) {
            return hfs::Err(hfs::ErrorCode::InvalidConfig, "Port out of range: " + std::to_string(port));
        }
    }
    if (controlPort != 0 && controlPort == dataPort) {
        return hfs::Err(hfs::ErrorCode::InvalidConfig, "control_port and data_port must differ");
    }
    if (legacyPort != 0 && (legacyPort == controlPort || legacyPort == dataPort)) {
        return hfs::Err(hfs::ErrorCode::InvalidConfig, "legacy_port collides with another port");
    }
    if (bufferSize == 0 || bufferSize > hfs::config::MAX_FRAME_SIZE) {
        return hfs::Err(hfs::ErrorCode::InvalidConfig, "buffer_size out of range");
    }
    // A client holds a control and a data connection at the same time
    if (maxConnections < 2) {
        return hfs::Err(hfs::ErrorCode::InvalidConfig, "max_connections must be at least 2");
    }
    if (saveDirectory.empty()) {
        return hfs::Err(hfs::ErrorCode::InvalidConfig, "save_directory must not be empty");
    }

    if (tls.enabled) {
        if (tls.certFile.empty() || tls.keyFile.empty()) {
            return hfs::Err(hfs::ErrorCode::MissingTLSMaterial,
                            "tls_enabled requires tls_cert_file and tls_key_file");
        }
        if (!fileExists(tls.certFile)) {
            return hfs::Err(hfs::ErrorCode::MissingTLSMaterial, "Certificate not found: " + tls.certFile);
        }
        if (!fileExists(tls.keyFile)) {
            return hfs::Err(hfs::ErrorCode::MissingTLSMaterial, "Private key not found: " + tls.keyFile);
        }
    }
    return hfs::Ok();
}

hfs::Result<ClientSettings> ClientSettings::fromConfig(const Config& config) {
    auto schema = commonSchema();
    schema["retry_attempts"] = intRange(1, 100);
    schema["retry_delay_ms"] = intRange(0, 600000);

    auto checked = checkSchema(config, schema);
    if (!checked) {
        return checked.error();
    }

    ClientSettings settings;
    settings.host = config.get("host", settings.host);
    settings.controlPort = config.getInt("control_port", settings.controlPort);
    settings.dataPort = config.getInt("data_port", settings.dataPort);
    settings.legacyPort = config.getInt("legacy_port", settings.legacyPort);
    settings.bufferSize = config.getSize("buffer_size", settings.bufferSize);
    settings.retryAttempts = config.getInt("retry_attempts", settings.retryAttempts);
    settings.retryDelayMs = config.getInt("retry_delay_ms", settings.retryDelayMs);
    settings.tls = readTls(config);

    auto valid = settings.validate();
    if (!valid) {
        return valid.error();
    }
    return settings;
}

hfs::Result<void> ClientSettings::validate() const {
    if (host.empty()) {
        return hfs::Err(hfs::ErrorCode::InvalidConfig, "host must not be empty");
    }
    for (int port : {controlPort, dataPort, legacyPort}) {
        if (port < 0 || port > 65535) {
            return hfs::Err(hfs::ErrorCode::InvalidConfig, "Port out of range: " + std::to_string(port));
        }
    }
    if (bufferSize == 0 || bufferSize > hfs::config::MAX_FRAME_SIZE) {
        return hfs::Err(hfs::ErrorCode::InvalidConfig, "buffer_size out of range");
    }
    if (retryAttempts < 1) {
        return hfs::Err(hfs::ErrorCode::InvalidConfig, "retry_attempts must be at least 1");
    }
    if (retryDelayMs < 0) {
        return hfs::Err(hfs::ErrorCode::InvalidConfig, "retry_delay_ms must not be negative");
    }
    if (tls.enabled && !tls.caFile.empty() && !fileExists(tls.caFile)) {
        return hfs::Err(hfs::ErrorCode::MissingTLSMaterial, "CA file not found: " + tls.caFile);
    }
    return hfs::Ok();
}

const std::vector<std::string>& knownConfigKeys() {
    static const std::vector<std::string> keys = {
        "host", "control_port", "data_port", "legacy_port",
        "tls_enabled", "tls_verify", "tls_cert_file", "tls_key_file", "tls_ca_file",
        "buffer_size", "retry_attempts", "retry_delay_ms", "max_connections",
        "save_directory", "log_file", "log_level", "log_max_size_mb"
    };
    return keys;
}

hfs::Result<void> applyLoggingConfig(const Config& config) {
    auto& logger = Logger::instance();

    std::string levelName = config.get("log_level");
    if (!levelName.empty()) {
        LogLevel level;
        if (!Logger::parseLevel(levelName, level)) {
            return hfs::Err(hfs::ErrorCode::InvalidConfig, "Unknown log_level: " + levelName);
        }
        logger.setLevel(level);
    }

    logger.setMaxFileSize(config.getSize("log_max_size_mb", hfs::config::DEFAULT_LOG_MAX_SIZE_MB));

    std::string logFile = config.get("log_file");
    if (!logFile.empty()) {
        logger.setLogFile(logFile);
    }
    return hfs::Ok();
}

} // namespace HuffStream
