#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>
#include "Config.h"
#include "Logger.h"
#include "PathUtils.h"
#include "TransferClient.h"
#include "TransferSettings.h"
#include "Version.h"

using namespace HuffStream;

namespace {
    void printUsage(const char* program) {
        std::cout << "HuffStream Client " << Version::toString() << std::endl;
        std::cout << "\nUsage: " << program << " [OPTIONS] <command> <argument>" << std::endl;
        std::cout << "\nCommands:" << std::endl;
        std::cout << "  send <FILE>                Encode and send a file over the control/data channels" << std::endl;
        std::cout << "  status <TRANSFER_ID>       Query the server-side state of a transfer" << std::endl;
        std::cout << "  cancel <TRANSFER_ID>       Cancel a transfer" << std::endl;
        std::cout << "  legacy <FILE>              Encode and send a file over the legacy single channel" << std::endl;
        std::cout << "\nOptions:" << std::endl;
        std::cout << "  --config <FILE>            Configuration file (key=value)" << std::endl;
        std::cout << "  --host <ADDR>              Server address (default: 127.0.0.1)" << std::endl;
        std::cout << "  --control-port <PORT>      Control channel port (default: 9001)" << std::endl;
        std::cout << "  --data-port <PORT>         Data channel port (default: 9000)" << std::endl;
        std::cout << "  --legacy-port <PORT>       Legacy channel port" << std::endl;
        std::cout << "  --buffer-size <BYTES>      Chunk size (default: 4096)" << std::endl;
        std::cout << "  --retries <N>              Connection attempts (default: 3)" << std::endl;
        std::cout << "  --retry-delay <MS>         Delay between attempts (default: 1000)" << std::endl;
        std::cout << "  --tls                      Use TLS" << std::endl;
        std::cout << "  --tls-ca <FILE>            Verify the server against this CA bundle" << std::endl;
        std::cout << "  --log-level <LEVEL>        debug, info, warn, error or critical" << std::endl;
        std::cout << "  --help                     Show this help message" << std::endl;
    }

    int fail(const hfs::Error& error) {
        std::cerr << "Error: " << error.message << " (" << hfs::errorCodeToString(error.code) << ")" << std::endl;
        return 1;
    }
}

int main(int argc, char* argv[]) {
    auto& logger = Logger::instance();
    logger.setComponent("Client");
    logger.setLevel(LogLevel::WARN);

    Config config;
    std::string configFile;
    std::unordered_map<std::string, std::string> overrides;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;

        if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config" && hasValue) {
            configFile = argv[++i];
        } else if (arg == "--host" && hasValue) {
            overrides["host"] = argv[++i];
        } else if (arg == "--control-port" && hasValue) {
            overrides["control_port"] = argv[++i];
        } else if (arg == "--data-port" && hasValue) {
            overrides["data_port"] = argv[++i];
        } else if (arg == "--legacy-port" && hasValue) {
            overrides["legacy_port"] = argv[++i];
        } else if (arg == "--buffer-size" && hasValue) {
            overrides["buffer_size"] = argv[++i];
        } else if (arg == "--retries" && hasValue) {
            overrides["retry_attempts"] = argv[++i];
        } else if (arg == "--retry-delay" && hasValue) {
            overrides["retry_delay_ms"] = argv[++i];
        } else if (arg == "--tls") {
            overrides["tls_enabled"] = "true";
        } else if (arg == "--tls-ca" && hasValue) {
            overrides["tls_enabled"] = "true";
            overrides["tls_verify"] = "true";
            overrides["tls_ca_file"] = argv[++i];
        } else if (arg == "--log-level" && hasValue) {
            overrides["log_level"] = argv[++i];
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Error: Unknown or incomplete option: " << arg << std::endl;
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        printUsage(argv[0]);
        return 1;
    }
    const std::string& command = positional[0];
    const std::string& argument = positional[1];

    if (!configFile.empty()) {
        if (!config.loadFromFile(configFile)) {
            std::cerr << "Error: Cannot read configuration file " << configFile << std::endl;
            return 1;
        }
    } else if (std::getenv("HOME") || std::getenv("XDG_CONFIG_HOME")) {
        auto defaultPath = (PathUtils::getConfigDir() / "client.conf").string();
        if (config.loadFromFile(defaultPath)) {
            logger.debug("Configuration loaded from " + defaultPath, "Client");
        }
    }
    config.applyEnvironment("HUFFSTREAM_", knownConfigKeys());
    for (const auto& [key, value] : overrides) {
        config.set(key, value);
    }

    auto logging = applyLoggingConfig(config);
    if (!logging) {
        return fail(logging.error());
    }

    auto settings = ClientSettings::fromConfig(config);
    if (!settings) {
        return fail(settings.error());
    }

    std::signal(SIGPIPE, SIG_IGN);

    TransferClient client(settings.value());
    auto initialized = client.initialize();
    if (!initialized) {
        return fail(initialized.error());
    }

    if (command == "send") {
        auto result = client.sendFile(argument);
        if (!result) {
            return fail(result.error());
        }
        std::cout << "Transfer ID: " << result->transferId << std::endl;
        std::cout << "Remote name: " << result->remoteName << std::endl;
        std::cout << "Original size: " << result->originalSize << " bytes" << std::endl;
        std::cout << "Encoded size: " << result->payloadSize << " bytes" << std::endl;
        std::cout << "Compression ratio: " << std::fixed << std::setprecision(2) << result->ratio << "%" << std::endl;
        std::cout << "Result: " << (result->complete ? "COMPLETE" : "INCOMPLETE") << std::endl;
        return result->complete ? 0 : 2;
    }

    if (command == "status" || command == "cancel") {
        auto result = command == "status" ? client.checkStatus(argument) : client.cancel(argument);
        if (!result) {
            return fail(result.error());
        }
        std::cout << argument << ": " << result.value() << std::endl;
        return 0;
    }

    if (command == "legacy") {
        auto result = client.sendLegacy(argument);
        if (!result) {
            return fail(result.error());
        }
        std::cout << result.value() << std::endl;
        return result.value() == hfs::config::LEGACY_SUCCESS_REPLY ? 0 : 2;
    }

    std::cerr << "Error: Unknown command: " << command << std::endl;
    printUsage(argv[0]);
    return 1;
}
