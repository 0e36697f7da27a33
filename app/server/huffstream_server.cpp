#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <unordered_map>
#include "Config.h"
#include "Logger.h"
#include "PathUtils.h"
#include "TransferServer.h"
#include "TransferSettings.h"
#include "Version.h"

using namespace HuffStream;

namespace {
    volatile sig_atomic_t signalReceived = 0;
    volatile sig_atomic_t receivedSignalNum = 0;

    void signalHandler(int signal) {
        receivedSignalNum = signal;
        signalReceived = 1;
    }

    void printUsage(const char* program) {
        std::cout << "HuffStream Server " << Version::toString() << " - Huffman-coded file transfer" << std::endl;
        std::cout << "\nUsage: " << program << " [OPTIONS]" << std::endl;
        std::cout << "\nOptions:" << std::endl;
        std::cout << "  --config <FILE>            Configuration file (key=value)" << std::endl;
        std::cout << "  --host <ADDR>              Bind address (default: 0.0.0.0)" << std::endl;
        std::cout << "  --control-port <PORT>      Control channel port (default: 9001)" << std::endl;
        std::cout << "  --data-port <PORT>         Data channel port (default: 9000)" << std::endl;
        std::cout << "  --legacy-port <PORT>       Legacy single-channel port (default: 0, disabled)" << std::endl;
        std::cout << "  --save-dir <PATH>          Where received files are written (default: received_files)" << std::endl;
        std::cout << "  --max-connections <N>      Concurrent connection cap (default: 16)" << std::endl;
        std::cout << "  --tls-cert <FILE>          Enable TLS with this certificate" << std::endl;
        std::cout << "  --tls-key <FILE>           Private key for --tls-cert" << std::endl;
        std::cout << "  --log-level <LEVEL>        debug, info, warn, error or critical" << std::endl;
        std::cout << "  --log-file <FILE>          Also log to this file" << std::endl;
        std::cout << "  --help                     Show this help message" << std::endl;
    }
}

int main(int argc, char* argv[]) {
    auto& logger = Logger::instance();
    logger.setComponent("Server");

    Config config;
    std::string configFile;
    std::unordered_map<std::string, std::string> overrides;

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
        } else if (arg == "--save-dir" && hasValue) {
            overrides["save_directory"] = argv[++i];
        } else if (arg == "--max-connections" && hasValue) {
            overrides["max_connections"] = argv[++i];
        } else if (arg == "--tls-cert" && hasValue) {
            overrides["tls_cert_file"] = argv[++i];
            overrides["tls_enabled"] = "true";
        } else if (arg == "--tls-key" && hasValue) {
            overrides["tls_key_file"] = argv[++i];
        } else if (arg == "--log-level" && hasValue) {
            overrides["log_level"] = argv[++i];
        } else if (arg == "--log-file" && hasValue) {
            overrides["log_file"] = argv[++i];
        } else {
            std::cerr << "Error: Unknown or incomplete option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    // File, then environment, then command line
    if (!configFile.empty()) {
        if (!config.loadFromFile(configFile)) {
            std::cerr << "Error: Cannot read configuration file " << configFile << std::endl;
            return 1;
        }
    } else if (std::getenv("HOME") || std::getenv("XDG_CONFIG_HOME")) {
        auto defaultPath = (PathUtils::getConfigDir() / "server.conf").string();
        if (config.loadFromFile(defaultPath)) {
            configFile = defaultPath;
        }
    }
    config.applyEnvironment("HUFFSTREAM_", knownConfigKeys());
    for (const auto& [key, value] : overrides) {
        config.set(key, value);
    }

    auto logging = applyLoggingConfig(config);
    if (!logging) {
        std::cerr << "Error: " << logging.error().message << std::endl;
        return 1;
    }

    auto settings = ServerSettings::fromConfig(config);
    if (!settings) {
        std::cerr << "Error: " << settings.error().message << std::endl;
        return 1;
    }

    logger.info("=== HuffStream Server " + Version::toString() + " starting ===", "Server");
    if (!configFile.empty()) {
        logger.info("Configuration loaded from " + configFile, "Server");
    }

    TransferServer server(settings.value());
    auto started = server.start();
    if (!started) {
        logger.critical("Failed to start: " + started.error().message, "Server");
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGPIPE, SIG_IGN);

    logger.info("Server running. Press Ctrl+C to stop.", "Server");
    while (!signalReceived && server.isRunning()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    if (signalReceived) {
        int sigNum = receivedSignalNum;
        logger.info("Received signal " + std::to_string(sigNum) + ", shutting down", "Server");
    }

    server.stop();
    logger.info("Server stopped. Transfers recorded: " + std::to_string(server.registry().size()) +
                ", rejected connections: " + std::to_string(server.rejectedConnections()), "Server");
    return 0;
}
