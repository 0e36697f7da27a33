#include "Logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace HuffStream {

    namespace {

        std::string formatNow(const char* format) {
            auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            struct tm tmBuf;
            localtime_r(&now, &tmBuf);

            std::ostringstream ss;
            ss << std::put_time(&tmBuf, format);
            return ss.str();
        }

        std::string formatEntry(LogLevel level, const std::string& component, const std::string& message) {
            return "[" + formatNow("%Y-%m-%d %H:%M:%S") + "] [" + Logger::levelName(level) + "] [" +
                   component + "] " + message;
        }

        const char* consoleColor(LogLevel level) {
            switch (level) {
                case LogLevel::WARN: return "\033[1;33m";
                case LogLevel::ERROR:
                case LogLevel::CRITICAL: return "\033[1;31m";
                default: return nullptr;
            }
        }

    } // namespace

    Logger& Logger::instance() {
        static Logger instance;
        return instance;
    }

    Logger::~Logger() {
        if (logFile_.is_open()) {
            logFile_.close();
        }
    }

    void Logger::setLogFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (logFile_.is_open()) {
            logFile_.close();
        }
        logFilePath_ = path;
        currentFileSize_ = 0;
        if (path.empty()) {
            return;
        }

        std::error_code ec;
        auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
        }

        logFile_.open(path, std::ios::app);
        auto existing = std::filesystem::file_size(path, ec);
        if (!ec) {
            currentFileSize_ = static_cast<size_t>(existing);
        }
    }

    void Logger::setMaxFileSize(size_t maxSizeMB) {
        std::lock_guard<std::mutex> lock(mutex_);
        maxFileBytes_ = maxSizeMB * 1024 * 1024;
    }

    void Logger::setComponent(const std::string& component) {
        std::lock_guard<std::mutex> lock(mutex_);
        defaultComponent_ = component;
    }

    void Logger::setLevel(LogLevel level) {
        currentLevel_ = level;
    }

    void Logger::setConsoleOutput(bool enabled) {
        consoleOutput_ = enabled;
    }

    const char* Logger::levelName(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARN: return "WARN";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::CRITICAL: return "CRITICAL";
        }
        return "UNKNOWN";
    }

    bool Logger::parseLevel(const std::string& name, LogLevel& level) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "warning") {
            lower = "warn";
        }
        for (auto candidate : {LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARN, LogLevel::ERROR, LogLevel::CRITICAL}) {
            std::string candidateName = levelName(candidate);
            std::transform(candidateName.begin(), candidateName.end(), candidateName.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (lower == candidateName) {
                level = candidate;
                return true;
            }
        }
        return false;
    }

    void Logger::log(LogLevel level, const std::string& message, const std::string& component) {
        if (!isEnabled(level)) {
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        std::string entry = formatEntry(level, component.empty() ? defaultComponent_ : component, message);

        if (consoleOutput_) {
            std::ostream& out = level >= LogLevel::ERROR ? std::cerr : std::cout;
            if (const char* color = consoleColor(level)) {
                out << color << entry << "\033[0m" << std::endl;
            } else {
                out << entry << std::endl;
            }
        }

        if (logFile_.is_open()) {
            writeToFile(entry);
        }
    }

    void Logger::debug(const std::string& message, const std::string& component) {
        log(LogLevel::DEBUG, message, component);
    }

    void Logger::info(const std::string& message, const std::string& component) {
        log(LogLevel::INFO, message, component);
    }

    void Logger::warn(const std::string& message, const std::string& component) {
        log(LogLevel::WARN, message, component);
    }

    void Logger::error(const std::string& message, const std::string& component) {
        log(LogLevel::ERROR, message, component);
    }

    void Logger::critical(const std::string& message, const std::string& component) {
        log(LogLevel::CRITICAL, message, component);
    }

    void Logger::writeToFile(const std::string& entry) {
        logFile_ << entry << std::endl;
        currentFileSize_ += entry.size() + 1;
        if (currentFileSize_ > maxFileBytes_) {
            rotateLogFile();
        }
    }

    // Rotated files are named <log>.<timestamp>.<n>, n counting rotations of this process
    void Logger::rotateLogFile() {
        if (logFilePath_.empty()) {
            return;
        }
        logFile_.close();

        std::string rotatedPath = logFilePath_ + "." + formatNow("%Y%m%d_%H%M%S") + "." + std::to_string(++rotations_);
        std::error_code ec;
        std::filesystem::rename(logFilePath_, rotatedPath, ec);
        if (ec) {
            std::cerr << "Failed to rotate log file " << logFilePath_ << ": " << ec.message() << std::endl;
        }

        logFile_.open(logFilePath_, std::ios::trunc);
        currentFileSize_ = 0;
        if (logFile_.is_open()) {
            std::string entry = formatEntry(LogLevel::INFO, "Logger", "Log file rotated to: " + rotatedPath);
            logFile_ << entry << std::endl;
            currentFileSize_ = entry.size() + 1;
        }
    }

}
