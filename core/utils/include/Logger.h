#pragma once

#include <string>
#include <mutex>
#include <fstream>
#include <iostream>
#include <atomic>

namespace HuffStream {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR,
        CRITICAL
    };

    /**
     * @brief Process-wide logger shared by the codec, the protocol handlers
     * and the binaries.
     *
     * Lines look like `[2026-01-01 12:00:00] [INFO] [DataChannel] message`.
     * Console output is always on unless disabled; file output starts with
     * setLogFile() and rotates once the file exceeds the configured size.
     */
    class Logger {
    public:
        static Logger& instance();

        void setLogFile(const std::string& path);
        void setLevel(LogLevel level);
        /// Rotate the log file once it grows past maxSizeMB (0 rotates after every line)
        void setMaxFileSize(size_t maxSizeMB);
        /// Component used when a call passes none
        void setComponent(const std::string& component);
        void setConsoleOutput(bool enabled);

        /**
         * @brief Parse a level name ("debug", "INFO", "warn", ...)
         * @return false if the name is not a known level
         */
        static bool parseLevel(const std::string& name, LogLevel& level);

        bool isEnabled(LogLevel level) const { return level >= currentLevel_.load(); }
        bool isDebugEnabled() const { return isEnabled(LogLevel::DEBUG); }
        LogLevel getLevel() const { return currentLevel_; }

        static const char* levelName(LogLevel level);

        void log(LogLevel level, const std::string& message, const std::string& component = "");

        void debug(const std::string& message, const std::string& component = "");
        void info(const std::string& message, const std::string& component = "");
        void warn(const std::string& message, const std::string& component = "");
        void error(const std::string& message, const std::string& component = "");
        void critical(const std::string& message, const std::string& component = "");

    private:
        Logger() = default;
        ~Logger();

        // Everything below except the atomics is guarded by mutex_
        void writeToFile(const std::string& entry);
        void rotateLogFile();

        std::mutex mutex_;
        std::ofstream logFile_;
        std::string logFilePath_;
        std::atomic<LogLevel> currentLevel_{LogLevel::INFO};
        std::atomic<bool> consoleOutput_{true};
        std::string defaultComponent_ = "HuffStream";
        size_t maxFileBytes_ = 100 * 1024 * 1024;
        size_t currentFileSize_ = 0;
        unsigned rotations_ = 0;
    };

}
