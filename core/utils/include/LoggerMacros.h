/**
 * @file LoggerMacros.h
 * @brief Component logging shorthands
 *
 * The *_IF variants check the level first, so a message built from
 * several std::to_string() pieces costs nothing when it would be dropped:
 *
 *   LOG_DEBUG_COMP_IF("Chunk of " + std::to_string(n) + " bytes", "DataChannel");
 */

#pragma once

#include "Logger.h"
#include <chrono>
#include <string>

#define HFS_LOG_IF_ENABLED(level, msg, component) \
    do { \
        auto& hfsLogger__ = ::HuffStream::Logger::instance(); \
        if (hfsLogger__.isEnabled(level)) { \
            hfsLogger__.log(level, msg, component); \
        } \
    } while (0)

#define LOG_DEBUG_COMP_IF(msg, component) HFS_LOG_IF_ENABLED(::HuffStream::LogLevel::DEBUG, msg, component)
#define LOG_INFO_COMP_IF(msg, component) HFS_LOG_IF_ENABLED(::HuffStream::LogLevel::INFO, msg, component)

#define LOG_WARN_COMP(msg, component) ::HuffStream::Logger::instance().warn(msg, component)
#define LOG_ERROR_COMP(msg, component) ::HuffStream::Logger::instance().error(msg, component)

namespace HuffStream {

/// Logs "<name> took N ms" at DEBUG when it goes out of scope
class ScopedTimer {
public:
    ScopedTimer(std::string name, std::string component)
        : name_(std::move(name)), component_(std::move(component)), start_(std::chrono::steady_clock::now()) {}

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    ~ScopedTimer() {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_).count();
        LOG_DEBUG_COMP_IF(name_ + " took " + std::to_string(elapsed) + " ms", component_);
    }

private:
    std::string name_;
    std::string component_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace HuffStream

#define SCOPED_TIMER_COMP(name, component) ::HuffStream::ScopedTimer scopedTimer__(name, component)
