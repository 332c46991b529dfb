/*
 * audioscribe - Queued Audio Transcription
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace audioscribe {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel level() noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

private:
    static std::string format(LogLevel level, const std::string& message);
    static const char* levelToString(LogLevel level) noexcept;
};

// Case-insensitive "error", "warn"/"warning", "info", "debug", "trace".
[[nodiscard]] LogLevel parseLogLevel(const std::string& text, LogLevel fallback) noexcept;

// Thread naming for log context
void setThreadName(const std::string& name);

}

#define LOG_ERROR(msg) ::audioscribe::Logger::error(msg)
#define LOG_WARN(msg)  ::audioscribe::Logger::warn(msg)
#define LOG_INFO(msg)  ::audioscribe::Logger::info(msg)
#define LOG_DEBUG(msg) ::audioscribe::Logger::debug(msg)
#define LOG_TRACE(msg) ::audioscribe::Logger::trace(msg)
