/*
 * audioscribe - Queued Audio Transcription
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "audioscribe/logger.hpp"
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_map>

namespace audioscribe {

namespace {
std::mutex g_log_mutex;
LogLevel g_level = LogLevel::INFO;
bool g_level_initialized = false;
std::unordered_map<std::thread::id, std::string> g_thread_names;

// Caller holds g_log_mutex.
std::string threadLabel() {
    auto tid = std::this_thread::get_id();
    auto it = g_thread_names.find(tid);
    if (it != g_thread_names.end()) {
        return it->second;
    }
    std::ostringstream oss;
    oss << "T" << tid;
    return oss.str();
}
}

LogLevel parseLogLevel(const std::string& text, LogLevel fallback) noexcept {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "error") return LogLevel::ERROR;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "trace") return LogLevel::TRACE;
    return fallback;
}

void Logger::setLevel(LogLevel level) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = level;
    g_level_initialized = true;
}

LogLevel Logger::level() noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_level_initialized) {
        const char* env = std::getenv("AUDIOSCRIBE_LOG_LEVEL");
        g_level = env ? parseLogLevel(env, LogLevel::INFO) : LogLevel::INFO;
        g_level_initialized = true;
    }
    return g_level;
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        if (static_cast<uint8_t>(level) > static_cast<uint8_t>(Logger::level())) {
            return;
        }

        std::lock_guard<std::mutex> lock(g_log_mutex);
        // stderr only; stdout belongs to the CLI's progress display
        std::cerr << format(level, message) << std::endl;
    } catch (...) {
        // Logging must never throw
    }
}

std::string Logger::format(LogLevel level, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&time, &tm);

    std::ostringstream ss;
    ss << "[" << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
       << "." << std::setfill('0') << std::setw(3) << ms.count() << "]"
       << " [" << levelToString(level) << "]"
       << " [" << threadLabel() << "]"
       << " " << message;
    return ss.str();
}

const char* Logger::levelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "UNKN ";
    }
}

void setThreadName(const std::string& name) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_thread_names[std::this_thread::get_id()] = name;
}

}
