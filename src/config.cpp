/*
 * audioscribe - Queued Audio Transcription
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "audioscribe/config.hpp"
#include <algorithm>
#include <cstdlib>
#include <thread>

namespace audioscribe {

namespace {
int env_int(const char* name, int defv, int minv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        int parsed = std::stoi(val);
        return parsed < minv ? defv : parsed;
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}

std::string env_string(const char* name, const std::string& defv) {
    const char* val = std::getenv(name);
    return (val && *val) ? std::string(val) : defv;
}
}

Config Config::fromEnv() {
    Config config;
    int hw = static_cast<int>(std::thread::hardware_concurrency());
    config.threads = std::max(1, std::min(hw, 8));

    config.modelPath = env_string("AUDIOSCRIBE_MODEL", config.modelPath);
    config.language = env_string("AUDIOSCRIBE_LANGUAGE", config.language);
    config.threads = env_int("AUDIOSCRIBE_THREADS", config.threads, 1);
    config.useGpu = env_int("AUDIOSCRIBE_GPU", 1, 0) != 0;
    config.ffmpegPath = env_string("AUDIOSCRIBE_FFMPEG", config.ffmpegPath);
    config.monitorInterval = std::chrono::milliseconds(
        env_int("AUDIOSCRIBE_MONITOR_MS", static_cast<int>(config.monitorInterval.count()), 1));
    config.readinessPoll = std::chrono::milliseconds(
        env_int("AUDIOSCRIBE_READY_POLL_MS", static_cast<int>(config.readinessPoll.count()), 1));
    config.historyLimit = static_cast<std::size_t>(
        env_int("AUDIOSCRIBE_HISTORY_LIMIT", static_cast<int>(config.historyLimit), 1));

    if (const char* level = std::getenv("WHISPER_LOG_LEVEL")) {
        config.engineEchoLevel = parseLogLevel(level, LogLevel::ERROR);
    }
    return config;
}

}
