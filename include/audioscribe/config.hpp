/*
 * audioscribe - Queued Audio Transcription
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <string>

#include "audioscribe/logger.hpp"

namespace audioscribe {

struct Config {
    std::string modelPath = "models/ggml-medium.bin";
    std::string language = "auto";
    int threads = 4;
    bool useGpu = true;
    std::string ffmpegPath = "ffmpeg";

    std::chrono::milliseconds monitorInterval{50};
    std::chrono::milliseconds readinessPoll{100};
    std::size_t historyLimit = 1000;

    // Engine lines at or above this severity are echoed to stderr while no job captures them.
    LogLevel engineEchoLevel = LogLevel::ERROR;

    // Defaults overridden by AUDIOSCRIBE_* (and WHISPER_LOG_LEVEL).
    [[nodiscard]] static Config fromEnv();
};

}
