/*
 * audioscribe - Queued Audio Transcription
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace audioscribe {

constexpr int kEngineSampleRate = 16000;

struct AudioResult {
    bool ok = false;
    std::vector<float> samples;  // mono float32
    int sampleRate = 0;
    std::string error;
};

// RIFF/WAVE with PCM16, PCM32 or float32 samples; channels are averaged.
[[nodiscard]] AudioResult readWav(const std::filesystem::path& path);

// Decodes any format ffmpeg understands to mono float32 at sampleRate.
[[nodiscard]] AudioResult decodeWithFfmpeg(const std::filesystem::path& path,
                                           const std::string& ffmpeg,
                                           int sampleRate = kEngineSampleRate);

[[nodiscard]] std::vector<float> resampleLinear(const std::vector<float>& in, int rateIn, int rateOut);

// .wav is read directly, anything else goes through ffmpeg. Output is at kEngineSampleRate.
[[nodiscard]] AudioResult loadAudio(const std::filesystem::path& path, const std::string& ffmpeg);

}
