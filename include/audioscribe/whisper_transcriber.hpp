/*
 * audioscribe - Queued Audio Transcription
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include "audioscribe/config.hpp"
#include "audioscribe/transcriber.hpp"

struct whisper_context;

namespace audioscribe {

// whisper.cpp engine. Its log output and progress lines are routed into
// OutputChannel::instance().
class WhisperTranscriber final : public Transcriber {
public:
    explicit WhisperTranscriber(Config config);
    ~WhisperTranscriber() override;

    WhisperTranscriber(const WhisperTranscriber&) = delete;
    WhisperTranscriber& operator=(const WhisperTranscriber&) = delete;
    WhisperTranscriber(WhisperTranscriber&&) = delete;
    WhisperTranscriber& operator=(WhisperTranscriber&&) = delete;

    void loadModel() override;
    [[nodiscard]] bool isLoaded() const noexcept override { return loaded_.load(); }
    [[nodiscard]] TranscribeResult transcribe(const std::filesystem::path& audioPath) override;

private:
    Config config_;

    // whisper_context is not thread-safe
    std::mutex mutex_;
    std::shared_ptr<whisper_context> ctx_;
    std::atomic<bool> loaded_{false};
};

}
