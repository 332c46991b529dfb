/*
 * audioscribe - Queued Audio Transcription
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>

namespace audioscribe {

struct TranscribeResult {
    bool ok = false;
    std::string text;
    std::string error;
};

// Speech-to-text engine. While transcribe() runs, the engine writes its
// human-readable progress lines to OutputChannel::instance().
class Transcriber {
public:
    virtual ~Transcriber() = default;

    // Loads the model; throws std::runtime_error on failure.
    virtual void loadModel() = 0;
    [[nodiscard]] virtual bool isLoaded() const noexcept = 0;

    // May throw on engine failure.
    [[nodiscard]] virtual TranscribeResult transcribe(const std::filesystem::path& audioPath) = 0;
};

}
