/*
 * audioscribe - Queued Audio Transcription
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>
#include <utility>

namespace audioscribe {

struct WriteResult {
    bool ok = false;
    std::filesystem::path path;
    std::string error;
};

// Writes <stem>_transcript.txt next to the source audio file.
class TranscriptWriter final {
public:
    static constexpr const char* kDefaultHeader = "Audio transcription:\n\n";

    explicit TranscriptWriter(std::string header = kDefaultHeader) : header_(std::move(header)) {}

    [[nodiscard]] static std::filesystem::path transcriptPathFor(const std::filesystem::path& source);

    // Overwrites an existing transcript.
    [[nodiscard]] WriteResult write(const std::filesystem::path& source, const std::string& text) const noexcept;

private:
    std::string header_;
};

}
