/*
 * audioscribe - Queued Audio Transcription
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "audioscribe/logger.hpp"

namespace audioscribe {

using TextSink = std::function<void(const std::string& text, LogLevel level)>;

// Process-wide text channel the transcription engine writes its
// human-readable lines to. Text goes to the most recently attached capture,
// or to the default sink when no capture is attached.
class OutputChannel final {
public:
    using Token = std::uint64_t;

    OutputChannel();

    OutputChannel(const OutputChannel&) = delete;
    OutputChannel& operator=(const OutputChannel&) = delete;
    OutputChannel(OutputChannel&&) = delete;
    OutputChannel& operator=(OutputChannel&&) = delete;

    static OutputChannel& instance();

    void write(const std::string& text, LogLevel level = LogLevel::INFO);

    // Each token removes only its own registration, in any order.
    [[nodiscard]] Token attach(TextSink sink);
    void detach(Token token) noexcept;

    void setDefaultSink(TextSink sink);
    // Default sink echoes lines at or above this severity to stderr.
    void setEchoLevel(LogLevel level) noexcept;

    [[nodiscard]] std::size_t captureCount() const;

private:
    void echo(const std::string& text, LogLevel level) const;

    mutable std::mutex mutex_;
    std::vector<std::pair<Token, TextSink>> captures_;
    TextSink defaultSink_;
    LogLevel echoLevel_ = LogLevel::ERROR;
    Token nextToken_ = 1;
};

}
