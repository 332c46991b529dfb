/*
 * audioscribe - Queued Audio Transcription
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "audioscribe/output_channel.hpp"

namespace audioscribe {

using ProgressCallback = std::function<void(double fraction)>;

// Captures the text a running job writes to the output channel and derives
// the job's completion fraction from the last " <digits>%" token seen.
// One instance per job; values are passed through unclamped.
class ProgressExtractor final {
public:
    explicit ProgressExtractor(ProgressCallback callback = {},
                               OutputChannel& channel = OutputChannel::instance());
    ~ProgressExtractor();

    ProgressExtractor(const ProgressExtractor&) = delete;
    ProgressExtractor& operator=(const ProgressExtractor&) = delete;
    ProgressExtractor(ProgressExtractor&&) = delete;
    ProgressExtractor& operator=(ProgressExtractor&&) = delete;

    void start();
    void stop() noexcept;
    [[nodiscard]] bool capturing() const;

    void append(const std::string& text);

    // 0.0 without invoking the callback until a token has been seen.
    double sample();

    [[nodiscard]] std::optional<double> latest() const;
    [[nodiscard]] std::string text() const;

private:
    void scanLocked();

    ProgressCallback callback_;
    OutputChannel& channel_;

    // The channel calls append() under its own lock, so the buffer mutex is
    // never held while calling into the channel.
    mutable std::mutex mutex_;
    std::string buffer_;
    std::size_t scanFrom_ = 0;
    std::optional<double> latest_;

    mutable std::mutex tokenMutex_;
    std::optional<OutputChannel::Token> token_;
};

// Scoped start()/stop() so the channel is released on every exit path.
class ProgressCapture final {
public:
    explicit ProgressCapture(ProgressExtractor& extractor) : extractor_(extractor) { extractor_.start(); }
    ~ProgressCapture() { extractor_.stop(); }

    ProgressCapture(const ProgressCapture&) = delete;
    ProgressCapture& operator=(const ProgressCapture&) = delete;

private:
    ProgressExtractor& extractor_;
};

}
