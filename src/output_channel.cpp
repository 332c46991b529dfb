/*
 * audioscribe - Queued Audio Transcription
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "audioscribe/output_channel.hpp"
#include <algorithm>
#include <cstdio>

namespace audioscribe {

OutputChannel::OutputChannel() {
    defaultSink_ = [this](const std::string& text, LogLevel level) { echo(text, level); };
}

OutputChannel& OutputChannel::instance() {
    static OutputChannel channel;
    return channel;
}

void OutputChannel::write(const std::string& text, LogLevel level) {
    if (text.empty()) {
        return;
    }

    // Sinks run under the lock so concurrent writers cannot interleave
    std::lock_guard<std::mutex> lock(mutex_);
    if (!captures_.empty()) {
        captures_.back().second(text, level);
    } else if (defaultSink_) {
        defaultSink_(text, level);
    }
}

OutputChannel::Token OutputChannel::attach(TextSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    Token token = nextToken_++;
    captures_.emplace_back(token, std::move(sink));
    LOG_TRACE("Output capture attached: " + std::to_string(token));
    return token;
}

void OutputChannel::detach(Token token) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(captures_.begin(), captures_.end(),
        [token](const auto& entry) { return entry.first == token; });
    if (it != captures_.end()) {
        captures_.erase(it);
        LOG_TRACE("Output capture detached: " + std::to_string(token));
    }
}

void OutputChannel::setDefaultSink(TextSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink) {
        defaultSink_ = std::move(sink);
    } else {
        defaultSink_ = [this](const std::string& text, LogLevel level) { echo(text, level); };
    }
}

void OutputChannel::setEchoLevel(LogLevel level) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    echoLevel_ = level;
}

std::size_t OutputChannel::captureCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return captures_.size();
}

// Called with mutex_ held.
void OutputChannel::echo(const std::string& text, LogLevel level) const {
    if (static_cast<uint8_t>(level) > static_cast<uint8_t>(echoLevel_)) {
        return;
    }
    std::fputs(text.c_str(), stderr);
}

}
