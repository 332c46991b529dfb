/*
 * audioscribe - Queued Audio Transcription
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "audioscribe/progress_extractor.hpp"
#include "audioscribe/logger.hpp"
#include <cctype>
#include <cstdlib>
#include <regex>

namespace audioscribe {

namespace {
const std::regex& percentPattern() {
    static const std::regex pattern("\\s(\\d+)%", std::regex::optimize);
    return pattern;
}
}

ProgressExtractor::ProgressExtractor(ProgressCallback callback, OutputChannel& channel)
    : callback_(std::move(callback)), channel_(channel) {
}

ProgressExtractor::~ProgressExtractor() {
    stop();
}

void ProgressExtractor::start() {
    std::lock_guard<std::mutex> lock(tokenMutex_);
    if (token_) {
        return;
    }
    token_ = channel_.attach([this](const std::string& text, LogLevel) { append(text); });
}

void ProgressExtractor::stop() noexcept {
    std::lock_guard<std::mutex> lock(tokenMutex_);
    if (token_) {
        channel_.detach(*token_);
        token_.reset();
    }
}

bool ProgressExtractor::capturing() const {
    std::lock_guard<std::mutex> lock(tokenMutex_);
    return token_.has_value();
}

void ProgressExtractor::append(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_.append(text);
}

double ProgressExtractor::sample() {
    std::optional<double> value;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        scanLocked();
        value = latest_;
    }

    if (!value) {
        return 0.0;
    }
    if (callback_) {
        callback_(*value);
    }
    return *value;
}

std::optional<double> ProgressExtractor::latest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_;
}

std::string ProgressExtractor::text() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_;
}

// Matches are final once their '%' has arrived, so each call only rescans
// from the trailing run that could still grow into a token (whitespace
// followed by digits at the end of the buffer).
void ProgressExtractor::scanLocked() {
    if (scanFrom_ >= buffer_.size()) {
        return;
    }

    auto begin = buffer_.cbegin() + static_cast<std::ptrdiff_t>(scanFrom_);
    std::sregex_iterator it(begin, buffer_.cend(), percentPattern());
    std::sregex_iterator end;
    std::string digits;
    for (; it != end; ++it) {
        digits = (*it)[1].str();
    }
    if (!digits.empty()) {
        latest_ = std::strtod(digits.c_str(), nullptr) / 100.0;
        LOG_TRACE("Progress token: " + digits + "%");
    }

    std::size_t tail = buffer_.size();
    while (tail > scanFrom_ && std::isdigit(static_cast<unsigned char>(buffer_[tail - 1]))) {
        --tail;
    }
    if (tail > scanFrom_ && std::isspace(static_cast<unsigned char>(buffer_[tail - 1]))) {
        scanFrom_ = tail - 1;
    } else {
        scanFrom_ = buffer_.size();
    }
}

}
