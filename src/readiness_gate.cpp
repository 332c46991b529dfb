/*
 * audioscribe - Queued Audio Transcription
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "audioscribe/readiness_gate.hpp"
#include "audioscribe/logger.hpp"

namespace audioscribe {

void ReadinessGate::signal() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (set_ || closed_) {
            return;
        }
        set_ = true;
    }
    cond_.notify_all();
    LOG_DEBUG("Readiness gate signaled");
}

bool ReadinessGate::wait(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cond_.wait_for(lock, timeout, [this] { return set_ || closed_; });
    return set_ && !closed_;
}

bool ReadinessGate::isSet() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return set_ && !closed_;
}

void ReadinessGate::reset() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        set_ = false;
        closed_ = true;
    }
    cond_.notify_all();
    LOG_DEBUG("Readiness gate closed");
}

bool ReadinessGate::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

}
