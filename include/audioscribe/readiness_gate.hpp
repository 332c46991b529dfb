/*
 * audioscribe - Queued Audio Transcription
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace audioscribe {

// One-shot latch set when the model has finished loading.
// Waiters always use a bounded wait; reset() is only for shutdown and makes
// the gate permanently not-ready.
class ReadinessGate final {
public:
    ReadinessGate() = default;

    ReadinessGate(const ReadinessGate&) = delete;
    ReadinessGate& operator=(const ReadinessGate&) = delete;
    ReadinessGate(ReadinessGate&&) = delete;
    ReadinessGate& operator=(ReadinessGate&&) = delete;

    // Sets the latch and wakes all waiters. No-op after the first call or after reset().
    void signal();

    // True if the latch is set within timeout. Returns false promptly once reset.
    [[nodiscard]] bool wait(std::chrono::milliseconds timeout);

    [[nodiscard]] bool isSet() const;

    void reset();

    [[nodiscard]] bool isClosed() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cond_;
    bool set_ = false;
    bool closed_ = false;
};

}
