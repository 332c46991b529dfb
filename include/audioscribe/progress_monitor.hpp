/*
 * audioscribe - Queued Audio Transcription
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "audioscribe/progress_extractor.hpp"

namespace audioscribe {

// The shared "current extractor" reference. The runner attaches and
// detaches; the monitor samples. Sampling holds the slot lock, so a detached
// job can never publish after the next job's extractor is attached.
class ProgressSlot final {
public:
    ProgressSlot() = default;

    ProgressSlot(const ProgressSlot&) = delete;
    ProgressSlot& operator=(const ProgressSlot&) = delete;

    void attach(std::shared_ptr<ProgressExtractor> extractor);
    void detach() noexcept;
    [[nodiscard]] bool attached() const;

    // Samples the attached extractor and hands the value to forward while
    // still holding the slot. Empty when no extractor is attached.
    std::optional<double> sample(const ProgressCallback& forward = {});

private:
    mutable std::mutex mutex_;
    std::shared_ptr<ProgressExtractor> extractor_;
};

// Samples the attached extractor on a fixed interval and forwards each
// value to the sink, independent of the runner's cadence.
class ProgressMonitor final {
public:
    ProgressMonitor(ProgressSlot& slot, ProgressCallback sink,
                    std::chrono::milliseconds interval = std::chrono::milliseconds(50));
    ~ProgressMonitor();

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;
    ProgressMonitor(ProgressMonitor&&) = delete;
    ProgressMonitor& operator=(ProgressMonitor&&) = delete;

    [[nodiscard]] bool start();
    void stop() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

private:
    void monitorLoop();

    ProgressSlot& slot_;
    ProgressCallback sink_;
    std::chrono::milliseconds interval_;

    std::atomic<bool> running_{false};
    std::mutex stopMutex_;
    std::condition_variable stopCond_;
    bool stopRequested_ = false;
    std::thread thread_;
};

}
