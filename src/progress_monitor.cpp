/*
 * audioscribe - Queued Audio Transcription
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "audioscribe/progress_monitor.hpp"
#include "audioscribe/logger.hpp"

namespace audioscribe {

void ProgressSlot::attach(std::shared_ptr<ProgressExtractor> extractor) {
    std::lock_guard<std::mutex> lock(mutex_);
    extractor_ = std::move(extractor);
}

void ProgressSlot::detach() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    extractor_.reset();
}

bool ProgressSlot::attached() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return extractor_ != nullptr;
}

std::optional<double> ProgressSlot::sample(const ProgressCallback& forward) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!extractor_) {
        return std::nullopt;
    }
    double value = extractor_->sample();
    if (forward) {
        forward(value);
    }
    return value;
}

ProgressMonitor::ProgressMonitor(ProgressSlot& slot, ProgressCallback sink, std::chrono::milliseconds interval)
    : slot_(slot), sink_(std::move(sink)), interval_(interval) {
    LOG_DEBUG("Progress monitor created, interval " + std::to_string(interval_.count()) + "ms");
}

ProgressMonitor::~ProgressMonitor() {
    stop();
}

bool ProgressMonitor::start() {
    if (running_.load()) {
        LOG_WARN("Progress monitor already running");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(stopMutex_);
        stopRequested_ = false;
    }

    try {
        thread_ = std::thread(&ProgressMonitor::monitorLoop, this);
        running_.store(true);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start progress monitor: " + std::string(e.what()));
        return false;
    }
}

void ProgressMonitor::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(stopMutex_);
        stopRequested_ = true;
    }
    stopCond_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    running_.store(false);
    LOG_DEBUG("Progress monitor stopped");
}

void ProgressMonitor::monitorLoop() {
    setThreadName("Monitor");
    LOG_DEBUG("Progress monitor loop started");

    while (true) {
        try {
            (void)slot_.sample(sink_);
        } catch (const std::exception& e) {
            LOG_ERROR("Progress sampling error: " + std::string(e.what()));
        } catch (...) {
            LOG_ERROR("Unknown progress sampling error");
        }

        std::unique_lock<std::mutex> lock(stopMutex_);
        if (stopCond_.wait_for(lock, interval_, [this] { return stopRequested_; })) {
            break;
        }
    }

    LOG_DEBUG("Progress monitor loop stopped");
}

}
