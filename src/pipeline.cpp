/*
 * audioscribe - Queued Audio Transcription
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "audioscribe/pipeline.hpp"
#include "audioscribe/logger.hpp"

namespace audioscribe {

Pipeline::Pipeline(Transcriber& transcriber, Observer observer, Config config)
    : transcriber_(transcriber), observer_(std::move(observer)), config_(std::move(config)) {
    LOG_DEBUG("Pipeline created - model: " + config_.modelPath +
              ", monitor interval: " + std::to_string(config_.monitorInterval.count()) + "ms");
}

Pipeline::~Pipeline() {
    shutdown();
}

bool Pipeline::start() {
    if (running_.load()) {
        LOG_WARN("Pipeline already running");
        return false;
    }

    LOG_INFO("Starting transcription pipeline...");

    try {
        RunnerOptions options;
        options.readinessPoll = config_.readinessPoll;
        options.historyLimit = config_.historyLimit;
        options.onExtract = [this](double fraction) { lastProgress_.store(fraction); };

        runner_ = std::make_unique<JobRunner>(queue_, gate_, slot_, transcriber_, observer_, std::move(options));
        monitor_ = std::make_unique<ProgressMonitor>(
            slot_, [this](double fraction) { observer_.progress(fraction); }, config_.monitorInterval);

        if (!monitor_->start()) {
            LOG_ERROR("Failed to start progress monitor");
            return false;
        }
        if (!runner_->start()) {
            LOG_ERROR("Failed to start job runner");
            monitor_->stop();
            return false;
        }

        running_.store(true);
        initState_.store(InitState::Loading);
        observer_.status("Initializing model...");
        initThread_ = std::thread(&Pipeline::initialize, this);

        // Jobs queued before start() are waiting for the gate like any other
        if (queue_.hasPending()) {
            runner_->notify();
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pipeline: " + std::string(e.what()));
        if (runner_) runner_->stop();
        if (monitor_) monitor_->stop();
        running_.store(false);
        return false;
    }
}

void Pipeline::shutdown() noexcept {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("Shutting down pipeline...");

    auto dropped = queue_.clearPending();
    if (!dropped.empty()) {
        LOG_INFO("Discarded " + std::to_string(dropped.size()) + " pending job(s)");
    }
    gate_.reset();

    // An in-flight transcription runs to completion before this returns
    if (runner_) {
        runner_->stop();
    }
    if (monitor_) {
        monitor_->stop();
    }
    if (initThread_.joinable()) {
        initThread_.join();
    }

    LOG_INFO("Pipeline shutdown complete");
}

void Pipeline::initialize() {
    setThreadName("Init");
    const auto startTime = std::chrono::steady_clock::now();

    std::string failure;
    try {
        if (transcriber_.isLoaded()) {
            LOG_DEBUG("Model already loaded");
        } else {
            transcriber_.loadModel();
        }
    } catch (const std::exception& e) {
        failure = e.what();
    } catch (...) {
        failure = "unknown error";
    }

    if (!failure.empty()) {
        const std::string message = "Model initialization failed: " + failure;
        LOG_ERROR(message);
        initState_.store(InitState::Failed);
        gate_.reset();
        runner_->setUnavailable("model unavailable");
        observer_.error(message);
        observer_.status("Error: " + message);
        return;
    }

    if (!running_.load()) {
        LOG_DEBUG("Model loaded after shutdown, ignoring");
        return;
    }

    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
    LOG_INFO("Model ready in " + std::to_string(elapsed) + "s");
    initState_.store(InitState::Ready);
    gate_.signal();
    observer_.status("Ready");
}

EnqueueResult Pipeline::enqueue(const std::string& rawPath) {
    EnqueueResult result;
    if (initState_.load() == InitState::Failed) {
        result.id = JobQueue::normalizePath(rawPath).string();
        result.error = EnqueueError::Unavailable;
        result.message = "Model unavailable, cannot queue: " + result.id;
    } else {
        result = queue_.enqueue(rawPath, [this](const Job& job) { observer_.jobChanged(job); });
    }

    if (!result.ok) {
        LOG_WARN(result.message);
        observer_.error(result.message);
        observer_.status("Error: " + result.message);
        return result;
    }

    if (!result.duplicate && runner_ && running_.load()) {
        runner_->notify();
    }
    return result;
}

std::vector<EnqueueResult> Pipeline::enqueueAll(const std::vector<std::string>& rawPaths) {
    std::vector<EnqueueResult> results;
    results.reserve(rawPaths.size());
    for (const auto& raw : rawPaths) {
        results.push_back(enqueue(raw));
    }
    return results;
}

std::vector<EnqueueResult> Pipeline::enqueueDropList(const std::string& data) {
    return enqueueAll(JobQueue::splitDropList(data));
}

bool Pipeline::waitIdle(std::chrono::milliseconds timeout) {
    return queue_.waitIdle(timeout);
}

RunnerState Pipeline::runnerState() const noexcept {
    return runner_ ? runner_->state() : RunnerState::Idle;
}

std::vector<Job> Pipeline::history() const {
    return runner_ ? runner_->history() : std::vector<Job>{};
}

std::size_t Pipeline::failedCount() const noexcept {
    return runner_ ? runner_->failedCount() : 0;
}

}
