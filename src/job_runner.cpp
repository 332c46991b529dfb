/*
 * audioscribe - Queued Audio Transcription
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "audioscribe/job_runner.hpp"
#include "audioscribe/logger.hpp"
#include <iomanip>
#include <memory>
#include <sstream>

namespace audioscribe {

namespace {
std::string displayName(const JobId& id) {
    return std::filesystem::path(id).filename().string();
}

std::string seconds(std::chrono::steady_clock::time_point since) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1)
       << std::chrono::duration<double>(std::chrono::steady_clock::now() - since).count() << "s";
    return ss.str();
}
}

const char* runnerStateName(RunnerState state) noexcept {
    switch (state) {
        case RunnerState::Idle: return "idle";
        case RunnerState::WaitingForReadiness: return "waiting";
        case RunnerState::Running: return "running";
        case RunnerState::Finishing: return "finishing";
        default: return "unknown";
    }
}

JobRunner::JobRunner(JobQueue& queue, ReadinessGate& gate, ProgressSlot& slot,
                     Transcriber& transcriber, const Observer& observer,
                     RunnerOptions options)
    : queue_(queue), gate_(gate), slot_(slot), transcriber_(transcriber),
      observer_(observer), options_(std::move(options)) {
}

JobRunner::~JobRunner() {
    stop();
}

bool JobRunner::start() {
    if (running_.load()) {
        LOG_WARN("Job runner already running");
        return false;
    }

    shutdown_.store(false);
    try {
        worker_ = std::thread(&JobRunner::workerLoop, this);
        running_.store(true);
        LOG_DEBUG("Job runner started");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start job runner: " + std::string(e.what()));
        return false;
    }
}

void JobRunner::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_DEBUG("Stopping job runner...");
    shutdown_.store(true);
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        wake_ = true;
    }
    wakeCond_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
    running_.store(false);
    LOG_DEBUG("Job runner stopped");
}

void JobRunner::notify() {
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        wake_ = true;
    }
    wakeCond_.notify_one();
}

void JobRunner::setUnavailable(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        unavailable_ = true;
        unavailableReason_ = reason;
        wake_ = true;
    }
    wakeCond_.notify_one();
}

std::vector<Job> JobRunner::history() const {
    std::lock_guard<std::mutex> lock(historyMutex_);
    return history_;
}

void JobRunner::workerLoop() {
    setThreadName("Runner");
    LOG_DEBUG("Runner thread started");

    while (true) {
        {
            std::unique_lock<std::mutex> lock(wakeMutex_);
            wakeCond_.wait(lock, [this] { return wake_ || shutdown_.load(); });
            if (shutdown_.load()) {
                break;
            }
            wake_ = false;
        }

        try {
            drain();
        } catch (const std::exception& e) {
            LOG_ERROR("Runner error: " + std::string(e.what()));
        }
        state_.store(RunnerState::Idle);
    }

    LOG_DEBUG("Runner thread stopped");
}

void JobRunner::drain() {
    while (!shutdown_.load() && queue_.hasPending()) {
        state_.store(RunnerState::WaitingForReadiness);
        if (!awaitReadiness()) {
            failPending();
            return;
        }

        auto job = queue_.dequeueNext();
        if (!job) {
            return;
        }
        processJob(*job);
    }
}

// Bounded waits, re-armed until the model is ready. A gate timeout is
// normal during startup and never reported as an error.
bool JobRunner::awaitReadiness() {
    while (!shutdown_.load()) {
        {
            std::lock_guard<std::mutex> lock(wakeMutex_);
            if (unavailable_) {
                return false;
            }
        }
        if (gate_.wait(options_.readinessPoll)) {
            return true;
        }
        if (gate_.isClosed()) {
            return false;
        }
        LOG_TRACE("Model not ready, retrying");
    }
    return false;
}

void JobRunner::processJob(const Job& job) {
    state_.store(RunnerState::Running);
    const auto name = displayName(job.path);
    const auto startTime = std::chrono::steady_clock::now();

    LOG_INFO("Processing: " + job.path);
    observer_.jobChanged(job);
    observer_.status("Processing: " + name);

    auto extractor = std::make_shared<ProgressExtractor>(options_.onExtract);
    TranscribeResult result;
    std::string error;
    {
        ProgressCapture capture(*extractor);
        slot_.attach(extractor);
        try {
            result = transcriber_.transcribe(job.path);
            if (!result.ok) {
                error = "Transcription failed: " + (result.error.empty() ? std::string("engine error") : result.error);
            }
        } catch (const std::exception& e) {
            error = "Transcription failed: " + std::string(e.what());
        } catch (...) {
            error = "Transcription failed: unknown engine error";
        }
        slot_.detach();
    }

    state_.store(RunnerState::Finishing);
    if (!error.empty()) {
        LOG_WARN(error + " (" + job.path + ", " + seconds(startTime) + ")");
        finishJob(job, JobError::Engine, error, {});
        return;
    }

    if (auto last = extractor->latest()) {
        observer_.progress(*last);
    }

    WriteResult written = options_.writer.write(job.path, result.text);
    if (!written.ok) {
        LOG_ERROR("Failed to save transcript for " + job.path + ": " + written.error);
        finishJob(job, JobError::Persistence, "Failed to save transcript: " + written.error, {});
        return;
    }

    LOG_INFO("JOB COMPLETED: " + job.path + " -> " + written.path.string() + " (" + seconds(startTime) + ")");
    finishJob(job, JobError::None, "", written.path);
}

// Observers hear about the outcome before the current slot is cleared.
void JobRunner::finishJob(const Job& job, JobError failure, const std::string& error,
                          const std::filesystem::path& transcript) {
    const bool success = failure == JobError::None;
    Job finished = job;
    finished.status = success ? Status::Done : Status::Failed;
    finished.error = error;
    finished.errorKind = failure;
    finished.timestamp = std::chrono::system_clock::now();

    const auto name = displayName(job.path);
    LOG_DEBUG("Job " + std::string(statusName(finished.status)) + " (" + jobErrorName(failure) + "): " + job.path);
    observer_.jobChanged(finished);
    if (success) {
        observer_.status("Transcription complete: " + name + " -> " + transcript.filename().string());
        ++done_;
    } else {
        observer_.error(name + ": " + error);
        observer_.status("Error: " + error);
        ++failed_;
    }

    record(std::move(finished));
    (void)queue_.completeCurrent(success, error);
}

void JobRunner::failPending() {
    std::string reason;
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        if (!unavailable_) {
            return;
        }
        reason = unavailableReason_;
    }

    // Each job passes through the current slot so it is recorded before
    // the queue reports idle.
    while (auto job = queue_.dequeueNext()) {
        job->status = Status::Failed;
        job->error = reason;
        job->errorKind = JobError::Unavailable;
        job->timestamp = std::chrono::system_clock::now();
        LOG_WARN("Dropping job, " + reason + ": " + job->path);
        observer_.jobChanged(*job);
        observer_.error(displayName(job->path) + ": " + reason);
        ++failed_;
        record(*job);
        (void)queue_.completeCurrent(false, reason);
    }
}

void JobRunner::record(Job job) {
    std::lock_guard<std::mutex> lock(historyMutex_);
    history_.push_back(std::move(job));
    if (options_.historyLimit > 0 && history_.size() > options_.historyLimit) {
        history_.erase(history_.begin(),
                       history_.begin() + static_cast<std::ptrdiff_t>(history_.size() - options_.historyLimit));
    }
}

}
