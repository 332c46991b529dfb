/*
 * audioscribe - Queued Audio Transcription
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "audioscribe/job_queue.hpp"
#include "audioscribe/observer.hpp"
#include "audioscribe/progress_monitor.hpp"
#include "audioscribe/readiness_gate.hpp"
#include "audioscribe/transcriber.hpp"
#include "audioscribe/transcript_writer.hpp"

namespace audioscribe {

enum class RunnerState : uint8_t {
    Idle,
    WaitingForReadiness,
    Running,
    Finishing
};

[[nodiscard]] const char* runnerStateName(RunnerState state) noexcept;

struct RunnerOptions {
    std::chrono::milliseconds readinessPoll{100};
    // Receives every value a job's extractor produces.
    ProgressCallback onExtract;
    TranscriptWriter writer{};
    // Finished records kept for history(); the oldest are dropped first.
    std::size_t historyLimit = 1000;
};

// The only consumer of the JobQueue. Owns exactly one worker thread, so at
// most one job is ever Running; notify() requests are coalesced into that
// thread rather than spawning work.
class JobRunner final {
public:
    JobRunner(JobQueue& queue, ReadinessGate& gate, ProgressSlot& slot,
              Transcriber& transcriber, const Observer& observer,
              RunnerOptions options = {});
    ~JobRunner();

    JobRunner(const JobRunner&) = delete;
    JobRunner& operator=(const JobRunner&) = delete;
    JobRunner(JobRunner&&) = delete;
    JobRunner& operator=(JobRunner&&) = delete;

    [[nodiscard]] bool start();
    // Waits for an in-flight transcription to finish; does not interrupt it.
    void stop() noexcept;

    // The queue became non-empty.
    void notify();

    // Initialization failed: pending and future jobs fail with reason.
    void setUnavailable(const std::string& reason);

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] RunnerState state() const noexcept { return state_.load(); }
    [[nodiscard]] std::vector<Job> history() const;
    [[nodiscard]] std::size_t failedCount() const noexcept { return failed_.load(); }
    [[nodiscard]] std::size_t doneCount() const noexcept { return done_.load(); }

private:
    void workerLoop();
    void drain();
    [[nodiscard]] bool awaitReadiness();
    void processJob(const Job& job);
    void finishJob(const Job& job, JobError failure, const std::string& error,
                   const std::filesystem::path& transcript);
    void failPending();
    void record(Job job);

    JobQueue& queue_;
    ReadinessGate& gate_;
    ProgressSlot& slot_;
    Transcriber& transcriber_;
    const Observer& observer_;
    RunnerOptions options_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::atomic<RunnerState> state_{RunnerState::Idle};
    std::atomic<std::size_t> done_{0};
    std::atomic<std::size_t> failed_{0};

    std::mutex wakeMutex_;
    std::condition_variable wakeCond_;
    bool wake_ = false;
    bool unavailable_ = false;
    std::string unavailableReason_;

    mutable std::mutex historyMutex_;
    std::vector<Job> history_;

    std::thread worker_;
};

}
