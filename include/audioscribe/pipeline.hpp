/*
 * audioscribe - Queued Audio Transcription
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "audioscribe/config.hpp"
#include "audioscribe/job_queue.hpp"
#include "audioscribe/job_runner.hpp"
#include "audioscribe/observer.hpp"
#include "audioscribe/progress_monitor.hpp"
#include "audioscribe/readiness_gate.hpp"
#include "audioscribe/transcriber.hpp"

namespace audioscribe {

enum class InitState : uint8_t { Loading, Ready, Failed };

// Wires the readiness gate, job queue, runner and progress monitor around a
// transcription engine whose model loads in the background.
class Pipeline final {
public:
    Pipeline(Transcriber& transcriber, Observer observer, Config config = {});
    ~Pipeline();

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;
    Pipeline(Pipeline&&) = delete;
    Pipeline& operator=(Pipeline&&) = delete;

    // Starts the worker threads and begins loading the model; returns immediately.
    [[nodiscard]] bool start();
    void shutdown() noexcept;

    EnqueueResult enqueue(const std::string& rawPath);
    std::vector<EnqueueResult> enqueueAll(const std::vector<std::string>& rawPaths);
    std::vector<EnqueueResult> enqueueDropList(const std::string& data);

    // True once nothing is pending or running.
    [[nodiscard]] bool waitIdle(std::chrono::milliseconds timeout);

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] InitState initState() const noexcept { return initState_.load(); }
    [[nodiscard]] RunnerState runnerState() const noexcept;
    [[nodiscard]] double lastProgress() const noexcept { return lastProgress_.load(); }

    [[nodiscard]] std::vector<Job> pending() const { return queue_.pending(); }
    [[nodiscard]] std::optional<Job> current() const { return queue_.current(); }
    [[nodiscard]] std::vector<Job> history() const;
    [[nodiscard]] std::size_t failedCount() const noexcept;

private:
    void initialize();

    Transcriber& transcriber_;
    Observer observer_;
    Config config_;

    ReadinessGate gate_;
    JobQueue queue_;
    ProgressSlot slot_;
    std::unique_ptr<JobRunner> runner_;
    std::unique_ptr<ProgressMonitor> monitor_;

    std::atomic<bool> running_{false};
    std::atomic<InitState> initState_{InitState::Loading};
    std::atomic<double> lastProgress_{0.0};
    std::thread initThread_;
};

}
