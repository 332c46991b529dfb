/*
 * audioscribe - Queued Audio Transcription
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "audioscribe/types.hpp"

namespace audioscribe {

enum class EnqueueError : uint8_t {
    None = 0,
    EmptyPath,
    FileNotFound,
    NotAFile,
    UnsupportedFormat,
    Unavailable
};

struct EnqueueResult {
    bool ok = false;
    JobId id;
    EnqueueError error = EnqueueError::None;
    std::string message;
    // Path was already pending or running; nothing was added.
    bool duplicate = false;
    explicit operator bool() const noexcept { return ok; }
};

// FIFO of pending jobs plus the single job currently running.
// A normalized path appears at most once across pending and current.
class JobQueue final {
public:
    JobQueue() = default;

    JobQueue(const JobQueue&) = delete;
    JobQueue& operator=(const JobQueue&) = delete;
    JobQueue(JobQueue&&) = delete;
    JobQueue& operator=(JobQueue&&) = delete;

    using QueuedCallback = std::function<void(const Job&)>;

    // onQueued runs before the job can be dequeued. It may read the queue
    // but must not enqueue.
    [[nodiscard]] EnqueueResult enqueue(const std::string& rawPath, const QueuedCallback& onQueued = {});

    // Moves the head pending job into the current slot as Running.
    // Empty when nothing is pending or a job is already current.
    [[nodiscard]] std::optional<Job> dequeueNext();

    // Clears the current slot and returns the finished record.
    std::optional<Job> completeCurrent(bool success, const std::string& error = "");

    // Drops every pending job; the current job is untouched.
    std::vector<Job> clearPending();

    [[nodiscard]] std::vector<Job> pending() const;
    [[nodiscard]] std::optional<Job> current() const;
    [[nodiscard]] std::size_t pendingCount() const;
    [[nodiscard]] bool hasPending() const;
    [[nodiscard]] bool idle() const;

    // Blocks until nothing is pending or running, or timeout expires.
    [[nodiscard]] bool waitIdle(std::chrono::milliseconds timeout);

    [[nodiscard]] static std::filesystem::path normalizePath(const std::string& raw);
    [[nodiscard]] static bool isSupportedFormat(const std::filesystem::path& path);
    [[nodiscard]] static const std::vector<std::string>& supportedExtensions();

    // Splits a drag-and-drop payload; paths containing spaces arrive as {a b.wav}.
    [[nodiscard]] static std::vector<std::string> splitDropList(const std::string& data);

private:
    [[nodiscard]] bool containsLocked(const JobId& id) const;

    // Taken before mutex_; serializes Pending notifications against dequeue.
    std::mutex notifyMutex_;
    mutable std::mutex mutex_;
    std::condition_variable idleCond_;
    std::deque<Job> pending_;
    std::optional<Job> current_;
};

}
