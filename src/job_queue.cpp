/*
 * audioscribe - Queued Audio Transcription
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "audioscribe/job_queue.hpp"
#include "audioscribe/logger.hpp"
#include <algorithm>
#include <cctype>

namespace audioscribe {

namespace {
std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool isTrimmable(char c) {
    return c == '{' || c == '}' || std::isspace(static_cast<unsigned char>(c));
}
}

const std::vector<std::string>& JobQueue::supportedExtensions() {
    static const std::vector<std::string> extensions = {".wav", ".mp3"};
    return extensions;
}

bool JobQueue::isSupportedFormat(const std::filesystem::path& path) {
    std::string ext = toLowerCopy(path.extension().string());
    const auto& valid = supportedExtensions();
    return std::find(valid.begin(), valid.end(), ext) != valid.end();
}

std::filesystem::path JobQueue::normalizePath(const std::string& raw) {
    std::size_t begin = 0;
    std::size_t end = raw.size();
    while (begin < end && isTrimmable(raw[begin])) ++begin;
    while (end > begin && isTrimmable(raw[end - 1])) --end;
    if (begin == end) {
        return {};
    }

    std::filesystem::path path(raw.substr(begin, end - begin));
    path.make_preferred();
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        return path.lexically_normal();
    }
    return absolute.lexically_normal();
}

std::vector<std::string> JobQueue::splitDropList(const std::string& data) {
    std::vector<std::string> paths;
    std::size_t i = 0;
    while (i < data.size()) {
        if (std::isspace(static_cast<unsigned char>(data[i]))) {
            ++i;
            continue;
        }
        if (data[i] == '{') {
            auto close = data.find('}', i + 1);
            if (close == std::string::npos) {
                paths.push_back(data.substr(i + 1));
                break;
            }
            paths.push_back(data.substr(i + 1, close - i - 1));
            i = close + 1;
            continue;
        }
        std::size_t start = i;
        while (i < data.size() && !std::isspace(static_cast<unsigned char>(data[i]))) ++i;
        paths.push_back(data.substr(start, i - start));
    }
    return paths;
}

EnqueueResult JobQueue::enqueue(const std::string& rawPath, const QueuedCallback& onQueued) {
    auto path = normalizePath(rawPath);
    if (path.empty()) {
        return {false, "", EnqueueError::EmptyPath, "Empty file path", false};
    }

    JobId id = path.string();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        LOG_DEBUG("Rejected missing file: " + id);
        return {false, id, EnqueueError::FileNotFound, "File not found: " + id, false};
    }
    if (!std::filesystem::is_regular_file(path, ec)) {
        LOG_DEBUG("Rejected non-file path: " + id);
        return {false, id, EnqueueError::NotAFile, "Path is not a file: " + id, false};
    }
    if (!isSupportedFormat(path)) {
        LOG_DEBUG("Rejected unsupported format: " + id);
        return {false, id, EnqueueError::UnsupportedFormat, "Unsupported format: " + id, false};
    }

    // Holding notifyMutex_ across onQueued keeps dequeueNext() from
    // overtaking the Pending notification, while mutex_ stays free for readers.
    std::lock_guard<std::mutex> notifyLock(notifyMutex_);
    Job queued{id, Status::Pending, "", JobError::None, std::chrono::system_clock::now()};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (containsLocked(id)) {
            LOG_DEBUG("Already queued: " + id);
            return {true, id, EnqueueError::None, "", true};
        }
        pending_.push_back(queued);
    }
    if (onQueued) {
        onQueued(queued);
    }

    LOG_INFO("Job queued: " + id);
    return {true, id, EnqueueError::None, "", false};
}

std::optional<Job> JobQueue::dequeueNext() {
    std::lock_guard<std::mutex> notifyLock(notifyMutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_ || pending_.empty()) {
        return std::nullopt;
    }
    Job job = std::move(pending_.front());
    pending_.pop_front();
    job.status = Status::Running;
    job.timestamp = std::chrono::system_clock::now();
    current_ = job;
    return job;
}

std::optional<Job> JobQueue::completeCurrent(bool success, const std::string& error) {
    std::optional<Job> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!current_) {
            return std::nullopt;
        }
        finished = std::move(current_);
        current_.reset();
    }
    finished->status = success ? Status::Done : Status::Failed;
    finished->error = success ? "" : error;
    finished->timestamp = std::chrono::system_clock::now();
    idleCond_.notify_all();
    return finished;
}

std::vector<Job> JobQueue::clearPending() {
    std::vector<Job> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped.assign(std::make_move_iterator(pending_.begin()),
                       std::make_move_iterator(pending_.end()));
        pending_.clear();
    }
    idleCond_.notify_all();
    return dropped;
}

std::vector<Job> JobQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {pending_.begin(), pending_.end()};
}

std::optional<Job> JobQueue::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

std::size_t JobQueue::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool JobQueue::hasPending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !pending_.empty();
}

bool JobQueue::idle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.empty() && !current_;
}

bool JobQueue::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idleCond_.wait_for(lock, timeout, [this] { return pending_.empty() && !current_; });
}

bool JobQueue::containsLocked(const JobId& id) const {
    if (current_ && current_->path == id) {
        return true;
    }
    return std::any_of(pending_.begin(), pending_.end(),
        [&id](const Job& job) { return job.path == id; });
}

}
