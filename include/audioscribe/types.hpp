/*
 * audioscribe - Queued Audio Transcription
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace audioscribe {

// Job lifecycle states.
enum class Status : std::uint8_t { Pending, Running, Done, Failed };

// Why a job ended Failed.
enum class JobError : std::uint8_t { None, Engine, Persistence, Unavailable };

// A job is identified by its normalized absolute path.
using JobId = std::string;

struct Job {
    JobId path;
    Status status = Status::Pending;
    std::string error;
    JobError errorKind = JobError::None;
    std::chrono::system_clock::time_point timestamp;
};

[[nodiscard]] const char* statusName(Status status) noexcept;
[[nodiscard]] const char* jobErrorName(JobError error) noexcept;

} // namespace audioscribe
