/*
 * audioscribe - Queued Audio Transcription
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "audioscribe/types.hpp"

namespace audioscribe {

const char* statusName(Status status) noexcept {
    switch (status) {
        case Status::Pending: return "pending";
        case Status::Running: return "running";
        case Status::Done:    return "done";
        case Status::Failed:  return "failed";
        default: return "unknown";
    }
}

const char* jobErrorName(JobError error) noexcept {
    switch (error) {
        case JobError::None:        return "none";
        case JobError::Engine:      return "engine";
        case JobError::Persistence: return "persistence";
        case JobError::Unavailable: return "unavailable";
        default: return "unknown";
    }
}

}
