/*
 * audioscribe - Queued Audio Transcription
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <functional>
#include <string>

#include "audioscribe/types.hpp"

namespace audioscribe {

// UI-facing callbacks. They run on pipeline threads and must be cheap;
// marshaling onto a UI thread is the receiver's job. Unset callbacks are skipped.
struct Observer {
    std::function<void(double fraction)> onProgress;
    std::function<void(const std::string& text)> onStatus;
    std::function<void(const std::string& message)> onError;
    std::function<void(const Job& job)> onJobChanged;

    void progress(double fraction) const noexcept;
    void status(const std::string& text) const noexcept;
    void error(const std::string& message) const noexcept;
    void jobChanged(const Job& job) const noexcept;
};

}
