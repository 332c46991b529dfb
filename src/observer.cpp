/*
 * audioscribe - Queued Audio Transcription
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "audioscribe/observer.hpp"
#include "audioscribe/logger.hpp"
#include <utility>

namespace audioscribe {

namespace {
template <typename Fn, typename... Args>
void notify(const char* name, const Fn& fn, Args&&... args) noexcept {
    if (!fn) {
        return;
    }
    try {
        fn(std::forward<Args>(args)...);
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Observer ") + name + " threw: " + e.what());
    } catch (...) {
        LOG_ERROR(std::string("Observer ") + name + " threw an unknown exception");
    }
}
}

void Observer::progress(double fraction) const noexcept {
    notify("onProgress", onProgress, fraction);
}

void Observer::status(const std::string& text) const noexcept {
    notify("onStatus", onStatus, text);
}

void Observer::error(const std::string& message) const noexcept {
    notify("onError", onError, message);
}

void Observer::jobChanged(const Job& job) const noexcept {
    notify("onJobChanged", onJobChanged, job);
}

}
