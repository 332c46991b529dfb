/*
 * audioscribe - Queued Audio Transcription
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "audioscribe/whisper_transcriber.hpp"
#include "audioscribe/audio.hpp"
#include "audioscribe/logger.hpp"
#include "audioscribe/output_channel.hpp"
#include "ggml-backend.h"
#include "whisper.h"
#include <chrono>
#include <cstdio>
#include <stdexcept>

namespace audioscribe {

namespace {
LogLevel fromGgmlLevel(enum ggml_log_level level) {
    switch (level) {
        case GGML_LOG_LEVEL_ERROR: return LogLevel::ERROR;
        case GGML_LOG_LEVEL_WARN:  return LogLevel::WARN;
        case GGML_LOG_LEVEL_DEBUG: return LogLevel::DEBUG;
        default: return LogLevel::INFO;
    }
}

// All whisper/ggml diagnostics land in the shared output channel
void channel_log(enum ggml_log_level level, const char* text, void* /*user_data*/) {
    if (!text || text[0] == '\0') {
        return;
    }
    OutputChannel::instance().write(text, fromGgmlLevel(level));
}

void channel_progress(struct whisper_context* /*ctx*/, struct whisper_state* /*state*/, int progress, void* /*user_data*/) {
    char line[64];
    std::snprintf(line, sizeof(line), "whisper_full: progress = %3d%%\n", progress);
    OutputChannel::instance().write(line, LogLevel::INFO);
}

std::string trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}
}

WhisperTranscriber::WhisperTranscriber(Config config) : config_(std::move(config)) {
    OutputChannel::instance().setEchoLevel(config_.engineEchoLevel);
    whisper_log_set(channel_log, nullptr);
    ggml_backend_load_all();
}

WhisperTranscriber::~WhisperTranscriber() = default;

void WhisperTranscriber::loadModel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ctx_) {
        return;
    }

    if (!std::filesystem::exists(config_.modelPath)) {
        throw std::runtime_error("Model not found: " + config_.modelPath);
    }
    if (config_.language != "auto" && whisper_lang_id(config_.language.c_str()) == -1) {
        throw std::runtime_error("Unknown language: " + config_.language);
    }

    LOG_INFO("Loading model: " + config_.modelPath);
    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = config_.useGpu;

    whisper_context* ctx = whisper_init_from_file_with_params(config_.modelPath.c_str(), cparams);
    if (!ctx) {
        throw std::runtime_error("Failed to load model: " + config_.modelPath);
    }

    ctx_ = std::shared_ptr<whisper_context>(ctx, whisper_free);
    loaded_.store(true);
    LOG_INFO("Model loaded successfully");
}

TranscribeResult WhisperTranscriber::transcribe(const std::filesystem::path& audioPath) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ctx_) {
        return {false, "", "Model not loaded"};
    }

    auto loadStart = std::chrono::steady_clock::now();
    AudioResult audio = loadAudio(audioPath, config_.ffmpegPath);
    if (!audio.ok) {
        return {false, "", audio.error};
    }
    auto loadTime = std::chrono::duration<double>(std::chrono::steady_clock::now() - loadStart).count();
    LOG_DEBUG("Decoded " + std::to_string(audio.samples.size()) + " samples in " + std::to_string(loadTime) + "s");

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.print_progress = false;
    wparams.print_special = false;
    wparams.print_realtime = false;
    wparams.print_timestamps = false;
    wparams.language = config_.language.c_str();
    wparams.n_threads = config_.threads;
    wparams.progress_callback = channel_progress;
    wparams.progress_callback_user_data = nullptr;

    if (whisper_full(ctx_.get(), wparams, audio.samples.data(), static_cast<int>(audio.samples.size())) != 0) {
        return {false, "", "whisper_full failed for " + audioPath.filename().string()};
    }

    std::string text;
    const int segments = whisper_full_n_segments(ctx_.get());
    for (int i = 0; i < segments; ++i) {
        const char* segment = whisper_full_get_segment_text(ctx_.get(), i);
        if (segment) {
            text += segment;
        }
    }

    LOG_INFO("Transcribed " + std::to_string(segments) + " segments, " + std::to_string(text.size()) + " bytes");
    return {true, trim(text), ""};
}

}
