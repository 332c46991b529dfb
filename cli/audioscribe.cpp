/*
 * audioscribe - Transcription queue CLI
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "audioscribe/config.hpp"
#include "audioscribe/logger.hpp"
#include "audioscribe/pipeline.hpp"
#include "audioscribe/whisper_transcriber.hpp"
#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace audioscribe;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

namespace {
std::mutex g_output_mutex;
bool g_progress_line = false;

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
    return buf;
}

// Caller holds g_output_mutex.
void endProgressLine() {
    if (g_progress_line) {
        std::cout << "\n";
        g_progress_line = false;
    }
}

void printLine(const std::string& text) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    endProgressLine();
    std::cout << "    \033[90m" << timestamp() << "\033[0m  " << text << "\n" << std::flush;
}

void printProgress(double fraction) {
    constexpr int width = 30;
    int filled = static_cast<int>(fraction * width);
    if (filled < 0) filled = 0;
    if (filled > width) filled = width;

    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cout << "\r    [" << std::string(filled, '#') << std::string(width - filled, '-') << "] "
              << std::setw(3) << static_cast<int>(fraction * 100) << "%" << std::flush;
    g_progress_line = true;
}

void printError(const std::string& message) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    endProgressLine();
    std::cerr << "    \033[31merror\033[0m  " << message << "\n" << std::flush;
}

void printJob(const Job& job) {
    const auto name = std::filesystem::path(job.path).filename().string();
    switch (job.status) {
        case Status::Pending: printLine(name + "  \033[90mqueued\033[0m"); break;
        case Status::Running: printLine(name + "  \033[33mrunning\033[0m"); break;
        case Status::Done:    printLine(name + "  \033[32mdone\033[0m"); break;
        case Status::Failed:  printLine(name + "  \033[31mfailed\033[0m"); break;
    }
}

void installSignalHandlers() {
    // No SA_RESTART: a blocking read on stdin must return on Ctrl-C
    struct sigaction sa {};
    sa.sa_handler = signalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}
}

void printUsage(const char* progName) {
    std::cout << "audioscribe v" << VERSION << " - queued audio transcription\n\n";
    std::cout << "Usage: " << progName << " [options] [file ...] [-]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  file            Audio file to transcribe (.wav, .mp3); {braced paths} allowed\n";
    std::cout << "  -               Read more files from stdin, one drop per line\n\n";
    std::cout << "Options:\n";
    std::cout << "  -m, --model <path>   whisper ggml model\n";
    std::cout << "  -l, --lang <code>    Language code or 'auto'\n";
    std::cout << "  -t, --threads <n>    Decoder threads\n";
    std::cout << "  --cpu                Disable GPU backends\n";
    std::cout << "  -h, --help           Show this help message\n";
    std::cout << "  -v, --version        Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  AUDIOSCRIBE_MODEL, AUDIOSCRIBE_LANGUAGE, AUDIOSCRIBE_THREADS, AUDIOSCRIBE_GPU,\n";
    std::cout << "  AUDIOSCRIBE_FFMPEG, AUDIOSCRIBE_MONITOR_MS, AUDIOSCRIBE_READY_POLL_MS,\n";
    std::cout << "  AUDIOSCRIBE_HISTORY_LIMIT,\n";
    std::cout << "  AUDIOSCRIBE_LOG_LEVEL (ERROR, WARN, INFO, DEBUG, TRACE), WHISPER_LOG_LEVEL\n\n";
    std::cout << "Transcripts are written next to each input as <name>_transcript.txt\n";
}

int main(int argc, char* argv[]) {
    // Keep the progress display clean; AUDIOSCRIBE_LOG_LEVEL overrides
    if (!std::getenv("AUDIOSCRIBE_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

    Config config = Config::fromEnv();
    std::vector<std::string> files;
    bool readStdin = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto needValue = [&](const char* flag) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << flag << " requires a value\n";
                std::exit(1);
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        } else if (arg == "-m" || arg == "--model") {
            config.modelPath = needValue("--model");
        } else if (arg == "-l" || arg == "--lang") {
            config.language = needValue("--lang");
        } else if (arg == "-t" || arg == "--threads") {
            try {
                config.threads = std::max(1, std::stoi(needValue("--threads")));
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid thread count\n";
                return 1;
            }
        } else if (arg == "--cpu") {
            config.useGpu = false;
        } else if (arg == "-") {
            readStdin = true;
        } else {
            files.push_back(arg);
        }
    }

    if (files.empty() && !isatty(fileno(stdin))) {
        readStdin = true;
    }
    if (files.empty() && !readStdin) {
        printUsage(argv[0]);
        return 1;
    }

    installSignalHandlers();

    Observer observer;
    observer.onProgress = printProgress;
    observer.onStatus = [](const std::string& text) { LOG_INFO("Status: " + text); };
    observer.onError = printError;
    observer.onJobChanged = printJob;

    std::cout << "\n  \033[1maudioscribe\033[0m " << VERSION << "\n";
    std::cout << "    Model      " << config.modelPath << "\n";
    std::cout << "    Language   " << config.language << "\n";
    std::cout << "    Threads    " << config.threads << "\n\n" << std::flush;

    try {
        WhisperTranscriber transcriber(config);
        Pipeline pipeline(transcriber, observer, config);

        std::size_t rejected = 0;
        // Each argument is one path, even when it contains spaces
        for (const auto& file : files) {
            if (!pipeline.enqueue(file)) ++rejected;
        }

        // Nothing to do: skip loading the model, which shutdown would wait for
        if (pipeline.pending().empty() && !readStdin) {
            return 1;
        }

        if (!pipeline.start()) {
            std::cerr << "Error: Failed to start pipeline\n";
            return 1;
        }

        if (readStdin) {
            std::string line;
            while (!g_shutdown_requested && std::getline(std::cin, line)) {
                if (!line.empty()) {
                    for (const auto& result : pipeline.enqueueDropList(line)) {
                        if (!result) ++rejected;
                    }
                }
            }
        }

        while (!g_shutdown_requested && !pipeline.waitIdle(std::chrono::milliseconds(100))) {
        }

        if (g_shutdown_requested) {
            printLine("Shutdown requested, finishing current job...");
        }
        pipeline.shutdown();

        bool failed = pipeline.initState() == InitState::Failed || pipeline.failedCount() > 0 || rejected > 0;
        return failed ? 1 : 0;

    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: " + std::string(e.what()));
        return 1;
    }
}
