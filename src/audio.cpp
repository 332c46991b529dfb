/*
 * audioscribe - Queued Audio Transcription
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "audioscribe/audio.hpp"
#include "audioscribe/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sys/wait.h>

namespace audioscribe {

namespace {
uint16_t read_u16_le(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t read_u32_le(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

std::string shellQuote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

AudioResult fail(const std::string& message) {
    AudioResult result;
    result.error = message;
    return result;
}
}

AudioResult readWav(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return fail("Failed to open audio file: " + path.string());
    }
    std::vector<uint8_t> buf((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    if (buf.size() < 44 || std::memcmp(buf.data(), "RIFF", 4) != 0 || std::memcmp(buf.data() + 8, "WAVE", 4) != 0) {
        return fail("Not a RIFF/WAVE file: " + path.string());
    }

    uint16_t format = 0;
    uint16_t channels = 0;
    uint32_t rate = 0;
    uint16_t bits = 0;
    std::size_t dataOff = 0;
    std::size_t dataSize = 0;

    std::size_t off = 12;
    while (off + 8 <= buf.size()) {
        const uint8_t* tag = buf.data() + off;
        const uint32_t chunkSize = read_u32_le(buf.data() + off + 4);
        const std::size_t chunkData = off + 8;
        if (chunkData + chunkSize > buf.size()) {
            // Truncated data chunks are common from interrupted recorders
            if (std::memcmp(tag, "data", 4) == 0) {
                dataOff = chunkData;
                dataSize = buf.size() - chunkData;
            }
            break;
        }

        if (std::memcmp(tag, "fmt ", 4) == 0 && chunkSize >= 16) {
            format = read_u16_le(buf.data() + chunkData);
            channels = read_u16_le(buf.data() + chunkData + 2);
            rate = read_u32_le(buf.data() + chunkData + 4);
            bits = read_u16_le(buf.data() + chunkData + 14);
        } else if (std::memcmp(tag, "data", 4) == 0) {
            dataOff = chunkData;
            dataSize = chunkSize;
        }

        off = chunkData + chunkSize;
        if (off & 1) off++;
    }

    if (!rate || !channels) {
        return fail("Missing fmt chunk: " + path.string());
    }
    if (!dataOff || !dataSize) {
        return fail("No audio data: " + path.string());
    }

    const bool pcm16 = format == 1 && bits == 16;
    const bool pcm32 = format == 1 && bits == 32;
    const bool float32 = format == 3 && bits == 32;
    if (!pcm16 && !pcm32 && !float32) {
        return fail("Unsupported WAV encoding (format " + std::to_string(format) +
                    ", " + std::to_string(bits) + " bits): " + path.string());
    }

    const std::size_t sampleBytes = bits / 8;
    const std::size_t frameBytes = sampleBytes * channels;
    const std::size_t frames = dataSize / frameBytes;

    AudioResult result;
    result.samples.reserve(frames);
    const uint8_t* data = buf.data() + dataOff;
    for (std::size_t i = 0; i < frames; ++i) {
        double sum = 0.0;
        const uint8_t* frame = data + i * frameBytes;
        for (uint16_t ch = 0; ch < channels; ++ch) {
            const uint8_t* p = frame + ch * sampleBytes;
            if (pcm16) {
                int16_t s;
                std::memcpy(&s, p, sizeof(s));
                sum += s / 32768.0;
            } else if (pcm32) {
                int32_t s;
                std::memcpy(&s, p, sizeof(s));
                sum += s / 2147483648.0;
            } else {
                float s;
                std::memcpy(&s, p, sizeof(s));
                sum += s;
            }
        }
        result.samples.push_back(static_cast<float>(sum / channels));
    }

    result.sampleRate = static_cast<int>(rate);
    result.ok = true;
    return result;
}

AudioResult decodeWithFfmpeg(const std::filesystem::path& path, const std::string& ffmpeg, int sampleRate) {
    std::string cmd = shellQuote(ffmpeg) + " -nostdin -loglevel error -i " + shellQuote(path.string()) +
                      " -f f32le -acodec pcm_f32le -ac 1 -ar " + std::to_string(sampleRate) + " - 2>/dev/null";
    LOG_DEBUG("Decoding with ffmpeg: " + path.string());

    FILE* pipe = ::popen(cmd.c_str(), "r");
    if (!pipe) {
        return fail("Failed to start ffmpeg for " + path.string());
    }

    AudioResult result;
    float chunk[4096];
    std::size_t n = 0;
    while ((n = std::fread(chunk, sizeof(float), 4096, pipe)) > 0) {
        result.samples.insert(result.samples.end(), chunk, chunk + n);
    }

    int status = ::pclose(pipe);
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return fail("ffmpeg could not decode " + path.string() + " (is ffmpeg installed?)");
    }
    if (result.samples.empty()) {
        return fail("No audio decoded from " + path.string());
    }

    result.sampleRate = sampleRate;
    result.ok = true;
    return result;
}

std::vector<float> resampleLinear(const std::vector<float>& in, int rateIn, int rateOut) {
    if (in.empty() || rateIn <= 0 || rateOut <= 0 || rateIn == rateOut) {
        return in;
    }

    const double ratio = static_cast<double>(rateIn) / rateOut;
    const std::size_t outSize = static_cast<std::size_t>(in.size() / ratio);
    std::vector<float> out;
    out.reserve(outSize);
    for (std::size_t i = 0; i < outSize; ++i) {
        const double pos = i * ratio;
        const std::size_t idx = static_cast<std::size_t>(pos);
        const double frac = pos - idx;
        const float a = in[std::min(idx, in.size() - 1)];
        const float b = in[std::min(idx + 1, in.size() - 1)];
        out.push_back(static_cast<float>(a + (b - a) * frac));
    }
    return out;
}

AudioResult loadAudio(const std::filesystem::path& path, const std::string& ffmpeg) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    AudioResult result = (ext == ".wav") ? readWav(path) : decodeWithFfmpeg(path, ffmpeg);
    if (!result.ok) {
        return result;
    }
    if (result.sampleRate != kEngineSampleRate) {
        LOG_DEBUG("Resampling " + std::to_string(result.sampleRate) + " Hz -> " +
                  std::to_string(kEngineSampleRate) + " Hz");
        result.samples = resampleLinear(result.samples, result.sampleRate, kEngineSampleRate);
        result.sampleRate = kEngineSampleRate;
    }
    return result;
}

}
