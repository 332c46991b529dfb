/*
 * audioscribe - Queued Audio Transcription
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "audioscribe/transcript_writer.hpp"
#include "audioscribe/logger.hpp"
#include <fstream>

namespace audioscribe {

std::filesystem::path TranscriptWriter::transcriptPathFor(const std::filesystem::path& source) {
    return source.parent_path() / (source.stem().string() + "_transcript.txt");
}

WriteResult TranscriptWriter::write(const std::filesystem::path& source, const std::string& text) const noexcept {
    WriteResult result;
    try {
        result.path = transcriptPathFor(source);
        auto tempPath = result.path;
        tempPath += ".tmp";

        {
            std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
            if (!file) {
                result.error = "Cannot open " + tempPath.string() + " for writing";
                return result;
            }
            file << header_ << text;
            file.flush();
            if (!file.good()) {
                result.error = "Failed writing " + tempPath.string();
                file.close();
                std::error_code ec;
                std::filesystem::remove(tempPath, ec);
                return result;
            }
        }

        std::error_code ec;
        std::filesystem::rename(tempPath, result.path, ec);
        if (ec) {
            result.error = "Failed to save " + result.path.string() + ": " + ec.message();
            std::filesystem::remove(tempPath, ec);
            return result;
        }

        LOG_DEBUG("Transcript written: " + result.path.string());
        result.ok = true;
        return result;
    } catch (const std::exception& e) {
        result.error = "Failed to save transcript: " + std::string(e.what());
        return result;
    } catch (...) {
        result.error = "Unknown error saving transcript";
        return result;
    }
}

}
