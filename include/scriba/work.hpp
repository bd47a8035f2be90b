/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "scriba/store.hpp"
#include "scriba/types.hpp"

namespace scriba {

enum class SubmissionError : uint8_t {
    None = 0,
    NotFound,
    IoError,
    InvalidSize,
    InvalidContent,
    WorkspaceError
};

struct SubmitResult {
    bool ok = false;
    JobId id;
    SubmissionError error = SubmissionError::None;
    std::string message;
    Job job;
    explicit operator bool() const noexcept { return ok; }
};

struct MediaFile {
    std::filesystem::path path;     // absolute
    std::uintmax_t size = 0;
    bool alreadyTranscribed = false;    // a completed job exists for this path
};

struct MediaScan {
    bool ok = false;
    std::vector<MediaFile> files;       // sorted by file name
    std::vector<std::string> errors;    // unreadable entries, scan continues
    explicit operator bool() const noexcept { return ok; }
};

// Validates a media file and persists it as a pending job.
class Work final {
public:
    explicit Work(Store& store);

    Work(const Work&) = delete;
    Work& operator=(const Work&) = delete;

    [[nodiscard]] SubmitResult submit(const std::filesystem::path& file, const EngineConfig& config = {});

    void setMaxSize(std::uintmax_t maxBytes) noexcept { maxBytes_ = maxBytes; }
    [[nodiscard]] std::uintmax_t maxSize() const noexcept { return maxBytes_; }

    // Supported media in `dir`, hidden entries skipped. Subdirectories are
    // only entered when `recursive` is set.
    [[nodiscard]] MediaScan scanDirectory(const std::filesystem::path& dir, bool recursive = false) const;

    [[nodiscard]] static JobId generateId();
    [[nodiscard]] static bool isSupportedMedia(const std::filesystem::path& file);

private:
    Store& store_;
    std::uintmax_t maxBytes_;
};

}
