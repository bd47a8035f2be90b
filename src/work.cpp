/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/work.hpp"
#include "scriba/logger.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <functional>
#include <set>
#include <sstream>
#include <vector>
#include <unistd.h>

namespace scriba {

namespace {
std::uintmax_t env_size(const char* name, std::uintmax_t defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        auto parsed = static_cast<std::uintmax_t>(std::stoull(val));
        return parsed == 0 ? defv : parsed;
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}
}

Work::Work(Store& store)
    : store_(store), maxBytes_(4ULL * 1024 * 1024 * 1024) {
    maxBytes_ = env_size("SCRIBA_MAX_INPUT_SIZE", maxBytes_);
}

bool Work::isSupportedMedia(const std::filesystem::path& file) {
    static const std::vector<std::string> valid_ext = {
        ".wav", ".mp3", ".m4a", ".aac", ".flac", ".ogg", ".opus", ".wma",
        ".webm", ".mp4", ".mkv", ".mov", ".avi", ".m4v"
    };
    std::string ext = toLowerCopy(file.extension().string());
    return std::find(valid_ext.begin(), valid_ext.end(), ext) != valid_ext.end();
}

SubmitResult Work::submit(const std::filesystem::path& file, const EngineConfig& config) {
    std::error_code ec;
    if (!std::filesystem::exists(file, ec)) {
        LOG_DEBUG("Input not found: " + file.string());
        return {false, "", SubmissionError::NotFound, "File not found: " + file.string(), {}};
    }
    if (!std::filesystem::is_regular_file(file, ec)) {
        return {false, "", SubmissionError::InvalidContent, "Not a regular file: " + file.string(), {}};
    }
    if (!isSupportedMedia(file)) {
        return {false, "", SubmissionError::InvalidContent, "Unsupported media type: " + file.string(), {}};
    }
    if (config.speakerCount < 0) {
        return {false, "", SubmissionError::InvalidContent, "Speaker count cannot be negative", {}};
    }

    auto size = std::filesystem::file_size(file, ec);
    if (ec) {
        LOG_ERROR("Failed to read size of " + file.string() + ": " + ec.message());
        return {false, "", SubmissionError::IoError, "Failed to read file size: " + file.string(), {}};
    }
    if (size > maxBytes_) {
        return {false, "", SubmissionError::InvalidSize,
                "File exceeds maximum size limit (" + std::to_string(maxBytes_) + " bytes)", {}};
    }

    Job job;
    job.id = generateId();
    job.filePath = std::filesystem::absolute(file, ec).lexically_normal().string();
    if (ec) {
        job.filePath = file.string();
    }
    job.fileName = file.filename().string();
    job.fileSize = size;
    job.config = config;
    job.status = Status::Pending;
    job.createdAt = std::chrono::system_clock::now();
    job.updatedAt = job.createdAt;
    LOG_DEBUG("Generated job ID: " + job.id);

    if (!store_.create(job)) {
        LOG_ERROR("Failed to persist job: " + job.id);
        return {false, "", SubmissionError::WorkspaceError, "Failed to persist job", {}};
    }

    LOG_INFO("Job submitted: " + job.id + " (" + job.fileName + ")");
    return {true, job.id, SubmissionError::None, "", job};
}

MediaScan Work::scanDirectory(const std::filesystem::path& dir, bool recursive) const {
    MediaScan scan;
    std::error_code ec;
    auto root = std::filesystem::absolute(dir, ec).lexically_normal();
    if (ec || !std::filesystem::is_directory(root, ec)) {
        scan.errors.push_back("Not a directory: " + dir.string());
        return scan;
    }

    std::set<std::string> transcribed;
    for (const auto& job : store_.list({Status::Completed, 0})) {
        transcribed.insert(job.filePath);
    }

    std::function<void(const std::filesystem::path&)> walk = [&](const std::filesystem::path& current) {
        std::error_code walkEc;
        std::filesystem::directory_iterator it(current, walkEc), end;
        if (walkEc) {
            scan.errors.push_back("Error scanning " + current.string() + ": " + walkEc.message());
            return;
        }
        for (; it != end; it.increment(walkEc)) {
            if (walkEc) {
                scan.errors.push_back("Error scanning " + current.string() + ": " + walkEc.message());
                return;
            }
            const auto& path = it->path();
            if (path.filename().string().rfind('.', 0) == 0) {
                continue;
            }
            std::error_code entryEc;
            if (it->is_directory(entryEc)) {
                if (recursive) {
                    walk(path);
                }
                continue;
            }
            if (!it->is_regular_file(entryEc) || !isSupportedMedia(path)) {
                continue;
            }
            auto size = it->file_size(entryEc);
            if (entryEc) {
                scan.errors.push_back("Error reading " + path.string() + ": " + entryEc.message());
                continue;
            }
            scan.files.push_back({path, size, transcribed.count(path.string()) > 0});
        }
    };
    walk(root);

    std::sort(scan.files.begin(), scan.files.end(), [](const MediaFile& a, const MediaFile& b) {
        auto an = a.path.filename().string();
        auto bn = b.path.filename().string();
        return an != bn ? an < bn : a.path < b.path;
    });
    LOG_DEBUG("Scanned " + root.string() + ": " + std::to_string(scan.files.size()) + " media files");
    scan.ok = true;
    return scan;
}

JobId Work::generateId() {
    static std::atomic<uint64_t> counter{0};

    // Wall clock so ids from different processes sort by submission time
    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    uint64_t unique_counter = counter.fetch_add(1);

    std::stringstream ss;
    ss << now << "_" << getpid() << "_" << unique_counter;
    return ss.str();
}

}
