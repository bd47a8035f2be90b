/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/scanner.hpp"
#include "scriba/logger.hpp"
#include <algorithm>

namespace scriba {

Scanner::Scanner(const std::filesystem::path& workspace) noexcept
    : workspace_(workspace), pendingPath_(workspace / "pending") {
}

std::vector<JobId> Scanner::scan() const noexcept {
    std::vector<JobId> jobs;

    try {
        std::error_code ec;
        if (!std::filesystem::exists(pendingPath_, ec)) {
            LOG_DEBUG("Pending directory does not exist: " + pendingPath_.string());
            return jobs;
        }

        for (const auto& entry : std::filesystem::directory_iterator(pendingPath_)) {
            if (isValidJobDirectory(entry.path())) {
                jobs.push_back(entry.path().filename().string());
                LOG_TRACE("Found job: " + jobs.back());
            }
        }

        std::sort(jobs.begin(), jobs.end());

        if (!jobs.empty()) {
            LOG_DEBUG("Scanner found " + std::to_string(jobs.size()) + " pending jobs");
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Scanner error: " + std::string(e.what()));
    }

    return jobs;
}

bool Scanner::hasNewJobs() const noexcept {
    std::error_code ec;
    for (std::filesystem::directory_iterator it(pendingPath_, ec), end; !ec && it != end; it.increment(ec)) {
        if (isValidJobDirectory(it->path())) {
            return true;
        }
    }
    return false;
}

std::size_t Scanner::pendingJobCount() const noexcept {
    std::size_t count = 0;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(pendingPath_, ec), end; !ec && it != end; it.increment(ec)) {
        if (isValidJobDirectory(it->path())) {
            ++count;
        }
    }
    return count;
}

bool Scanner::isValidJobDirectory(const std::filesystem::path& dir) const noexcept {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return false;
    }

    // A job record written by FileStore; anything else is still being moved in
    auto record = dir / "job.json";
    if (!std::filesystem::is_regular_file(record, ec)) {
        LOG_DEBUG("Invalid job directory (missing job.json): " + dir.string());
        return false;
    }
    auto size = std::filesystem::file_size(record, ec);
    if (ec || size == 0) {
        LOG_DEBUG("Invalid job directory (empty job.json): " + dir.string());
        return false;
    }
    return true;
}

}
