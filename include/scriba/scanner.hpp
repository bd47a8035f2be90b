/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <vector>

#include "scriba/types.hpp"

namespace scriba {

// Finds pending job directories, including those written by other processes.
class Scanner {
public:
    explicit Scanner(const std::filesystem::path& workspace) noexcept;

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;
    Scanner(Scanner&&) noexcept = default;
    Scanner& operator=(Scanner&&) noexcept = default;

    // Sorted by id, which sorts by submission time.
    [[nodiscard]] std::vector<JobId> scan() const noexcept;
    [[nodiscard]] bool hasNewJobs() const noexcept;
    [[nodiscard]] std::size_t pendingJobCount() const noexcept;

private:
    std::filesystem::path workspace_;
    std::filesystem::path pendingPath_;

    [[nodiscard]] bool isValidJobDirectory(const std::filesystem::path& dir) const noexcept;
};

}
