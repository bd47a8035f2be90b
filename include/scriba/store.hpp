/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "scriba/types.hpp"

namespace scriba {

struct JobFilter {
    std::optional<Status> status;
    std::size_t limit = 0;      // 0 = no limit
};

struct SearchHit {
    Job job;
    std::vector<Segment> segments;
};

// Persistence of jobs, their segments and their speakers.
class Store {
public:
    virtual ~Store() = default;

    [[nodiscard]] virtual bool create(const Job& job) = 0;
    [[nodiscard]] virtual std::optional<Job> get(const JobId& id) const = 0;
    // Newest first.
    [[nodiscard]] virtual std::vector<Job> list(const JobFilter& filter = {}) const = 0;
    [[nodiscard]] virtual bool update(const Job& job) = 0;
    [[nodiscard]] virtual bool remove(const JobId& id) = 0;

    // Both replace whatever was stored before.
    [[nodiscard]] virtual bool saveSegments(const JobId& id, const std::vector<Segment>& segments) = 0;
    [[nodiscard]] virtual std::vector<Segment> segments(const JobId& id) const = 0;
    [[nodiscard]] virtual bool saveSpeakers(const JobId& id, const std::vector<Speaker>& speakers) = 0;
    [[nodiscard]] virtual std::vector<Speaker> speakers(const JobId& id) const = 0;

    [[nodiscard]] virtual bool renameSpeaker(const JobId& id, const std::string& speakerId,
                                             const std::string& displayName) = 0;

    // Case-insensitive substring match over segment text, grouped by job.
    [[nodiscard]] virtual std::vector<SearchHit> search(const std::string& query, std::size_t limit = 50) const = 0;
};

// Each job is a directory that moves between per-status phase directories:
//   <workspace>/incoming/<id>     being written
//   <workspace>/pending/<id>      ... processing/ completed/ failed/ cancelled/
// The directory a job sits in is the authority for its status.
class FileStore final : public Store {
public:
    explicit FileStore(const std::filesystem::path& workspace, bool createIfMissing = true);

    FileStore(const FileStore&) = delete;
    FileStore& operator=(const FileStore&) = delete;

    [[nodiscard]] bool ready() const noexcept { return ready_; }
    [[nodiscard]] const std::filesystem::path& workspace() const noexcept { return workspace_; }
    [[nodiscard]] std::filesystem::path phaseDirectory(Status status) const;

    [[nodiscard]] bool create(const Job& job) override;
    [[nodiscard]] std::optional<Job> get(const JobId& id) const override;
    [[nodiscard]] std::vector<Job> list(const JobFilter& filter = {}) const override;
    [[nodiscard]] bool update(const Job& job) override;
    [[nodiscard]] bool remove(const JobId& id) override;

    [[nodiscard]] bool saveSegments(const JobId& id, const std::vector<Segment>& segments) override;
    [[nodiscard]] std::vector<Segment> segments(const JobId& id) const override;
    [[nodiscard]] bool saveSpeakers(const JobId& id, const std::vector<Speaker>& speakers) override;
    [[nodiscard]] std::vector<Speaker> speakers(const JobId& id) const override;

    [[nodiscard]] bool renameSpeaker(const JobId& id, const std::string& speakerId,
                                     const std::string& displayName) override;

    [[nodiscard]] std::vector<SearchHit> search(const std::string& query, std::size_t limit = 50) const override;

private:
    std::filesystem::path workspace_;
    bool ready_ = false;
    mutable std::mutex mutex_;

    [[nodiscard]] bool createWorkspace(bool createIfMissing) noexcept;
    [[nodiscard]] std::optional<std::pair<Status, std::filesystem::path>> locate(const JobId& id) const;
    [[nodiscard]] std::optional<Job> readJob(const std::filesystem::path& dir, Status status) const;
    [[nodiscard]] std::vector<Segment> readSegments(const std::filesystem::path& dir) const;
    [[nodiscard]] std::vector<Speaker> readSpeakers(const std::filesystem::path& dir) const;
    [[nodiscard]] std::vector<Job> listLocked(const JobFilter& filter) const;
};

}
