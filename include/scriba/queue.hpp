/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "scriba/pipeline.hpp"
#include "scriba/store.hpp"
#include "scriba/types.hpp"
#include "scriba/work.hpp"

namespace scriba {

inline constexpr const char* kInterruptedMessage =
    "Interrupted: the application stopped while this job was processing";
inline constexpr const char* kCancelledMessage = "Transcription cancelled";

// Job lifecycle events. Called from whichever thread drives the queue.
class JobObserver {
public:
    virtual ~JobObserver() = default;
    virtual void onCreated(const Job&) {}
    virtual void onProgress(const JobId&, int /*percent*/, const std::string& /*stage*/) {}
    virtual void onCompleted(const JobId&, double /*durationSeconds*/, std::size_t /*segmentCount*/) {}
    // Also reports cancellation, with kCancelledMessage.
    virtual void onFailed(const JobId&, const std::string& /*error*/) {}
};

// FIFO backlog of persisted jobs, run one at a time through a JobRunner.
class Queue final {
public:
    Queue(Store& store, JobRunner& runner, JobObserver* observer = nullptr);

    Queue(const Queue&) = delete;
    Queue& operator=(const Queue&) = delete;
    Queue(Queue&&) = delete;
    Queue& operator=(Queue&&) = delete;

    [[nodiscard]] SubmitResult enqueue(const std::filesystem::path& file, const EngineConfig& config = {});

    // Drains the backlog. Returns at once if another thread is already draining.
    void processNext();

    void cancelActive() noexcept;
    bool cancel(const JobId& id);

    // Startup reconciliation: processing jobs become failed, pending jobs are
    // reloaded into the backlog. Returns the number of failed-over jobs.
    std::size_t recoverInterrupted();

    // Appends a pending job persisted by another process.
    bool adopt(const JobId& id);

    // Re-attempts status writes that failed earlier. Returns how many remain.
    std::size_t retryDeferred();

    // Cancels the active run and refuses further work; the active job keeps
    // its processing status so the next start reports it as interrupted.
    void stop() noexcept;

    [[nodiscard]] bool isProcessing() const noexcept { return processing_.load(); }
    [[nodiscard]] std::optional<JobId> activeJob() const;
    [[nodiscard]] std::vector<JobId> backlog() const;
    [[nodiscard]] std::size_t backlogSize() const;
    [[nodiscard]] std::size_t deferredCount() const;
    [[nodiscard]] std::string lastSetupError() const;

private:
    Store& store_;
    JobRunner& runner_;
    JobObserver* observer_;
    Work work_;

    mutable std::mutex mutex_;
    std::deque<JobId> backlog_;
    std::optional<JobId> active_;
    std::string setupError_;

    std::atomic<bool> processing_{false};
    std::atomic<bool> cancelRequested_{false};
    std::atomic<bool> stopping_{false};

    mutable std::mutex persistMutex_;
    std::vector<Job> deferred_;

    void runJob(const JobId& id);
    void finishCompleted(Job& job, RunOutcome& outcome);
    void finishFailed(Job& job, const std::string& error);
    void finishCancelled(Job& job);
    bool transition(Job& job);
    bool appendToBacklog(const JobId& id);
    [[nodiscard]] std::optional<Status> deferredStatus(const JobId& id) const;
};

}
