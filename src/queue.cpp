/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/queue.hpp"
#include "scriba/logger.hpp"
#include <algorithm>
#include <chrono>

namespace scriba {

namespace {
template <typename Fn>
void notify(JobObserver* observer, Fn&& fn) {
    if (!observer) {
        return;
    }
    try {
        fn(*observer);
    } catch (const std::exception& e) {
        LOG_ERROR("Job observer threw: " + std::string(e.what()));
    }
}

class ProcessingGuard {
public:
    explicit ProcessingGuard(std::atomic<bool>& flag) noexcept : flag_(flag) {}
    ~ProcessingGuard() { flag_.store(false); }
    ProcessingGuard(const ProcessingGuard&) = delete;
    ProcessingGuard& operator=(const ProcessingGuard&) = delete;
private:
    std::atomic<bool>& flag_;
};
}

Queue::Queue(Store& store, JobRunner& runner, JobObserver* observer)
    : store_(store), runner_(runner), observer_(observer), work_(store) {
}

SubmitResult Queue::enqueue(const std::filesystem::path& file, const EngineConfig& config) {
    auto result = work_.submit(file, config);
    if (!result) {
        LOG_WARN("Rejected " + file.string() + ": " + result.message);
        return result;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        backlog_.push_back(result.id);
    }
    notify(observer_, [&](JobObserver& o) { o.onCreated(result.job); });
    return result;
}

void Queue::processNext() {
    bool expected = false;
    if (!processing_.compare_exchange_strong(expected, true)) {
        LOG_DEBUG("Processing loop already running");
        return;
    }
    ProcessingGuard guard(processing_);

    // Writes that failed last time go first so the store catches up
    retryDeferred();

    while (!stopping_.load()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (backlog_.empty()) {
                break;
            }
        }

        // Setup failures leave the backlog intact for the next wake-up
        std::string error;
        if (!runner_.prepare(error)) {
            std::lock_guard<std::mutex> lock(mutex_);
            setupError_ = error;
            LOG_ERROR("Engine setup failed, " + std::to_string(backlog_.size()) +
                      " jobs stay pending: " + error);
            break;
        }

        JobId id;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (backlog_.empty()) {
                break;
            }
            id = backlog_.front();
            backlog_.pop_front();
            active_ = id;
            cancelRequested_.store(false);
            setupError_.clear();
        }

        runJob(id);

        std::lock_guard<std::mutex> lock(mutex_);
        active_.reset();
    }
}

void Queue::runJob(const JobId& id) {
    auto job = store_.get(id);
    if (!job) {
        LOG_WARN("Job " + id + " disappeared before processing");
        return;
    }
    // A status write still waiting for retry outranks what the store says
    if (auto deferred = deferredStatus(id)) {
        LOG_INFO("Skipping job " + id + ": already " + statusName(*deferred) + " (not yet persisted)");
        return;
    }
    if (job->status != Status::Pending) {
        LOG_INFO("Skipping job " + id + ": already " + statusName(job->status));
        return;
    }

    // Step 1: mark processing
    job->status = Status::Processing;
    job->error.clear();
    (void)transition(*job);
    LOG_INFO("Processing job " + id + " (" + job->fileName + ")");

    // Step 2: run, unless a cancel arrived while the job was being claimed
    auto started = std::chrono::steady_clock::now();
    RunOutcome outcome;
    if (cancelRequested_.load()) {
        outcome.status = Status::Cancelled;
    } else {
        outcome = runner_.run(*job, [this, &id](int percent, const std::string& stage) {
            notify(observer_, [&](JobObserver& o) { o.onProgress(id, percent, stage); });
        });
    }

    // Shutdown keeps the job processing so the next start reports it interrupted
    if (stopping_.load() && outcome.status != Status::Completed) {
        LOG_WARN("Job " + id + " interrupted by shutdown");
        return;
    }
    // A requested cancel wins over whatever the runner managed to finish
    if (cancelRequested_.load()) {
        outcome.status = Status::Cancelled;
    }

    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    LOG_DEBUG("Job " + id + " ran for " + std::to_string(elapsed) + "s");

    // Step 3: finalize
    switch (outcome.status) {
        case Status::Completed:
            finishCompleted(*job, outcome);
            break;
        case Status::Cancelled:
            finishCancelled(*job);
            break;
        default:
            finishFailed(*job, outcome.error.empty() ? "Transcription failed" : outcome.error);
            break;
    }
}

void Queue::finishCompleted(Job& job, RunOutcome& outcome) {
    // Segments land before the status flips, so a completed job always has them
    if (!store_.saveSegments(job.id, outcome.segments)) {
        finishFailed(job, "Failed to save transcript");
        return;
    }
    if (!outcome.speakers.empty() && !store_.saveSpeakers(job.id, outcome.speakers)) {
        LOG_WARN("Failed to save speakers for job " + job.id);
    }

    job.status = Status::Completed;
    job.duration = outcome.duration;
    job.language = outcome.language;
    job.completedAt = std::chrono::system_clock::now();
    job.error.clear();
    (void)transition(job);

    notify(observer_, [&](JobObserver& o) { o.onProgress(job.id, 100, "complete"); });
    LOG_INFO("Job completed: " + job.id + " -> " + std::to_string(outcome.segments.size()) + " segments");
    notify(observer_, [&](JobObserver& o) { o.onCompleted(job.id, outcome.duration, outcome.segments.size()); });
}

void Queue::finishFailed(Job& job, const std::string& error) {
    job.status = Status::Failed;
    job.error = error;
    (void)transition(job);
    LOG_WARN("Job failed: " + job.id + " - " + error);
    notify(observer_, [&](JobObserver& o) { o.onFailed(job.id, error); });
}

void Queue::finishCancelled(Job& job) {
    job.status = Status::Cancelled;
    job.error = kCancelledMessage;
    (void)transition(job);
    LOG_INFO("Job cancelled: " + job.id);
    notify(observer_, [&](JobObserver& o) { o.onFailed(job.id, kCancelledMessage); });
}

void Queue::cancelActive() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_) {
            return;
        }
        cancelRequested_.store(true);
        LOG_INFO("Cancelling active job " + *active_);
    }
    runner_.cancel();
}

bool Queue::cancel(const JobId& id) {
    bool isActive = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_ && *active_ == id) {
            isActive = true;
            cancelRequested_.store(true);
        } else {
            auto it = std::find(backlog_.begin(), backlog_.end(), id);
            if (it != backlog_.end()) {
                backlog_.erase(it);
            }
        }
    }
    if (isActive) {
        LOG_INFO("Cancelling active job " + id);
        runner_.cancel();
        return true;
    }

    auto job = store_.get(id);
    if (!job || job->status != Status::Pending) {
        return false;
    }
    finishCancelled(*job);
    return true;
}

std::size_t Queue::recoverInterrupted() {
    if (processing_.load()) {
        LOG_WARN("Recovery skipped: a processing loop is running");
        return 0;
    }

    std::size_t recovered = 0;
    for (auto& job : store_.list({Status::Processing, 0})) {
        job.status = Status::Failed;
        job.error = kInterruptedMessage;
        (void)transition(job);
        LOG_WARN("Recovered interrupted job " + job.id);
        ++recovered;
    }

    // list() is newest first; the backlog wants oldest first
    auto pending = store_.list({Status::Pending, 0});
    std::reverse(pending.begin(), pending.end());
    std::size_t reloaded = 0;
    for (const auto& job : pending) {
        if (appendToBacklog(job.id)) {
            ++reloaded;
        }
    }
    if (recovered > 0 || reloaded > 0) {
        LOG_INFO("Recovery: " + std::to_string(recovered) + " interrupted, " +
                 std::to_string(reloaded) + " pending reloaded");
    }
    return recovered;
}

bool Queue::adopt(const JobId& id) {
    auto job = store_.get(id);
    if (!job || job->status != Status::Pending) {
        return false;
    }
    if (!appendToBacklog(id)) {
        return false;
    }
    LOG_INFO("Adopted job " + id);
    notify(observer_, [&](JobObserver& o) { o.onCreated(*job); });
    return true;
}

bool Queue::appendToBacklog(const JobId& id) {
    if (deferredStatus(id)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if ((active_ && *active_ == id) ||
        std::find(backlog_.begin(), backlog_.end(), id) != backlog_.end()) {
        return false;
    }
    backlog_.push_back(id);
    return true;
}

std::size_t Queue::retryDeferred() {
    std::lock_guard<std::mutex> lock(persistMutex_);
    if (deferred_.empty()) {
        return 0;
    }
    std::vector<Job> remaining;
    for (auto& job : deferred_) {
        if (store_.update(job)) {
            LOG_INFO("Persisted deferred status for job " + job.id + ": " + statusName(job.status));
        } else {
            remaining.push_back(std::move(job));
        }
    }
    deferred_ = std::move(remaining);
    return deferred_.size();
}

std::optional<Status> Queue::deferredStatus(const JobId& id) const {
    std::lock_guard<std::mutex> lock(persistMutex_);
    for (const auto& job : deferred_) {
        if (job.id == id) {
            return job.status;
        }
    }
    return std::nullopt;
}

bool Queue::transition(Job& job) {
    job.updatedAt = std::chrono::system_clock::now();
    std::lock_guard<std::mutex> lock(persistMutex_);
    auto existing = std::find_if(deferred_.begin(), deferred_.end(),
        [&job](const Job& j) { return j.id == job.id; });

    if (store_.update(job)) {
        if (existing != deferred_.end()) {
            deferred_.erase(existing);
        }
        return true;
    }

    // Only the latest status per job is kept for retry
    LOG_ERROR("Failed to persist job " + job.id + " as " + statusName(job.status) + ", will retry");
    if (existing != deferred_.end()) {
        *existing = job;
    } else {
        deferred_.push_back(job);
    }
    return false;
}

void Queue::stop() noexcept {
    stopping_.store(true);
    bool active = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active = active_.has_value();
    }
    if (active) {
        runner_.cancel();
    }
}

std::optional<JobId> Queue::activeJob() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

std::vector<JobId> Queue::backlog() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<JobId>(backlog_.begin(), backlog_.end());
}

std::size_t Queue::backlogSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backlog_.size();
}

std::size_t Queue::deferredCount() const {
    std::lock_guard<std::mutex> lock(persistMutex_);
    return deferred_.size();
}

std::string Queue::lastSetupError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return setupError_;
}

}
