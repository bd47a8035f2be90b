/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>
#include <vector>

#include "scriba/diarizer.hpp"
#include "scriba/transcriber.hpp"
#include "scriba/types.hpp"

namespace scriba {

struct RunOutcome {
    Status status = Status::Failed;     // Completed, Failed or Cancelled
    std::vector<Segment> segments;
    std::vector<Speaker> speakers;      // empty unless diarized
    double duration = 0.0;
    std::string language;
    std::string error;
};

// What the queue runs for each job.
class JobRunner {
public:
    virtual ~JobRunner() = default;

    // Brings the engine up. A false return is a setup problem, not a job failure.
    [[nodiscard]] virtual bool prepare(std::string& error) = 0;

    [[nodiscard]] virtual RunOutcome run(const Job& job, const JobProgress& progress) = 0;

    // Aborts a run() in progress from another thread.
    virtual void cancel() noexcept = 0;
};

// Transcribe, then optionally diarize and align.
class Pipeline final : public JobRunner {
public:
    explicit Pipeline(Transcriber& transcriber, Diarizer* diarizer = nullptr) noexcept;

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    [[nodiscard]] bool prepare(std::string& error) override;
    [[nodiscard]] RunOutcome run(const Job& job, const JobProgress& progress) override;
    void cancel() noexcept override;

private:
    Transcriber& transcriber_;
    Diarizer* diarizer_;
};

}
