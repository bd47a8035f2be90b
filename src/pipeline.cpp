/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/pipeline.hpp"
#include "scriba/aligner.hpp"
#include "scriba/logger.hpp"

namespace scriba {

Pipeline::Pipeline(Transcriber& transcriber, Diarizer* diarizer) noexcept
    : transcriber_(transcriber), diarizer_(diarizer) {
}

bool Pipeline::prepare(std::string& error) {
    // A cancel only covers the job it was aimed at
    transcriber_.resume();
    if (diarizer_) {
        diarizer_->resume();
    }
    return transcriber_.ensureReady(error);
}

RunOutcome Pipeline::run(const Job& job, const JobProgress& progress) {
    RunOutcome outcome;
    LOG_DEBUG("Running job " + job.id + ": " + job.filePath);

    auto transcript = transcriber_.transcribe(job.filePath, job.config, progress);
    if (!transcript) {
        outcome.status = transcript.errorKind == ErrorKind::Cancelled ? Status::Cancelled : Status::Failed;
        outcome.error = transcript.error;
        return outcome;
    }

    outcome.segments = std::move(transcript.segments);
    outcome.duration = transcript.duration;
    outcome.language = transcript.language;

    // Diarization is best effort: only a cancel discards the transcript
    if (job.config.diarize) {
        if (!diarizer_) {
            LOG_WARN("Diarization requested for " + job.id + " but no diarizer is configured");
        } else {
            if (progress) {
                progress(95, "diarizing");
            }
            auto diarization = diarizer_->diarize(transcript.mediaPath, job.config.speakerCount, progress);
            if (diarization) {
                outcome.segments = align(outcome.segments, diarization.segments);
                outcome.speakers = speakersFrom(diarization.segments);
            } else if (diarization.errorKind == ErrorKind::Cancelled) {
                outcome.status = Status::Cancelled;
                outcome.error = diarization.error;
                outcome.segments.clear();
                return outcome;
            } else {
                LOG_WARN("Diarization failed, continuing without speaker labels: " + diarization.error);
            }
        }
    }

    outcome.status = Status::Completed;
    return outcome;
}

void Pipeline::cancel() noexcept {
    transcriber_.cancel();
    if (diarizer_) {
        diarizer_->cancel();
    }
}

}
