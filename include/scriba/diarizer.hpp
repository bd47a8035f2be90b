/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <string>
#include <vector>

#include "scriba/client.hpp"
#include "scriba/transcriber.hpp"
#include "scriba/types.hpp"

namespace scriba {

struct Diarization {
    bool ok = false;
    std::vector<SpeakerSegment> segments;   // worker order
    std::vector<std::string> speakers;      // distinct, sorted
    ErrorKind errorKind = ErrorKind::None;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

// SPEAKER_00, SPEAKER_01, ...
[[nodiscard]] std::string speakerLabel(long long index);

class Diarizer final {
public:
    explicit Diarizer(Caller& caller, std::chrono::milliseconds timeout = kInferenceTimeout);

    Diarizer(const Diarizer&) = delete;
    Diarizer& operator=(const Diarizer&) = delete;

    // speakerCount <= 0 lets the engine decide.
    [[nodiscard]] Diarization diarize(const std::string& filePath, int speakerCount,
                                      const JobProgress& progress = {});

    void cancel() noexcept { caller_.cancel(); }
    void resume() noexcept { caller_.resume(); }

private:
    Caller& caller_;
    std::chrono::milliseconds timeout_;
};

}
