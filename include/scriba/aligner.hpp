/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>
#include <vector>

#include "scriba/types.hpp"

namespace scriba {

inline constexpr const char* kUnknownSpeaker = "UNKNOWN";

// Labels each transcript segment with the speaker whose turn overlaps it the
// most. No positive overlap gives UNKNOWN; on a tie the earlier turn wins.
[[nodiscard]] std::vector<Segment> align(const std::vector<Segment>& transcript,
                                         const std::vector<SpeakerSegment>& turns);

[[nodiscard]] double overlapSeconds(double aStart, double aEnd, double bStart, double bEnd) noexcept;

// One Speaker per distinct id, sorted, named "Speaker N" with a palette colour.
[[nodiscard]] std::vector<Speaker> speakersFrom(const std::vector<SpeakerSegment>& turns);

}
