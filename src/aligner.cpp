/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/aligner.hpp"
#include <algorithm>
#include <array>
#include <set>

namespace scriba {

namespace {
constexpr std::array<const char*, 8> kPalette = {
    "#4f8cc9", "#e07b39", "#5aa469", "#c9514f",
    "#8e6cc9", "#c9a24f", "#4fb3c9", "#c94f9e",
};
}

double overlapSeconds(double aStart, double aEnd, double bStart, double bEnd) noexcept {
    return std::max(0.0, std::min(aEnd, bEnd) - std::max(aStart, bStart));
}

std::vector<Segment> align(const std::vector<Segment>& transcript,
                           const std::vector<SpeakerSegment>& turns) {
    std::vector<Segment> aligned;
    aligned.reserve(transcript.size());

    for (const auto& segment : transcript) {
        const SpeakerSegment* best = nullptr;
        double bestOverlap = 0.0;
        for (const auto& turn : turns) {
            double overlap = overlapSeconds(segment.start, segment.end, turn.start, turn.end);
            if (overlap > bestOverlap) {
                bestOverlap = overlap;
                best = &turn;
            }
        }
        Segment labelled = segment;
        labelled.speaker = best ? best->speaker : std::string(kUnknownSpeaker);
        aligned.push_back(std::move(labelled));
    }
    return aligned;
}

std::vector<Speaker> speakersFrom(const std::vector<SpeakerSegment>& turns) {
    std::set<std::string> ids;
    for (const auto& turn : turns) {
        ids.insert(turn.speaker);
    }

    std::vector<Speaker> speakers;
    speakers.reserve(ids.size());
    std::size_t index = 0;
    for (const auto& id : ids) {
        speakers.push_back({id, "Speaker " + std::to_string(index + 1),
                            std::string(kPalette[index % kPalette.size()])});
        ++index;
    }
    return speakers;
}

}
