/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/diarizer.hpp"
#include "scriba/logger.hpp"
#include <algorithm>
#include <cstdio>
#include <set>

namespace scriba {

std::string speakerLabel(long long index) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "SPEAKER_%02lld", index);
    return buffer;
}

Diarizer::Diarizer(Caller& caller, std::chrono::milliseconds timeout)
    : caller_(caller), timeout_(timeout) {
}

Diarization Diarizer::diarize(const std::string& filePath, int speakerCount, const JobProgress& progress) {
    Diarization out;

    Json payload = {{"type", "diarize"}, {"filePath", filePath}};
    if (speakerCount > 0) {
        payload["numSpeakers"] = speakerCount;
    }

    CallOptions options;
    options.timeout = timeout_;
    // By value: the reader thread may still hold this after a timeout
    if (progress) {
        options.onProgress = [progress](const Progress& p) {
            if (!p.stage.empty()) {
                progress(95, p.stage);
            }
        };
    }

    auto result = caller_.call(payload, options);
    if (!result) {
        out.errorKind = result.error;
        out.error = result.errorMessage;
        return out;
    }

    const Json& body = result.message.payload;
    auto segments = body.find("segments");
    if (segments == body.end() || !segments->is_array()) {
        out.errorKind = ErrorKind::Protocol;
        out.error = "Diarization result has no segments";
        return out;
    }

    std::set<std::string> distinct;
    for (const auto& entry : *segments) {
        if (!entry.is_object()) {
            continue;
        }
        auto start = entry.find("start");
        auto end = entry.find("end");
        auto speaker = entry.find("speaker");
        if (start == entry.end() || !start->is_number() ||
            end == entry.end() || !end->is_number() || speaker == entry.end()) {
            LOG_WARN("Skipping malformed diarization segment: " + entry.dump());
            continue;
        }

        SpeakerSegment turn;
        turn.start = start->get<double>();
        turn.end = std::max(turn.start, end->get<double>());
        // Either a label or a cluster index
        if (speaker->is_string()) {
            turn.speaker = speaker->get<std::string>();
        } else if (speaker->is_number_integer()) {
            turn.speaker = speakerLabel(speaker->get<long long>());
        } else {
            LOG_WARN("Skipping diarization segment with bad speaker: " + entry.dump());
            continue;
        }
        distinct.insert(turn.speaker);
        out.segments.push_back(std::move(turn));
    }

    out.speakers.assign(distinct.begin(), distinct.end());
    out.ok = true;
    LOG_INFO("Diarization found " + std::to_string(out.speakers.size()) + " speakers in " +
             std::to_string(out.segments.size()) + " segments");
    return out;
}

}
