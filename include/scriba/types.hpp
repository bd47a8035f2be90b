#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace scriba {

// Job lifecycle states.
enum class Status : std::uint8_t { Pending, Processing, Completed, Failed, Cancelled };

// Opaque job identifier (timestamp_pid_counter).
using JobId = std::string;

using TimePoint = std::chrono::system_clock::time_point;

struct EngineConfig {
    std::string model;      // empty selects the first available model
    std::string language;   // empty lets the engine detect it
    bool diarize = false;
    int speakerCount = 0;   // 0 = unknown
};

struct Job {
    JobId id;
    std::string filePath;
    std::string fileName;
    std::optional<std::uintmax_t> fileSize;
    EngineConfig config;
    Status status = Status::Pending;
    TimePoint createdAt{};
    TimePoint updatedAt{};
    std::optional<TimePoint> completedAt;
    std::string error;
    std::optional<double> duration;
    std::string language;
};

// File-absolute span of transcribed text.
struct Segment {
    double start = 0.0;
    double end = 0.0;
    std::string text;
    std::optional<std::string> speaker;
    std::optional<double> confidence;
};

// Diarization output. Never persisted.
struct SpeakerSegment {
    double start = 0.0;
    double end = 0.0;
    std::string speaker;
};

struct Speaker {
    std::string id;
    std::optional<std::string> displayName;
    std::optional<std::string> color;
};

[[nodiscard]] inline const char* statusName(Status status) noexcept {
    switch (status) {
        case Status::Pending:    return "pending";
        case Status::Processing: return "processing";
        case Status::Completed:  return "completed";
        case Status::Failed:     return "failed";
        case Status::Cancelled:  return "cancelled";
        default:                 return "unknown";
    }
}

[[nodiscard]] inline std::optional<Status> parseStatus(const std::string& name) noexcept {
    if (name == "pending") return Status::Pending;
    if (name == "processing") return Status::Processing;
    if (name == "completed") return Status::Completed;
    if (name == "failed") return Status::Failed;
    if (name == "cancelled") return Status::Cancelled;
    return std::nullopt;
}

[[nodiscard]] inline bool isTerminal(Status status) noexcept {
    return status == Status::Completed || status == Status::Failed || status == Status::Cancelled;
}

} // namespace scriba
