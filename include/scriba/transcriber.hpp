/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "scriba/client.hpp"
#include "scriba/models.hpp"
#include "scriba/types.hpp"

namespace scriba {

// Job-level progress: percent in [0, 100] and a short stage name.
using JobProgress = std::function<void(int percent, const std::string& stage)>;

struct Window {
    std::size_t index = 0;
    double start = 0.0;
    double end = 0.0;
};

struct WindowPlan {
    bool ok = false;
    std::vector<Window> windows;
    std::string error;
};

// Windows of at most `ceiling` seconds, each overlapping the previous one by
// `overlap`. A duration within the ceiling gives one window over everything.
[[nodiscard]] WindowPlan planWindows(double duration, double ceiling, double overlap);

// 20 + floor(index / count * 70)
[[nodiscard]] int chunkProgress(std::size_t index, std::size_t count) noexcept;

struct TranscriberOptions {
    double chunkSeconds = 30.0;
    double overlapSeconds = 1.0;
    std::chrono::milliseconds requestTimeout{kInferenceTimeout};
};

struct Transcript {
    bool ok = false;
    std::vector<Segment> segments;
    std::string text;
    double duration = 0.0;
    std::string language;
    std::string model;
    std::string mediaPath;      // the worker's prepared copy of the input
    ErrorKind errorKind = ErrorKind::None;
    std::string error;
    explicit operator bool() const noexcept { return ok; }
};

// Drives one input through loadModel, prepare and windowed transcribe calls.
class Transcriber final {
public:
    Transcriber(Caller& caller, const ModelCatalog& catalog, TranscriberOptions options = {});

    Transcriber(const Transcriber&) = delete;
    Transcriber& operator=(const Transcriber&) = delete;

    [[nodiscard]] Transcript transcribe(const std::string& filePath, const EngineConfig& config,
                                        const JobProgress& progress = {});

    [[nodiscard]] bool ensureReady(std::string& error) { return caller_.ensureRunning(error); }
    void cancel() noexcept { caller_.cancel(); }
    void resume() noexcept { caller_.resume(); }

    [[nodiscard]] const std::string& loadedModel() const noexcept { return loadedModel_; }
    [[nodiscard]] const TranscriberOptions& options() const noexcept { return options_; }

private:
    Caller& caller_;
    const ModelCatalog& catalog_;
    TranscriberOptions options_;

    std::string loadedModel_;
    std::uint64_t loadedSession_ = 0;

    [[nodiscard]] bool ensureModel(const std::string& requested, Transcript& out);
    [[nodiscard]] bool transcribeWhole(const std::string& wavPath, const EngineConfig& config, Transcript& out);
    [[nodiscard]] bool transcribeWindows(const std::string& wavPath, const EngineConfig& config,
                                         const JobProgress& progress, Transcript& out);
    [[nodiscard]] CallResult request(const Json& payload);
};

}
