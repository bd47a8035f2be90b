/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/transcriber.hpp"
#include "scriba/logger.hpp"
#include <algorithm>
#include <cmath>
#include <optional>

namespace scriba {

namespace {
void report(const JobProgress& progress, int percent, const std::string& stage) {
    if (progress) {
        progress(percent, stage);
    }
}

std::string trim(const std::string& text) {
    const char* ws = " \t\r\n";
    auto begin = text.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(ws);
    return text.substr(begin, end - begin + 1);
}

std::optional<double> numberField(const Json& body, const char* name) {
    auto it = body.find(name);
    if (it == body.end() || !it->is_number()) {
        return std::nullopt;
    }
    double value = it->get<double>();
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::string textField(const Json& body) {
    auto it = body.find("text");
    return it != body.end() && it->is_string() ? trim(it->get<std::string>()) : std::string{};
}

bool fail(Transcript& out, ErrorKind kind, const std::string& error) {
    out.ok = false;
    out.segments.clear();
    out.text.clear();
    out.errorKind = kind;
    out.error = error;
    return false;
}

bool fail(Transcript& out, const CallResult& result) {
    return fail(out, result.error, result.errorMessage);
}
}

WindowPlan planWindows(double duration, double ceiling, double overlap) {
    WindowPlan plan;
    if (!std::isfinite(duration) || duration < 0.0) {
        plan.error = "Invalid duration: " + std::to_string(duration);
        return plan;
    }
    if (!std::isfinite(ceiling) || ceiling <= 0.0) {
        plan.error = "Chunk length must be positive";
        return plan;
    }
    if (!std::isfinite(overlap) || overlap < 0.0 || overlap >= ceiling) {
        plan.error = "Overlap must be non-negative and shorter than the chunk length";
        return plan;
    }

    if (duration <= ceiling) {
        plan.windows.push_back({0, 0.0, duration});
        plan.ok = true;
        return plan;
    }

    const double step = ceiling - overlap;
    const auto count = static_cast<std::size_t>(std::ceil((duration - overlap) / step));
    plan.windows.reserve(count);
    for (std::size_t k = 0; k < count; ++k) {
        double start = static_cast<double>(k) * step;
        plan.windows.push_back({k, start, std::min(start + ceiling, duration)});
    }
    plan.ok = true;
    return plan;
}

int chunkProgress(std::size_t index, std::size_t count) noexcept {
    if (count == 0) {
        return 20;
    }
    return 20 + static_cast<int>((index * 70) / count);
}

Transcriber::Transcriber(Caller& caller, const ModelCatalog& catalog, TranscriberOptions options)
    : caller_(caller), catalog_(catalog), options_(options) {
}

Transcript Transcriber::transcribe(const std::string& filePath, const EngineConfig& config,
                                   const JobProgress& progress) {
    Transcript out;
    out.language = config.language.empty() ? "auto" : config.language;

    report(progress, 5, "loading");
    if (!ensureModel(config.model, out)) {
        return out;
    }
    out.model = loadedModel_;

    report(progress, 10, "preparing");
    auto prepared = request(Json{{"type", "prepare"}, {"filePath", filePath}});
    if (!prepared) {
        fail(out, prepared);
        return out;
    }

    const Json& body = prepared.message.payload;
    auto duration = numberField(body, "duration");
    if (!duration || *duration < 0.0) {
        fail(out, ErrorKind::Protocol, "Worker did not report a valid duration for " + filePath);
        return out;
    }
    auto wavPath = body.find("wavPath");
    out.mediaPath = wavPath != body.end() && wavPath->is_string() ? wavPath->get<std::string>() : filePath;
    out.duration = *duration;
    LOG_DEBUG("Prepared " + filePath + ": " + std::to_string(out.duration) + "s");

    report(progress, 20, "processing");
    bool ok = out.duration <= options_.chunkSeconds
        ? transcribeWhole(out.mediaPath, config, out)
        : transcribeWindows(out.mediaPath, config, progress, out);
    if (!ok) {
        return out;
    }

    report(progress, 95, "finalizing");
    for (const auto& segment : out.segments) {
        if (!out.text.empty()) {
            out.text += ' ';
        }
        out.text += segment.text;
    }
    out.ok = true;
    return out;
}

bool Transcriber::ensureModel(const std::string& requested, Transcript& out) {
    auto resolution = catalog_.resolve(requested);
    if (!resolution) {
        LOG_ERROR(resolution.error);
        return fail(out, ErrorKind::Config, resolution.error);
    }
    const ModelSpec& spec = *resolution.spec;

    // A restarted worker has forgotten whatever was loaded before
    if (loadedModel_ == spec.name && loadedSession_ != 0 && loadedSession_ == caller_.session()) {
        return true;
    }

    LOG_INFO("Loading model: " + spec.name);
    Json payload = {
        {"type", "loadModel"},
        {"modelPath", catalog_.directory().string()},
        {"modelName", spec.name},
        {"config", {{"encoder", spec.encoder}, {"decoder", spec.decoder}, {"tokens", spec.tokens}}},
    };
    auto loaded = request(payload);
    if (!loaded) {
        loadedModel_.clear();
        LOG_ERROR("Failed to load model " + spec.name + ": " + loaded.errorMessage);
        return fail(out, loaded);
    }
    loadedModel_ = spec.name;
    loadedSession_ = caller_.session();
    return true;
}

bool Transcriber::transcribeWhole(const std::string& wavPath, const EngineConfig& config, Transcript& out) {
    Json payload = {{"type", "transcribe"}, {"filePath", wavPath}};
    if (!config.language.empty()) {
        payload["language"] = config.language;
    }
    auto result = request(payload);
    if (!result) {
        return fail(out, result);
    }
    std::string text = textField(result.message.payload);
    if (!text.empty()) {
        out.segments.push_back({0.0, out.duration, text, std::nullopt, std::nullopt});
    }
    return true;
}

bool Transcriber::transcribeWindows(const std::string& wavPath, const EngineConfig& config,
                                    const JobProgress& progress, Transcript& out) {
    auto plan = planWindows(out.duration, options_.chunkSeconds, options_.overlapSeconds);
    if (!plan.ok) {
        return fail(out, ErrorKind::Config, plan.error);
    }

    const std::size_t count = plan.windows.size();
    LOG_INFO("Transcribing " + std::to_string(out.duration) + "s in " + std::to_string(count) + " chunks");

    for (const auto& window : plan.windows) {
        report(progress, chunkProgress(window.index, count), "decoding");

        Json payload = {
            {"type", "transcribe"},
            {"filePath", wavPath},
            {"start", window.start},
            {"end", window.end},
        };
        if (!config.language.empty()) {
            payload["language"] = config.language;
        }

        auto result = request(payload);
        if (!result) {
            LOG_WARN("Chunk " + std::to_string(window.index + 1) + "/" + std::to_string(count) +
                     " failed: " + result.errorMessage);
            return fail(out, result);
        }

        const Json& body = result.message.payload;
        std::string text = textField(body);
        if (text.empty()) {
            LOG_TRACE("Chunk " + std::to_string(window.index + 1) + " is silent");
            continue;
        }
        double length = window.end - window.start;
        double relStart = numberField(body, "start").value_or(0.0);
        double relEnd = numberField(body, "end").value_or(length);
        double start = window.start + std::max(0.0, relStart);
        double end = std::max(start, window.start + relEnd);
        out.segments.push_back({start, end, text, std::nullopt, std::nullopt});
    }
    return true;
}

CallResult Transcriber::request(const Json& payload) {
    CallOptions options;
    options.timeout = options_.requestTimeout;
    options.onProgress = [](const Progress& p) {
        LOG_TRACE("Worker progress: " + std::to_string(p.percent) + "% " + p.stage);
    };
    return caller_.call(payload, options);
}

}
