/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/config.hpp"
#include "scriba/logger.hpp"
#include <cstdlib>

namespace scriba {

namespace {
int env_int(const char* name, int defv, int minv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        int parsed = std::stoi(val);
        if (parsed < minv) {
            LOG_WARN(std::string("Ignoring ") + name + "=" + val + " (below " + std::to_string(minv) + ")");
            return defv;
        }
        return parsed;
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}

double env_double(const char* name, double defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}

std::string env_string(const char* name) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : std::string{};
}
}

std::vector<std::string> splitCommand(const std::string& line) {
    std::vector<std::string> words;
    std::string current;
    bool quoted = false;
    bool inWord = false;
    // Double quotes group words; there is no escaping
    for (char c : line) {
        if (c == '"') {
            quoted = !quoted;
            inWord = true;
        } else if (!quoted && (c == ' ' || c == '\t')) {
            if (inWord) {
                words.push_back(current);
                current.clear();
                inWord = false;
            }
        } else {
            current.push_back(c);
            inWord = true;
        }
    }
    if (inWord) {
        words.push_back(current);
    }
    return words;
}

Config Config::fromEnv() {
    Config config;

    if (auto worker = splitCommand(env_string("SCRIBA_WORKER")); !worker.empty()) {
        config.workerCommand = worker;
    }
    config.diarizerCommand = splitCommand(env_string("SCRIBA_DIARIZER"));
    config.workerLibraryPath = env_string("SCRIBA_WORKER_LIBPATH");
    config.workerDirectory = env_string("SCRIBA_WORKER_CWD");
    if (auto models = env_string("SCRIBA_MODELS_DIR"); !models.empty()) {
        config.modelsDir = models;
    }

    config.startupTimeout = std::chrono::milliseconds(
        env_int("SCRIBA_STARTUP_TIMEOUT_MS", static_cast<int>(config.startupTimeout.count()), 1));
    config.requestTimeout = std::chrono::milliseconds(
        env_int("SCRIBA_REQUEST_TIMEOUT_MS", static_cast<int>(config.requestTimeout.count()), 1));
    config.pingTimeout = std::chrono::milliseconds(
        env_int("SCRIBA_PING_TIMEOUT_MS", static_cast<int>(config.pingTimeout.count()), 1));
    config.scanInterval = std::chrono::milliseconds(
        env_int("SCRIBA_SCAN_INTERVAL_MS", static_cast<int>(config.scanInterval.count()), 100));

    // Chunk and overlap only make sense together
    double chunk = env_double("SCRIBA_CHUNK_SECONDS", config.chunkSeconds);
    double overlap = env_double("SCRIBA_OVERLAP_SECONDS", config.overlapSeconds);
    if (chunk > 0.0 && overlap >= 0.0 && overlap < chunk) {
        config.chunkSeconds = chunk;
        config.overlapSeconds = overlap;
    } else {
        LOG_WARN("Ignoring chunk settings " + std::to_string(chunk) + "/" + std::to_string(overlap) +
                 ": overlap must be shorter than the chunk");
    }
    return config;
}

bool Config::validate(std::string& error) const {
    if (workspace.empty()) {
        error = "No workspace directory given";
        return false;
    }
    if (workerCommand.empty()) {
        error = "No worker command configured";
        return false;
    }
    if (chunkSeconds <= 0.0 || overlapSeconds < 0.0 || overlapSeconds >= chunkSeconds) {
        error = "Chunk overlap must be shorter than the chunk length";
        return false;
    }
    if (!workerDirectory.empty() && !std::filesystem::is_directory(workerDirectory)) {
        error = "Worker directory does not exist: " + workerDirectory.string();
        return false;
    }
    return true;
}

WorkerOptions Config::workerOptions(const std::string& name, const std::vector<std::string>& command) const {
    WorkerOptions options;
    options.name = name;
    options.command = command;
    options.workingDirectory = workerDirectory;
    options.libraryPath = workerLibraryPath;
    options.startupTimeout = startupTimeout;
    return options;
}

TranscriberOptions Config::transcriberOptions() const {
    TranscriberOptions options;
    options.chunkSeconds = chunkSeconds;
    options.overlapSeconds = overlapSeconds;
    options.requestTimeout = requestTimeout;
    return options;
}

}
