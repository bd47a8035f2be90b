/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "scriba/transcriber.hpp"
#include "scriba/worker.hpp"

namespace scriba {

struct Config {
    std::filesystem::path workspace;
    std::vector<std::string> workerCommand{"scriba-worker"};
    std::filesystem::path workerLibraryPath;
    std::filesystem::path workerDirectory;
    std::vector<std::string> diarizerCommand;   // empty: diarize on the transcription worker
    std::filesystem::path modelsDir{"models"};
    std::chrono::milliseconds startupTimeout{10000};
    std::chrono::milliseconds requestTimeout{30 * 60 * 1000};
    std::chrono::milliseconds pingTimeout{5000};
    double chunkSeconds = 30.0;
    double overlapSeconds = 1.0;
    std::chrono::milliseconds scanInterval{5000};

    // Defaults overridden by SCRIBA_* environment variables.
    [[nodiscard]] static Config fromEnv();

    [[nodiscard]] bool validate(std::string& error) const;

    [[nodiscard]] WorkerOptions workerOptions(const std::string& name,
                                              const std::vector<std::string>& command) const;
    [[nodiscard]] TranscriberOptions transcriberOptions() const;
};

// Whitespace-separated command line; double quotes group words.
[[nodiscard]] std::vector<std::string> splitCommand(const std::string& line);

}
