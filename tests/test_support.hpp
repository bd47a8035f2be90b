/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <unistd.h>

#include "scriba/models.hpp"
#include "scriba/worker.hpp"

#ifndef SCRIBA_FAKE_WORKER
#error "SCRIBA_FAKE_WORKER must name the fake_worker executable"
#endif

namespace scriba::test {

// Scratch directory removed with everything in it on scope exit.
class TempDir {
public:
    explicit TempDir(const std::string& tag = "scriba") {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                (tag + "-" + std::to_string(::getpid()) + "-" + std::to_string(counter.fetch_add(1)));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

struct Turn {
    std::string speaker;
    double start;
    double end;
};

// The fake worker reads "duration=" and "speaker=" lines from its input file
// instead of decoding audio.
inline std::filesystem::path writeMedia(const std::filesystem::path& dir, const std::string& name,
                                        double duration, const std::vector<Turn>& turns = {},
                                        bool silent = false) {
    auto file = dir / name;
    std::ofstream out(file);
    out << "duration=" << duration << "\n";
    for (const auto& turn : turns) {
        out << "speaker=" << turn.speaker << "," << turn.start << "," << turn.end << "\n";
    }
    if (silent) {
        out << "silent\n";
    }
    return file;
}

inline void installModel(const std::filesystem::path& dir, const std::string& name) {
    const ModelSpec* spec = ModelCatalog::find(name);
    std::filesystem::create_directories(dir);
    for (const auto* file : {&spec->encoder, &spec->decoder, &spec->tokens}) {
        std::ofstream(dir / *file) << "model";
    }
}

inline std::vector<std::string> fakeWorkerCommand() {
    return {SCRIBA_FAKE_WORKER};
}

inline WorkerOptions fakeWorkerOptions(const std::string& mode = "normal",
                                       std::vector<std::pair<std::string, std::string>> env = {}) {
    WorkerOptions options;
    options.name = "fake";
    options.command = fakeWorkerCommand();
    options.environment = std::move(env);
    options.environment.emplace_back("FAKE_WORKER_MODE", mode);
    options.startupTimeout = std::chrono::milliseconds(5000);
    options.stopGrace = std::chrono::milliseconds(500);
    return options;
}

// Lines the fake worker appended to its FAKE_WORKER_LOG, one request type each.
inline std::vector<std::string> readRequestLog(const std::filesystem::path& file) {
    std::vector<std::string> lines;
    std::ifstream in(file);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

inline std::size_t countRequests(const std::filesystem::path& file, const std::string& type) {
    std::size_t count = 0;
    for (const auto& line : readRequestLog(file)) {
        if (line == type) {
            ++count;
        }
    }
    return count;
}

template <typename Predicate>
bool waitFor(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return predicate();
}

}
