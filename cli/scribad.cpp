/*
 * scriba - Server daemon (scribad)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/server.hpp"
#include "scriba/logger.hpp"
#include "scriba/models.hpp"
#include "scriba/store.hpp"
#include <iostream>
#include <iomanip>
#include <fstream>
#include <chrono>
#include <thread>
#include <csignal>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <optional>
#include <sstream>
#include <unistd.h>

using namespace scriba;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

std::optional<pid_t> readPidFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    long pid = 0;
    file >> pid;
    if (pid <= 0) {
        return std::nullopt;
    }
    return static_cast<pid_t>(pid);
}

bool isProcessAlive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

std::size_t countDirEntries(const std::filesystem::path& dir) {
    std::size_t count = 0;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_directory(ec)) ++count;
    }
    return count;
}

std::filesystem::path resolveModelsDir(const char* argv0, const std::filesystem::path& configured) {
    if (std::getenv("SCRIBA_MODELS_DIR")) {
        return configured;
    }

    std::filesystem::path exePath(argv0 ? argv0 : "");
    if (!exePath.empty()) {
        std::error_code ec;
        exePath = std::filesystem::absolute(exePath, ec);
        if (!ec && std::filesystem::exists(exePath, ec)) {
            auto base = exePath.parent_path();
            if (std::filesystem::exists(base / "models", ec)) {
                return base / "models";
            }
            if (std::filesystem::exists(base.parent_path() / "models", ec)) {
                return base.parent_path() / "models";
            }
        }
    }

    return std::filesystem::current_path() / configured;
}

std::string shortId(const JobId& id) {
    return id.size() > 12 ? id.substr(id.size() - 12) : id;
}

// Prints one line per job event, keeping the latest stage of the active job.
class ConsoleObserver final : public JobObserver {
public:
    void onCreated(const Job& job) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "  \033[90mqueued\033[0m   " << shortId(job.id) << "  " << job.fileName << "\n" << std::flush;
    }

    void onProgress(const JobId& id, int percent, const std::string& stage) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stage == lastStage_ && id == lastJob_) {
            return;
        }
        lastStage_ = stage;
        lastJob_ = id;
        std::cout << "  \033[33mrunning\033[0m  " << shortId(id) << "  " << std::setw(3) << percent
                  << "%  " << stage << "\n" << std::flush;
    }

    void onCompleted(const JobId& id, double durationSeconds, std::size_t segmentCount) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostringstream duration;
        duration << std::fixed << std::setprecision(1) << durationSeconds;
        std::cout << "  \033[32mdone\033[0m     " << shortId(id) << "  " << duration.str() << "s, "
                  << segmentCount << " segments\n" << std::flush;
    }

    void onFailed(const JobId& id, const std::string& error) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "  \033[31mfailed\033[0m   " << shortId(id) << "  " << error << "\n" << std::flush;
    }

private:
    std::mutex mutex_;
    JobId lastJob_;
    std::string lastStage_;
};

int listModels(const std::filesystem::path& dir) {
    ModelCatalog catalog(dir);
    auto preferred = catalog.autoSelect();
    std::cout << "Models in " << dir.string() << ":\n";
    for (const auto& model : catalog.available()) {
        std::cout << "  " << (model.available ? "\033[32m*\033[0m " : "  ")
                  << std::left << std::setw(10) << model.name
                  << std::setw(8) << model.size << model.description;
        if (preferred && *preferred == model.name) {
            std::cout << "  (default)";
        }
        std::cout << "\n";
    }
    return preferred ? 0 : 1;
}

void printUsage() {
    std::cout << "scriba " << VERSION << " - media transcription daemon\n\n";
    std::cout << "Usage: scribad <workspace> [options]\n";
    std::cout << "       scribad --list-models [--models <dir>]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --worker <cmd>      Worker command line (default: scriba-worker)\n";
    std::cout << "  --diarizer <cmd>    Separate diarization worker command line\n";
    std::cout << "  --models <dir>      Model directory\n";
    std::cout << "  --chunk <seconds>   Window length for long inputs (default: 30)\n";
    std::cout << "  --overlap <seconds> Window overlap (default: 1)\n";
    std::cout << "  --verbose           Debug logging\n";
    std::cout << "  -v, --version       Print version\n";
    std::cout << "\nEnvironment: SCRIBA_WORKER, SCRIBA_MODELS_DIR, SCRIBA_LOG_LEVEL, SCRIBA_LOG_FILE, ...\n";
}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
        if (arg == "--list-models") {
            auto dir = resolveModelsDir(argv[0], Config::fromEnv().modelsDir);
            for (int j = 1; j + 1 < argc; ++j) {
                if (std::string(argv[j]) == "--models") {
                    dir = argv[j + 1];
                }
            }
            return listModels(dir);
        }
    }

    if (argc < 2) {
        printUsage();
        return 1;
    }

    Logger::initFromEnv();

    Config config = Config::fromEnv();
    config.workspace = argv[1];
    config.modelsDir = resolveModelsDir(argv[0], config.modelsDir);

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--worker" && i + 1 < argc) {
            config.workerCommand = splitCommand(argv[++i]);
        } else if (arg == "--diarizer" && i + 1 < argc) {
            config.diarizerCommand = splitCommand(argv[++i]);
        } else if (arg == "--models" && i + 1 < argc) {
            config.modelsDir = argv[++i];
        } else if ((arg == "--chunk" || arg == "--overlap") && i + 1 < argc) {
            try {
                double value = std::stod(argv[++i]);
                (arg == "--chunk" ? config.chunkSeconds : config.overlapSeconds) = value;
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid value for " << arg << "\n";
                return 1;
            }
        } else if (arg == "--verbose") {
            Logger::setLevel(LogLevel::DEBUG);
        } else {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            return 1;
        }
    }

    std::string error;
    if (!config.validate(error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }

    std::filesystem::path pidPath = config.workspace / ".scribad.pid";
    if (auto pid = readPidFile(pidPath); pid && isProcessAlive(*pid)) {
        std::cerr << "Error: scribad already running on " << config.workspace.string()
                  << " (pid " << *pid << ")\n";
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::cout << "\n";
    std::cout << "  \033[1mscriba\033[0m " << VERSION << "                     \033[90mtranscribe · diarize · align\033[0m\n";
    std::cout << "  \033[90m─────────────────────────────────────────────────────────────────\033[0m\n";
    std::cout << "\n";

    ConsoleObserver observer;

    try {
        Server server(config, &observer);

        if (!server.start()) {
            std::cout << "  \033[31mFailed to start\033[0m\n";
            return 1;
        }

        {
            std::ofstream pf(pidPath);
            if (pf) {
                pf << getpid();
            }
        }

        ModelCatalog catalog(config.modelsDir);
        auto model = catalog.autoSelect();

        std::cout << "  \033[1mRUNNING\033[0m\n\n";
        std::cout << "    Workspace  " << config.workspace.string() << "\n";
        std::cout << "    Models     " << config.modelsDir.string() << "\n";
        std::cout << "    Default    " << (model ? *model : std::string("\033[31mnone installed\033[0m")) << "\n";
        std::cout << "    Pending    " << countDirEntries(config.workspace / "pending") << "\n";
        std::cout << "    Completed  " << countDirEntries(config.workspace / "completed") << "\n";
        if (server.recovered() > 0) {
            std::cout << "    Recovered  " << server.recovered() << " interrupted\n";
        }
        std::cout << "\n";
        std::cout << "  Submit:  scb-add " << config.workspace.string() << " <media-file>\n";
        std::cout << "  Results: scb-show " << config.workspace.string() << " <job-id>\n";
        std::cout << "\n";
        std::cout << "  \033[90m─────────────────────────────────────────────────────────────────\033[0m\n";
        std::cout << "\n" << std::flush;

        while (!g_shutdown_requested && server.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (g_shutdown_requested) {
            std::cout << "\nShutdown requested, stopping server..." << std::endl;
        }
        {
            std::error_code ec;
            std::filesystem::remove(pidPath, ec);
        }
        server.shutdown();

    } catch (const std::exception& e) {
        LOG_ERROR("Server error: " + std::string(e.what()));
        return 1;
    }

    LOG_DEBUG("scriba daemon stopped");
    return 0;
}
