/*
 * scriba - Job submission tool (scb-add)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/work.hpp"
#include "scriba/logger.hpp"
#include "scriba/models.hpp"
#include "scriba/store.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using namespace scriba;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "scriba Job Submission Tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <workspace> <media-file|directory...> [options]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  workspace     Directory for job storage\n";
    std::cout << "  media-file    Audio or video file to transcribe (repeatable)\n";
    std::cout << "  directory     Folder whose supported media is imported; files that\n";
    std::cout << "                already have a completed transcript are skipped\n\n";
    std::cout << "Options:\n";
    std::cout << "  --model <name>     Model variant (default: first installed of";
    for (const auto& name : ModelCatalog::preferenceOrder()) {
        std::cout << " " << name;
    }
    std::cout << ")\n";
    std::cout << "  --language <code>  Language hint (default: auto)\n";
    std::cout << "  --diarize          Label speakers\n";
    std::cout << "  --speakers <n>     Expected number of speakers (implies --diarize)\n";
    std::cout << "  -r, --recursive    Descend into subdirectories of directory arguments\n";
    std::cout << "  -h, --help         Show this help message\n";
    std::cout << "  -v, --version      Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  SCRIBA_LOG_LEVEL        Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  SCRIBA_MAX_INPUT_SIZE   Largest accepted file in bytes\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./workspace interview.m4a\n";
    std::cout << "  " << progName << " ./workspace meeting.wav --diarize --speakers 3\n";
    std::cout << "  " << progName << " ./workspace ~/Recordings --recursive\n";
}

int main(int argc, char* argv[]) {
    // Default to WARN for clean piping; SCRIBA_LOG_LEVEL overrides
    if (!std::getenv("SCRIBA_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    if (argc < 3) {
        printUsage(argv[0]);
        return 1;
    }

    std::string workspace = argv[1];
    EngineConfig config;
    std::vector<std::filesystem::path> files;
    bool recursive = false;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--model" || arg == "--language" || arg == "--speakers") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a value\n";
                return 1;
            }
            std::string value = argv[++i];
            if (arg == "--model") {
                if (!ModelCatalog::find(value)) {
                    std::cerr << "Error: Unknown model: " << value << "\n";
                    return 1;
                }
                config.model = value;
            } else if (arg == "--language") {
                config.language = value;
            } else {
                try {
                    config.speakerCount = std::stoi(value);
                } catch (const std::exception&) {
                    std::cerr << "Error: Invalid speaker count\n";
                    return 1;
                }
                config.diarize = true;
            }
        } else if (arg == "--diarize") {
            config.diarize = true;
        } else if (arg == "-r" || arg == "--recursive") {
            recursive = true;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            return 1;
        } else {
            files.emplace_back(arg);
        }
    }

    if (files.empty()) {
        std::cerr << "Error: No media file given\n";
        return 1;
    }

    try {
        FileStore store(workspace, true); // Create workspace if missing
        if (!store.ready()) {
            std::cerr << "Error: Cannot use workspace " << workspace << "\n";
            return 1;
        }
        Work work(store);

        int failures = 0;
        auto submit = [&](const std::filesystem::path& file) {
            auto result = work.submit(file, config);
            if (result.ok) {
                // Just the job ID - clean for piping, no noise
                std::cout << result.id << std::endl;
            } else {
                std::cerr << "Error: " << result.message << std::endl;
                ++failures;
            }
        };

        for (const auto& file : files) {
            std::error_code ec;
            if (!std::filesystem::is_directory(file, ec)) {
                submit(file);
                continue;
            }

            auto scan = work.scanDirectory(file, recursive);
            for (const auto& error : scan.errors) {
                std::cerr << "Warning: " << error << std::endl;
            }
            if (!scan) {
                ++failures;
                continue;
            }
            for (const auto& media : scan.files) {
                if (media.alreadyTranscribed) {
                    std::cerr << "Skipping " << media.path.string() << " (already transcribed)" << std::endl;
                    continue;
                }
                submit(media.path);
            }
        }
        return failures == 0 ? 0 : 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
