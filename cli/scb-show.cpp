/*
 * scriba - Transcript retrieval tool (scb-show)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/logger.hpp"
#include "scriba/queue.hpp"
#include "scriba/store.hpp"
#include <chrono>
#include <cstdio>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <thread>
#include <unistd.h>

using namespace scriba;

void printUsage(const char* progName) {
    std::cout << "scriba Transcript Retrieval Tool\n\n";
    std::cout << "Usage: " << progName << " <workspace> [job_id] [--wait] [--segments] [--speakers]\n";
    std::cout << "       " << progName << " <workspace> --list [status]\n";
    std::cout << "       " << progName << " <workspace> --search <text>\n";
    std::cout << "       " << progName << " <workspace> <job_id> --rename <speaker> <name>\n";
    std::cout << "       " << progName << " <workspace> <job_id> --cancel\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  workspace     Directory for job storage\n";
    std::cout << "  job_id        Job to show (default: latest job)\n\n";
    std::cout << "Options:\n";
    std::cout << "  -w, --wait        Block until the job finishes\n";
    std::cout << "  --segments        Print timed segments instead of plain text\n";
    std::cout << "  --speakers        Print the job's speakers\n";
    std::cout << "  --list [status]   List jobs, newest first\n";
    std::cout << "  --search <text>   Find segments containing text\n";
    std::cout << "  --rename <speaker> <name>  Set a speaker's display name\n";
    std::cout << "  --cancel          Cancel a pending job\n\n";
    std::cout << "Exit codes: 0 completed, 1 failed or error, 2 not finished\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./workspace\n";
    std::cout << "  scb-add ./workspace talk.mp3 | " << progName << " ./workspace --wait\n";
}

std::string timestamp(double seconds) {
    if (seconds < 0.0) {
        seconds = 0.0;
    }
    auto total = static_cast<long>(seconds * 10.0 + 0.5);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02ld:%02ld.%ld", total / 600, (total / 10) % 60, total % 10);
    return buf;
}

std::map<std::string, std::string> speakerNames(const Store& store, const JobId& id) {
    std::map<std::string, std::string> names;
    for (const auto& speaker : store.speakers(id)) {
        names[speaker.id] = speaker.displayName.value_or(speaker.id);
    }
    return names;
}

void printSegments(const Store& store, const JobId& id) {
    auto names = speakerNames(store, id);
    for (const auto& segment : store.segments(id)) {
        std::cout << "[" << timestamp(segment.start) << " -> " << timestamp(segment.end) << "]";
        if (segment.speaker) {
            auto it = names.find(*segment.speaker);
            std::cout << " " << (it != names.end() ? it->second : *segment.speaker) << ":";
        }
        std::cout << " " << segment.text << "\n";
    }
}

void printText(const Store& store, const JobId& id) {
    auto names = speakerNames(store, id);
    std::optional<std::string> current;
    std::string line;
    for (const auto& segment : store.segments(id)) {
        if (segment.speaker && segment.speaker != current) {
            if (!line.empty()) {
                std::cout << line << "\n";
                line.clear();
            }
            current = segment.speaker;
            auto it = names.find(*segment.speaker);
            line = (it != names.end() ? it->second : *segment.speaker) + ":";
        }
        if (!line.empty()) {
            line += " ";
        }
        line += segment.text;
    }
    if (!line.empty()) {
        std::cout << line << "\n";
    }
}

int listJobs(const Store& store, const std::string& statusArg) {
    JobFilter filter;
    if (!statusArg.empty()) {
        filter.status = parseStatus(statusArg);
        if (!filter.status) {
            std::cerr << "Error: Unknown status: " << statusArg << std::endl;
            return 1;
        }
    }
    for (const auto& job : store.list(filter)) {
        std::cout << job.id << "  " << statusName(job.status) << "  " << job.fileName;
        if (job.duration) {
            std::cout << "  " << timestamp(*job.duration);
        }
        if (!job.error.empty()) {
            std::cout << "  (" << job.error << ")";
        }
        std::cout << "\n";
    }
    return 0;
}

int searchJobs(const Store& store, const std::string& query) {
    auto hits = store.search(query);
    if (hits.empty()) {
        std::cerr << "No matches for: " << query << std::endl;
        return 1;
    }
    for (const auto& hit : hits) {
        std::cout << hit.job.id << "  " << hit.job.fileName << "\n";
        for (const auto& segment : hit.segments) {
            std::cout << "  [" << timestamp(segment.start) << "] " << segment.text << "\n";
        }
    }
    return 0;
}

int main(int argc, char* argv[]) {
    // Silence logs for CLI tool usage
    Logger::setLevel(LogLevel::WARN);

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string workspace = argv[1];
    std::string jobId;
    bool wait = false;
    bool showSegments = false;
    bool showSpeakers = false;
    bool cancel = false;
    bool list = false;
    std::string listStatus;
    std::string query;
    std::string renameSpeaker;
    std::string renameTo;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "-w" || arg == "--wait") {
            wait = true;
        } else if (arg == "--segments") {
            showSegments = true;
        } else if (arg == "--speakers") {
            showSpeakers = true;
        } else if (arg == "--cancel") {
            cancel = true;
        } else if (arg == "--list") {
            list = true;
            if (i + 1 < argc && argv[i + 1][0] != '-') {
                listStatus = argv[++i];
            }
        } else if (arg == "--search" && i + 1 < argc) {
            query = argv[++i];
        } else if (arg == "--rename" && i + 2 < argc) {
            renameSpeaker = argv[++i];
            renameTo = argv[++i];
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            return 1;
        } else {
            jobId = arg;
        }
    }

    try {
        FileStore store(workspace, false);
        if (!store.ready()) {
            std::cerr << "Not a workspace: " << workspace << std::endl;
            return 1;
        }

        if (list) {
            return listJobs(store, listStatus);
        }
        if (!query.empty()) {
            return searchJobs(store, query);
        }

        // Check piped input for JobID if not provided
        if (jobId.empty() && !isatty(fileno(stdin))) {
            std::cin >> jobId;
        }

        if (jobId.empty()) {
            auto latest = store.list({std::nullopt, 1});
            if (latest.empty()) {
                std::cerr << "No jobs found" << std::endl;
                return 1;
            }
            jobId = latest.front().id;
        }

        if (!renameSpeaker.empty()) {
            if (!store.renameSpeaker(jobId, renameSpeaker, renameTo)) {
                std::cerr << "Speaker not found: " << renameSpeaker << std::endl;
                return 1;
            }
            return 0;
        }

        if (cancel) {
            auto job = store.get(jobId);
            if (!job) {
                std::cerr << "Job not found: " << jobId << std::endl;
                return 1;
            }
            if (job->status != Status::Pending) {
                std::cerr << "Only pending jobs can be cancelled here (status: "
                          << statusName(job->status) << ")" << std::endl;
                return 1;
            }
            job->status = Status::Cancelled;
            job->error = kCancelledMessage;
            job->updatedAt = std::chrono::system_clock::now();
            if (!store.update(*job)) {
                std::cerr << "Failed to cancel job: " << jobId << std::endl;
                return 1;
            }
            std::cout << jobId << " cancelled" << std::endl;
            return 0;
        }

        if (wait) {
            while (true) {
                auto job = store.get(jobId);
                if (!job || isTerminal(job->status)) break;
                std::this_thread::sleep_for(std::chrono::milliseconds(250));
            }
        }

        auto job = store.get(jobId);
        if (!job) {
            std::cerr << "Job not found: " << jobId << std::endl;
            return 1;
        }

        if (showSpeakers) {
            for (const auto& speaker : store.speakers(jobId)) {
                std::cout << speaker.id << "  " << speaker.displayName.value_or("")
                          << "  " << speaker.color.value_or("") << "\n";
            }
            return 0;
        }

        switch (job->status) {
            case Status::Completed:
                if (showSegments) {
                    printSegments(store, jobId);
                } else {
                    printText(store, jobId);
                }
                return 0;
            case Status::Failed:
            case Status::Cancelled:
                std::cerr << "Job " << statusName(job->status) << ": " << jobId << std::endl;
                if (!job->error.empty()) {
                    std::cerr << "Error: " << job->error << std::endl;
                }
                return 1;
            default:
                std::cerr << "Job not ready: " << jobId << " (status: " << statusName(job->status) << ")" << std::endl;
                return 2; // Different exit code for "not ready"
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
