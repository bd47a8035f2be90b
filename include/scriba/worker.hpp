/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <sys/types.h>

#include "scriba/codec.hpp"

namespace scriba {

struct WorkerOptions {
    std::string name = "worker";
    std::vector<std::string> command;               // argv, command[0] searched in PATH
    std::filesystem::path workingDirectory;         // empty keeps the parent's
    std::filesystem::path libraryPath;              // prepended to the loader search path
    std::vector<std::pair<std::string, std::string>> environment;
    std::chrono::milliseconds startupTimeout{10000};
    std::chrono::milliseconds stopGrace{2000};
    std::size_t maxLineBytes = kDefaultMaxLineBytes;
};

struct WorkerExit {
    int code = -1;          // exit status, -1 when killed by a signal
    int signal = 0;
    bool requested = false; // stop() asked for it

    [[nodiscard]] std::string describe() const;
};

using MessageHandler = std::function<void(const Message&)>;
using ExitHandler = std::function<void(const WorkerExit&)>;
using Subscription = std::uint64_t;

// Supervises one worker process speaking the line protocol on stdin/stdout.
// Handlers run on the supervisor's reader and reaper threads and must not
// call start() or stop().
class Worker final {
public:
    explicit Worker(WorkerOptions options);
    ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;
    Worker(Worker&&) = delete;
    Worker& operator=(Worker&&) = delete;

    // Spawns the process and waits for its ready handshake. No-op when running.
    [[nodiscard]] bool start();

    // Closes stdin, SIGTERM, then SIGKILL after the grace period. Idempotent.
    void stop() noexcept;

    [[nodiscard]] bool send(const std::string& line);

    [[nodiscard]] Subscription subscribe(MessageHandler onMessage, ExitHandler onExit = {});
    void unsubscribe(Subscription id);

    [[nodiscard]] bool isRunning() const noexcept;
    [[nodiscard]] pid_t pid() const noexcept;
    [[nodiscard]] Json readyInfo() const;
    [[nodiscard]] std::string lastError() const;
    [[nodiscard]] WorkerExit lastExit() const;

    // Incremented by every successful start(); lets callers detect restarts.
    [[nodiscard]] std::uint64_t generation() const noexcept;

    [[nodiscard]] const WorkerOptions& options() const noexcept { return options_; }

private:
    struct Listener {
        Subscription id;
        MessageHandler onMessage;
        ExitHandler onExit;
    };

    WorkerOptions options_;

    std::mutex lifecycleMutex_;

    mutable std::mutex stateMutex_;
    std::condition_variable stateCv_;
    pid_t pid_ = -1;
    bool running_ = false;
    bool ready_ = false;
    bool exited_ = true;
    bool stopRequested_ = false;
    Json readyInfo_;
    std::string lastError_;
    WorkerExit lastExit_;
    std::uint64_t generation_ = 0;

    std::mutex writeMutex_;
    int stdinFd_ = -1;

    std::thread stdoutThread_;
    std::thread stderrThread_;
    std::thread reaperThread_;

    std::mutex listenersMutex_;
    std::vector<Listener> listeners_;
    Subscription nextSubscription_ = 1;

    [[nodiscard]] bool spawn();
    void stopLocked() noexcept;
    [[nodiscard]] bool waitExited(std::chrono::milliseconds timeout);
    void joinReaper() noexcept;
    void closeStdin() noexcept;
    void setError(const std::string& error);

    void readStdout(int fd);
    void readStderr(int fd);
    void reap(pid_t pid);
    void dispatch(const Decoded& decoded);
};

}
