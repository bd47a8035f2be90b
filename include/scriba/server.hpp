/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <thread>

#include "scriba/config.hpp"
#include "scriba/queue.hpp"
#include "scriba/work.hpp"

namespace scriba {

class FileStore;
class Worker;
class Client;
class ModelCatalog;
class Transcriber;
class Diarizer;
class Pipeline;
class Scanner;

class Server final {
public:
    explicit Server(Config config, JobObserver* observer = nullptr);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    [[nodiscard]] bool start();
    void shutdown() noexcept;

    [[nodiscard]] SubmitResult enqueue(const std::filesystem::path& file, const EngineConfig& config = {});
    bool cancel(const JobId& id);
    void cancelActive() noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t recovered() const noexcept { return recovered_; }
    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] Store& store();
    [[nodiscard]] Queue& queue();

private:
    void processLoop();
    void scanLoop();
    void tick();
    void wake();

    Config config_;
    JobObserver* observer_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::size_t recovered_ = 0;

    std::unique_ptr<FileStore> store_;
    std::unique_ptr<ModelCatalog> catalog_;
    std::unique_ptr<Worker> worker_;
    std::unique_ptr<Worker> diarizerWorker_;
    std::unique_ptr<Client> client_;
    std::unique_ptr<Client> diarizerClient_;
    std::unique_ptr<Transcriber> transcriber_;
    std::unique_ptr<Diarizer> diarizer_;
    std::unique_ptr<Pipeline> pipeline_;
    std::unique_ptr<Queue> queue_;
    std::unique_ptr<Scanner> scanner_;

    std::mutex wakeMutex_;
    std::condition_variable wakeCv_;
    bool wakePending_ = false;

    std::thread processThread_;
    std::thread scannerThread_;
};

}
