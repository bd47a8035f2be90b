/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "scriba/server.hpp"
#include "scriba/client.hpp"
#include "scriba/diarizer.hpp"
#include "scriba/logger.hpp"
#include "scriba/models.hpp"
#include "scriba/pipeline.hpp"
#include "scriba/scanner.hpp"
#include "scriba/store.hpp"
#include "scriba/transcriber.hpp"
#include "scriba/worker.hpp"
#include <chrono>

namespace scriba {

// Note: Signal handling is done by the CLI (scribad.cpp), not by Server class

namespace {
std::string joinCommand(const std::vector<std::string>& command) {
    std::string line;
    for (const auto& word : command) {
        if (!line.empty()) {
            line += ' ';
        }
        line += word;
    }
    return line;
}
}

Server::Server(Config config, JobObserver* observer)
    : config_(std::move(config)), observer_(observer) {
    store_ = std::make_unique<FileStore>(config_.workspace);
    catalog_ = std::make_unique<ModelCatalog>(config_.modelsDir);

    worker_ = std::make_unique<Worker>(config_.workerOptions("transcriber", config_.workerCommand));
    client_ = std::make_unique<Client>(*worker_);
    transcriber_ = std::make_unique<Transcriber>(*client_, *catalog_, config_.transcriberOptions());

    if (config_.diarizerCommand.empty()) {
        diarizer_ = std::make_unique<Diarizer>(*client_, config_.requestTimeout);
    } else {
        diarizerWorker_ = std::make_unique<Worker>(config_.workerOptions("diarizer", config_.diarizerCommand));
        diarizerClient_ = std::make_unique<Client>(*diarizerWorker_);
        diarizer_ = std::make_unique<Diarizer>(*diarizerClient_, config_.requestTimeout);
    }

    pipeline_ = std::make_unique<Pipeline>(*transcriber_, diarizer_.get());
    queue_ = std::make_unique<Queue>(*store_, *pipeline_, observer_);
    scanner_ = std::make_unique<Scanner>(config_.workspace);

    LOG_DEBUG("Server created - workspace: " + config_.workspace.string() +
              ", worker: " + joinCommand(config_.workerCommand));
}

Server::~Server() {
    shutdown();
}

bool Server::start() {
    if (running_.load()) {
        LOG_WARN("Server already running");
        return false;
    }

    LOG_INFO("Starting scriba server...");

    std::string error;
    if (!config_.validate(error)) {
        LOG_ERROR("Invalid configuration: " + error);
        return false;
    }
    if (!store_->ready()) {
        LOG_ERROR("Failed to create workspace: " + config_.workspace.string());
        return false;
    }

    setThreadName("Main");

    LOG_DEBUG("========================================");
    LOG_DEBUG("scriba Server Starting");
    LOG_DEBUG("========================================");
    LOG_DEBUG("Workspace: " + config_.workspace.string());
    LOG_DEBUG("Worker: " + joinCommand(config_.workerCommand));
    LOG_DEBUG("Diarizer: " + (config_.diarizerCommand.empty()
                              ? std::string("(transcription worker)") : joinCommand(config_.diarizerCommand)));
    LOG_DEBUG("Models: " + config_.modelsDir.string());
    LOG_DEBUG("Windows: " + std::to_string(config_.chunkSeconds) + "s, overlap " +
              std::to_string(config_.overlapSeconds) + "s");
    LOG_DEBUG("========================================");

    if (auto model = catalog_->autoSelect()) {
        LOG_INFO("Default model: " + *model);
    } else {
        LOG_WARN("No model installed in " + config_.modelsDir.string() + ", jobs will fail until one is");
    }

    try {
        recovered_ = queue_->recoverInterrupted();
        if (recovered_ > 0) {
            LOG_WARN("Marked " + std::to_string(recovered_) + " interrupted job(s) as failed");
        }

        shutdown_.store(false);
        running_.store(true);

        processThread_ = std::thread(&Server::processLoop, this);
        scannerThread_ = std::thread(&Server::scanLoop, this);
        wake();

        LOG_DEBUG("Server started successfully");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start server: " + std::string(e.what()));
        shutdown();
        return false;
    }
}

void Server::shutdown() noexcept {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("Shutting down server...");

    shutdown_.store(true);
    queue_->stop();
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        wakePending_ = true;
    }
    wakeCv_.notify_all();

    if (scannerThread_.joinable()) {
        scannerThread_.join();
    }
    if (processThread_.joinable()) {
        processThread_.join();
    }

    worker_->stop();
    if (diarizerWorker_) {
        diarizerWorker_->stop();
    }

    LOG_INFO("Server shutdown complete");
}

SubmitResult Server::enqueue(const std::filesystem::path& file, const EngineConfig& config) {
    auto result = queue_->enqueue(file, config);
    if (result) {
        wake();
    }
    return result;
}

bool Server::cancel(const JobId& id) {
    return queue_->cancel(id);
}

void Server::cancelActive() noexcept {
    queue_->cancelActive();
}

Store& Server::store() {
    return *store_;
}

Queue& Server::queue() {
    return *queue_;
}

void Server::wake() {
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        wakePending_ = true;
    }
    wakeCv_.notify_one();
}

void Server::processLoop() {
    setThreadName("Queue");
    LOG_DEBUG("Processing loop started");

    while (!shutdown_.load()) {
        {
            std::unique_lock<std::mutex> lock(wakeMutex_);
            wakeCv_.wait(lock, [this] { return wakePending_; });
            wakePending_ = false;
        }
        if (shutdown_.load()) {
            break;
        }
        try {
            queue_->processNext();
        } catch (const std::exception& e) {
            LOG_ERROR("Processing loop error: " + std::string(e.what()));
        }
    }

    LOG_DEBUG("Processing loop stopped");
}

void Server::tick() {
    int adopted = 0;
    for (const auto& id : scanner_->scan()) {
        if (shutdown_.load()) {
            break;
        }
        if (queue_->adopt(id)) {
            ++adopted;
        }
    }
    if (adopted > 0) {
        LOG_DEBUG("Adopted " + std::to_string(adopted) + " new jobs");
    }

    if (auto remaining = queue_->retryDeferred(); remaining > 0) {
        LOG_WARN(std::to_string(remaining) + " status writes still deferred");
    }

    // Also retries jobs held back by a setup failure
    wake();
}

void Server::scanLoop() {
    setThreadName("Scanner");
    LOG_DEBUG("Scanner loop started");

    while (!shutdown_.load()) {
        try {
            tick();
        } catch (const std::exception& e) {
            LOG_ERROR("Scanner loop error: " + std::string(e.what()));
        }

        auto sleepEnd = std::chrono::steady_clock::now() + config_.scanInterval;
        while (std::chrono::steady_clock::now() < sleepEnd && !shutdown_.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    LOG_DEBUG("Scanner loop stopped");
}

}
