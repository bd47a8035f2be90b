/*
 * scriba - Media Inference Job Coordinator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "scriba/codec.hpp"
#include "scriba/worker.hpp"

namespace scriba {

inline constexpr std::chrono::milliseconds kPingTimeout{5000};
inline constexpr std::chrono::milliseconds kInferenceTimeout{30 * 60 * 1000};

enum class ErrorKind : uint8_t {
    None = 0,
    Startup,        // worker never became ready
    NotRunning,     // request could not be written
    Timeout,
    WorkerExited,
    Cancelled,
    Remote,         // worker answered with an error message
    Protocol,       // malformed request or response
    Config          // unknown or missing model, bad parameters
};

[[nodiscard]] const char* errorKindName(ErrorKind kind) noexcept;

struct CallResult {
    bool ok = false;
    Message message;
    ErrorKind error = ErrorKind::None;
    std::string errorMessage;
    explicit operator bool() const noexcept { return ok; }
};

using ProgressCallback = std::function<void(const Progress&)>;

struct CallOptions {
    ProgressCallback onProgress;
    std::chrono::milliseconds timeout{kInferenceTimeout};
};

// Anything that can answer correlated requests. Client is the real one;
// tests script their own.
class Caller {
public:
    virtual ~Caller() = default;

    [[nodiscard]] virtual CallResult call(const Json& payload, const CallOptions& options) = 0;

    // Starts the worker if needed; false with `error` set on setup failure.
    [[nodiscard]] virtual bool ensureRunning(std::string& error) = 0;

    // Rejects everything outstanding and tears the worker down. Later calls
    // fail as cancelled until resume().
    virtual void cancel() noexcept = 0;

    // Lifts an earlier cancel so the next call may start a worker again.
    virtual void resume() noexcept = 0;

    // Changes whenever the worker behind this caller restarts.
    [[nodiscard]] virtual std::uint64_t session() const noexcept = 0;
};

class Client final : public Caller {
public:
    explicit Client(Worker& worker);
    ~Client() override;

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;
    Client(Client&&) = delete;
    Client& operator=(Client&&) = delete;

    [[nodiscard]] CallResult call(const Json& payload, const CallOptions& options) override;
    [[nodiscard]] bool ensureRunning(std::string& error) override;
    void cancel() noexcept override;
    void resume() noexcept override;
    [[nodiscard]] std::uint64_t session() const noexcept override;

    [[nodiscard]] CallResult ping(std::chrono::milliseconds timeout = kPingTimeout);

    [[nodiscard]] std::size_t pendingCount() const;

private:
    struct PendingRequest {
        std::string type;
        bool done = false;
        CallResult result;

        // Guards onProgress. Cleared before call() returns so the reader
        // thread never runs a callback whose captures are gone.
        std::mutex callbackMutex;
        ProgressCallback onProgress;
    };

    Worker& worker_;
    Subscription subscription_ = 0;
    IdGenerator ids_;

    mutable std::mutex mutex_;
    std::condition_variable resolved_;
    std::unordered_map<std::string, std::shared_ptr<PendingRequest>> pending_;
    bool cancelled_ = false;

    [[nodiscard]] static CallResult finish(const std::shared_ptr<PendingRequest>& request, CallResult result);

    void handleMessage(const Message& message);
    void handleExit(const WorkerExit& exit);
    void rejectAll(ErrorKind kind, const std::string& message);
};

}
